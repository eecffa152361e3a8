#pragma once
#include <quire/core/diagnostics.h>
#include <quire/markup/parser.h>
#include <quire/net/response.h>
#include <quire/xmldoc/document_holder.h>
#include <memory>
#include <optional>
#include <string_view>

namespace quire::xmldoc {

// Flavor named by the response's Content-Type: an exact supported type, or
// application/xml for any other "+xml" type.
std::optional<markup::MediaType> declared_content_type(const net::Response& response);

// Declared flavor, else the one implied by the URL's file extension.
// nullopt when neither says anything.
std::optional<markup::MediaType> resolve_content_type(const net::Response& response);

// Parses `text` as `type`. Returns nullptr when the parser throws
// markup::ParseError, yields no document element, or reports an error
// through a parsererror element at or directly below the root.
std::unique_ptr<dom::Document> parse_and_return_null_if_error(
    std::string_view text, markup::MediaType type, markup::MarkupParser& parser,
    core::DiagnosticEmitter* diagnostics = nullptr);

// Turns a fetched resource into a holder, trying flavors in turn:
// the resolved type (XML if unknown); a re-parse as HTML or SVG when the
// type was not declared and the root element says otherwise; HTML as the
// last resort. Returns nullptr when nothing parses. Parse failures never
// escape as exceptions.
std::shared_ptr<DocumentHolder> parse_xml_resource(const net::Response& response,
                                                   markup::MarkupParser& parser,
                                                   core::DiagnosticEmitter* diagnostics = nullptr);

} // namespace quire::xmldoc
