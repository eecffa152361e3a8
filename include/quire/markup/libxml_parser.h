#pragma once
#include <quire/core/diagnostics.h>
#include <quire/markup/parser.h>

namespace quire::markup {

// MarkupParser on top of libxml2.
//
// XML flavors go through the XML parser in recover mode; a document that is
// not namespace well-formed gets a <parsererror> element, placed as the
// first child of whatever root was recovered or as the root itself when
// nothing was. HTML goes through the libxml2 HTML parser; elements land in
// the XHTML namespace (SVG and MathML subtrees in theirs) and a missing
// <head> or <body> is synthesized.
class LibxmlParser : public MarkupParser {
public:
    explicit LibxmlParser(core::DiagnosticEmitter* diagnostics = nullptr);

    std::unique_ptr<dom::Document> parse_from_string(std::string_view text,
                                                     MediaType type) override;

private:
    std::unique_ptr<dom::Document> parse_xml(std::string_view text, MediaType type);
    std::unique_ptr<dom::Document> parse_html(std::string_view text);

    core::DiagnosticEmitter* diagnostics_;
};

} // namespace quire::markup
