#pragma once
#include <quire/dom/document.h>
#include <quire/markup/media_type.h>
#include <memory>
#include <stdexcept>
#include <string_view>

namespace quire::markup {

// Thrown when the parser cannot produce a document at all. Recoverable
// well-formedness errors are reported in-tree instead, see is_parser_error().
class ParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// True for the sentinel element a parser inserts to report a malformed
// document, either as the document element or as one of its children.
bool is_parser_error(const dom::Element& element);

class MarkupParser {
public:
    virtual ~MarkupParser() = default;

    // Parses `text` as `type`. The returned document records `type` as its
    // content type.
    virtual std::unique_ptr<dom::Document> parse_from_string(std::string_view text,
                                                             MediaType type) = 0;
};

} // namespace quire::markup
