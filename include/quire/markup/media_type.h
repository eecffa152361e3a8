#pragma once
#include <optional>
#include <string_view>

namespace quire::markup {

// Parse flavors understood by MarkupParser, named after the DOMParser
// supported types.
enum class MediaType {
    TextHtml,
    TextXml,
    ApplicationXml,
    ApplicationXhtmlXml,
    ImageSvgXml
};

const char* media_type_name(MediaType type);

// Exact match against the names above
std::optional<MediaType> media_type_from_name(std::string_view name);

inline bool is_html(MediaType type) { return type == MediaType::TextHtml; }

} // namespace quire::markup
