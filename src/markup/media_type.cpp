#include <quire/markup/media_type.h>

namespace quire::markup {

namespace {

constexpr MediaType kAllTypes[] = {
    MediaType::TextHtml,
    MediaType::TextXml,
    MediaType::ApplicationXml,
    MediaType::ApplicationXhtmlXml,
    MediaType::ImageSvgXml,
};

} // namespace

const char* media_type_name(MediaType type) {
    switch (type) {
        case MediaType::TextHtml:            return "text/html";
        case MediaType::TextXml:             return "text/xml";
        case MediaType::ApplicationXml:      return "application/xml";
        case MediaType::ApplicationXhtmlXml: return "application/xhtml+xml";
        case MediaType::ImageSvgXml:         return "image/svg+xml";
    }
    return "application/xml";
}

std::optional<MediaType> media_type_from_name(std::string_view name) {
    for (MediaType type : kAllTypes) {
        if (name == media_type_name(type)) {
            return type;
        }
    }
    return std::nullopt;
}

} // namespace quire::markup
