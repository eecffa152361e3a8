#pragma once
#include <quire/dom/document.h>
#include <quire/net/header_map.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace quire::net {

struct Response {
    uint16_t status = 0;
    std::string url;  // canonical URL after redirects
    HeaderMap headers;
    std::vector<uint8_t> body;

    // Tree already parsed by the fetcher, if it produced one
    std::shared_ptr<const dom::Document> document;

    // Declared media type: Content-Type without parameters, trimmed and
    // lowercased. nullopt when the header is absent or blank.
    std::optional<std::string> content_type() const;

    // Body as text. gzip / deflate bodies (Content-Encoding, or a gzip
    // stream such as an .svgz file) are inflated first.
    std::string body_as_string() const;
};

} // namespace quire::net
