#include <quire/xmldoc/content_resolver.h>
#include <algorithm>
#include <cctype>
#include <string>

namespace quire::xmldoc {

using markup::MediaType;

namespace {

constexpr const char kModule[] = "xmldoc";

struct ExtensionRule {
    const char* extension;
    MediaType type;
};

constexpr ExtensionRule kExtensionRules[] = {
    {"html", MediaType::TextHtml},
    {"htm", MediaType::TextHtml},
    {"xhtml", MediaType::ApplicationXhtmlXml},
    {"xht", MediaType::ApplicationXhtmlXml},
    {"svg", MediaType::ImageSvgXml},
    {"svgz", MediaType::ImageSvgXml},
    {"opf", MediaType::ApplicationXml},
    {"xml", MediaType::ApplicationXml},
};

std::string lowercase(std::string_view value) {
    std::string result(value);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool ends_with(std::string_view value, std::string_view suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Extension of the last path segment, without query or fragment
std::string url_extension(std::string_view url) {
    auto cut = url.find_first_of("?#");
    if (cut != std::string_view::npos) {
        url = url.substr(0, cut);
    }
    auto dot = url.rfind('.');
    if (dot == std::string_view::npos || dot + 1 == url.size()) {
        return {};
    }
    std::string_view extension = url.substr(dot + 1);
    if (extension.find('/') != std::string_view::npos) {
        return {};
    }
    return lowercase(extension);
}

void note(core::DiagnosticEmitter* diagnostics, core::Severity severity,
          const std::string& stage, const std::string& message) {
    if (diagnostics) {
        diagnostics->emit(severity, kModule, stage, message);
    }
}

} // namespace

std::optional<MediaType> declared_content_type(const net::Response& response) {
    auto declared = response.content_type();
    if (!declared) {
        return std::nullopt;
    }
    if (auto exact = markup::media_type_from_name(*declared)) {
        return exact;
    }
    if (ends_with(*declared, "+xml")) {
        return MediaType::ApplicationXml;
    }
    return std::nullopt;
}

std::optional<MediaType> resolve_content_type(const net::Response& response) {
    if (auto declared = declared_content_type(response)) {
        return declared;
    }
    std::string extension = url_extension(response.url);
    if (extension.empty()) {
        return std::nullopt;
    }
    for (const auto& rule : kExtensionRules) {
        if (extension == rule.extension) {
            return rule.type;
        }
    }
    return std::nullopt;
}

std::unique_ptr<dom::Document> parse_and_return_null_if_error(
    std::string_view text, MediaType type, markup::MarkupParser& parser,
    core::DiagnosticEmitter* diagnostics) {
    const std::string type_name = markup::media_type_name(type);

    std::unique_ptr<dom::Document> document;
    try {
        document = parser.parse_from_string(text, type);
    } catch (const markup::ParseError& e) {
        note(diagnostics, core::Severity::Warning, "parse",
             "parsing as " + type_name + " failed: " + e.what());
        return nullptr;
    }

    const dom::Element* root = document ? document->document_element() : nullptr;
    if (!root) {
        note(diagnostics, core::Severity::Warning, "parse",
             "parsing as " + type_name + " produced no document element");
        return nullptr;
    }
    if (markup::is_parser_error(*root)) {
        note(diagnostics, core::Severity::Warning, "parse",
             "parsing as " + type_name + " failed: " + root->text_content());
        return nullptr;
    }
    for (const dom::Element* child = root->first_element_child(); child;
         child = child->next_element_sibling()) {
        if (markup::is_parser_error(*child)) {
            note(diagnostics, core::Severity::Warning, "parse",
                 "parsing as " + type_name + " failed: " + child->text_content());
            return nullptr;
        }
    }
    return document;
}

std::shared_ptr<DocumentHolder> parse_xml_resource(const net::Response& response,
                                                   markup::MarkupParser& parser,
                                                   core::DiagnosticEmitter* diagnostics) {
    if (response.document) {
        if (!response.document->document_element()) {
            note(diagnostics, core::Severity::Warning, "resolve",
                 "supplied document for " + response.url + " has no root element");
            return nullptr;
        }
        return std::make_shared<DocumentHolder>(response.url, response.document);
    }

    const std::string text = response.body_as_string();
    if (text.empty()) {
        note(diagnostics, core::Severity::Warning, "resolve",
             "empty response body for " + response.url);
        return nullptr;
    }

    const auto declared = declared_content_type(response);
    const auto content_type = resolve_content_type(response);
    note(diagnostics, core::Severity::Info, "resolve",
         response.url + " resolved to " +
         (content_type ? markup::media_type_name(*content_type) : "unknown") +
         (declared ? " (declared)" : ""));

    auto document = parse_and_return_null_if_error(
        text, content_type.value_or(MediaType::ApplicationXml), parser, diagnostics);

    // Without a declared type the root element decides between HTML, SVG
    // and generic XML
    if (document && !declared) {
        const dom::Element* root = document->document_element();
        const std::string local_name = lowercase(root->local_name());
        if (local_name == "html" && root->namespace_uri().empty()) {
            note(diagnostics, core::Severity::Info, "sniff",
                 "html root without namespace, re-parsing " + response.url + " as text/html");
            document = parse_and_return_null_if_error(text, MediaType::TextHtml, parser,
                                                      diagnostics);
        } else if (local_name == "svg" &&
                   document->content_type() != markup::media_type_name(MediaType::ImageSvgXml)) {
            note(diagnostics, core::Severity::Info, "sniff",
                 "svg root, re-parsing " + response.url + " as image/svg+xml");
            document = parse_and_return_null_if_error(text, MediaType::ImageSvgXml, parser,
                                                      diagnostics);
        }
    }

    if (!document) {
        note(diagnostics, core::Severity::Info, "fallback",
             "falling back to text/html for " + response.url);
        document = parse_and_return_null_if_error(text, MediaType::TextHtml, parser, diagnostics);
    }

    if (!document) {
        note(diagnostics, core::Severity::Warning, "resolve",
             "no usable document for " + response.url);
        return nullptr;
    }
    return std::make_shared<DocumentHolder>(response.url,
                                            std::shared_ptr<const dom::Document>(std::move(document)));
}

} // namespace quire::xmldoc
