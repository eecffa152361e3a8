#include <quire/markup/libxml_parser.h>
#include <quire/core/config.h>

#include <libxml/HTMLparser.h>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

#include <climits>
#include <string>

namespace quire::markup {

namespace config = quire::core::config;

namespace {

constexpr const char kModule[] = "markup";

using XmlDocPtr = std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)>;
using XmlCtxtPtr = std::unique_ptr<xmlParserCtxt, decltype(&xmlFreeParserCtxt)>;
using HtmlCtxtPtr = std::unique_ptr<htmlParserCtxt, decltype(&htmlFreeParserCtxt)>;

constexpr int kXmlOptions = XML_PARSE_NONET | XML_PARSE_NOCDATA | XML_PARSE_RECOVER |
                            XML_PARSE_NOERROR | XML_PARSE_NOWARNING;
constexpr int kHtmlOptions = HTML_PARSE_NONET | HTML_PARSE_RECOVER |
                             HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING;

std::string to_string(const xmlChar* s) {
    return s ? std::string(reinterpret_cast<const char*>(s)) : std::string();
}

std::string qualified_name(const xmlChar* prefix, const xmlChar* name) {
    if (prefix && *prefix) {
        return to_string(prefix) + ":" + to_string(name);
    }
    return to_string(name);
}

std::string attribute_value(xmlNode* owner, xmlAttr* attr) {
    xmlChar* value = xmlNodeListGetString(owner->doc, attr->children, 1);
    if (!value) return {};
    std::string result = to_string(value);
    xmlFree(value);
    return result;
}

// Appends text to `parent`, extending a trailing Text child so that a
// contiguous run stays a single node.
void append_text(dom::Node& parent, dom::Document& document, const std::string& data) {
    if (data.empty()) return;
    dom::Node* last = parent.last_child();
    if (last && last->node_type() == dom::NodeType::Text) {
        auto* text = static_cast<dom::Text*>(last);
        text->set_data(text->data() + data);
        return;
    }
    parent.append_child(document.create_text_node(data));
}

struct BuildContext {
    dom::Document& document;
    bool html = false;
};

void convert_children(xmlNode* first, dom::Node& parent, BuildContext& ctx,
                      const std::string& inherited_ns);

void convert_element(xmlNode* node, dom::Node& parent, BuildContext& ctx,
                     const std::string& inherited_ns) {
    std::string ns;
    std::string tag;
    if (ctx.html) {
        tag = to_string(node->name);
        ns = inherited_ns;
        if (tag == "svg") {
            ns = config::kSvgNamespace;
        } else if (tag == "math") {
            ns = config::kMathMlNamespace;
        }
    } else {
        tag = qualified_name(node->ns ? node->ns->prefix : nullptr, node->name);
        ns = node->ns ? to_string(node->ns->href) : std::string();
    }

    auto element = ctx.document.create_element(tag, ns);
    dom::Element* element_ptr = element.get();

    for (xmlAttr* attr = node->properties; attr != nullptr; attr = attr->next) {
        std::string value = attribute_value(node, attr);
        if (!ctx.html && attr->ns) {
            element_ptr->set_attribute_ns(to_string(attr->ns->href),
                                          qualified_name(attr->ns->prefix, attr->name), value);
        } else {
            element_ptr->set_attribute(to_string(attr->name), value);
        }
    }

    parent.append_child(std::move(element));

    if (!element_ptr->id().empty()) {
        ctx.document.register_id(element_ptr->id(), element_ptr);
    }
    if (!ctx.html) {
        if (auto xml_id = element_ptr->get_attribute_ns(config::kXmlNamespace, "id")) {
            ctx.document.register_id(*xml_id, element_ptr);
        }
    } else if (auto name = element_ptr->get_attribute("name")) {
        ctx.document.register_name(*name, element_ptr);
    }

    convert_children(node->children, *element_ptr, ctx, ns);
}

void convert_children(xmlNode* first, dom::Node& parent, BuildContext& ctx,
                      const std::string& inherited_ns) {
    for (xmlNode* cur = first; cur != nullptr; cur = cur->next) {
        switch (cur->type) {
            case XML_ELEMENT_NODE:
                convert_element(cur, parent, ctx, inherited_ns);
                break;
            case XML_TEXT_NODE:
            case XML_CDATA_SECTION_NODE:
                append_text(parent, ctx.document, to_string(cur->content));
                break;
            case XML_ENTITY_REF_NODE: {
                xmlChar* content = xmlNodeGetContent(cur);
                if (content) {
                    append_text(parent, ctx.document, to_string(content));
                    xmlFree(content);
                }
                break;
            }
            case XML_COMMENT_NODE:
                parent.append_child(ctx.document.create_comment(to_string(cur->content)));
                break;
            case XML_PI_NODE:
                if (ctx.html) {
                    // HTML has no PIs: "<?x y?>" is the bogus comment "?x y?"
                    std::string data = "?" + to_string(cur->name);
                    if (cur->content && *cur->content) {
                        data += " " + to_string(cur->content);
                    }
                    if (data.back() != '?') {
                        data += '?';
                    }
                    parent.append_child(ctx.document.create_comment(data));
                } else {
                    parent.append_child(ctx.document.create_processing_instruction(
                        to_string(cur->name), to_string(cur->content)));
                }
                break;
            default:
                // DTD, XInclude markers
                break;
        }
    }
}

std::string describe_error(xmlParserCtxt* ctxt) {
    const xmlError* err = xmlCtxtGetLastError(ctxt);
    if (!err || !err->message) {
        return "XML Parsing Error";
    }
    std::string message = err->message;
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
        message.pop_back();
    }
    return "XML Parsing Error: " + message + " (line " + std::to_string(err->line) +
           ", column " + std::to_string(err->int2) + ")";
}

void attach_parser_error(dom::Document& document, const std::string& message) {
    auto sentinel = document.create_element(config::kParserErrorTag, config::kParserErrorNamespace);
    sentinel->append_child(document.create_text_node(message));

    if (dom::Element* root = document.document_element()) {
        root->insert_before(std::move(sentinel), root->first_child());
    } else {
        document.append_child(std::move(sentinel));
    }
}

dom::Element* find_child(dom::Element& parent, std::string_view local_name) {
    for (dom::Element* child : parent.element_children()) {
        if (child->local_name() == local_name) {
            return child;
        }
    }
    return nullptr;
}

// Every HTML document has html, head and body, whatever the input looked
// like. Returns true when something had to be added.
bool complete_html_skeleton(dom::Document& document) {
    bool changed = false;
    dom::Element* root = document.document_element();
    if (!root) {
        document.append_child(document.create_element("html", config::kXhtmlNamespace));
        root = document.document_element();
        changed = true;
    }
    if (root->local_name() != "html") {
        return changed;
    }
    if (!find_child(*root, "head")) {
        root->insert_before(document.create_element("head", config::kXhtmlNamespace),
                            root->first_child());
        changed = true;
    }
    if (!find_child(*root, "body") && !find_child(*root, "frameset")) {
        root->append_child(document.create_element("body", config::kXhtmlNamespace));
        changed = true;
    }
    return changed;
}

void check_size(std::string_view text) {
    if (text.size() > static_cast<size_t>(INT_MAX)) {
        throw ParseError("document exceeds the parser size limit");
    }
}

} // namespace

bool is_parser_error(const dom::Element& element) {
    return element.local_name() == config::kParserErrorTag;
}

LibxmlParser::LibxmlParser(core::DiagnosticEmitter* diagnostics)
    : diagnostics_(diagnostics) {
    xmlInitParser();
}

std::unique_ptr<dom::Document> LibxmlParser::parse_from_string(std::string_view text,
                                                               MediaType type) {
    check_size(text);
    if (is_html(type)) {
        return parse_html(text);
    }
    return parse_xml(text, type);
}

std::unique_ptr<dom::Document> LibxmlParser::parse_xml(std::string_view text, MediaType type) {
    XmlCtxtPtr ctxt(xmlNewParserCtxt(), &xmlFreeParserCtxt);
    if (!ctxt) {
        throw ParseError("unable to allocate an XML parser context");
    }

    XmlDocPtr xdoc(xmlCtxtReadMemory(ctxt.get(), text.data(), static_cast<int>(text.size()),
                                     nullptr, nullptr, kXmlOptions),
                   &xmlFreeDoc);
    const bool well_formed = xdoc && ctxt->wellFormed && ctxt->nsWellFormed;

    auto document = std::make_unique<dom::Document>();
    document->set_content_type(media_type_name(type));

    BuildContext build{*document, false};
    if (xdoc) {
        convert_children(xdoc->children, *document, build, std::string());
    }
    if (!well_formed) {
        std::string message = describe_error(ctxt.get());
        if (diagnostics_) {
            diagnostics_->warning(kModule, "xml",
                                  std::string(media_type_name(type)) + ": " + message);
        }
        attach_parser_error(*document, message);
    }
    return document;
}

std::unique_ptr<dom::Document> LibxmlParser::parse_html(std::string_view text) {
    HtmlCtxtPtr ctxt(htmlNewParserCtxt(), &htmlFreeParserCtxt);
    if (!ctxt) {
        throw ParseError("unable to allocate an HTML parser context");
    }

    auto document = std::make_unique<dom::Document>();
    document->set_content_type(media_type_name(MediaType::TextHtml));

    if (!text.empty()) {
        XmlDocPtr xdoc(htmlCtxtReadMemory(ctxt.get(), text.data(), static_cast<int>(text.size()),
                                          nullptr, "UTF-8", kHtmlOptions),
                       &xmlFreeDoc);
        if (xdoc) {
            BuildContext build{*document, true};
            convert_children(xdoc->children, *document, build, config::kXhtmlNamespace);
        }
    }

    if (complete_html_skeleton(*document) && diagnostics_) {
        diagnostics_->info(kModule, "html", "synthesized missing html, head or body");
    }
    return document;
}

} // namespace quire::markup
