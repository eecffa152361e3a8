#include <quire/xmldoc/document_holder.h>
#include <quire/core/config.h>
#include <algorithm>
#include <vector>

namespace quire::xmldoc {

namespace config = quire::core::config;

namespace {

// Text of a non-element node as it counts toward offsets
std::string_view character_data(const dom::Node& node) {
    switch (node.node_type()) {
        case dom::NodeType::Text:
            return static_cast<const dom::Text&>(node).data();
        case dom::NodeType::Comment:
            return static_cast<const dom::Comment&>(node).data();
        case dom::NodeType::ProcessingInstruction:
            return static_cast<const dom::ProcessingInstruction&>(node).data();
        default:
            return {};
    }
}

// Same set as the ECMAScript \s class: ASCII whitespace, NBSP, the Unicode
// space separators, line/paragraph separators and the BOM
bool is_whitespace(char32_t c) {
    switch (c) {
        case 0x09: case 0x0A: case 0x0B: case 0x0C: case 0x0D: case 0x20:
        case 0xA0: case 0x1680: case 0x2028: case 0x2029: case 0x202F:
        case 0x205F: case 0x3000: case 0xFEFF:
            return true;
        default:
            return c >= 0x2000 && c <= 0x200A;
    }
}

// Decodes UTF-8; a malformed sequence counts as a non-space character
bool is_all_whitespace(std::string_view s) {
    size_t i = 0;
    while (i < s.size()) {
        const auto lead = static_cast<unsigned char>(s[i]);
        size_t extra = 0;
        char32_t c = lead;
        if (lead >= 0xF0) {
            extra = 3;
            c = lead & 0x07;
        } else if (lead >= 0xE0) {
            extra = 2;
            c = lead & 0x0F;
        } else if (lead >= 0xC0) {
            extra = 1;
            c = lead & 0x1F;
        } else if (lead >= 0x80) {
            return false;
        }
        if (i + extra >= s.size()) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            const auto cont = static_cast<unsigned char>(s[i + k]);
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
            c = (c << 6) | (cont & 0x3F);
        }
        if (!is_whitespace(c)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

const dom::Element& require_element(const dom::Node* node) {
    if (!node || !node->is_element()) {
        throw OffsetTraversalError("offset anchor is not an element of this document");
    }
    return static_cast<const dom::Element&>(*node);
}

} // namespace

size_t character_length(std::string_view text) {
    size_t length = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++length;
            // Four-byte sequences are surrogate pairs in UTF-16
            if (c >= 0xF0) {
                ++length;
            }
        }
    }
    return length;
}

DocumentHolder::DocumentHolder(std::string url, std::shared_ptr<const dom::Document> document)
    : url_(std::move(url))
    , document_(std::move(document)) {
    if (!document_ || !document_->document_element()) {
        throw std::invalid_argument("DocumentHolder requires a document with a root element");
    }
    root_ = document_->document_element();

    if (root_->namespace_uri() == config::kXhtmlNamespace) {
        for (const dom::Element* child : root_->element_children()) {
            if (child->namespace_uri() != config::kXhtmlNamespace) {
                continue;
            }
            if (child->local_name() == "head") {
                head_ = child;
            } else if (child->local_name() == "body") {
                body_ = child;
            }
        }
        lang_ = root_->get_attribute("lang");
    }

    last_visited_ = root_;
    element_offsets_.emplace(root_, 0);
}

NodeList DocumentHolder::doc() const {
    return NodeList({document_.get()});
}

size_t DocumentHolder::get_element_offset(const dom::Element& element) {
    std::lock_guard lock(mutex_);
    return element_offset_locked(element);
}

size_t DocumentHolder::get_node_offset(const dom::Node& node, size_t offset_in_node, bool after) {
    std::lock_guard lock(mutex_);
    return node_offset_locked(node, offset_in_node, after);
}

size_t DocumentHolder::get_total_offset() {
    std::lock_guard lock(mutex_);
    if (!total_offset_) {
        total_offset_ = node_offset_locked(*root_, 0, true);
    }
    return *total_offset_;
}

size_t DocumentHolder::element_offset_locked(const dom::Element& element) {
    auto cached = element_offsets_.find(&element);
    if (cached != element_offsets_.end()) {
        return cached->second;
    }

    size_t offset = last_offset_;
    const dom::Node* last = last_visited_;
    while (last != &element) {
        const dom::Node* next = last->first_child();
        if (!next) {
            while (true) {
                next = last->next_sibling();
                if (next) {
                    break;
                }
                last = last->parent();
                if (!last) {
                    throw OffsetTraversalError(
                        "element is not reachable from the offset cursor of " + url_);
                }
            }
        }
        last = next;
        if (next->is_element()) {
            element_offsets_.emplace(static_cast<const dom::Element*>(next), offset);
            ++offset;
        } else {
            offset += character_length(character_data(*next));
        }
    }
    last_offset_ = offset;
    last_visited_ = &element;
    return offset - 1;
}

size_t DocumentHolder::node_offset_locked(const dom::Node& src, size_t offset_in_node, bool after) {
    size_t extra = 0;
    const dom::Node* node = &src;
    if (node->is_element()) {
        if (!after) {
            return element_offset_locked(static_cast<const dom::Element&>(*node));
        }
    } else {
        // Count back from the character to the nearest element boundary
        extra = offset_in_node;
        const dom::Node* prev = node->previous_sibling();
        if (!prev) {
            return element_offset_locked(require_element(node->parent())) + extra + 1;
        }
        node = prev;
    }

    while (true) {
        while (node->last_child()) {
            node = node->last_child();
        }
        if (node->is_element()) {
            // Empty element
            break;
        }
        extra += character_length(character_data(*node));
        const dom::Node* prev = node->previous_sibling();
        if (!prev) {
            node = node->parent();
            break;
        }
        node = prev;
    }
    extra += 1;
    return element_offset_locked(require_element(node)) + extra;
}

const dom::Node* DocumentHolder::get_node_by_offset(size_t offset) {
    std::lock_guard lock(mutex_);

    // Descend to the last element whose offset does not exceed `offset`
    const dom::Element* element = root_;
    size_t element_offset = 0;
    while (true) {
        element_offset = element_offset_locked(*element);
        if (element_offset >= offset) {
            return element;
        }
        std::vector<dom::Element*> children = element->element_children();
        auto first_after = std::partition_point(children.begin(), children.end(),
            [this, offset](const dom::Element* child) {
                return element_offset_locked(*child) <= offset;
            });
        if (first_after == children.begin()) {
            break;
        }
        element = *(first_after - 1);
    }

    // Walk the text that follows the element up to the next element
    size_t node_offset = element_offset + 1;
    const dom::Node* node = element;
    const dom::Node* next = node->first_child() ? node->first_child() : node->next_sibling();
    const dom::Node* last_good = nullptr;
    while (true) {
        if (next) {
            if (next->is_element()) {
                break;
            }
            node = next;
            last_good = node;
            std::string_view data = character_data(*next);
            node_offset += character_length(data);
            if (node_offset > offset && !is_all_whitespace(data)) {
                break;
            }
        } else {
            node = node->parent();
            if (!node) {
                break;
            }
        }
        next = node->next_sibling();
    }

    // Whitespace right before an element belongs to that element
    if (next && last_good && is_all_whitespace(character_data(*last_good))) {
        last_good = next;
    }
    return last_good ? last_good : element;
}

const dom::Element* DocumentHolder::get_element(std::string_view reference) {
    auto hash = reference.find('#');
    if (hash == std::string_view::npos || hash + 1 == reference.size()) {
        return nullptr;
    }
    std::string_view url = reference.substr(0, hash);
    if (!url.empty() && url != url_) {
        return nullptr;
    }
    std::string id(reference.substr(hash + 1));

    if (const dom::Element* found = document_->get_element_by_id(id)) {
        return found;
    }
    auto named = document_->get_elements_by_name(id);
    if (!named.empty()) {
        return named.front();
    }

    std::lock_guard lock(mutex_);
    if (!id_index_) {
        build_id_index_locked();
    }
    auto it = id_index_->find(id);
    return it != id_index_->end() ? it->second : nullptr;
}

void DocumentHolder::build_id_index_locked() {
    std::unordered_map<std::string, const dom::Element*> index;
    std::vector<const dom::Element*> stack{root_};
    while (!stack.empty()) {
        const dom::Element* element = stack.back();
        stack.pop_back();

        // emplace keeps the first element seen for a key
        if (auto id = element->get_attribute("id"); id && !id->empty()) {
            index.emplace(*id, element);
        }
        if (auto xml_id = element->get_attribute_ns(config::kXmlNamespace, "id");
            xml_id && !xml_id->empty()) {
            index.emplace(*xml_id, element);
        }

        auto children = element->element_children();
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            stack.push_back(*it);
        }
    }
    id_index_ = std::move(index);
}

} // namespace quire::xmldoc
