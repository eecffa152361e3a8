#include <quire/dom/document.h>

namespace quire::dom {

Document::Document() : Node(NodeType::Document) {}

Element* Document::document_element() const {
    return first_element_child();
}

std::unique_ptr<Element> Document::create_element(const std::string& tag, const std::string& ns) {
    return std::make_unique<Element>(tag, ns);
}

std::unique_ptr<Text> Document::create_text_node(const std::string& data) {
    return std::make_unique<Text>(data);
}

std::unique_ptr<Comment> Document::create_comment(const std::string& data) {
    return std::make_unique<Comment>(data);
}

std::unique_ptr<ProcessingInstruction> Document::create_processing_instruction(
    const std::string& target, const std::string& data) {
    return std::make_unique<ProcessingInstruction>(target, data);
}

Element* Document::get_element_by_id(std::string_view id) const {
    auto it = id_map_.find(std::string(id));
    if (it != id_map_.end()) {
        return it->second;
    }
    return nullptr;
}

void Document::register_id(const std::string& id, Element* element) {
    if (id.empty() || !element) return;
    id_map_.emplace(id, element);
}

std::vector<Element*> Document::get_elements_by_name(std::string_view name) const {
    auto it = name_map_.find(std::string(name));
    if (it != name_map_.end()) {
        return it->second;
    }
    return {};
}

void Document::register_name(const std::string& name, Element* element) {
    if (name.empty() || !element) return;
    name_map_[name].push_back(element);
}

} // namespace quire::dom
