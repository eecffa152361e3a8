#pragma once
#include <quire/dom/element.h>
#include <quire/dom/text.h>
#include <quire/dom/comment.h>
#include <quire/dom/processing_instruction.h>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace quire::dom {

class Document : public Node {
public:
    Document();

    // The first Element child
    Element* document_element() const;

    // Media type the document was parsed as ("application/xml", "text/html", ...)
    const std::string& content_type() const { return content_type_; }
    void set_content_type(const std::string& type) { content_type_ = type; }

    // Factory methods
    std::unique_ptr<Element> create_element(const std::string& tag, const std::string& ns = "");
    std::unique_ptr<Text> create_text_node(const std::string& data);
    std::unique_ptr<Comment> create_comment(const std::string& data);
    std::unique_ptr<ProcessingInstruction> create_processing_instruction(const std::string& target,
                                                                         const std::string& data);

    // ID-based lookup. Only ids registered by the builder are visible;
    // the first registration of an id wins.
    Element* get_element_by_id(std::string_view id) const;
    void register_id(const std::string& id, Element* element);

    // Name-based lookup, populated for HTML documents only
    std::vector<Element*> get_elements_by_name(std::string_view name) const;
    void register_name(const std::string& name, Element* element);

private:
    std::string content_type_;
    std::unordered_map<std::string, Element*> id_map_;
    std::unordered_map<std::string, std::vector<Element*>> name_map_;
};

} // namespace quire::dom
