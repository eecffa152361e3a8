#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace quire::dom {

class Element;

enum class NodeType {
    Element, Text, Comment, ProcessingInstruction, Document
};

class Node {
public:
    explicit Node(NodeType type);
    virtual ~Node();

    // Non-copyable
    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    NodeType node_type() const { return type_; }
    bool is_element() const { return type_ == NodeType::Element; }
    Node* parent() const { return parent_; }
    Node* first_child() const;
    Node* last_child() const;
    Node* next_sibling() const { return next_sibling_; }
    Node* previous_sibling() const { return prev_sibling_; }

    // Element-only navigation
    Element* parent_element() const;
    Element* first_element_child() const;
    Element* next_element_sibling() const;
    std::vector<Element*> element_children() const;

    // Tree construction
    Node& append_child(std::unique_ptr<Node> child);
    Node& insert_before(std::unique_ptr<Node> child, Node* reference);

    size_t child_count() const;

    // Iterate children
    template<typename Fn>
    void for_each_child(Fn&& fn) const {
        for (auto& child : children_) {
            fn(*child);
        }
    }

    // Text content (recursive)
    virtual std::string text_content() const;

protected:
    NodeType type_;
    Node* parent_ = nullptr;
    Node* next_sibling_ = nullptr;
    Node* prev_sibling_ = nullptr;
    std::vector<std::unique_ptr<Node>> children_;
};

} // namespace quire::dom
