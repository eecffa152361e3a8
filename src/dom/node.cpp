#include <quire/dom/node.h>
#include <quire/dom/element.h>
#include <algorithm>
#include <stdexcept>

namespace quire::dom {

Node::Node(NodeType type) : type_(type) {}

Node::~Node() = default;

Node* Node::first_child() const {
    if (children_.empty()) return nullptr;
    return children_.front().get();
}

Node* Node::last_child() const {
    if (children_.empty()) return nullptr;
    return children_.back().get();
}

Element* Node::parent_element() const {
    if (parent_ && parent_->is_element()) {
        return static_cast<Element*>(parent_);
    }
    return nullptr;
}

Element* Node::first_element_child() const {
    for (auto& child : children_) {
        if (child->is_element()) {
            return static_cast<Element*>(child.get());
        }
    }
    return nullptr;
}

Element* Node::next_element_sibling() const {
    for (Node* n = next_sibling_; n; n = n->next_sibling_) {
        if (n->is_element()) {
            return static_cast<Element*>(n);
        }
    }
    return nullptr;
}

std::vector<Element*> Node::element_children() const {
    std::vector<Element*> result;
    for (auto& child : children_) {
        if (child->is_element()) {
            result.push_back(static_cast<Element*>(child.get()));
        }
    }
    return result;
}

Node& Node::append_child(std::unique_ptr<Node> child) {
    return insert_before(std::move(child), nullptr);
}

Node& Node::insert_before(std::unique_ptr<Node> child, Node* reference) {
    if (!child) {
        throw std::invalid_argument("insert_before: null child");
    }

    // If reference is null, append at the end
    if (reference == nullptr) {
        Node* new_child = child.get();

        // Set up sibling links
        if (!children_.empty()) {
            Node* old_last = children_.back().get();
            old_last->next_sibling_ = new_child;
            new_child->prev_sibling_ = old_last;
        }
        new_child->next_sibling_ = nullptr;
        new_child->parent_ = this;

        children_.push_back(std::move(child));
        return *new_child;
    }

    // Find the reference child's position
    auto it = std::find_if(children_.begin(), children_.end(),
        [reference](const std::unique_ptr<Node>& c) {
            return c.get() == reference;
        });
    if (it == children_.end()) {
        throw std::invalid_argument("insert_before: reference node is not a child of this node");
    }

    Node* new_child = child.get();
    new_child->parent_ = this;

    // Set up sibling links
    Node* prev = reference->prev_sibling_;
    new_child->prev_sibling_ = prev;
    new_child->next_sibling_ = reference;
    reference->prev_sibling_ = new_child;
    if (prev) {
        prev->next_sibling_ = new_child;
    }

    children_.insert(it, std::move(child));
    return *new_child;
}

size_t Node::child_count() const {
    return children_.size();
}

std::string Node::text_content() const {
    std::string result;
    for (auto& child : children_) {
        if (child->node_type() == NodeType::Comment ||
            child->node_type() == NodeType::ProcessingInstruction) continue;
        result += child->text_content();
    }
    return result;
}

} // namespace quire::dom
