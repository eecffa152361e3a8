#include <quire/xmldoc/node_list.h>
#include <quire/dom/element.h>

namespace quire::xmldoc {

Predicate::Predicate(Fn fn) : fn_(std::move(fn)) {}

Predicate Predicate::with_attribute(const std::string& name, const std::string& value) const {
    Fn self = fn_;
    return Predicate([self, name, value](const dom::Node& node) {
        if (!self(node) || !node.is_element()) {
            return false;
        }
        auto attr = static_cast<const dom::Element&>(node).get_attribute(name);
        return attr && *attr == value;
    });
}

Predicate Predicate::with_child(const std::string& name,
                                std::optional<Predicate> child_predicate) const {
    Fn self = fn_;
    return Predicate([self, name, child_predicate](const dom::Node& node) {
        if (!self(node)) {
            return false;
        }
        NodeList list = NodeList({&node}).child(name);
        if (child_predicate) {
            list = list.predicate(*child_predicate);
        }
        return !list.empty();
    });
}

const Predicate& any_node() {
    static const Predicate predicate([](const dom::Node&) { return true; });
    return predicate;
}

NodeList::NodeList(std::vector<const dom::Node*> nodes) : nodes_(std::move(nodes)) {}

NodeList NodeList::predicate(const Predicate& pr) const {
    std::vector<const dom::Node*> result;
    for (const dom::Node* node : nodes_) {
        if (pr.check(*node)) {
            result.push_back(node);
        }
    }
    return NodeList(std::move(result));
}

NodeList NodeList::for_each_node(
    const std::function<void(const dom::Node&, const Emit&)>& fn) const {
    std::vector<const dom::Node*> result;
    const Emit emit = [&result](const dom::Node* node) {
        if (node) {
            result.push_back(node);
        }
    };
    for (const dom::Node* node : nodes_) {
        fn(*node, emit);
    }
    return NodeList(std::move(result));
}

NodeList NodeList::child(std::string_view tag) const {
    return for_each_node([tag](const dom::Node& node, const Emit& emit) {
        node.for_each_child([tag, &emit](const dom::Node& c) {
            if (c.is_element() && static_cast<const dom::Element&>(c).local_name() == tag) {
                emit(&c);
            }
        });
    });
}

NodeList NodeList::child_elements() const {
    return for_each_node([](const dom::Node& node, const Emit& emit) {
        node.for_each_child([&emit](const dom::Node& c) {
            if (c.is_element()) {
                emit(&c);
            }
        });
    });
}

std::vector<std::string> NodeList::attribute(std::string_view name) const {
    return for_each_non_null([name](const dom::Node& node) -> std::optional<std::string> {
        if (!node.is_element()) {
            return std::nullopt;
        }
        return static_cast<const dom::Element&>(node).get_attribute(name);
    });
}

std::vector<std::string> NodeList::text_content() const {
    return for_each([](const dom::Node& node) { return node.text_content(); });
}

} // namespace quire::xmldoc
