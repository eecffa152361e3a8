#pragma once
#include <quire/dom/node.h>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace quire::xmldoc {

// Boolean test over a node. with_*() return a new predicate that also
// requires the extra condition.
class Predicate {
public:
    using Fn = std::function<bool(const dom::Node&)>;

    explicit Predicate(Fn fn);

    bool check(const dom::Node& node) const { return fn_(node); }

    // Node is an element whose attribute `name` equals `value`
    Predicate with_attribute(const std::string& name, const std::string& value) const;

    // Node has a child element named `name` (matching `child_predicate`, if given)
    Predicate with_child(const std::string& name,
                         std::optional<Predicate> child_predicate = std::nullopt) const;

private:
    Fn fn_;
};

// Matches every node
const Predicate& any_node();

// Immutable list of nodes with chainable structural navigation. The nodes
// are borrowed; the tree must outlive the list.
class NodeList {
public:
    using Emit = std::function<void(const dom::Node*)>;

    NodeList() = default;
    explicit NodeList(std::vector<const dom::Node*> nodes);

    const std::vector<const dom::Node*>& nodes() const { return nodes_; }
    size_t size() const { return nodes_.size(); }
    bool empty() const { return nodes_.empty(); }

    NodeList predicate(const Predicate& pr) const;

    // Calls fn(node, emit) per node; the result holds everything emitted
    NodeList for_each_node(const std::function<void(const dom::Node&, const Emit&)>& fn) const;

    template<typename Fn>
    auto for_each(Fn&& fn) const {
        using T = std::invoke_result_t<Fn, const dom::Node&>;
        std::vector<T> result;
        result.reserve(nodes_.size());
        for (const dom::Node* node : nodes_) {
            result.push_back(fn(*node));
        }
        return result;
    }

    // fn returns std::optional<T>; empty results are dropped
    template<typename Fn>
    auto for_each_non_null(Fn&& fn) const {
        using T = typename std::invoke_result_t<Fn, const dom::Node&>::value_type;
        std::vector<T> result;
        for (const dom::Node* node : nodes_) {
            auto value = fn(*node);
            if (value) {
                result.push_back(std::move(*value));
            }
        }
        return result;
    }

    // Child elements with the given local name
    NodeList child(std::string_view tag) const;
    NodeList child_elements() const;

    // Attribute values of element nodes; absent attributes are skipped
    std::vector<std::string> attribute(std::string_view name) const;
    std::vector<std::string> text_content() const;

private:
    std::vector<const dom::Node*> nodes_;
};

} // namespace quire::xmldoc
