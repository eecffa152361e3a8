#include <quire/dom/element.h>
#include <algorithm>

namespace quire::dom {

namespace {

std::string_view after_colon(std::string_view qname) {
    auto colon = qname.find(':');
    if (colon == std::string_view::npos) return qname;
    return qname.substr(colon + 1);
}

} // namespace

std::string_view Attribute::local_name() const {
    return after_colon(name);
}

Element::Element(const std::string& tag_name, const std::string& ns)
    : Node(NodeType::Element)
    , tag_name_(tag_name)
    , namespace_uri_(ns) {}

std::string_view Element::local_name() const {
    return after_colon(tag_name_);
}

std::string_view Element::prefix() const {
    std::string_view qname = tag_name_;
    auto colon = qname.find(':');
    if (colon == std::string_view::npos) return {};
    return qname.substr(0, colon);
}

std::optional<std::string> Element::get_attribute(std::string_view name) const {
    for (auto& attr : attributes_) {
        if (attr.name == name) {
            return attr.value;
        }
    }
    return std::nullopt;
}

bool Element::has_attribute(std::string_view name) const {
    return std::any_of(attributes_.begin(), attributes_.end(),
        [name](const Attribute& attr) { return attr.name == name; });
}

void Element::set_attribute(const std::string& name, const std::string& value) {
    for (auto& attr : attributes_) {
        if (attr.name == name) {
            attr.value = value;
            on_attribute_changed(attr);
            return;
        }
    }
    attributes_.push_back({name, value, ""});
    on_attribute_changed(attributes_.back());
}

std::optional<std::string> Element::get_attribute_ns(std::string_view ns,
                                                     std::string_view local_name) const {
    for (auto& attr : attributes_) {
        if (attr.namespace_uri == ns && attr.local_name() == local_name) {
            return attr.value;
        }
    }
    return std::nullopt;
}

void Element::set_attribute_ns(const std::string& ns, const std::string& name,
                               const std::string& value) {
    std::string_view local = after_colon(name);
    for (auto& attr : attributes_) {
        if (attr.namespace_uri == ns && attr.local_name() == local) {
            attr.name = name;
            attr.value = value;
            on_attribute_changed(attr);
            return;
        }
    }
    attributes_.push_back({name, value, ns});
    on_attribute_changed(attributes_.back());
}

std::string Element::text_content() const {
    return Node::text_content();
}

void Element::on_attribute_changed(const Attribute& attr) {
    if (attr.namespace_uri.empty() && attr.name == "id") {
        id_ = attr.value;
    }
}

} // namespace quire::dom
