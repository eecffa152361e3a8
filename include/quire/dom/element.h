#pragma once
#include <quire/dom/node.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quire::dom {

struct Attribute {
    std::string name;           // qualified name as written, e.g. "xml:id"
    std::string value;
    std::string namespace_uri;  // empty when the attribute has no namespace

    std::string_view local_name() const;
};

class Element : public Node {
public:
    explicit Element(const std::string& tag_name, const std::string& ns = "");

    // Qualified name as written ("svg:rect"); local_name() drops the prefix
    const std::string& tag_name() const { return tag_name_; }
    std::string_view local_name() const;
    std::string_view prefix() const;
    const std::string& namespace_uri() const { return namespace_uri_; }

    // Attributes by qualified name
    std::optional<std::string> get_attribute(std::string_view name) const;
    bool has_attribute(std::string_view name) const;
    void set_attribute(const std::string& name, const std::string& value);

    // Attributes by (namespace, local name)
    std::optional<std::string> get_attribute_ns(std::string_view ns, std::string_view local_name) const;
    void set_attribute_ns(const std::string& ns, const std::string& name, const std::string& value);

    const std::vector<Attribute>& attributes() const { return attributes_; }

    // Value of the plain "id" attribute, empty when absent
    const std::string& id() const { return id_; }

    std::string text_content() const override;

private:
    std::string tag_name_;
    std::string namespace_uri_;
    std::vector<Attribute> attributes_;
    std::string id_;

    void on_attribute_changed(const Attribute& attr);
};

} // namespace quire::dom
