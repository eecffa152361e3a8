#pragma once
#include <quire/dom/node.h>

namespace quire::dom {

class Text : public Node {
public:
    explicit Text(const std::string& data);
    const std::string& data() const { return data_; }
    void set_data(const std::string& data);
    std::string text_content() const override;
private:
    std::string data_;
};

} // namespace quire::dom
