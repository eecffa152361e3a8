#pragma once
#include <quire/dom/node.h>

namespace quire::dom {

class Comment : public Node {
public:
    explicit Comment(const std::string& data);
    const std::string& data() const { return data_; }
    void set_data(const std::string& data);
    std::string text_content() const override;
private:
    std::string data_;
};

} // namespace quire::dom
