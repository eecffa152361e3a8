#include <quire/dom/comment.h>

namespace quire::dom {

Comment::Comment(const std::string& data)
    : Node(NodeType::Comment)
    , data_(data) {}

void Comment::set_data(const std::string& data) {
    data_ = data;
}

std::string Comment::text_content() const {
    return data_;
}

} // namespace quire::dom
