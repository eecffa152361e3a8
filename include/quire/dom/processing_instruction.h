#pragma once
#include <quire/dom/node.h>

namespace quire::dom {

// <?target data?>. Only the data takes part in text and offsets.
class ProcessingInstruction : public Node {
public:
    ProcessingInstruction(const std::string& target, const std::string& data);
    const std::string& target() const { return target_; }
    const std::string& data() const { return data_; }
    std::string text_content() const override;
private:
    std::string target_;
    std::string data_;
};

} // namespace quire::dom
