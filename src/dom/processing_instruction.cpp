#include <quire/dom/processing_instruction.h>

namespace quire::dom {

ProcessingInstruction::ProcessingInstruction(const std::string& target, const std::string& data)
    : Node(NodeType::ProcessingInstruction)
    , target_(target)
    , data_(data) {}

std::string ProcessingInstruction::text_content() const {
    return data_;
}

} // namespace quire::dom
