#include "Instruction.h"

namespace StackEvo {

std::string formatInstruction(const Instruction& instruction)
{
    std::string text = toString(instruction.opcode);
    if (instruction.operand.has_value()) {
        text += " " + std::to_string(instruction.operand.value());
    }
    return text;
}

} // namespace StackEvo
