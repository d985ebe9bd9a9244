#include "Program.h"

#include <algorithm>

namespace StackEvo {

Result<Program, MalformedProgram> Program::create(std::vector<Instruction> instructions)
{
    using ProgramResult = Result<Program, MalformedProgram>;

    const int length = static_cast<int>(instructions.size());
    for (int i = 0; i < length; ++i) {
        const Instruction& instruction = instructions[i];
        if (static_cast<int>(instruction.opcode) >= kOpcodeCount) {
            return ProgramResult::error(MalformedProgram{ "Invalid opcode", i });
        }

        const OpcodeInfo& info = opcodeInfo(instruction.opcode);

        if (info.operandKind == OperandKind::None) {
            if (instruction.operand.has_value()) {
                return ProgramResult::error(MalformedProgram{
                    std::string(info.name) + " takes no operand", i });
            }
            continue;
        }

        if (!instruction.operand.has_value()) {
            return ProgramResult::error(MalformedProgram{
                std::string(info.name) + " requires an operand", i });
        }

        const Value operand = instruction.operand.value();
        switch (info.operandKind) {
            case OperandKind::Slot:
                if (operand < 0 || operand >= kVariableSlotCount) {
                    return ProgramResult::error(MalformedProgram{
                        "Slot " + std::to_string(operand) + " outside variable bank of "
                            + std::to_string(kVariableSlotCount),
                        i });
                }
                break;
            case OperandKind::JumpTarget:
                if (operand < 0 || operand >= length) {
                    return ProgramResult::error(MalformedProgram{
                        "Jump target " + std::to_string(operand) + " outside program of length "
                            + std::to_string(length),
                        i });
                }
                break;
            case OperandKind::Literal:
            case OperandKind::None:
                break;
        }
    }

    return ProgramResult::okay(Program(std::move(instructions)));
}

bool Program::hasJumps() const
{
    return std::any_of(instructions_.begin(), instructions_.end(), [](const Instruction& in) {
        return isJump(in.opcode);
    });
}

int Program::operandCount() const
{
    return static_cast<int>(
        std::count_if(instructions_.begin(), instructions_.end(), [](const Instruction& in) {
            return in.operand.has_value();
        }));
}

} // namespace StackEvo
