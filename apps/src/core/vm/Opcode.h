#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace StackEvo {

// Bumped whenever an opcode is added. New opcodes are appended, never renumbered.
inline constexpr int kInstructionSetVersion = 1;

enum class Opcode : uint8_t {
    Push = 0,
    Pop,
    Add,
    Sub,
    Mul,
    Div,
    Dup,
    Swap,
    Load,
    Store,
    Jmp,
    Jz,
    Halt,
};

inline constexpr int kOpcodeCount = static_cast<int>(Opcode::Halt) + 1;

enum class OperandKind : uint8_t {
    None,
    Literal,
    Slot,
    JumpTarget,
};

struct OpcodeInfo {
    Opcode opcode;
    const char* name;
    OperandKind operandKind;
    int stackInputs; // Values popped (or read) before the instruction can execute.
};

const OpcodeInfo& opcodeInfo(Opcode opcode);

const std::array<Opcode, kOpcodeCount>& allOpcodes();

inline bool hasOperand(Opcode opcode)
{
    return opcodeInfo(opcode).operandKind != OperandKind::None;
}

inline bool isJump(Opcode opcode)
{
    return opcodeInfo(opcode).operandKind == OperandKind::JumpTarget;
}

std::string toString(Opcode opcode);

// Case-insensitive.
std::optional<Opcode> opcodeFromString(const std::string& name);

} // namespace StackEvo
