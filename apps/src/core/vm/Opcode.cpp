#include "Opcode.h"

#include <algorithm>
#include <cctype>

namespace StackEvo {

namespace {
constexpr std::array<OpcodeInfo, kOpcodeCount> kOpcodeTable = { {
    { Opcode::Push, "PUSH", OperandKind::Literal, 0 },
    { Opcode::Pop, "POP", OperandKind::None, 1 },
    { Opcode::Add, "ADD", OperandKind::None, 2 },
    { Opcode::Sub, "SUB", OperandKind::None, 2 },
    { Opcode::Mul, "MUL", OperandKind::None, 2 },
    { Opcode::Div, "DIV", OperandKind::None, 2 },
    { Opcode::Dup, "DUP", OperandKind::None, 1 },
    { Opcode::Swap, "SWAP", OperandKind::None, 2 },
    { Opcode::Load, "LOAD", OperandKind::Slot, 0 },
    { Opcode::Store, "STORE", OperandKind::Slot, 1 },
    { Opcode::Jmp, "JMP", OperandKind::JumpTarget, 0 },
    { Opcode::Jz, "JZ", OperandKind::JumpTarget, 1 },
    { Opcode::Halt, "HALT", OperandKind::None, 0 },
} };

constexpr std::array<Opcode, kOpcodeCount> kAllOpcodes = {
    Opcode::Push, Opcode::Pop, Opcode::Add,  Opcode::Sub,   Opcode::Mul,
    Opcode::Div,  Opcode::Dup, Opcode::Swap, Opcode::Load,  Opcode::Store,
    Opcode::Jmp,  Opcode::Jz,  Opcode::Halt,
};

constexpr bool tableMatchesEnum()
{
    for (int i = 0; i < kOpcodeCount; ++i) {
        if (static_cast<int>(kOpcodeTable[i].opcode) != i) {
            return false;
        }
    }
    return true;
}
static_assert(tableMatchesEnum(), "kOpcodeTable must be indexed by Opcode value");
} // namespace

const OpcodeInfo& opcodeInfo(Opcode opcode)
{
    return kOpcodeTable[static_cast<size_t>(opcode)];
}

const std::array<Opcode, kOpcodeCount>& allOpcodes()
{
    return kAllOpcodes;
}

std::string toString(Opcode opcode)
{
    return opcodeInfo(opcode).name;
}

std::optional<Opcode> opcodeFromString(const std::string& name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });

    for (const auto& info : kOpcodeTable) {
        if (upper == info.name) {
            return info.opcode;
        }
    }
    return std::nullopt;
}

} // namespace StackEvo
