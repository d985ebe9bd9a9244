#pragma once

#include "Opcode.h"

#include <cstdint>
#include <optional>
#include <string>

namespace StackEvo {

// All stack and variable values. Arithmetic on it wraps modulo 2^32.
using Value = int32_t;

struct Instruction {
    Opcode opcode = Opcode::Halt;
    std::optional<Value> operand; // Present exactly when opcodeInfo(opcode) has an operand.

    static Instruction make(Opcode opcode) { return Instruction{ opcode, std::nullopt }; }
    static Instruction make(Opcode opcode, Value operand) { return Instruction{ opcode, operand }; }

    bool operator==(const Instruction& other) const = default;
};

// "PUSH 3", "ADD", "JZ 4".
std::string formatInstruction(const Instruction& instruction);

} // namespace StackEvo
