#pragma once

#include "Instruction.h"
#include "core/Result.h"

#include <cstddef>
#include <string>
#include <vector>

namespace StackEvo {

// Size of every machine's variable bank. LOAD/STORE slots must be below this.
inline constexpr int kVariableSlotCount = 8;

struct MalformedProgram {
    std::string message;
    int instructionIndex = -1; // -1 when the problem is not tied to one instruction.
};

/**
 * An immutable, structurally valid instruction sequence.
 *
 * The only way to obtain a Program is create(), which checks every operand against its
 * opcode: literals present where required, slots inside the variable bank, jump targets
 * inside the program. Anything holding a Program may therefore execute it without
 * re-validating, and share it across threads.
 */
class Program {
public:
    Program() = default;

    static Result<Program, MalformedProgram> create(std::vector<Instruction> instructions);

    size_t size() const { return instructions_.size(); }
    bool empty() const { return instructions_.empty(); }
    const Instruction& at(size_t index) const { return instructions_[index]; }
    const std::vector<Instruction>& instructions() const { return instructions_; }

    bool hasJumps() const;
    int operandCount() const;

    bool operator==(const Program& other) const = default;

private:
    explicit Program(std::vector<Instruction> instructions)
        : instructions_(std::move(instructions))
    {}

    std::vector<Instruction> instructions_;
};

} // namespace StackEvo
