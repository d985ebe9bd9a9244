#pragma once

#include "EvolutionConfig.h"
#include "core/vm/Program.h"

#include <random>
#include <vector>

namespace StackEvo {

/**
 * Samples random valid instructions and programs within the configured grammar limits.
 *
 * Half of all sampled instructions are PUSH with a literal in [literalMin, literalMax]; the
 * other half are drawn uniformly from the remaining opcodes.
 */
class ProgramGenerator {
public:
    explicit ProgramGenerator(const EvolutionConfig& config);

    // Jump targets are drawn from [0, programLength).
    Instruction randomInstruction(int programLength, std::mt19937& rng) const;

    // Same, restricted to opcodes that do (or do not) carry an operand.
    Instruction randomInstructionWithArity(
        bool withOperand, int programLength, std::mt19937& rng) const;

    Value randomOperand(Opcode opcode, int programLength, std::mt19937& rng) const;

    Program randomProgram(std::mt19937& rng) const;

    int minLength() const { return minLength_; }
    int maxLength() const { return maxLength_; }

private:
    Instruction makeInstruction(Opcode opcode, int programLength, std::mt19937& rng) const;

    int minLength_;
    int maxLength_;
    int literalMin_;
    int literalMax_;
    int variableSlots_;
    std::vector<Opcode> nonPushOpcodes_;
    std::vector<Opcode> operandOpcodes_;
    std::vector<Opcode> bareOpcodes_;
};

} // namespace StackEvo
