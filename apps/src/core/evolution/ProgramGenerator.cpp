#include "ProgramGenerator.h"
#include "core/Assert.h"

namespace StackEvo {

namespace {
Opcode pickOpcode(const std::vector<Opcode>& opcodes, std::mt19937& rng)
{
    std::uniform_int_distribution<size_t> dist(0, opcodes.size() - 1);
    return opcodes[dist(rng)];
}
} // namespace

ProgramGenerator::ProgramGenerator(const EvolutionConfig& config)
    : minLength_(config.minProgramLength),
      maxLength_(config.maxProgramLength),
      literalMin_(config.literalMin),
      literalMax_(config.literalMax),
      variableSlots_(config.variableSlots)
{
    for (Opcode opcode : allOpcodes()) {
        if (opcode != Opcode::Push) {
            nonPushOpcodes_.push_back(opcode);
        }
        if (hasOperand(opcode)) {
            operandOpcodes_.push_back(opcode);
        }
        else {
            bareOpcodes_.push_back(opcode);
        }
    }
}

Value ProgramGenerator::randomOperand(Opcode opcode, int programLength, std::mt19937& rng) const
{
    switch (opcodeInfo(opcode).operandKind) {
        case OperandKind::Literal: {
            std::uniform_int_distribution<Value> dist(literalMin_, literalMax_);
            return dist(rng);
        }
        case OperandKind::Slot: {
            std::uniform_int_distribution<Value> dist(0, variableSlots_ - 1);
            return dist(rng);
        }
        case OperandKind::JumpTarget: {
            STACKEVO_ASSERT(programLength > 0, "Jump target needs a non-empty program");
            std::uniform_int_distribution<Value> dist(0, programLength - 1);
            return dist(rng);
        }
        case OperandKind::None:
            break;
    }
    return 0;
}

Instruction ProgramGenerator::makeInstruction(
    Opcode opcode, int programLength, std::mt19937& rng) const
{
    if (!hasOperand(opcode)) {
        return Instruction::make(opcode);
    }
    return Instruction::make(opcode, randomOperand(opcode, programLength, rng));
}

Instruction ProgramGenerator::randomInstruction(int programLength, std::mt19937& rng) const
{
    std::bernoulli_distribution isPush(0.5);
    if (isPush(rng)) {
        return makeInstruction(Opcode::Push, programLength, rng);
    }
    return makeInstruction(pickOpcode(nonPushOpcodes_, rng), programLength, rng);
}

Instruction ProgramGenerator::randomInstructionWithArity(
    bool withOperand, int programLength, std::mt19937& rng) const
{
    const auto& pool = withOperand ? operandOpcodes_ : bareOpcodes_;
    return makeInstruction(pickOpcode(pool, rng), programLength, rng);
}

Program ProgramGenerator::randomProgram(std::mt19937& rng) const
{
    std::uniform_int_distribution<int> lengthDist(minLength_, maxLength_);
    const int length = lengthDist(rng);

    std::vector<Instruction> instructions;
    instructions.reserve(length);
    for (int i = 0; i < length; ++i) {
        instructions.push_back(randomInstruction(length, rng));
    }

    auto program = Program::create(std::move(instructions));
    STACKEVO_ASSERT(program.isValue(), "ProgramGenerator produced a malformed program");
    return program.value();
}

} // namespace StackEvo
