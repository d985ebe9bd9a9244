#include "Mutation.h"
#include "core/LoggingChannels.h"

#include <algorithm>

namespace StackEvo {

namespace {
std::optional<Program> toProgram(std::vector<Instruction> instructions)
{
    auto result = Program::create(std::move(instructions));
    if (result.isError()) {
        return std::nullopt;
    }
    return std::move(result.value());
}

std::vector<size_t> operandPositions(const Program& program)
{
    std::vector<size_t> positions;
    for (size_t i = 0; i < program.size(); ++i) {
        if (program.at(i).operand.has_value()) {
            positions.push_back(i);
        }
    }
    return positions;
}

size_t randomPosition(size_t count, std::mt19937& rng)
{
    std::uniform_int_distribution<size_t> dist(0, count - 1);
    return dist(rng);
}

std::optional<Program> tryMutation(
    MutationKind kind, const Program& parent, const ProgramGenerator& generator, std::mt19937& rng)
{
    const int length = static_cast<int>(parent.size());

    switch (kind) {
        case MutationKind::Point: {
            if (length == 0) {
                return std::nullopt;
            }
            const size_t position = randomPosition(parent.size(), rng);
            const bool withOperand = parent.at(position).operand.has_value();
            const Instruction replacement =
                generator.randomInstructionWithArity(withOperand, length, rng);
            return ProgramEdit::replaceAt(parent, position, replacement);
        }
        case MutationKind::Insertion: {
            if (length >= generator.maxLength()) {
                return std::nullopt;
            }
            const size_t position = randomPosition(parent.size() + 1, rng);
            const Instruction inserted = generator.randomInstruction(length + 1, rng);
            return ProgramEdit::insertAt(parent, position, inserted, generator.maxLength());
        }
        case MutationKind::Deletion: {
            if (length <= generator.minLength()) {
                return std::nullopt;
            }
            const size_t position = randomPosition(parent.size(), rng);
            return ProgramEdit::deleteAt(parent, position, generator.minLength());
        }
        case MutationKind::Operand: {
            const auto positions = operandPositions(parent);
            if (positions.empty()) {
                return std::nullopt;
            }
            const size_t position = positions[randomPosition(positions.size(), rng)];
            Instruction changed = parent.at(position);
            changed.operand = generator.randomOperand(changed.opcode, length, rng);
            return ProgramEdit::replaceAt(parent, position, changed);
        }
    }
    return std::nullopt;
}
} // namespace

std::string toString(MutationKind kind)
{
    switch (kind) {
        case MutationKind::Point:
            return "point";
        case MutationKind::Insertion:
            return "insertion";
        case MutationKind::Deletion:
            return "deletion";
        case MutationKind::Operand:
            return "operand";
    }
    return "unknown";
}

namespace ProgramEdit {

std::optional<Program> replaceAt(const Program& program, size_t position, const Instruction& with)
{
    if (position >= program.size()) {
        return std::nullopt;
    }
    std::vector<Instruction> instructions = program.instructions();
    instructions[position] = with;
    return toProgram(std::move(instructions));
}

std::optional<Program> insertAt(
    const Program& program, size_t position, const Instruction& instruction, int maxLength)
{
    if (position > program.size() || static_cast<int>(program.size()) >= maxLength) {
        return std::nullopt;
    }

    std::vector<Instruction> instructions;
    instructions.reserve(program.size() + 1);
    for (const Instruction& existing : program.instructions()) {
        Instruction shifted = existing;
        if (isJump(shifted.opcode) && shifted.operand.value() >= static_cast<Value>(position)) {
            shifted.operand = shifted.operand.value() + 1;
        }
        instructions.push_back(shifted);
    }
    instructions.insert(instructions.begin() + static_cast<std::ptrdiff_t>(position), instruction);
    return toProgram(std::move(instructions));
}

std::optional<Program> deleteAt(const Program& program, size_t position, int minLength)
{
    if (position >= program.size() || static_cast<int>(program.size()) - 1 < minLength) {
        return std::nullopt;
    }

    const Value removed = static_cast<Value>(position);
    const Value newLength = static_cast<Value>(program.size()) - 1;
    if (newLength == 0) {
        return toProgram({});
    }

    std::vector<Instruction> instructions;
    instructions.reserve(program.size() - 1);
    for (size_t i = 0; i < program.size(); ++i) {
        if (i == position) {
            continue;
        }
        Instruction shifted = program.at(i);
        if (isJump(shifted.opcode)) {
            Value target = shifted.operand.value();
            if (target > removed) {
                target -= 1;
            }
            shifted.operand = std::min(target, newLength - 1);
        }
        instructions.push_back(shifted);
    }
    return toProgram(std::move(instructions));
}

} // namespace ProgramEdit

Result<Program, OperatorRepairFailure> mutate(
    const Program& parent, const ProgramGenerator& generator, std::mt19937& rng, MutationStats* stats)
{
    std::uniform_int_distribution<int> kindDist(0, kMutationKindCount - 1);

    for (int attempt = 1; attempt <= kMaxOperatorAttempts; ++attempt) {
        const auto kind = static_cast<MutationKind>(kindDist(rng));
        auto child = tryMutation(kind, parent, generator, rng);
        if (child.has_value()) {
            if (stats) {
                stats->kind = kind;
                stats->attempts = attempt;
            }
            return Result<Program, OperatorRepairFailure>::okay(std::move(child.value()));
        }
    }

    LOG_WARN(
        Operators,
        "mutation gave up after {} attempts on a program of length {}",
        kMaxOperatorAttempts,
        parent.size());
    return Result<Program, OperatorRepairFailure>::error(
        OperatorRepairFailure{ "mutation", kMaxOperatorAttempts });
}

} // namespace StackEvo
