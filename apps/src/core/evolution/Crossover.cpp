#include "Crossover.h"
#include "Mutation.h"
#include "core/LoggingChannels.h"

#include <vector>

namespace StackEvo {

namespace {

// One parent segment copied into a child: parent[begin, end) lands at childOffset.
struct Segment {
    const Program* parent;
    size_t begin;
    size_t end;
    size_t childOffset;
};

std::optional<Value> mapTarget(const Segment& own, Value target)
{
    const auto t = static_cast<size_t>(target);
    if (t < own.begin || t >= own.end) {
        return std::nullopt;
    }
    return static_cast<Value>(own.childOffset + (t - own.begin));
}

std::optional<Program> assemble(const Segment& head, const Segment& tail)
{
    std::vector<Instruction> instructions;
    instructions.reserve((head.end - head.begin) + (tail.end - tail.begin));

    for (const Segment* segment : { &head, &tail }) {
        for (size_t i = segment->begin; i < segment->end; ++i) {
            Instruction instruction = segment->parent->at(i);
            if (isJump(instruction.opcode)) {
                auto mapped = mapTarget(*segment, instruction.operand.value());
                if (!mapped.has_value()) {
                    return std::nullopt;
                }
                instruction.operand = mapped.value();
            }
            instructions.push_back(instruction);
        }
    }

    auto result = Program::create(std::move(instructions));
    if (result.isError()) {
        return std::nullopt;
    }
    return std::move(result.value());
}

bool lengthInBounds(size_t length, int minLength, int maxLength)
{
    return static_cast<int>(length) >= minLength && static_cast<int>(length) <= maxLength;
}

} // namespace

std::optional<ProgramPair> crossoverAt(
    const Program& a, size_t cutA, const Program& b, size_t cutB, int minLength, int maxLength)
{
    if (cutA > a.size() || cutB > b.size()) {
        return std::nullopt;
    }

    const size_t length1 = cutA + (b.size() - cutB);
    const size_t length2 = cutB + (a.size() - cutA);
    if (!lengthInBounds(length1, minLength, maxLength)
        || !lengthInBounds(length2, minLength, maxLength)) {
        return std::nullopt;
    }

    auto child1 = assemble(Segment{ &a, 0, cutA, 0 }, Segment{ &b, cutB, b.size(), cutA });
    if (!child1.has_value()) {
        return std::nullopt;
    }
    auto child2 = assemble(Segment{ &b, 0, cutB, 0 }, Segment{ &a, cutA, a.size(), cutB });
    if (!child2.has_value()) {
        return std::nullopt;
    }

    return ProgramPair{ std::move(child1.value()), std::move(child2.value()) };
}

Result<ProgramPair, OperatorRepairFailure> crossover(
    const Program& a, const Program& b, int minLength, int maxLength, std::mt19937& rng, int* attempts)
{
    std::uniform_int_distribution<size_t> cutADist(0, a.size());
    std::uniform_int_distribution<size_t> cutBDist(0, b.size());

    for (int attempt = 1; attempt <= kMaxOperatorAttempts; ++attempt) {
        const size_t cutA = cutADist(rng);
        const size_t cutB = cutBDist(rng);
        auto children = crossoverAt(a, cutA, b, cutB, minLength, maxLength);
        if (children.has_value()) {
            if (attempts) {
                *attempts = attempt;
            }
            return Result<ProgramPair, OperatorRepairFailure>::okay(std::move(children.value()));
        }
    }

    if (attempts) {
        *attempts = kMaxOperatorAttempts;
    }
    LOG_DEBUG(
        Operators,
        "crossover rejected {} cut pairs for parents of length {} and {}",
        kMaxOperatorAttempts,
        a.size(),
        b.size());
    return Result<ProgramPair, OperatorRepairFailure>::error(
        OperatorRepairFailure{ "crossover", kMaxOperatorAttempts });
}

} // namespace StackEvo
