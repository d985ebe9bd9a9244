#include "FitnessEvaluator.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>

namespace StackEvo {

FitnessEvaluator::FitnessEvaluator(
    const VmLimits& limits, double parsimonyWeight, int maxProgramLength)
    : vm_(limits), parsimonyWeight_(parsimonyWeight), maxProgramLength_(std::max(1, maxProgramLength))
{}

double FitnessEvaluator::scoreCase(const ExecutionResult& result, Value expected)
{
    if (!result.completed()) {
        return kFailurePenalty;
    }

    const auto top = result.topOfStack();
    if (!top.has_value()) {
        return 0.0;
    }
    if (top.value() == expected) {
        return kExactReward;
    }

    const int64_t distance =
        std::llabs(static_cast<int64_t>(top.value()) - static_cast<int64_t>(expected));
    return kNearMissCeiling / (1.0 + std::log2(1.0 + static_cast<double>(distance)));
}

double FitnessEvaluator::parsimonyPenalty(const Program& program) const
{
    return parsimonyWeight_ * static_cast<double>(program.size())
        / static_cast<double>(maxProgramLength_);
}

Evaluation FitnessEvaluator::evaluate(
    const Program& program, const Problem& problem, const std::atomic<bool>* stopRequested) const
{
    const auto& cases = problem.testCases();

    Evaluation evaluation;
    evaluation.totalCases = static_cast<int>(cases.size());

    std::vector<double> contributions;
    contributions.reserve(cases.size());

    for (const TestCase& testCase : cases) {
        if (stopRequested && stopRequested->load(std::memory_order_relaxed)) {
            evaluation.cancelled = true;
            return evaluation;
        }

        const ExecutionResult result = vm_.execute(program, testCase.initialState());
        switch (result.outcome) {
            case ExecutionOutcome::Faulted:
                evaluation.faultedCases++;
                break;
            case ExecutionOutcome::TimedOut:
                evaluation.timedOutCases++;
                break;
            case ExecutionOutcome::Completed:
                if (!result.topOfStack().has_value()) {
                    evaluation.incompleteCases++;
                }
                else if (result.topOfStack().value() == testCase.expected) {
                    evaluation.exactCases++;
                }
                break;
        }

        contributions.push_back(scoreCase(result, testCase.expected) * testCase.weight);
    }

    evaluation.fitness = problem.aggregate(contributions) - parsimonyPenalty(program);
    return evaluation;
}

} // namespace StackEvo
