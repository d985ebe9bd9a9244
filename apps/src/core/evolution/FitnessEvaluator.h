#pragma once

#include "Problem.h"
#include "core/vm/VirtualMachine.h"

#include <atomic>

namespace StackEvo {

struct Evaluation {
    double fitness = 0.0;
    int totalCases = 0;
    int exactCases = 0;
    int faultedCases = 0;
    int timedOutCases = 0;
    int incompleteCases = 0; // Completed with nothing on the stack.
    bool cancelled = false;  // Stop was requested before every case ran; discard.

    bool perfect() const { return totalCases > 0 && exactCases == totalCases; }
    bool anyFailure() const { return faultedCases > 0 || timedOutCases > 0; }
};

/**
 * Scores programs against a Problem by running every test case on the VM.
 *
 * Per case, higher is better: an exact answer earns kExactReward, a wrong answer earns a
 * share of kNearMissCeiling that shrinks with log distance, an empty stack earns nothing,
 * and a fault or timeout costs kFailurePenalty. The aggregate is reduced by
 * parsimonyWeight * length / maxProgramLength.
 *
 * Stateless between calls and safe to share across threads.
 */
class FitnessEvaluator {
public:
    static constexpr double kExactReward = 1.0;
    static constexpr double kNearMissCeiling = 0.5;
    static constexpr double kFailurePenalty = -1.0;

    FitnessEvaluator(const VmLimits& limits, double parsimonyWeight, int maxProgramLength);

    Evaluation evaluate(
        const Program& program,
        const Problem& problem,
        const std::atomic<bool>* stopRequested = nullptr) const;

    static double scoreCase(const ExecutionResult& result, Value expected);

    double parsimonyPenalty(const Program& program) const;

private:
    VirtualMachine vm_;
    double parsimonyWeight_ = 0.0;
    int maxProgramLength_ = 1;
};

} // namespace StackEvo
