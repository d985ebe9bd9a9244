#pragma once

#include <string>

namespace StackEvo {

// An EvolutionConfig that cannot drive a run. Reported before any generation starts.
struct ConfigurationError {
    std::string field;
    std::string message;

    std::string describe() const { return field + ": " + message; }
};

// A genetic operator ran out of attempts to build a valid program. This points at a mismatch
// between the operators and the instruction grammar, not at a bad evolved program.
struct OperatorRepairFailure {
    std::string operatorName;
    int attempts = 0;

    std::string describe() const
    {
        return operatorName + " produced no valid program after " + std::to_string(attempts)
            + " attempts";
    }
};

} // namespace StackEvo
