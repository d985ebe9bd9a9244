#pragma once

#include "MachineState.h"

#include <optional>
#include <string>

namespace StackEvo {

enum class ExecutionOutcome : uint8_t {
    Completed,
    Faulted,
    TimedOut,
};

enum class ExecutionFault : uint8_t {
    StackUnderflow,
    StackOverflow,
    DivisionByZero,
    InvalidJumpTarget,
};

std::string toString(ExecutionOutcome outcome);
std::string toString(ExecutionFault fault);

struct ExecutionResult {
    ExecutionOutcome outcome = ExecutionOutcome::Completed;
    std::optional<ExecutionFault> fault; // Set only when outcome == Faulted.
    int faultIndex = -1;                 // Instruction that faulted.
    MachineState finalState;

    bool completed() const { return outcome == ExecutionOutcome::Completed; }
    int steps() const { return finalState.steps; }
    std::optional<Value> topOfStack() const { return finalState.top(); }

    bool operator==(const ExecutionResult& other) const = default;
};

} // namespace StackEvo
