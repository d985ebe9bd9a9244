#pragma once

#include "ExecutionResult.h"
#include "MachineState.h"
#include "Program.h"

#include <memory>

namespace spdlog {
class logger;
}

namespace StackEvo {

struct VmLimits {
    int stepLimit = 1000;
    int maxStackDepth = 256;
};

/**
 * Deterministic, step-bounded interpreter for the stack language.
 *
 * Each call to execute() runs on its own copy of the initial state, so one VirtualMachine
 * may serve any number of threads. Runtime problems (underflow, division by zero, running
 * out of steps) are reported in the ExecutionResult, never thrown.
 *
 * Arithmetic wraps modulo 2^32. DIV truncates toward zero and INT32_MIN / -1 wraps to
 * INT32_MIN.
 */
class VirtualMachine {
public:
    explicit VirtualMachine(const VmLimits& limits = VmLimits{});

    ExecutionResult execute(const Program& program, MachineState initialState) const;

    const VmLimits& getLimits() const { return limits_; }

private:
    VmLimits limits_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace StackEvo
