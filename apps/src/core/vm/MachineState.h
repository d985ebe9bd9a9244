#pragma once

#include "Instruction.h"
#include "Program.h"

#include <array>
#include <optional>
#include <vector>

namespace StackEvo {

/**
 * Everything a single execution reads and writes. A fresh MachineState is built for every
 * run and is owned by that run alone.
 */
struct MachineState {
    std::vector<Value> stack; // Back is the top of stack.
    std::array<Value, kVariableSlotCount> variables{};
    int ip = 0;
    int steps = 0;

    static MachineState withStack(std::vector<Value> values)
    {
        MachineState state;
        state.stack = std::move(values);
        return state;
    }

    std::optional<Value> top() const
    {
        if (stack.empty()) {
            return std::nullopt;
        }
        return stack.back();
    }

    bool operator==(const MachineState& other) const = default;
};

} // namespace StackEvo
