#include "VirtualMachine.h"
#include "core/LoggingChannels.h"

#include <cstdint>
#include <limits>

namespace StackEvo {

namespace {
Value wrapAdd(Value a, Value b)
{
    return static_cast<Value>(static_cast<uint32_t>(a) + static_cast<uint32_t>(b));
}

Value wrapSub(Value a, Value b)
{
    return static_cast<Value>(static_cast<uint32_t>(a) - static_cast<uint32_t>(b));
}

Value wrapMul(Value a, Value b)
{
    return static_cast<Value>(static_cast<uint32_t>(a) * static_cast<uint32_t>(b));
}

Value wrapDiv(Value a, Value b)
{
    if (a == std::numeric_limits<Value>::min() && b == -1) {
        return a;
    }
    return a / b;
}

Value popValue(std::vector<Value>& stack)
{
    const Value v = stack.back();
    stack.pop_back();
    return v;
}
} // namespace

std::string toString(ExecutionOutcome outcome)
{
    switch (outcome) {
        case ExecutionOutcome::Completed:
            return "Completed";
        case ExecutionOutcome::Faulted:
            return "Faulted";
        case ExecutionOutcome::TimedOut:
            return "TimedOut";
    }
    return "Unknown";
}

std::string toString(ExecutionFault fault)
{
    switch (fault) {
        case ExecutionFault::StackUnderflow:
            return "StackUnderflow";
        case ExecutionFault::StackOverflow:
            return "StackOverflow";
        case ExecutionFault::DivisionByZero:
            return "DivisionByZero";
        case ExecutionFault::InvalidJumpTarget:
            return "InvalidJumpTarget";
    }
    return "Unknown";
}

VirtualMachine::VirtualMachine(const VmLimits& limits)
    : limits_(limits), logger_(LoggingChannels::get(LogChannel::Vm))
{}

ExecutionResult VirtualMachine::execute(const Program& program, MachineState state) const
{
    const int length = static_cast<int>(program.size());
    auto& stack = state.stack;

    const auto finish = [&state](ExecutionOutcome outcome) {
        ExecutionResult result;
        result.outcome = outcome;
        result.finalState = std::move(state);
        return result;
    };
    const auto fault = [&state](ExecutionFault kind) {
        ExecutionResult result;
        result.outcome = ExecutionOutcome::Faulted;
        result.fault = kind;
        result.faultIndex = state.ip;
        result.finalState = std::move(state);
        return result;
    };

    while (true) {
        if (state.ip == length) {
            return finish(ExecutionOutcome::Completed);
        }
        // Only reachable from a caller-supplied starting state; jumps are checked below.
        if (state.ip < 0 || state.ip > length) {
            return fault(ExecutionFault::InvalidJumpTarget);
        }
        if (state.steps >= limits_.stepLimit) {
            SPDLOG_LOGGER_TRACE(logger_, "Step limit {} reached at ip={}", limits_.stepLimit, state.ip);
            return finish(ExecutionOutcome::TimedOut);
        }

        const Instruction& instruction = program.at(state.ip);
        if (static_cast<int>(stack.size()) < opcodeInfo(instruction.opcode).stackInputs) {
            return fault(ExecutionFault::StackUnderflow);
        }

        if (logger_->should_log(spdlog::level::trace)) {
            SPDLOG_LOGGER_TRACE(
                logger_,
                "step={} ip={} {} depth={}",
                state.steps,
                state.ip,
                formatInstruction(instruction),
                stack.size());
        }

        int nextIp = state.ip + 1;
        bool jumped = false;
        switch (instruction.opcode) {
            case Opcode::Push:
                stack.push_back(instruction.operand.value_or(0));
                break;
            case Opcode::Pop:
                stack.pop_back();
                break;
            case Opcode::Add:
            case Opcode::Sub:
            case Opcode::Mul:
            case Opcode::Div: {
                const Value b = popValue(stack);
                const Value a = popValue(stack);
                if (instruction.opcode == Opcode::Div && b == 0) {
                    // Restore the operands so the final state shows what DIV saw.
                    stack.push_back(a);
                    stack.push_back(b);
                    return fault(ExecutionFault::DivisionByZero);
                }
                switch (instruction.opcode) {
                    case Opcode::Add:
                        stack.push_back(wrapAdd(a, b));
                        break;
                    case Opcode::Sub:
                        stack.push_back(wrapSub(a, b));
                        break;
                    case Opcode::Mul:
                        stack.push_back(wrapMul(a, b));
                        break;
                    default:
                        stack.push_back(wrapDiv(a, b));
                        break;
                }
                break;
            }
            case Opcode::Dup:
                stack.push_back(stack.back());
                break;
            case Opcode::Swap:
                std::swap(stack[stack.size() - 1], stack[stack.size() - 2]);
                break;
            case Opcode::Load:
                stack.push_back(state.variables[instruction.operand.value_or(0)]);
                break;
            case Opcode::Store:
                state.variables[instruction.operand.value_or(0)] = popValue(stack);
                break;
            case Opcode::Jmp:
                nextIp = instruction.operand.value_or(0);
                jumped = true;
                break;
            case Opcode::Jz:
                if (popValue(stack) == 0) {
                    nextIp = instruction.operand.value_or(0);
                    jumped = true;
                }
                break;
            case Opcode::Halt:
                state.steps++;
                return finish(ExecutionOutcome::Completed);
        }

        state.steps++;

        if (static_cast<int>(stack.size()) > limits_.maxStackDepth) {
            return fault(ExecutionFault::StackOverflow);
        }

        // A jump may only land on an instruction; landing on length is not an implicit halt.
        if (jumped && (nextIp < 0 || nextIp >= length)) {
            return fault(ExecutionFault::InvalidJumpTarget);
        }
        state.ip = nextIp;
    }
}

} // namespace StackEvo
