#include "core/vm/ProgramText.h"
#include "core/vm/VirtualMachine.h"

#include <gtest/gtest.h>
#include <limits>

using namespace StackEvo;

class VirtualMachineTest : public ::testing::Test {
protected:
    Program parse(const std::string& text)
    {
        auto result = parseProgram(text);
        EXPECT_TRUE(result.isValue()) << (result.isError() ? result.errorValue().message : "");
        return result.isValue() ? result.value() : Program{};
    }

    ExecutionResult run(const std::string& text, std::vector<Value> stack = {}, int stepLimit = 1000)
    {
        const VirtualMachine vm(VmLimits{ .stepLimit = stepLimit, .maxStackDepth = 256 });
        return vm.execute(parse(text), MachineState::withStack(std::move(stack)));
    }
};

TEST_F(VirtualMachineTest, PopOnEmptyStackFaultsWithUnderflow)
{
    const auto result = run("POP; HALT");

    EXPECT_EQ(result.outcome, ExecutionOutcome::Faulted);
    ASSERT_TRUE(result.fault.has_value());
    EXPECT_EQ(result.fault.value(), ExecutionFault::StackUnderflow);
    EXPECT_EQ(result.faultIndex, 0);
}

TEST_F(VirtualMachineTest, AddLeavesSumOnTop)
{
    const auto result = run("ADD; HALT", { 2, 3 });

    EXPECT_EQ(result.outcome, ExecutionOutcome::Completed);
    ASSERT_TRUE(result.topOfStack().has_value());
    EXPECT_EQ(result.topOfStack().value(), 5);
    EXPECT_EQ(result.steps(), 2);
}

TEST_F(VirtualMachineTest, SelfLoopTimesOutAfterExactlyStepLimit)
{
    const auto result = run("JMP 0", {}, 1000);

    EXPECT_EQ(result.outcome, ExecutionOutcome::TimedOut);
    EXPECT_EQ(result.steps(), 1000);
    EXPECT_FALSE(result.fault.has_value());
}

TEST_F(VirtualMachineTest, RunningPastEndIsImplicitHalt)
{
    const auto result = run("PUSH 7; DUP; MUL");

    EXPECT_EQ(result.outcome, ExecutionOutcome::Completed);
    EXPECT_EQ(result.topOfStack().value(), 49);
    EXPECT_EQ(result.steps(), 3);
}

TEST_F(VirtualMachineTest, EmptyProgramCompletesWithoutSteps)
{
    const auto result = run("", { 4 });

    EXPECT_EQ(result.outcome, ExecutionOutcome::Completed);
    EXPECT_EQ(result.steps(), 0);
    EXPECT_EQ(result.topOfStack().value(), 4);
}

TEST_F(VirtualMachineTest, HaltStopsBeforeLaterInstructions)
{
    const auto result = run("PUSH 1; HALT; PUSH 2");

    EXPECT_EQ(result.outcome, ExecutionOutcome::Completed);
    EXPECT_EQ(result.topOfStack().value(), 1);
    EXPECT_EQ(result.steps(), 2);
}

TEST_F(VirtualMachineTest, SubAndDivUseSecondFromTopAsLeftOperand)
{
    EXPECT_EQ(run("SUB", { 10, 3 }).topOfStack().value(), 7);
    EXPECT_EQ(run("DIV", { 10, 3 }).topOfStack().value(), 3);
}

TEST_F(VirtualMachineTest, DivisionTruncatesTowardZero)
{
    EXPECT_EQ(run("DIV", { -7, 2 }).topOfStack().value(), -3);
    EXPECT_EQ(run("DIV", { 7, -2 }).topOfStack().value(), -3);
}

TEST_F(VirtualMachineTest, DivisionByZeroFaults)
{
    const auto result = run("PUSH 0; DIV", { 5 });

    EXPECT_EQ(result.outcome, ExecutionOutcome::Faulted);
    EXPECT_EQ(result.fault.value(), ExecutionFault::DivisionByZero);
    EXPECT_EQ(result.faultIndex, 1);
}

TEST_F(VirtualMachineTest, ArithmeticWrapsOnOverflow)
{
    constexpr Value max = std::numeric_limits<Value>::max();
    constexpr Value min = std::numeric_limits<Value>::min();

    EXPECT_EQ(run("ADD", { max, 1 }).topOfStack().value(), min);
    EXPECT_EQ(run("SUB", { min, 1 }).topOfStack().value(), max);
    EXPECT_EQ(run("MUL", { 65536, 65536 }).topOfStack().value(), 0);
    EXPECT_EQ(run("DIV", { min, -1 }).topOfStack().value(), min);
}

TEST_F(VirtualMachineTest, DupAndSwapRearrangeTop)
{
    const auto dup = run("DUP", { 3 });
    EXPECT_EQ(dup.finalState.stack, (std::vector<Value>{ 3, 3 }));

    const auto swap = run("SWAP", { 1, 2 });
    EXPECT_EQ(swap.finalState.stack, (std::vector<Value>{ 2, 1 }));

    EXPECT_EQ(run("SWAP", { 1 }).fault.value(), ExecutionFault::StackUnderflow);
}

TEST_F(VirtualMachineTest, StoreAndLoadUseVariableBank)
{
    const auto result = run("STORE 2; LOAD 2; LOAD 2; ADD", { 21 });

    EXPECT_EQ(result.outcome, ExecutionOutcome::Completed);
    EXPECT_EQ(result.topOfStack().value(), 42);
    EXPECT_EQ(result.finalState.variables[2], 21);
}

TEST_F(VirtualMachineTest, JzPopsConditionAndBranchesOnZero)
{
    // Pushes 1 when the input is zero, 2 otherwise.
    const std::string program = "JZ 3; PUSH 2; HALT; PUSH 1";

    const auto zero = run(program, { 0 });
    EXPECT_EQ(zero.finalState.stack, (std::vector<Value>{ 1 }));

    const auto nonZero = run(program, { 9 });
    EXPECT_EQ(nonZero.finalState.stack, (std::vector<Value>{ 2 }));
}

TEST_F(VirtualMachineTest, CountdownLoopTerminates)
{
    // Decrement slot 0 from 5 to 0, counting iterations in slot 1.
    const std::string program = "STORE 0;"
                                "LOAD 0; JZ 12;"
                                "LOAD 0; PUSH 1; SUB; STORE 0;"
                                "LOAD 1; PUSH 1; ADD; STORE 1;"
                                "JMP 1;"
                                "LOAD 1";

    const auto result = run(program, { 5 });

    EXPECT_EQ(result.outcome, ExecutionOutcome::Completed);
    EXPECT_EQ(result.topOfStack().value(), 5);
}

TEST_F(VirtualMachineTest, StackDepthLimitFaultsWithOverflow)
{
    const VirtualMachine vm(VmLimits{ .stepLimit = 10000, .maxStackDepth = 16 });
    const auto result = vm.execute(parse("PUSH 1; JMP 0"), MachineState{});

    EXPECT_EQ(result.outcome, ExecutionOutcome::Faulted);
    EXPECT_EQ(result.fault.value(), ExecutionFault::StackOverflow);
    EXPECT_EQ(result.finalState.stack.size(), 17u);
}

TEST_F(VirtualMachineTest, ExecutionIsDeterministic)
{
    const Program program = parse("DUP; PUSH 3; MUL; SWAP; PUSH 2; SUB; JZ 0; ADD");
    const VirtualMachine vm;

    for (Value seed : { -4, 0, 2, 17 }) {
        const auto first = vm.execute(program, MachineState::withStack({ seed, seed + 1 }));
        const auto second = vm.execute(program, MachineState::withStack({ seed, seed + 1 }));
        EXPECT_EQ(first, second);
        EXPECT_EQ(first.steps(), second.steps());
    }
}

TEST_F(VirtualMachineTest, StartingIpPastEndFaultsWithInvalidJumpTarget)
{
    const VirtualMachine vm;
    MachineState start;
    start.ip = 5;

    const auto result = vm.execute(parse("PUSH 1"), start);

    EXPECT_EQ(result.outcome, ExecutionOutcome::Faulted);
    ASSERT_TRUE(result.fault.has_value());
    EXPECT_EQ(result.fault.value(), ExecutionFault::InvalidJumpTarget);
    EXPECT_EQ(result.faultIndex, 5);
    EXPECT_EQ(result.steps(), 0);
}

TEST_F(VirtualMachineTest, NegativeStartingIpFaultsWithInvalidJumpTarget)
{
    const VirtualMachine vm;
    MachineState start;
    start.ip = -1;

    const auto result = vm.execute(parse("PUSH 1; HALT"), start);

    EXPECT_EQ(result.outcome, ExecutionOutcome::Faulted);
    EXPECT_EQ(result.fault.value(), ExecutionFault::InvalidJumpTarget);
}

TEST_F(VirtualMachineTest, StartingIpAtEndCompletesImmediately)
{
    const VirtualMachine vm;
    MachineState start = MachineState::withStack({ 4 });
    start.ip = 2;

    const auto result = vm.execute(parse("PUSH 1; HALT"), start);

    EXPECT_EQ(result.outcome, ExecutionOutcome::Completed);
    EXPECT_EQ(result.topOfStack().value(), 4);
    EXPECT_EQ(result.steps(), 0);
}
