#pragma once

#include "core/vm/MachineState.h"

#include <array>
#include <numeric>
#include <string>
#include <vector>

namespace StackEvo {

struct TestCase {
    std::vector<Value> initialStack; // Pushed in order, so the last entry starts on top.
    std::array<Value, kVariableSlotCount> initialVariables{};
    Value expected = 0; // Expected top of stack after a completed run.
    double weight = 1.0;

    MachineState initialState() const
    {
        MachineState state = MachineState::withStack(initialStack);
        state.variables = initialVariables;
        return state;
    }
};

/**
 * A target behavior: the test cases a program must satisfy.
 *
 * Implementations must be safe to read from several threads at once; the evaluator only
 * calls const members.
 */
class Problem {
public:
    virtual ~Problem() = default;

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
    virtual const std::vector<TestCase>& testCases() const = 0;

    // Reduces per-case contributions to one score. Default is the sum.
    virtual double aggregate(const std::vector<double>& contributions) const
    {
        return std::accumulate(contributions.begin(), contributions.end(), 0.0);
    }
};

// A Problem backed by a fixed list of test cases.
class TestCaseProblem : public Problem {
public:
    TestCaseProblem(std::string name, std::string description, std::vector<TestCase> cases)
        : name_(std::move(name)), description_(std::move(description)), cases_(std::move(cases))
    {}

    std::string name() const override { return name_; }
    std::string description() const override { return description_; }
    const std::vector<TestCase>& testCases() const override { return cases_; }

private:
    std::string name_;
    std::string description_;
    std::vector<TestCase> cases_;
};

} // namespace StackEvo
