#include "ArithmeticProblems.h"

#include <functional>

namespace StackEvo {

namespace {
std::vector<TestCase> binaryCases(int lo, int hi, const std::function<Value(Value, Value)>& fn)
{
    std::vector<TestCase> cases;
    for (Value a = lo; a <= hi; ++a) {
        for (Value b = lo; b <= hi; ++b) {
            TestCase testCase;
            testCase.initialStack = { a, b };
            testCase.expected = fn(a, b);
            cases.push_back(testCase);
        }
    }
    return cases;
}

std::vector<TestCase> unaryCases(int lo, int hi, const std::function<Value(Value)>& fn)
{
    std::vector<TestCase> cases;
    for (Value a = lo; a <= hi; ++a) {
        TestCase testCase;
        testCase.initialStack = { a };
        testCase.expected = fn(a);
        cases.push_back(testCase);
    }
    return cases;
}

Value fibonacci(Value n)
{
    Value previous = 0;
    Value current = 1;
    for (Value i = 0; i < n; ++i) {
        const Value next = previous + current;
        previous = current;
        current = next;
    }
    return previous;
}
} // namespace

std::unique_ptr<Problem> createAdditionProblem()
{
    return std::make_unique<TestCaseProblem>(
        "add", "a + b for a, b in [0, 9]", binaryCases(0, 9, [](Value a, Value b) {
            return a + b;
        }));
}

std::unique_ptr<Problem> createSubtractionProblem()
{
    return std::make_unique<TestCaseProblem>(
        "subtract", "a - b for a, b in [0, 9]", binaryCases(0, 9, [](Value a, Value b) {
            return a - b;
        }));
}

std::unique_ptr<Problem> createMultiplicationProblem()
{
    return std::make_unique<TestCaseProblem>(
        "multiply", "a * b for a, b in [0, 9]", binaryCases(0, 9, [](Value a, Value b) {
            return a * b;
        }));
}

std::unique_ptr<Problem> createSquareProblem()
{
    return std::make_unique<TestCaseProblem>(
        "square", "a * a for a in [-9, 9]", unaryCases(-9, 9, [](Value a) { return a * a; }));
}

std::unique_ptr<Problem> createSumOfSquaresProblem()
{
    return std::make_unique<TestCaseProblem>(
        "sum-of-squares", "a * a + b * b for a, b in [0, 5]", binaryCases(0, 5, [](Value a, Value b) {
            return a * a + b * b;
        }));
}

std::unique_ptr<Problem> createFibonacciProblem()
{
    return std::make_unique<TestCaseProblem>(
        "fibonacci", "fib(n) for n in [0, 10]", unaryCases(0, 10, fibonacci));
}

} // namespace StackEvo
