#pragma once

#include "core/evolution/Problem.h"

#include <memory>

namespace StackEvo {

// Operands are pushed in order, so for two inputs b starts on top of a.

// a + b for a, b in [0, 9].
std::unique_ptr<Problem> createAdditionProblem();

// a - b for a, b in [0, 9].
std::unique_ptr<Problem> createSubtractionProblem();

// a * b for a, b in [0, 9].
std::unique_ptr<Problem> createMultiplicationProblem();

// a * a for a in [-9, 9].
std::unique_ptr<Problem> createSquareProblem();

// a * a + b * b for a, b in [0, 5].
std::unique_ptr<Problem> createSumOfSquaresProblem();

// fib(n) for n in [0, 10], fib(0) = 0, fib(1) = 1.
std::unique_ptr<Problem> createFibonacciProblem();

} // namespace StackEvo
