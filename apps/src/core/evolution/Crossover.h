#pragma once

#include "EvolutionErrors.h"
#include "core/Result.h"
#include "core/vm/Program.h"

#include <optional>
#include <random>
#include <utility>

namespace StackEvo {

using ProgramPair = std::pair<Program, Program>;

/**
 * Variable-length single-point crossover at fixed cut points.
 *
 * child1 = a[0, cutA) + b[cutB, |b|), child2 = b[0, cutB) + a[cutA, |a|).
 * Jump targets follow the instruction they pointed at into the child. If that instruction was
 * not inherited by the same child, or a child length falls outside [minLength, maxLength],
 * returns nullopt.
 */
std::optional<ProgramPair> crossoverAt(
    const Program& a,
    size_t cutA,
    const Program& b,
    size_t cutB,
    int minLength,
    int maxLength);

/**
 * Crossover with random cut points, redrawn up to kMaxOperatorAttempts times.
 * attempts, when given, receives the number of draws used.
 */
Result<ProgramPair, OperatorRepairFailure> crossover(
    const Program& a,
    const Program& b,
    int minLength,
    int maxLength,
    std::mt19937& rng,
    int* attempts = nullptr);

} // namespace StackEvo
