#pragma once

#include "EvolutionConfig.h"
#include "EvolutionErrors.h"
#include "ProgramGenerator.h"
#include "core/Result.h"
#include "core/vm/Program.h"

#include <array>
#include <optional>
#include <random>
#include <string>

namespace StackEvo {

enum class MutationKind : uint8_t {
    Point = 0,
    Insertion,
    Deletion,
    Operand,
};

inline constexpr int kMutationKindCount = 4;

// Draws an operator may spend before reporting OperatorRepairFailure.
inline constexpr int kMaxOperatorAttempts = 16;

std::string toString(MutationKind kind);

struct MutationStats {
    MutationKind kind = MutationKind::Point;
    int attempts = 0;
};

/**
 * Apply exactly one randomly chosen mutation to a copy of parent.
 *
 * The operator is drawn uniformly from point, insertion, deletion and operand mutation. A
 * draw that does not apply (insertion at max length, deletion at min length, operand
 * mutation with no operands) or that fails validation is redrawn, up to
 * kMaxOperatorAttempts times.
 */
Result<Program, OperatorRepairFailure> mutate(
    const Program& parent,
    const ProgramGenerator& generator,
    std::mt19937& rng,
    MutationStats* stats = nullptr);

/**
 * Deterministic program edits used by mutate(). Each returns nullopt when the edit does not
 * apply or the result would not be a valid program.
 */
namespace ProgramEdit {

// Replace the instruction at position. The replacement's jump target is in program coordinates.
std::optional<Program> replaceAt(const Program& program, size_t position, const Instruction& with);

// Insert before position (position == size appends). Existing jump targets at or past position
// shift by +1. The inserted instruction's jump target is taken as-is in the new coordinates.
std::optional<Program> insertAt(
    const Program& program, size_t position, const Instruction& instruction, int maxLength);

// Remove the instruction at position. Targets past it shift by -1; targets at it keep
// pointing at the same index (the instruction that moved up), clamped to the new last index.
std::optional<Program> deleteAt(const Program& program, size_t position, int minLength);

} // namespace ProgramEdit

} // namespace StackEvo
