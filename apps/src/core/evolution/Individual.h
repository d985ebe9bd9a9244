#pragma once

#include "FitnessEvaluator.h"
#include "core/vm/Program.h"

#include <cstdint>
#include <optional>
#include <string>

namespace StackEvo {

enum class IndividualOrigin : uint8_t {
    Seed = 0,
    EliteCarryover = 1,
    OffspringCrossover = 2,
    OffspringMutated = 3,
    OffspringClone = 4,
    Immigrant = 5,
};

std::string toString(IndividualOrigin origin);

struct Individual {
    Program program;
    std::optional<double> fitness;
    std::optional<Evaluation> evaluation;
    int birthGeneration = 0;
    IndividualOrigin origin = IndividualOrigin::Seed;

    bool evaluated() const { return fitness.has_value(); }

    // A changed program invalidates the cached score.
    void setProgram(Program next)
    {
        program = std::move(next);
        fitness.reset();
        evaluation.reset();
    }
};

} // namespace StackEvo
