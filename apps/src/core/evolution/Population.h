#pragma once

#include "Individual.h"
#include "ProgramGenerator.h"

#include <cstdint>
#include <vector>

namespace StackEvo {

/**
 * The individuals of one generation.
 *
 * Size is fixed at construction. seed() fills it and every replace() must supply exactly the
 * same number of individuals; a mismatch is a bug in the caller and asserts.
 */
class Population {
public:
    explicit Population(int size);

    // Generation 0 of random programs. Individual i draws from its own seeding stream.
    void seed(const ProgramGenerator& generator, uint64_t runSeed);

    // Installs the next generation and advances the generation index.
    void replace(std::vector<Individual> next);

    int size() const { return size_; }
    int generation() const { return generation_; }
    bool seeded() const { return !individuals_.empty(); }

    const std::vector<Individual>& individuals() const { return individuals_; }
    Individual& at(size_t index) { return individuals_[index]; }
    const Individual& at(size_t index) const { return individuals_[index]; }

    bool allEvaluated() const;

    // Requires allEvaluated().
    std::vector<double> fitnessScores() const;

    // Highest fitness, lowest index on ties. Requires allEvaluated().
    int bestIndex() const;

private:
    int size_ = 0;
    int generation_ = 0;
    std::vector<Individual> individuals_;
};

} // namespace StackEvo
