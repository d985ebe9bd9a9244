#include "Population.h"
#include "RandomStreams.h"
#include "core/Assert.h"

namespace StackEvo {

std::string toString(IndividualOrigin origin)
{
    switch (origin) {
        case IndividualOrigin::Seed:
            return "seed";
        case IndividualOrigin::EliteCarryover:
            return "elite";
        case IndividualOrigin::OffspringCrossover:
            return "crossover";
        case IndividualOrigin::OffspringMutated:
            return "mutated";
        case IndividualOrigin::OffspringClone:
            return "clone";
        case IndividualOrigin::Immigrant:
            return "immigrant";
    }
    return "unknown";
}

Population::Population(int size) : size_(size)
{
    STACKEVO_ASSERT(size > 0, "Population size must be positive");
}

void Population::seed(const ProgramGenerator& generator, uint64_t runSeed)
{
    individuals_.clear();
    individuals_.reserve(size_);
    generation_ = 0;

    for (int i = 0; i < size_; ++i) {
        std::mt19937 rng = makeStreamRng(runSeed, RngDomain::Seeding, 0, static_cast<uint64_t>(i));
        Individual individual;
        individual.program = generator.randomProgram(rng);
        individual.birthGeneration = 0;
        individual.origin = IndividualOrigin::Seed;
        individuals_.push_back(std::move(individual));
    }
}

void Population::replace(std::vector<Individual> next)
{
    STACKEVO_ASSERT(
        static_cast<int>(next.size()) == size_,
        "Population size must stay constant across generations");
    individuals_ = std::move(next);
    generation_++;
}

bool Population::allEvaluated() const
{
    if (individuals_.empty()) {
        return false;
    }
    for (const auto& individual : individuals_) {
        if (!individual.evaluated()) {
            return false;
        }
    }
    return true;
}

std::vector<double> Population::fitnessScores() const
{
    std::vector<double> scores;
    scores.reserve(individuals_.size());
    for (const auto& individual : individuals_) {
        STACKEVO_ASSERT(individual.evaluated(), "Fitness requested for an unevaluated individual");
        scores.push_back(individual.fitness.value());
    }
    return scores;
}

int Population::bestIndex() const
{
    STACKEVO_ASSERT(!individuals_.empty(), "Population has not been seeded");
    STACKEVO_ASSERT(individuals_[0].evaluated(), "Best requested before evaluation");

    int best = 0;
    for (int i = 1; i < static_cast<int>(individuals_.size()); ++i) {
        STACKEVO_ASSERT(individuals_[i].evaluated(), "Best requested before evaluation");
        if (individuals_[i].fitness.value() > individuals_[best].fitness.value()) {
            best = i;
        }
    }
    return best;
}

} // namespace StackEvo
