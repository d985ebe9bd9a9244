#include "Selection.h"
#include "core/Assert.h"

#include <algorithm>
#include <numeric>

namespace StackEvo {

int tournamentSelectIndex(const std::vector<double>& fitness, int tournamentSize, std::mt19937& rng)
{
    STACKEVO_ASSERT(!fitness.empty(), "Selection requires a non-empty population");
    STACKEVO_ASSERT(tournamentSize > 0, "Tournament size must be positive");

    std::uniform_int_distribution<int> dist(0, static_cast<int>(fitness.size()) - 1);

    int bestIdx = dist(rng);
    double bestFitness = fitness[bestIdx];

    for (int i = 1; i < tournamentSize; i++) {
        const int idx = dist(rng);
        if (fitness[idx] > bestFitness) {
            bestIdx = idx;
            bestFitness = fitness[idx];
        }
    }

    return bestIdx;
}

int rouletteSelectIndex(const std::vector<double>& fitness, std::mt19937& rng)
{
    STACKEVO_ASSERT(!fitness.empty(), "Selection requires a non-empty population");

    const double minFitness = *std::min_element(fitness.begin(), fitness.end());

    std::vector<double> weights;
    weights.reserve(fitness.size());
    for (double f : fitness) {
        weights.push_back(f - minFitness);
    }

    const double total = std::accumulate(weights.begin(), weights.end(), 0.0);
    if (total <= 0.0) {
        std::uniform_int_distribution<int> dist(0, static_cast<int>(fitness.size()) - 1);
        return dist(rng);
    }

    std::discrete_distribution<int> dist(weights.begin(), weights.end());
    return dist(rng);
}

int selectIndex(
    SelectionStrategy strategy,
    const std::vector<double>& fitness,
    int tournamentSize,
    std::mt19937& rng)
{
    switch (strategy) {
        case SelectionStrategy::Tournament:
            return tournamentSelectIndex(fitness, tournamentSize, rng);
        case SelectionStrategy::Roulette:
            return rouletteSelectIndex(fitness, rng);
    }
    STACKEVO_ASSERT(false, "Unhandled SelectionStrategy");
    return 0;
}

std::vector<int> eliteIndices(const std::vector<double>& fitness, int count)
{
    std::vector<int> order(fitness.size());
    std::iota(order.begin(), order.end(), 0);

    std::stable_sort(order.begin(), order.end(), [&fitness](int a, int b) {
        return fitness[a] > fitness[b];
    });

    order.resize(std::min(order.size(), static_cast<size_t>(std::max(count, 0))));
    return order;
}

} // namespace StackEvo
