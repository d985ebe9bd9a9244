#pragma once

#include "EvolutionConfig.h"

#include <random>
#include <vector>

namespace StackEvo {

/**
 * Tournament selection: sample tournamentSize indices uniformly with replacement and return the
 * fittest. Ties keep the earliest draw.
 */
int tournamentSelectIndex(const std::vector<double>& fitness, int tournamentSize, std::mt19937& rng);

/**
 * Fitness-proportionate selection on fitness shifted by the population minimum, so every weight
 * is non-negative. Falls back to a uniform pick when all weights are zero.
 */
int rouletteSelectIndex(const std::vector<double>& fitness, std::mt19937& rng);

int selectIndex(
    SelectionStrategy strategy,
    const std::vector<double>& fitness,
    int tournamentSize,
    std::mt19937& rng);

/**
 * Indices of the count fittest entries, best first. Equal fitness is ordered by lower index.
 */
std::vector<int> eliteIndices(const std::vector<double>& fitness, int count);

} // namespace StackEvo
