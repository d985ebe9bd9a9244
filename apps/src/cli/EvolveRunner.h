#pragma once

#include "core/evolution/EvolutionConfig.h"
#include "core/evolution/Problem.h"

#include <atomic>
#include <string>

namespace StackEvo {
namespace Client {

/**
 * Results from a completed evolve run, printed as JSON by the CLI.
 */
struct EvolveResults {
    std::string problem;
    std::string reason;
    int generationsRun = 0;
    int generationFound = -1;
    int populationSize = 0;
    double durationSec = 0.0;

    double bestFitness = 0.0;
    int exactCases = 0;
    int totalCases = 0;
    std::string bestProgram;

    bool completed = false;
    std::string errorMessage;
};

/**
 * Runs the evolution engine in-process and prints one progress line per generation.
 */
class EvolveRunner {
public:
    /**
     * Run evolution against problem with config.
     *
     * @return EvolveResults; completed is false when the config is rejected or an operator
     *         fails, with the cause in errorMessage.
     */
    EvolveResults run(const EvolutionConfig& config, const Problem& problem);

    /**
     * Request stop of the current run (from signal handler).
     */
    void requestStop();

private:
    std::atomic<bool> stopRequested_{ false };

    void displayProgress(
        int generation, int maxGenerations, double best, double mean, double bestEver);
};

} // namespace Client
} // namespace StackEvo
