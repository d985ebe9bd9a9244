#include "EvolveRunner.h"
#include "core/LoggingChannels.h"
#include "core/evolution/EvolutionEngine.h"
#include "core/vm/ProgramText.h"

#include <chrono>
#include <iomanip>
#include <iostream>

namespace StackEvo {
namespace Client {

void EvolveRunner::requestStop()
{
    stopRequested_ = true;
}

void EvolveRunner::displayProgress(
    int generation, int maxGenerations, double best, double mean, double bestEver)
{
    std::cerr << "Gen " << std::setw(4) << generation << "/" << maxGenerations << std::fixed
              << std::setprecision(4) << "  best " << best << "  mean " << mean << "  best ever "
              << bestEver << std::endl;
}

EvolveResults EvolveRunner::run(const EvolutionConfig& config, const Problem& problem)
{
    EvolveResults results;
    results.problem = problem.name();
    results.populationSize = config.populationSize;

    auto created = EvolutionEngine::create(config, problem);
    if (created.isError()) {
        results.errorMessage = created.errorValue().describe();
        return results;
    }
    auto engine = std::move(created.value());

    engine->setGenerationObserver([this, &config](const GenerationStats& stats) {
        displayProgress(
            stats.generation,
            config.maxGenerations,
            stats.bestFitness,
            stats.meanFitness,
            stats.bestEverFitness);
    });

    const auto start = std::chrono::steady_clock::now();
    auto outcome = engine->run(&stopRequested_);
    results.durationSec =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    if (outcome.isError()) {
        results.errorMessage = outcome.errorValue().describe();
        return results;
    }

    const RunResult& run = outcome.value();
    results.reason = toString(run.reason);
    results.generationsRun = run.generationsRun;
    results.generationFound = run.generationFound;
    results.bestFitness = run.bestFitness;
    results.exactCases = run.bestEvaluation.exactCases;
    results.totalCases = run.bestEvaluation.totalCases;
    results.bestProgram = formatProgram(run.bestProgram, "; ");
    results.completed = true;

    LOG_INFO(
        Cli,
        "{}: {} after {} generations in {:.2f}s",
        results.problem,
        results.reason,
        results.generationsRun,
        results.durationSec);
    return results;
}

} // namespace Client
} // namespace StackEvo
