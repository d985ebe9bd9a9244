#pragma once

#include "EvaluationPool.h"
#include "EvolutionConfig.h"
#include "EvolutionErrors.h"
#include "Individual.h"
#include "Mutation.h"
#include "Population.h"
#include "ProgramGenerator.h"
#include "core/Result.h"

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace StackEvo {

enum class EvolutionPhase : uint8_t {
    Seeding = 0,
    Evaluating,
    Selecting,
    Reproducing,
    Replacing,
    Terminated,
};

enum class TerminationReason : uint8_t {
    Solved = 0,
    Exhausted,
    Stagnated,
    Cancelled,
};

std::string toString(EvolutionPhase phase);
std::string toString(TerminationReason reason);

// How the individuals of one generation were produced from the previous one.
struct BreedingStats {
    int eliteCount = 0;
    int crossoverOffspring = 0;
    int crossoverRejections = 0; // Pairs cloned because no valid cut points were found.
    int mutatedOffspring = 0;
    int cloneOffspring = 0;
    int immigrants = 0;
    std::array<int, kMutationKindCount> mutationsByKind{};
};

struct GenerationStats {
    int generation = 0;
    double bestFitness = 0.0;
    double meanFitness = 0.0;
    double worstFitness = 0.0;
    double bestEverFitness = 0.0;
    double faultedFraction = 0.0;  // Individuals with at least one faulted case.
    double timedOutFraction = 0.0; // Individuals with at least one timed-out case.
    int evaluatedCount = 0;        // Individuals scored this generation; the rest kept a cache.
    BreedingStats breeding;
};

struct RunResult {
    Program bestProgram;
    double bestFitness = 0.0;
    Evaluation bestEvaluation;
    int generationFound = -1; // -1 when no generation finished evaluating.
    int generationsRun = 0;
    TerminationReason reason = TerminationReason::Cancelled;
    std::vector<GenerationStats> history;
};

/**
 * Runs the generational loop for one Problem.
 *
 * Each step() advances one phase:
 * Seeding -> Evaluating -> Selecting -> Reproducing -> Replacing -> Evaluating ... -> Terminated.
 * A generation after the first is built from the elites, then config.immigrantCount fresh
 * random programs, then bred offspring.
 * Termination is decided after each evaluation (solved, then exhausted, then stagnated), or
 * when the stop flag is seen at a phase boundary or during evaluation.
 *
 * All randomness comes from streams derived from config.seed, so a run is reproducible for a
 * given config regardless of maxParallelEvaluations.
 */
class EvolutionEngine {
public:
    struct Status {
        EvolutionPhase phase = EvolutionPhase::Seeding;
        int generation = 0;
        std::optional<double> bestFitness; // Best ever, once a generation has been evaluated.
        std::optional<TerminationReason> reason;
    };

    using GenerationObserver = std::function<void(const GenerationStats&)>;

    // The problem must outlive the engine.
    static Result<std::unique_ptr<EvolutionEngine>, ConfigurationError> create(
        const EvolutionConfig& config, const Problem& problem);

    // An OperatorRepairFailure from mutation terminates the run.
    Result<Status, OperatorRepairFailure> step(const std::atomic<bool>* stopRequested = nullptr);

    Result<RunResult, OperatorRepairFailure> run(const std::atomic<bool>* stopRequested = nullptr);

    // Called once per evaluated generation.
    void setGenerationObserver(GenerationObserver observer) { observer_ = std::move(observer); }

    Status status() const;
    RunResult result() const;

    EvolutionPhase phase() const { return phase_; }
    int generation() const { return population_.generation(); }
    const Population& population() const { return population_; }
    const EvolutionConfig& config() const { return config_; }
    const std::vector<GenerationStats>& history() const { return history_; }
    const std::optional<Individual>& bestEver() const { return bestEver_; }

private:
    EvolutionEngine(const EvolutionConfig& config, const Problem& problem);

    void seedPopulation();
    void evaluateGeneration(const std::atomic<bool>* stopRequested);
    void selectParents();
    Result<std::monostate, OperatorRepairFailure> reproduce();
    int offspringNeeded() const;
    void replaceGeneration();

    GenerationStats captureStats(int evaluatedCount) const;
    std::optional<TerminationReason> checkTermination() const;
    void terminate(TerminationReason reason);

    EvolutionConfig config_;
    const Problem& problem_;
    ProgramGenerator generator_;
    EvaluationPool pool_;
    Population population_;

    EvolutionPhase phase_ = EvolutionPhase::Seeding;
    std::optional<TerminationReason> reason_;

    std::vector<std::pair<int, int>> parentPairs_;
    std::vector<Individual> nextGeneration_;
    BreedingStats pendingBreeding_;

    std::optional<Individual> bestEver_;
    int generationFound_ = -1;
    int generationsEvaluated_ = 0;
    int stagnantGenerations_ = 0;
    std::vector<GenerationStats> history_;
    GenerationObserver observer_;
};

} // namespace StackEvo
