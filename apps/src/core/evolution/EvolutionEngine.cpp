#include "EvolutionEngine.h"
#include "Crossover.h"
#include "RandomStreams.h"
#include "Selection.h"
#include "core/Assert.h"
#include "core/LoggingChannels.h"
#include "core/vm/ProgramText.h"

#include <algorithm>
#include <limits>

namespace StackEvo {

namespace {
bool isStopped(const std::atomic<bool>* stopRequested)
{
    return stopRequested && stopRequested->load(std::memory_order_relaxed);
}

Individual makeOffspring(const Individual& parent, int generation)
{
    // A clone keeps the parent's score until something changes its program.
    Individual child = parent;
    child.birthGeneration = generation;
    child.origin = IndividualOrigin::OffspringClone;
    return child;
}
} // namespace

std::string toString(EvolutionPhase phase)
{
    switch (phase) {
        case EvolutionPhase::Seeding:
            return "seeding";
        case EvolutionPhase::Evaluating:
            return "evaluating";
        case EvolutionPhase::Selecting:
            return "selecting";
        case EvolutionPhase::Reproducing:
            return "reproducing";
        case EvolutionPhase::Replacing:
            return "replacing";
        case EvolutionPhase::Terminated:
            return "terminated";
    }
    return "unknown";
}

std::string toString(TerminationReason reason)
{
    switch (reason) {
        case TerminationReason::Solved:
            return "solved";
        case TerminationReason::Exhausted:
            return "exhausted";
        case TerminationReason::Stagnated:
            return "stagnated";
        case TerminationReason::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

Result<std::unique_ptr<EvolutionEngine>, ConfigurationError> EvolutionEngine::create(
    const EvolutionConfig& config, const Problem& problem)
{
    using CreateResult = Result<std::unique_ptr<EvolutionEngine>, ConfigurationError>;

    auto validation = validateConfig(config);
    if (validation.isError()) {
        LOG_ERROR(Evolution, "Invalid configuration: {}", validation.errorValue().describe());
        return CreateResult::error(validation.errorValue());
    }
    if (problem.testCases().empty()) {
        return CreateResult::error(
            ConfigurationError{ "problem", "'" + problem.name() + "' has no test cases" });
    }

    LOG_INFO(
        Evolution,
        "Evolving '{}': population {}, up to {} generations, seed {}, {} selection",
        problem.name(),
        config.populationSize,
        config.maxGenerations,
        config.seed,
        toString(config.selectionStrategy));

    return CreateResult::okay(std::unique_ptr<EvolutionEngine>(new EvolutionEngine(config, problem)));
}

EvolutionEngine::EvolutionEngine(const EvolutionConfig& config, const Problem& problem)
    : config_(config),
      problem_(problem),
      generator_(config),
      pool_(
          FitnessEvaluator(vmLimitsFor(config), config.parsimonyWeight, config.maxProgramLength),
          problem,
          config.maxParallelEvaluations),
      population_(config.populationSize)
{}

Result<EvolutionEngine::Status, OperatorRepairFailure> EvolutionEngine::step(
    const std::atomic<bool>* stopRequested)
{
    using StepResult = Result<Status, OperatorRepairFailure>;

    if (phase_ == EvolutionPhase::Terminated) {
        return StepResult::okay(status());
    }
    if (isStopped(stopRequested)) {
        terminate(TerminationReason::Cancelled);
        return StepResult::okay(status());
    }

    switch (phase_) {
        case EvolutionPhase::Seeding:
            seedPopulation();
            phase_ = EvolutionPhase::Evaluating;
            break;
        case EvolutionPhase::Evaluating:
            evaluateGeneration(stopRequested);
            break;
        case EvolutionPhase::Selecting:
            selectParents();
            phase_ = EvolutionPhase::Reproducing;
            break;
        case EvolutionPhase::Reproducing: {
            auto reproduced = reproduce();
            if (reproduced.isError()) {
                LOG_ERROR(
                    Evolution,
                    "Generation {} aborted: {}",
                    population_.generation(),
                    reproduced.errorValue().describe());
                phase_ = EvolutionPhase::Terminated;
                return StepResult::error(reproduced.errorValue());
            }
            phase_ = EvolutionPhase::Replacing;
            break;
        }
        case EvolutionPhase::Replacing:
            replaceGeneration();
            phase_ = EvolutionPhase::Evaluating;
            break;
        case EvolutionPhase::Terminated:
            break;
    }

    return StepResult::okay(status());
}

Result<RunResult, OperatorRepairFailure> EvolutionEngine::run(const std::atomic<bool>* stopRequested)
{
    while (phase_ != EvolutionPhase::Terminated) {
        auto stepped = step(stopRequested);
        if (stepped.isError()) {
            return Result<RunResult, OperatorRepairFailure>::error(stepped.errorValue());
        }
    }
    return Result<RunResult, OperatorRepairFailure>::okay(result());
}

EvolutionEngine::Status EvolutionEngine::status() const
{
    Status status;
    status.phase = phase_;
    status.generation = population_.generation();
    if (bestEver_.has_value()) {
        status.bestFitness = bestEver_->fitness;
    }
    status.reason = reason_;
    return status;
}

RunResult EvolutionEngine::result() const
{
    RunResult result;
    if (bestEver_.has_value()) {
        result.bestProgram = bestEver_->program;
        result.bestFitness = bestEver_->fitness.value();
        result.bestEvaluation = bestEver_->evaluation.value_or(Evaluation{});
    }
    else {
        result.bestFitness = std::numeric_limits<double>::lowest();
    }
    result.generationFound = generationFound_;
    result.generationsRun = generationsEvaluated_;
    result.reason = reason_.value_or(TerminationReason::Cancelled);
    result.history = history_;
    return result;
}

void EvolutionEngine::seedPopulation()
{
    population_.seed(generator_, config_.seed);
    pendingBreeding_ = BreedingStats{};
    LOG_DEBUG(Evolution, "Seeded {} random programs", population_.size());
}

void EvolutionEngine::evaluateGeneration(const std::atomic<bool>* stopRequested)
{
    std::vector<EvaluationTask> tasks;
    for (int i = 0; i < population_.size(); ++i) {
        const Individual& individual = population_.at(i);
        if (!individual.evaluated()) {
            tasks.push_back(EvaluationTask{ i, individual.program });
        }
    }

    auto evaluations = pool_.evaluateAll(tasks, stopRequested);
    for (const auto& task : tasks) {
        if (!evaluations[task.index].has_value()) {
            LOG_INFO(
                Evolution, "Generation {} cancelled during evaluation", population_.generation());
            terminate(TerminationReason::Cancelled);
            return;
        }
    }
    for (const auto& task : tasks) {
        Individual& individual = population_.at(task.index);
        individual.evaluation = evaluations[task.index].value();
        individual.fitness = individual.evaluation->fitness;
    }
    generationsEvaluated_++;

    const int best = population_.bestIndex();
    const Individual& champion = population_.at(best);
    if (!bestEver_.has_value() || champion.fitness.value() > bestEver_->fitness.value()) {
        bestEver_ = champion;
        generationFound_ = population_.generation();
        stagnantGenerations_ = 0;
    }
    else {
        stagnantGenerations_++;
    }

    GenerationStats stats = captureStats(static_cast<int>(tasks.size()));
    history_.push_back(stats);

    LOG_INFO(
        Evolution,
        "gen {}: best {:.4f} mean {:.4f} worst {:.4f} | faulted {:.0f}% timed out {:.0f}% | "
        "{} crossover, {} mutated, {} clones, {} immigrants, {} rejected",
        stats.generation,
        stats.bestFitness,
        stats.meanFitness,
        stats.worstFitness,
        stats.faultedFraction * 100.0,
        stats.timedOutFraction * 100.0,
        stats.breeding.crossoverOffspring,
        stats.breeding.mutatedOffspring,
        stats.breeding.cloneOffspring,
        stats.breeding.immigrants,
        stats.breeding.crossoverRejections);
    LOG_DEBUG(
        Evolution,
        "gen {} best program: {}",
        stats.generation,
        formatProgram(champion.program, "; "));

    if (observer_) {
        observer_(stats);
    }

    if (auto reason = checkTermination()) {
        terminate(reason.value());
        return;
    }
    phase_ = EvolutionPhase::Selecting;
}

void EvolutionEngine::selectParents()
{
    const std::vector<double> fitness = population_.fitnessScores();
    std::mt19937 rng = makeStreamRng(
        config_.seed, RngDomain::Selection, static_cast<uint64_t>(population_.generation()), 0);

    const int pairCount = (offspringNeeded() + 1) / 2;

    parentPairs_.clear();
    parentPairs_.reserve(pairCount);
    for (int i = 0; i < pairCount; ++i) {
        const int first = selectIndex(config_.selectionStrategy, fitness, config_.tournamentSize, rng);
        const int second =
            selectIndex(config_.selectionStrategy, fitness, config_.tournamentSize, rng);
        parentPairs_.emplace_back(first, second);
    }
}

Result<std::monostate, OperatorRepairFailure> EvolutionEngine::reproduce()
{
    const int nextGen = population_.generation() + 1;
    const int offspringWanted = offspringNeeded();

    BreedingStats breeding;
    nextGeneration_.clear();
    nextGeneration_.reserve(config_.populationSize);

    for (int index : eliteIndices(population_.fitnessScores(), config_.eliteCount)) {
        Individual elite = population_.at(index);
        elite.origin = IndividualOrigin::EliteCarryover;
        nextGeneration_.push_back(std::move(elite));
        breeding.eliteCount++;
    }

    for (int i = 0; i < config_.immigrantCount; ++i) {
        std::mt19937 rng = makeStreamRng(
            config_.seed,
            RngDomain::Immigration,
            static_cast<uint64_t>(population_.generation()),
            static_cast<uint64_t>(i));
        Individual immigrant;
        immigrant.program = generator_.randomProgram(rng);
        immigrant.birthGeneration = nextGen;
        immigrant.origin = IndividualOrigin::Immigrant;
        nextGeneration_.push_back(std::move(immigrant));
        breeding.immigrants++;
    }

    std::bernoulli_distribution doCrossover(config_.crossoverRate);
    std::bernoulli_distribution doMutation(config_.mutationRate);

    int produced = 0;
    for (size_t pair = 0; pair < parentPairs_.size() && produced < offspringWanted; ++pair) {
        std::mt19937 rng = makeStreamRng(
            config_.seed,
            RngDomain::Reproduction,
            static_cast<uint64_t>(population_.generation()),
            static_cast<uint64_t>(pair));

        const Individual& mother = population_.at(parentPairs_[pair].first);
        const Individual& father = population_.at(parentPairs_[pair].second);

        std::array<Individual, 2> children{ makeOffspring(mother, nextGen),
                                            makeOffspring(father, nextGen) };

        if (doCrossover(rng)) {
            auto recombined = crossover(
                mother.program,
                father.program,
                config_.minProgramLength,
                config_.maxProgramLength,
                rng);
            if (recombined.isValue()) {
                children[0].setProgram(std::move(recombined.value().first));
                children[1].setProgram(std::move(recombined.value().second));
                children[0].origin = IndividualOrigin::OffspringCrossover;
                children[1].origin = IndividualOrigin::OffspringCrossover;
            }
            else {
                breeding.crossoverRejections++;
            }
        }

        for (Individual& child : children) {
            if (produced >= offspringWanted) {
                break;
            }

            if (doMutation(rng)) {
                MutationStats mutationStats;
                auto mutated = mutate(child.program, generator_, rng, &mutationStats);
                if (mutated.isError()) {
                    return Result<std::monostate, OperatorRepairFailure>::error(
                        mutated.errorValue());
                }
                child.setProgram(std::move(mutated.value()));
                child.origin = IndividualOrigin::OffspringMutated;
                breeding.mutationsByKind[static_cast<size_t>(mutationStats.kind)]++;
            }

            switch (child.origin) {
                case IndividualOrigin::OffspringCrossover:
                    breeding.crossoverOffspring++;
                    break;
                case IndividualOrigin::OffspringMutated:
                    breeding.mutatedOffspring++;
                    break;
                default:
                    breeding.cloneOffspring++;
                    break;
            }

            nextGeneration_.push_back(std::move(child));
            produced++;
        }
    }

    pendingBreeding_ = breeding;
    return Result<std::monostate, OperatorRepairFailure>::okay(std::monostate{});
}

int EvolutionEngine::offspringNeeded() const
{
    return config_.populationSize - config_.eliteCount - config_.immigrantCount;
}

void EvolutionEngine::replaceGeneration()
{
    population_.replace(std::move(nextGeneration_));
    nextGeneration_.clear();
    parentPairs_.clear();
}

GenerationStats EvolutionEngine::captureStats(int evaluatedCount) const
{
    GenerationStats stats;
    stats.generation = population_.generation();
    stats.evaluatedCount = evaluatedCount;
    stats.breeding = pendingBreeding_;
    stats.bestEverFitness = bestEver_.has_value() ? bestEver_->fitness.value() : 0.0;

    const auto& individuals = population_.individuals();
    stats.bestFitness = std::numeric_limits<double>::lowest();
    stats.worstFitness = std::numeric_limits<double>::max();

    double total = 0.0;
    int faulted = 0;
    int timedOut = 0;
    for (const Individual& individual : individuals) {
        const double fitness = individual.fitness.value();
        stats.bestFitness = std::max(stats.bestFitness, fitness);
        stats.worstFitness = std::min(stats.worstFitness, fitness);
        total += fitness;
        if (individual.evaluation.has_value()) {
            if (individual.evaluation->faultedCases > 0) {
                faulted++;
            }
            if (individual.evaluation->timedOutCases > 0) {
                timedOut++;
            }
        }
    }

    const double count = static_cast<double>(individuals.size());
    stats.meanFitness = total / count;
    stats.faultedFraction = faulted / count;
    stats.timedOutFraction = timedOut / count;
    return stats;
}

std::optional<TerminationReason> EvolutionEngine::checkTermination() const
{
    STACKEVO_ASSERT(bestEver_.has_value(), "Termination checked before any evaluation");

    const bool solved = config_.fitnessThreshold.has_value()
        ? bestEver_->fitness.value() >= config_.fitnessThreshold.value()
        : bestEver_->evaluation.has_value() && bestEver_->evaluation->perfect();
    if (solved) {
        return TerminationReason::Solved;
    }
    if (population_.generation() + 1 >= config_.maxGenerations) {
        return TerminationReason::Exhausted;
    }
    if (config_.stagnationWindow > 0 && stagnantGenerations_ >= config_.stagnationWindow) {
        return TerminationReason::Stagnated;
    }
    return std::nullopt;
}

void EvolutionEngine::terminate(TerminationReason reason)
{
    phase_ = EvolutionPhase::Terminated;
    reason_ = reason;

    if (bestEver_.has_value()) {
        LOG_INFO(
            Evolution,
            "'{}' run {} after {} generations: best fitness {:.4f} (gen {}, {} instructions)",
            problem_.name(),
            toString(reason),
            generationsEvaluated_,
            bestEver_->fitness.value(),
            generationFound_,
            bestEver_->program.size());
    }
    else {
        LOG_INFO(
            Evolution,
            "'{}' run {} before any generation was evaluated",
            problem_.name(),
            toString(reason));
    }
}

} // namespace StackEvo
