#include "core/evolution/EvolutionEngine.h"
#include "core/problems/ArithmeticProblems.h"

#include <gtest/gtest.h>

using namespace StackEvo;

class EvolutionEngineTest : public ::testing::Test {
protected:
    std::unique_ptr<Problem> addition = createAdditionProblem();
    std::unique_ptr<Problem> fibonacci = createFibonacciProblem();

    EvolutionConfig smallConfig()
    {
        EvolutionConfig config;
        config.populationSize = 40;
        config.maxGenerations = 30;
        config.maxProgramLength = 8;
        config.stepLimit = 200;
        config.seed = 11;
        return config;
    }

    std::unique_ptr<EvolutionEngine> makeEngine(const EvolutionConfig& config, const Problem& problem)
    {
        auto created = EvolutionEngine::create(config, problem);
        EXPECT_TRUE(created.isValue());
        return created.isValue() ? std::move(created.value()) : nullptr;
    }

    RunResult runToEnd(EvolutionEngine& engine, const std::atomic<bool>* stop = nullptr)
    {
        auto result = engine.run(stop);
        EXPECT_TRUE(result.isValue());
        return result.isValue() ? result.value() : RunResult{};
    }
};

TEST_F(EvolutionEngineTest, CreateRejectsInvalidConfig)
{
    EvolutionConfig config = smallConfig();
    config.eliteCount = config.populationSize;

    auto created = EvolutionEngine::create(config, *addition);

    ASSERT_TRUE(created.isError());
    EXPECT_EQ(created.errorValue().field, "eliteCount");
}

TEST_F(EvolutionEngineTest, CreateRejectsProblemWithoutCases)
{
    const TestCaseProblem empty("empty", "no cases", {});

    auto created = EvolutionEngine::create(smallConfig(), empty);

    ASSERT_TRUE(created.isError());
    EXPECT_EQ(created.errorValue().field, "problem");
}

TEST_F(EvolutionEngineTest, StepsThroughPhasesInOrder)
{
    auto engine = makeEngine(smallConfig(), *fibonacci);
    ASSERT_NE(engine, nullptr);
    EXPECT_EQ(engine->phase(), EvolutionPhase::Seeding);

    const std::vector<EvolutionPhase> expected = {
        EvolutionPhase::Evaluating,  EvolutionPhase::Selecting, EvolutionPhase::Reproducing,
        EvolutionPhase::Replacing,   EvolutionPhase::Evaluating, EvolutionPhase::Selecting,
    };
    for (EvolutionPhase phase : expected) {
        auto status = engine->step();
        ASSERT_TRUE(status.isValue());
        EXPECT_EQ(status.value().phase, phase);
        EXPECT_EQ(engine->population().size(), 40);
    }
    EXPECT_EQ(engine->generation(), 1);
    EXPECT_TRUE(engine->status().bestFitness.has_value());
}

TEST_F(EvolutionEngineTest, SolvesAddition)
{
    EvolutionConfig config = smallConfig();
    config.populationSize = 100;
    config.maxProgramLength = 4;
    config.maxGenerations = 100;

    auto engine = makeEngine(config, *addition);
    ASSERT_NE(engine, nullptr);
    const RunResult result = runToEnd(*engine);

    EXPECT_EQ(result.reason, TerminationReason::Solved);
    EXPECT_TRUE(result.bestEvaluation.perfect());
    EXPECT_EQ(result.bestEvaluation.exactCases, 100);
    EXPECT_GE(result.generationFound, 0);
    EXPECT_EQ(static_cast<int>(result.history.size()), result.generationsRun);
}

TEST_F(EvolutionEngineTest, ThresholdSolvesEarly)
{
    EvolutionConfig config = smallConfig();
    config.fitnessThreshold = -1000.0;

    auto engine = makeEngine(config, *fibonacci);
    const RunResult result = runToEnd(*engine);

    EXPECT_EQ(result.reason, TerminationReason::Solved);
    EXPECT_EQ(result.generationsRun, 1);
}

TEST_F(EvolutionEngineTest, StopsAfterMaxGenerations)
{
    EvolutionConfig config = smallConfig();
    config.maxGenerations = 3;
    config.fitnessThreshold = 1e9;

    auto engine = makeEngine(config, *fibonacci);
    const RunResult result = runToEnd(*engine);

    EXPECT_EQ(result.reason, TerminationReason::Exhausted);
    EXPECT_EQ(result.generationsRun, 3);
    EXPECT_EQ(result.history.size(), 3u);
    EXPECT_EQ(engine->phase(), EvolutionPhase::Terminated);
}

TEST_F(EvolutionEngineTest, StopsWhenBestStagnates)
{
    EvolutionConfig config = smallConfig();
    config.populationSize = 10;
    config.maxGenerations = 1000;
    config.stagnationWindow = 2;
    config.fitnessThreshold = 1e9;

    auto engine = makeEngine(config, *fibonacci);
    const RunResult result = runToEnd(*engine);

    ASSERT_EQ(result.reason, TerminationReason::Stagnated);
    ASSERT_GE(result.history.size(), 3u);
    const size_t last = result.history.size() - 1;
    EXPECT_DOUBLE_EQ(result.history[last].bestEverFitness, result.history[last - 2].bestEverFitness);
}

TEST_F(EvolutionEngineTest, PresetStopCancelsBeforeSeeding)
{
    auto engine = makeEngine(smallConfig(), *addition);
    std::atomic<bool> stop{ true };

    const RunResult result = runToEnd(*engine, &stop);

    EXPECT_EQ(result.reason, TerminationReason::Cancelled);
    EXPECT_EQ(result.generationsRun, 0);
    EXPECT_EQ(result.generationFound, -1);
}

TEST_F(EvolutionEngineTest, StopDuringRunCancelsAtNextPhase)
{
    EvolutionConfig config = smallConfig();
    config.fitnessThreshold = 1e9;
    auto engine = makeEngine(config, *fibonacci);
    std::atomic<bool> stop{ false };

    engine->setGenerationObserver([&stop](const GenerationStats& stats) {
        if (stats.generation == 1) {
            stop = true;
        }
    });
    const RunResult result = runToEnd(*engine, &stop);

    EXPECT_EQ(result.reason, TerminationReason::Cancelled);
    EXPECT_EQ(result.generationsRun, 2);
    EXPECT_GE(result.generationFound, 0);
}

TEST_F(EvolutionEngineTest, ElitismKeepsBestFitnessMonotonic)
{
    EvolutionConfig config = smallConfig();
    config.eliteCount = 1;
    config.fitnessThreshold = 1e9;

    auto engine = makeEngine(config, *fibonacci);
    const RunResult result = runToEnd(*engine);

    ASSERT_EQ(result.history.size(), 30u);
    for (size_t i = 1; i < result.history.size(); i++) {
        EXPECT_GE(result.history[i].bestFitness, result.history[i - 1].bestFitness) << i;
        EXPECT_EQ(result.history[i].breeding.eliteCount, 1);
    }
}

TEST_F(EvolutionEngineTest, SameSeedReproducesRun)
{
    EvolutionConfig config = smallConfig();
    config.fitnessThreshold = 1e9;
    config.maxGenerations = 10;

    auto first = makeEngine(config, *fibonacci);
    auto second = makeEngine(config, *fibonacci);
    const RunResult a = runToEnd(*first);
    const RunResult b = runToEnd(*second);

    EXPECT_EQ(a.bestProgram, b.bestProgram);
    EXPECT_DOUBLE_EQ(a.bestFitness, b.bestFitness);
    ASSERT_EQ(a.history.size(), b.history.size());
    for (size_t i = 0; i < a.history.size(); i++) {
        EXPECT_DOUBLE_EQ(a.history[i].meanFitness, b.history[i].meanFitness);
    }
}

TEST_F(EvolutionEngineTest, WorkerCountDoesNotChangeOutcome)
{
    EvolutionConfig config = smallConfig();
    config.fitnessThreshold = 1e9;
    config.maxGenerations = 8;

    EvolutionConfig threaded = config;
    threaded.maxParallelEvaluations = 4;

    auto serialEngine = makeEngine(config, *fibonacci);
    auto threadedEngine = makeEngine(threaded, *fibonacci);
    const RunResult serial = runToEnd(*serialEngine);
    const RunResult parallel = runToEnd(*threadedEngine);

    EXPECT_EQ(serial.bestProgram, parallel.bestProgram);
    ASSERT_EQ(serial.history.size(), parallel.history.size());
    for (size_t i = 0; i < serial.history.size(); i++) {
        EXPECT_DOUBLE_EQ(serial.history[i].meanFitness, parallel.history[i].meanFitness);
        EXPECT_DOUBLE_EQ(serial.history[i].worstFitness, parallel.history[i].worstFitness);
    }
}

TEST_F(EvolutionEngineTest, ClonesKeepCachedFitness)
{
    EvolutionConfig config = smallConfig();
    config.crossoverRate = 0.0;
    config.mutationRate = 0.0;
    config.maxGenerations = 2;
    config.fitnessThreshold = 1e9;

    auto engine = makeEngine(config, *fibonacci);
    const RunResult result = runToEnd(*engine);

    ASSERT_EQ(result.history.size(), 2u);
    EXPECT_EQ(result.history[0].evaluatedCount, 40);
    EXPECT_EQ(result.history[1].evaluatedCount, 0);
    EXPECT_EQ(result.history[1].breeding.cloneOffspring, 40 - config.eliteCount);
    EXPECT_EQ(result.history[1].breeding.mutatedOffspring, 0);
}

TEST_F(EvolutionEngineTest, OffspringCountsAddUpToPopulation)
{
    EvolutionConfig config = smallConfig();
    config.populationSize = 41;
    config.maxGenerations = 4;
    config.fitnessThreshold = 1e9;

    auto engine = makeEngine(config, *fibonacci);
    const RunResult result = runToEnd(*engine);

    for (size_t i = 1; i < result.history.size(); i++) {
        const BreedingStats& breeding = result.history[i].breeding;
        EXPECT_EQ(
            breeding.eliteCount + breeding.crossoverOffspring + breeding.mutatedOffspring
                + breeding.cloneOffspring + breeding.immigrants,
            41);

        int mutations = 0;
        for (int count : breeding.mutationsByKind) {
            mutations += count;
        }
        EXPECT_EQ(mutations, breeding.mutatedOffspring);
    }
    EXPECT_EQ(engine->population().size(), 41);
}

TEST_F(EvolutionEngineTest, FaultAndTimeoutFractionsCountSeededPrograms)
{
    // Empty starting stack: programs opening with a consuming instruction fault at once, and
    // a one-step budget times out anything that neither faults nor halts on its first step.
    const TestCaseProblem emptyStack("empty-stack", "push 7", { TestCase{ .expected = 7 } });
    EvolutionConfig config = smallConfig();
    config.minProgramLength = 2;
    config.stepLimit = 1;
    config.maxGenerations = 1;
    config.fitnessThreshold = 1e9;

    auto engine = makeEngine(config, emptyStack);
    const RunResult result = runToEnd(*engine);
    ASSERT_EQ(result.history.size(), 1u);

    int faulted = 0;
    int timedOut = 0;
    for (const Individual& individual : engine->population().individuals()) {
        ASSERT_TRUE(individual.evaluation.has_value());
        faulted += individual.evaluation->faultedCases > 0 ? 1 : 0;
        timedOut += individual.evaluation->timedOutCases > 0 ? 1 : 0;
    }

    const GenerationStats& stats = result.history[0];
    EXPECT_GT(faulted, 0);
    EXPECT_GT(timedOut, 0);
    EXPECT_DOUBLE_EQ(stats.faultedFraction, faulted / 40.0);
    EXPECT_DOUBLE_EQ(stats.timedOutFraction, timedOut / 40.0);
    EXPECT_LE(stats.faultedFraction + stats.timedOutFraction, 1.0);
}

TEST_F(EvolutionEngineTest, FixedLengthCrossoverRejectionsBecomeClones)
{
    // With equal min and max length only matching cut points fit, so some pairs exhaust
    // their attempts and are carried over as clones.
    EvolutionConfig config = smallConfig();
    config.minProgramLength = 12;
    config.maxProgramLength = 12;
    config.crossoverRate = 1.0;
    config.mutationRate = 0.0;
    config.maxGenerations = 4;
    config.fitnessThreshold = 1e9;

    auto engine = makeEngine(config, *fibonacci);
    const RunResult result = runToEnd(*engine);
    ASSERT_EQ(result.history.size(), 4u);

    int rejections = 0;
    for (size_t i = 1; i < result.history.size(); i++) {
        const BreedingStats& breeding = result.history[i].breeding;
        rejections += breeding.crossoverRejections;
        EXPECT_EQ(breeding.cloneOffspring, 2 * breeding.crossoverRejections);
        EXPECT_EQ(breeding.crossoverOffspring + breeding.cloneOffspring, 38);
    }
    EXPECT_GT(rejections, 0);

    for (const Individual& individual : engine->population().individuals()) {
        EXPECT_EQ(individual.program.size(), 12u);
    }
}

TEST_F(EvolutionEngineTest, RouletteSelectionRunsReproducibly)
{
    EvolutionConfig config = smallConfig();
    config.selectionStrategy = SelectionStrategy::Roulette;
    config.maxGenerations = 8;

    auto first = makeEngine(config, *addition);
    auto second = makeEngine(config, *addition);
    const RunResult a = runToEnd(*first);
    const RunResult b = runToEnd(*second);

    ASSERT_FALSE(a.history.empty());
    ASSERT_EQ(a.history.size(), b.history.size());
    for (size_t i = 0; i < a.history.size(); i++) {
        EXPECT_DOUBLE_EQ(a.history[i].meanFitness, b.history[i].meanFitness);
        if (i > 0) {
            EXPECT_GE(a.history[i].bestEverFitness, a.history[i - 1].bestEverFitness);
        }
    }
    EXPECT_EQ(a.bestProgram, b.bestProgram);
}

TEST_F(EvolutionEngineTest, ImmigrantsFillTheirSlotsEachGeneration)
{
    EvolutionConfig config = smallConfig();
    config.immigrantCount = 5;
    config.crossoverRate = 0.0;
    config.mutationRate = 0.0;
    config.maxGenerations = 3;
    config.fitnessThreshold = 1e9;

    auto engine = makeEngine(config, *fibonacci);
    const RunResult result = runToEnd(*engine);
    ASSERT_EQ(result.history.size(), 3u);

    EXPECT_EQ(result.history[0].breeding.immigrants, 0);
    for (size_t i = 1; i < result.history.size(); i++) {
        const BreedingStats& breeding = result.history[i].breeding;
        EXPECT_EQ(breeding.immigrants, 5);
        EXPECT_EQ(breeding.cloneOffspring, 40 - config.eliteCount - 5);
        // Only the fresh programs need scoring; elites and clones keep their cache.
        EXPECT_EQ(result.history[i].evaluatedCount, 5);
    }

    int immigrants = 0;
    for (const Individual& individual : engine->population().individuals()) {
        if (individual.origin == IndividualOrigin::Immigrant) {
            immigrants++;
            EXPECT_EQ(individual.birthGeneration, 2);
        }
    }
    EXPECT_EQ(immigrants, 5);
}

TEST_F(EvolutionEngineTest, CreateRejectsImmigrantsThatCrowdOutOffspring)
{
    EvolutionConfig config = smallConfig();
    config.immigrantCount = config.populationSize - config.eliteCount;

    auto created = EvolutionEngine::create(config, *addition);

    ASSERT_TRUE(created.isError());
    EXPECT_EQ(created.errorValue().field, "immigrantCount");
}

TEST(TerminationReasonTest, NamesAreStable)
{
    EXPECT_EQ(toString(TerminationReason::Solved), "solved");
    EXPECT_EQ(toString(TerminationReason::Exhausted), "exhausted");
    EXPECT_EQ(toString(TerminationReason::Stagnated), "stagnated");
    EXPECT_EQ(toString(TerminationReason::Cancelled), "cancelled");
}
