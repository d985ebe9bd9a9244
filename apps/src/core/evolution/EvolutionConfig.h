#pragma once

#include "EvolutionErrors.h"
#include "core/ReflectSerializer.h"
#include "core/Result.h"
#include "core/vm/VirtualMachine.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace StackEvo {

enum class SelectionStrategy : uint8_t {
    Tournament = 0,
    Roulette = 1,
};

std::string toString(SelectionStrategy strategy);
std::optional<SelectionStrategy> selectionStrategyFromString(const std::string& name);

/**
 * Configuration for one evolutionary run. Immutable once the run starts.
 */
struct EvolutionConfig {
    int populationSize = 100;
    double mutationRate = 0.8;  // Probability each offspring receives one mutation.
    double crossoverRate = 0.7; // Probability each parent pair is recombined.
    int minProgramLength = 1;
    int maxProgramLength = 24;
    int maxGenerations = 200;

    // Evaluation settings.
    int stepLimit = 1000;
    int maxStackDepth = 256;
    double parsimonyWeight = 0.01; // Subtracted as weight * length / maxProgramLength.

    SelectionStrategy selectionStrategy = SelectionStrategy::Tournament;
    int tournamentSize = 3;
    int eliteCount = 2;
    int immigrantCount = 0; // Fresh random programs added to every generation after the first.

    uint64_t seed = 1;
    int stagnationWindow = 0;              // 0 = disabled.
    std::optional<double> fitnessThreshold; // Unset = solved when every test case is exact.

    // Random instruction sampling.
    int literalMin = -10;
    int literalMax = 10;
    int variableSlots = 4; // Slots the generator uses, at most kVariableSlotCount.

    int maxParallelEvaluations = 1; // 0 = auto (use detected core count).
};

Result<std::monostate, ConfigurationError> validateConfig(const EvolutionConfig& config);

inline VmLimits vmLimitsFor(const EvolutionConfig& config)
{
    return VmLimits{ .stepLimit = config.stepLimit, .maxStackDepth = config.maxStackDepth };
}

inline void to_json(nlohmann::json& j, const EvolutionConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

inline void from_json(const nlohmann::json& j, EvolutionConfig& config)
{
    config = ReflectSerializer::from_json<EvolutionConfig>(j);
}

} // namespace StackEvo
