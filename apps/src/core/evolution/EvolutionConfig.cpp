#include "EvolutionConfig.h"

#include <algorithm>
#include <cctype>

namespace StackEvo {

std::string toString(SelectionStrategy strategy)
{
    return std::string(reflect::enum_name(strategy));
}

std::optional<SelectionStrategy> selectionStrategyFromString(const std::string& name)
{
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    for (const auto& [value, enumName] : reflect::enumerators<SelectionStrategy>) {
        std::string candidate(enumName);
        std::transform(candidate.begin(), candidate.end(), candidate.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (candidate == lower) {
            return static_cast<SelectionStrategy>(value);
        }
    }
    return std::nullopt;
}

Result<std::monostate, ConfigurationError> validateConfig(const EvolutionConfig& config)
{
    using ValidationResult = Result<std::monostate, ConfigurationError>;
    const auto fail = [](const char* field, std::string message) {
        return ValidationResult::error(ConfigurationError{ field, std::move(message) });
    };

    if (config.populationSize < 1) {
        return fail("populationSize", "must be at least 1");
    }
    if (config.mutationRate < 0.0 || config.mutationRate > 1.0) {
        return fail("mutationRate", "must be within [0, 1]");
    }
    if (config.crossoverRate < 0.0 || config.crossoverRate > 1.0) {
        return fail("crossoverRate", "must be within [0, 1]");
    }
    if (config.minProgramLength < 1) {
        return fail("minProgramLength", "must be at least 1");
    }
    if (config.minProgramLength > config.maxProgramLength) {
        return fail(
            "minProgramLength",
            "min length " + std::to_string(config.minProgramLength) + " exceeds max length "
                + std::to_string(config.maxProgramLength));
    }
    if (config.maxGenerations < 1) {
        return fail("maxGenerations", "must be at least 1");
    }
    if (config.stepLimit < 1) {
        return fail("stepLimit", "must be at least 1");
    }
    if (config.maxStackDepth < 1) {
        return fail("maxStackDepth", "must be at least 1");
    }
    if (config.parsimonyWeight < 0.0 || config.parsimonyWeight > 1.0) {
        return fail("parsimonyWeight", "must be within [0, 1]");
    }
    if (config.tournamentSize < 1) {
        return fail("tournamentSize", "must be at least 1");
    }
    if (config.eliteCount < 0 || config.eliteCount >= config.populationSize) {
        return fail("eliteCount", "must leave at least one offspring slot in the population");
    }
    if (config.immigrantCount < 0
        || config.eliteCount + config.immigrantCount >= config.populationSize) {
        return fail(
            "immigrantCount",
            "elites plus immigrants must leave at least one offspring slot in the population");
    }
    if (config.stagnationWindow < 0) {
        return fail("stagnationWindow", "must not be negative");
    }
    if (config.literalMin > config.literalMax) {
        return fail("literalMin", "must not exceed literalMax");
    }
    if (config.variableSlots < 1 || config.variableSlots > kVariableSlotCount) {
        return fail(
            "variableSlots", "must be within [1, " + std::to_string(kVariableSlotCount) + "]");
    }
    if (config.maxParallelEvaluations < 0) {
        return fail("maxParallelEvaluations", "must not be negative");
    }

    return ValidationResult::okay(std::monostate{});
}

} // namespace StackEvo
