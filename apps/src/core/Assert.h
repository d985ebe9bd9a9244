#pragma once

#include "spdlog/spdlog.h"
#include <cstdlib>

/**
 * Runtime assertion that works in both debug and release builds.
 *
 * Unlike standard assert(), STACKEVO_ASSERT is never compiled out.
 * Use for internal invariants whose violation means a bug in StackEvo itself,
 * never for conditions an evolved program or a user config can trigger.
 *
 * When an assertion fails:
 * - Logs a CRITICAL message with file, line, and condition
 * - Aborts the program immediately
 *
 * Example:
 *   STACKEVO_ASSERT(next.size() == config.populationSize,
 *                   "Population size must stay constant across generations");
 */
#define STACKEVO_ASSERT(condition, message)                                                 \
    do {                                                                                    \
        if (!(condition)) {                                                                 \
            spdlog::critical("ASSERTION FAILED: {} at {}:{}", message, __FILE__, __LINE__); \
            spdlog::critical("  Condition: {}", #condition);                                \
            std::abort();                                                                   \
        }                                                                                   \
    } while (0)
