#pragma once

// Enable all log levels for SPDLOG_LOGGER_* macros (must be before spdlog includes).
#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include "Result.h"

#include <array>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace StackEvo {

/**
 * @brief Available logging channels for categorizing log messages.
 */
enum class LogChannel {
    Cli,
    Config,
    Evolution,
    Fitness,
    Operators,
    Vm,
};

struct LogChannelInfo {
    LogChannel channel;
    const char* name;
    spdlog::level::level_enum defaultLevel;
};

// The VM channel starts at warn: a trace of every step of every evaluation is only useful
// when asked for explicitly.
inline constexpr std::array<LogChannelInfo, 6> kLogChannels = { {
    { LogChannel::Cli, "cli", spdlog::level::info },
    { LogChannel::Config, "config", spdlog::level::info },
    { LogChannel::Evolution, "evolution", spdlog::level::info },
    { LogChannel::Fitness, "fitness", spdlog::level::info },
    { LogChannel::Operators, "operators", spdlog::level::info },
    { LogChannel::Vm, "vm", spdlog::level::warn },
} };

constexpr bool channelTableMatchesEnum()
{
    for (size_t i = 0; i < kLogChannels.size(); ++i) {
        if (static_cast<size_t>(kLogChannels[i].channel) != i) {
            return false;
        }
    }
    return true;
}
static_assert(channelTableMatchesEnum(), "kLogChannels must be indexed by LogChannel value");

inline const char* toString(LogChannel channel)
{
    return kLogChannels[static_cast<size_t>(channel)].name;
}

struct LoggingOptions {
    spdlog::level::level_enum consoleLevel = spdlog::level::info;
    spdlog::level::level_enum fileLevel = spdlog::level::debug;
    std::string logFile; // Empty = console only.
    bool consoleToStderr = true;
};

/**
 * @brief Named loggers for the VM, the evaluator, the genetic operators and the evolution
 * loop, so a run can trace one subsystem without flooding the others.
 *
 * Every channel and the default logger write through one set of sinks.
 */
class LoggingChannels {
public:
    static void initialize(const LoggingOptions& options = {});

    /**
     * @brief Get a specific channel logger. Initializes with default options on first use,
     * which is what unit tests rely on.
     */
    static std::shared_ptr<spdlog::logger> get(LogChannel channel);

    /**
     * @brief Apply per-channel levels.
     * @param spec "channel:level,channel2:level2", with "*" addressing every channel.
     * Examples:
     *   "evolution:debug,vm:trace" - Per-generation detail plus every VM step
     *   "*:off,operators:warn" - Only operator repair warnings
     *
     * Entries are applied in order. The first malformed entry stops the parse and is
     * reported; entries before it stay applied.
     */
    static Result<std::monostate, std::string> configureFromString(const std::string& spec);

    static void setChannelLevel(LogChannel channel, spdlog::level::level_enum level);

    static std::optional<LogChannel> channelFromString(std::string_view name);
    static std::optional<spdlog::level::level_enum> parseLevel(std::string_view name);

private:
    static bool initialized_;
};

#define STACKEVO_CHANNEL_LOGGER(channel) \
    ::StackEvo::LoggingChannels::get(::StackEvo::LogChannel::channel)

#define LOG_TRACE(channel, ...) SPDLOG_LOGGER_TRACE(STACKEVO_CHANNEL_LOGGER(channel), __VA_ARGS__)
#define LOG_DEBUG(channel, ...) SPDLOG_LOGGER_DEBUG(STACKEVO_CHANNEL_LOGGER(channel), __VA_ARGS__)
#define LOG_INFO(channel, ...) SPDLOG_LOGGER_INFO(STACKEVO_CHANNEL_LOGGER(channel), __VA_ARGS__)
#define LOG_WARN(channel, ...) SPDLOG_LOGGER_WARN(STACKEVO_CHANNEL_LOGGER(channel), __VA_ARGS__)
#define LOG_ERROR(channel, ...) SPDLOG_LOGGER_ERROR(STACKEVO_CHANNEL_LOGGER(channel), __VA_ARGS__)

} // namespace StackEvo
