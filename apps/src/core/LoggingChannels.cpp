#include "LoggingChannels.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace StackEvo {

namespace {

constexpr const char* kPattern = "[%H:%M:%S.%e] [%n] [%^%l%$] %v";

std::string_view trim(std::string_view text)
{
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

} // namespace

bool LoggingChannels::initialized_ = false;

void LoggingChannels::initialize(const LoggingOptions& options)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;
    if (options.consoleToStderr) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }
    else {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    sinks.back()->set_level(options.consoleLevel);

    if (!options.logFile.empty()) {
        sinks.push_back(
            std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.logFile, true));
        sinks.back()->set_level(options.fileLevel);
    }

    for (auto& sink : sinks) {
        sink->set_pattern(kPattern);
    }

    for (const LogChannelInfo& info : kLogChannels) {
        auto logger = std::make_shared<spdlog::logger>(info.name, sinks.begin(), sinks.end());
        logger->set_level(info.defaultLevel);
        spdlog::register_logger(logger);
    }

    // Library code outside a channel (spdlog::warn and friends) lands on the same sinks.
    auto defaultLogger = std::make_shared<spdlog::logger>("stackevo", sinks.begin(), sinks.end());
    defaultLogger->set_level(spdlog::level::info);
    spdlog::set_default_logger(defaultLogger);

    if (!options.logFile.empty()) {
        spdlog::flush_every(std::chrono::seconds(1));
    }

    initialized_ = true;
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(LogChannel channel)
{
    if (!initialized_) {
        initialize();
    }
    return spdlog::get(toString(channel));
}

Result<std::monostate, std::string> LoggingChannels::configureFromString(const std::string& spec)
{
    using ConfigureResult = Result<std::monostate, std::string>;

    if (!initialized_) {
        initialize();
    }

    std::string_view rest = spec;
    while (!rest.empty()) {
        const auto comma = rest.find(',');
        const std::string_view entry = trim(rest.substr(0, comma));
        rest = comma == std::string_view::npos ? std::string_view{} : rest.substr(comma + 1);
        if (entry.empty()) {
            continue;
        }

        const auto colon = entry.find(':');
        if (colon == std::string_view::npos) {
            return ConfigureResult::error(
                "Log channel entry '" + std::string(entry) + "' is missing ':level'");
        }

        const std::string_view channelName = trim(entry.substr(0, colon));
        const auto level = parseLevel(trim(entry.substr(colon + 1)));
        if (!level.has_value()) {
            return ConfigureResult::error(
                "Unknown log level in '" + std::string(entry) + "'");
        }

        if (channelName == "*") {
            for (const LogChannelInfo& info : kLogChannels) {
                setChannelLevel(info.channel, level.value());
            }
            continue;
        }

        const auto channel = channelFromString(channelName);
        if (!channel.has_value()) {
            return ConfigureResult::error(
                "Unknown log channel '" + std::string(channelName) + "'");
        }
        setChannelLevel(channel.value(), level.value());
    }

    return ConfigureResult::okay(std::monostate{});
}

void LoggingChannels::setChannelLevel(LogChannel channel, spdlog::level::level_enum level)
{
    get(channel)->set_level(level);
}

std::optional<LogChannel> LoggingChannels::channelFromString(std::string_view name)
{
    for (const LogChannelInfo& info : kLogChannels) {
        if (name == info.name) {
            return info.channel;
        }
    }
    return std::nullopt;
}

std::optional<spdlog::level::level_enum> LoggingChannels::parseLevel(std::string_view name)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    // from_str maps anything it does not know to off.
    const auto level = spdlog::level::from_str(lower);
    if (level == spdlog::level::off && lower != "off") {
        return std::nullopt;
    }
    return level;
}

} // namespace StackEvo
