#pragma once

#include "Result.h"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace StackEvo {

/**
 * @brief Loads JSON run configurations by name or by explicit path.
 *
 * Search order for load() (first match wins):
 * 1. Explicit config directory (if set via setConfigDir)
 * 2. ./config/ (CWD - for development)
 * 3. ~/.config/stackevo/ (user overrides)
 * 4. /etc/stackevo/ (system defaults)
 *
 * At each location, <name>.local is preferred over <name>. The .local file replaces
 * the base file entirely, it is not merged.
 */
class ConfigLoader {
public:
    static void setConfigDir(const std::string& path);
    static void clearConfigDir();

    // Searches the config directories for filename.
    template <typename T>
    static Result<T, std::string> load(const std::string& filename);

    // Reads exactly the given file, no search.
    template <typename T>
    static Result<T, std::string> loadFromPath(const std::filesystem::path& path);

    static std::optional<std::filesystem::path> findConfigFile(const std::string& filename);
    static std::vector<std::filesystem::path> getSearchPaths();

private:
    template <typename T>
    static Result<T, std::string> decode(
        const Result<nlohmann::json, std::string>& jsonResult, const std::string& source);

    static std::optional<std::string> explicitConfigDir_;
    static Result<nlohmann::json, std::string> readJson(const std::filesystem::path& path);
};

template <typename T>
Result<T, std::string> ConfigLoader::decode(
    const Result<nlohmann::json, std::string>& jsonResult, const std::string& source)
{
    if (jsonResult.isError()) {
        return Result<T, std::string>::error(jsonResult.errorValue());
    }

    try {
        T config;
        // Unqualified so the type's own from_json is found by ADL.
        from_json(jsonResult.value(), config);
        return Result<T, std::string>::okay(config);
    }
    catch (const std::exception& e) {
        return Result<T, std::string>::error("Failed to parse " + source + ": " + e.what());
    }
}

template <typename T>
Result<T, std::string> ConfigLoader::load(const std::string& filename)
{
    auto path = findConfigFile(filename);
    if (!path.has_value()) {
        return Result<T, std::string>::error("Config file not found: " + filename);
    }
    return decode<T>(readJson(path.value()), path->string());
}

template <typename T>
Result<T, std::string> ConfigLoader::loadFromPath(const std::filesystem::path& path)
{
    return decode<T>(readJson(path), path.string());
}

} // namespace StackEvo
