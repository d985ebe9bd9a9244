#include "ConfigLoader.h"
#include "LoggingChannels.h"
#include <cstdlib>
#include <fstream>

namespace StackEvo {

std::optional<std::string> ConfigLoader::explicitConfigDir_ = std::nullopt;

void ConfigLoader::setConfigDir(const std::string& path)
{
    explicitConfigDir_ = path;
}

void ConfigLoader::clearConfigDir()
{
    explicitConfigDir_ = std::nullopt;
}

std::vector<std::filesystem::path> ConfigLoader::getSearchPaths()
{
    namespace fs = std::filesystem;
    std::vector<fs::path> paths;

    if (explicitConfigDir_.has_value()) {
        paths.push_back(fs::path(explicitConfigDir_.value()));
    }

    paths.push_back(fs::current_path() / "config");

    if (const char* home = std::getenv("HOME")) {
        paths.push_back(fs::path(home) / ".config" / "stackevo");
    }

    paths.push_back(fs::path("/etc/stackevo"));

    return paths;
}

std::optional<std::filesystem::path> ConfigLoader::findConfigFile(const std::string& filename)
{
    namespace fs = std::filesystem;

    for (const auto& dir : getSearchPaths()) {
        for (const fs::path candidate : { dir / (filename + ".local"), dir / filename }) {
            std::error_code ec;
            if (fs::is_regular_file(candidate, ec)) {
                return candidate;
            }
        }
    }

    LOG_DEBUG(Config, "No '{}' in any config search path", filename);
    return std::nullopt;
}

Result<nlohmann::json, std::string> ConfigLoader::readJson(const std::filesystem::path& path)
{
    namespace fs = std::filesystem;
    using JsonResult = Result<nlohmann::json, std::string>;

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return JsonResult::error("Config file not found: " + path.string());
    }
    if (fs::file_size(path, ec) == 0 || ec) {
        LOG_WARN(Config, "Empty config file: {}", path.string());
        return JsonResult::error("Empty config file: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN(Config, "Cannot open config file: {}", path.string());
        return JsonResult::error("Cannot open config file: " + path.string());
    }

    try {
        nlohmann::json config = nlohmann::json::parse(file);
        LOG_INFO(Config, "Loaded config from {}", path.string());
        return JsonResult::okay(config);
    }
    catch (const nlohmann::json::parse_error& e) {
        LOG_ERROR(Config, "Parse error in {}: {}", path.string(), e.what());
        return JsonResult::error("Parse error in " + path.string() + ": " + e.what());
    }
}

} // namespace StackEvo
