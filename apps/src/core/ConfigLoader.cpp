#include "ConfigLoader.h"
#include "LoggingChannels.h"

#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <vector>

namespace KnapEvo {

std::optional<std::filesystem::path> ConfigLoader::configDir_;

void ConfigLoader::setConfigDir(const std::filesystem::path& dir)
{
    configDir_ = dir;
}

void ConfigLoader::clearConfigDir()
{
    configDir_.reset();
}

std::optional<std::filesystem::path> ConfigLoader::locate()
{
    namespace fs = std::filesystem;

    std::vector<fs::path> dirs;
    if (configDir_) {
        dirs.push_back(*configDir_);
    }
    dirs.push_back("config");
    if (const char* home = std::getenv("HOME")) {
        dirs.push_back(fs::path(home) / ".config" / "knapevo");
    }
    dirs.push_back("/etc/knapevo");

    const std::string localName = std::string(kFileName) + ".local";
    for (const auto& dir : dirs) {
        for (const auto& name : { localName, std::string(kFileName) }) {
            std::error_code ec;
            if (fs::is_regular_file(dir / name, ec)) {
                return dir / name;
            }
        }
    }
    return std::nullopt;
}

Result<EvolutionConfig, std::string> ConfigLoader::loadOrDefault()
{
    const auto path = locate();
    if (!path) {
        LOG_DEBUG(Config, "No {} on the search path, using built-in defaults", kFileName);
        return Result<EvolutionConfig, std::string>::okay(EvolutionConfig{});
    }
    return loadFromFile(*path);
}

Result<EvolutionConfig, std::string> ConfigLoader::loadFromFile(const std::filesystem::path& path)
{
    using LoadResult = Result<EvolutionConfig, std::string>;

    std::ifstream file(path);
    if (!file.is_open()) {
        return LoadResult::error("Cannot open config file: " + path.string());
    }
    std::stringstream contents;
    contents << file.rdbuf();
    const std::string text = contents.str();

    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
        LOG_WARN(Config, "Config file {} is empty", path.string());
        return LoadResult::error("Empty config file: " + path.string());
    }

    const nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        LOG_ERROR(Config, "{} is not a JSON object", path.string());
        return LoadResult::error("Parse error in " + path.string() + ": expected a JSON object");
    }

    try {
        EvolutionConfig config = j.get<EvolutionConfig>();
        LOG_INFO(Config, "Loaded run defaults from {}", path.string());
        return LoadResult::okay(config);
    }
    catch (const nlohmann::json::exception& e) {
        LOG_ERROR(Config, "Bad field in {}: {}", path.string(), e.what());
        return LoadResult::error("Invalid value in " + path.string() + ": " + e.what());
    }
}

} // namespace KnapEvo
