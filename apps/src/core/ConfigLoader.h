#pragma once

#include "Result.h"
#include "core/evolution/EvolutionConfig.h"

#include <filesystem>
#include <optional>
#include <string>

namespace KnapEvo {

/**
 * Reads the run defaults from knapevo.json.
 *
 * Directories are tried in order: the one given to setConfigDir(), ./config,
 * ~/.config/knapevo, /etc/knapevo. The first directory holding either
 * knapevo.json.local or knapevo.json wins, and .local replaces the base file
 * outright. Keys missing from the file keep their EvolutionConfig defaults.
 */
class ConfigLoader {
public:
    static constexpr const char* kFileName = "knapevo.json";

    static void setConfigDir(const std::filesystem::path& dir);
    static void clearConfigDir();

    // EvolutionConfig{} when no config file exists anywhere on the search path.
    static Result<EvolutionConfig, std::string> loadOrDefault();

    static Result<EvolutionConfig, std::string> loadFromFile(const std::filesystem::path& path);

private:
    static std::optional<std::filesystem::path> locate();

    static std::optional<std::filesystem::path> configDir_;
};

} // namespace KnapEvo
