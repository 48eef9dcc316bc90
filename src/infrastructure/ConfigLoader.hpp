/**
 * @file ConfigLoader.hpp
 * @brief Static utility for locating the configuration directory and loading settings.json.
 *
 * Keeps JSON parsing of engine settings in one place instead of scattering it
 * through the CLI and the services.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "application/compliance/EngineSettings.hpp"

namespace copycheck::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads <configDir>/settings.json.
     * @param configDir Directory holding settings.json, rules/ and products/.
     * @return Defaults when the file is missing; defaults plus a logged error when it is malformed.
     */
    static application::compliance::EngineSettings LoadEngineSettings(const std::filesystem::path& configDir);

    /**
     * @brief Picks the configuration directory.
     *
     * Order: @p explicitDir, $COPYCHECK_CONFIG_DIR, $XDG_CONFIG_HOME/copycheck when it exists,
     * then @p builtinDir.
     */
    static std::filesystem::path ResolveConfigDirectory(const std::optional<std::string>& explicitDir,
                                                        const std::string& builtinDir);

    /** @brief Resolves a settings path (rulesDirectory, productsDirectory) against the config directory. */
    static std::filesystem::path ResolveRelative(const std::filesystem::path& configDir, const std::string& path);
};

} // namespace copycheck::infrastructure
