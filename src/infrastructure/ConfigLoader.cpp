/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace copycheck::infrastructure {

namespace fs = std::filesystem;

namespace {

// $XDG_CONFIG_HOME, else ~/.config.
std::optional<fs::path> UserConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return std::nullopt;
}

} // namespace

application::compliance::EngineSettings ConfigLoader::LoadEngineSettings(const fs::path& configDir) {
    application::compliance::EngineSettings settings;
    fs::path configPath = configDir / "settings.json";
    if (!fs::exists(configPath)) {
        return settings;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;

        if (j.contains("maxInputLength")) {
            const auto maxLength = j["maxInputLength"].get<long long>();
            if (maxLength > 0) {
                settings.maxInputLength = static_cast<std::size_t>(maxLength);
            } else {
                std::cerr << "[ConfigLoader] Ignoring non-positive maxInputLength " << maxLength << std::endl;
            }
        }
        settings.parallelSegmentEvaluation = j.value("parallelSegmentEvaluation", settings.parallelSegmentEvaluation);
        settings.rulesDirectory = j.value("rulesDirectory", settings.rulesDirectory);
        settings.productsDirectory = j.value("productsDirectory", settings.productsDirectory);
        settings.recordsDirectory = j.value("recordsDirectory", settings.recordsDirectory);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
        return application::compliance::EngineSettings{};
    }

    return settings;
}

fs::path ConfigLoader::ResolveConfigDirectory(const std::optional<std::string>& explicitDir,
                                              const std::string& builtinDir) {
    if (explicitDir && !explicitDir->empty()) {
        return fs::path(*explicitDir);
    }
    const char* fromEnv = std::getenv("COPYCHECK_CONFIG_DIR");
    if (fromEnv && *fromEnv) {
        return fs::path(fromEnv);
    }
    if (auto configHome = UserConfigHome()) {
        fs::path userConfig = *configHome / "copycheck";
        std::error_code ec;
        if (fs::is_directory(userConfig, ec)) {
            return userConfig;
        }
    }
    return fs::path(builtinDir);
}

fs::path ConfigLoader::ResolveRelative(const fs::path& configDir, const std::string& path) {
    fs::path p(path);
    return p.is_absolute() ? p : configDir / p;
}

} // namespace copycheck::infrastructure
