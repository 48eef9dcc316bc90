/**
 * @file EngineSettings.hpp
 * @brief Tunables read from settings.json.
 */

#pragma once

#include <cstddef>
#include <string>

#include "domain/compliance/Segmenter.hpp"

namespace copycheck::application::compliance {

struct EngineSettings {
    std::size_t maxInputLength = domain::compliance::Segmenter::DefaultMaxInputLength; ///< Code points.
    bool parallelSegmentEvaluation = true;      ///< Evaluate segments with std::async.
    std::string rulesDirectory = "rules";       ///< Relative to the config directory.
    std::string productsDirectory = "products"; ///< Relative to the config directory.
    std::string recordsDirectory = "records";   ///< Relative to the config directory.
};

} // namespace copycheck::application::compliance
