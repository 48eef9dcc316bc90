/**
 * @file ValidationResult.hpp
 * @brief Aggregated outcome of a keyword scan.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "domain/compliance/KeywordMatch.hpp"

namespace copycheck::domain::compliance {

struct TierCounts {
    std::size_t absolute = 0;
    std::size_t conditional = 0;
    std::size_t contextDependent = 0;

    bool operator==(const TierCounts& o) const {
        return absolute == o.absolute && conditional == o.conditional && contextDependent == o.contextDependent;
    }
};

struct SeverityCounts {
    std::size_t low = 0;
    std::size_t medium = 0;
    std::size_t high = 0;
    std::size_t critical = 0;

    bool operator==(const SeverityCounts& o) const {
        return low == o.low && medium == o.medium && high == o.high && critical == o.critical;
    }
};

struct ValidationSummary {
    TierCounts byTier;
    SeverityCounts bySeverity;
    std::size_t total = 0;

    bool operator==(const ValidationSummary& o) const {
        return byTier == o.byTier && bySeverity == o.bySeverity && total == o.total;
    }
};

/**
 * @struct ValidationResult
 * @brief Matches that survived annotation filtering, with counts for reporting.
 */
struct ValidationResult {
    bool hasViolations = false;
    std::vector<KeywordMatch> matches;
    ValidationSummary summary;
    std::vector<std::string> uniqueFlaggedKeywords; ///< First-seen order.

    bool operator==(const ValidationResult& o) const {
        return hasViolations == o.hasViolations && matches == o.matches && summary == o.summary &&
               uniqueFlaggedKeywords == o.uniqueFlaggedKeywords;
    }
};

} // namespace copycheck::domain::compliance
