/**
 * @file KeywordMatch.hpp
 * @brief A single rule hit produced by the keyword matcher.
 */

#pragma once

#include <optional>
#include <string>

#include "domain/compliance/KeywordRule.hpp"
#include "domain/compliance/Segment.hpp"

namespace copycheck::domain::compliance {

/**
 * @struct KeywordMatch
 * @brief One occurrence of a regulated keyword. Not deduplicated across tiers.
 */
struct KeywordMatch {
    std::string keyword;                      ///< Literal text that matched.
    std::string ruleId;
    RuleTier tier = RuleTier::Absolute;
    std::string category;
    Severity severity = Severity::High;
    std::string regulatoryClass;
    std::string rationale;                    ///< Rule description.
    std::string reason;                       ///< Why this occurrence was flagged.
    std::optional<std::string> referenceHint;
    std::optional<std::string> acceptableRewrite;
    TextSpan position;                        ///< Code points within the scanned text.

    bool operator==(const KeywordMatch& other) const {
        return keyword == other.keyword && ruleId == other.ruleId && tier == other.tier &&
               category == other.category && severity == other.severity &&
               regulatoryClass == other.regulatoryClass && rationale == other.rationale &&
               reason == other.reason && referenceHint == other.referenceHint &&
               acceptableRewrite == other.acceptableRewrite && position == other.position;
    }
};

} // namespace copycheck::domain::compliance
