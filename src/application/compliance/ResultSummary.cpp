/**
 * @file ResultSummary.cpp
 * @brief Implementation of the result summary helpers.
 */

#include "application/compliance/ResultSummary.hpp"

#include <sstream>
#include <vector>

namespace copycheck::application::compliance {

using namespace domain::compliance;

std::string SummaryText(const ValidationResult& result) {
    if (!result.hasViolations) {
        return "明示的なNGキーワードは検出されませんでした";
    }

    const TierCounts& tiers = result.summary.byTier;
    std::vector<std::string> parts;
    if (tiers.absolute > 0) parts.push_back("完全NG: " + std::to_string(tiers.absolute) + "件");
    if (tiers.conditional > 0) parts.push_back("条件付きNG: " + std::to_string(tiers.conditional) + "件");
    if (tiers.contextDependent > 0) parts.push_back("文脈依存NG: " + std::to_string(tiers.contextDependent) + "件");

    std::ostringstream out;
    out << "NGキーワード検出: ";
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out << ", ";
        out << parts[i];
    }
    out << " (合計" << result.summary.total << "件)";
    return out.str();
}

std::string DetailedList(const ValidationResult& result) {
    if (!result.hasViolations) {
        return "検出なし";
    }

    std::ostringstream out;
    for (std::size_t i = 0; i < result.matches.size(); ++i) {
        const KeywordMatch& match = result.matches[i];
        if (i > 0) out << '\n';
        out << "- 【" << RuleTierToString(match.tier) << "】「" << match.keyword << "」: " << match.reason;
    }
    return out.str();
}

std::string ClaimList(const std::vector<ClaimViolation>& violations) {
    if (violations.empty()) {
        return "検出なし";
    }

    std::ostringstream out;
    for (std::size_t i = 0; i < violations.size(); ++i) {
        const ClaimViolation& violation = violations[i];
        if (i > 0) out << '\n';
        out << "- 【" << ClaimViolationTypeToString(violation.type) << "/" << SeverityToString(violation.severity)
            << "】" << violation.description;
    }
    return out.str();
}

} // namespace copycheck::application::compliance
