/**
 * @file ViolationAggregator.cpp
 * @brief Implementation of the violation aggregator.
 */

#include "domain/compliance/ViolationAggregator.hpp"

#include <algorithm>
#include <set>
#include <string>

namespace copycheck::domain::compliance {

ValidationResult ViolationAggregator::Aggregate(const std::vector<KeywordMatch>& rawMatches,
                                                const std::vector<AnnotationBinding>& bindings) const {
    std::set<std::string> annotated;
    for (const auto& binding : bindings) {
        if (binding.isValid) annotated.insert(binding.keyword);
    }

    std::vector<KeywordMatch> kept;
    kept.reserve(rawMatches.size());
    for (const auto& match : rawMatches) {
        if (match.tier == RuleTier::Conditional && annotated.count(match.keyword)) continue;
        kept.push_back(match);
    }
    return Summarize(std::move(kept));
}

ValidationResult ViolationAggregator::Merge(const std::vector<ValidationResult>& results) const {
    std::vector<KeywordMatch> all;
    for (const auto& result : results) {
        all.insert(all.end(), result.matches.begin(), result.matches.end());
    }
    return Summarize(std::move(all));
}

ValidationResult ViolationAggregator::Summarize(std::vector<KeywordMatch> matches) {
    ValidationResult result;
    for (const auto& match : matches) {
        switch (match.tier) {
            case RuleTier::Absolute: ++result.summary.byTier.absolute; break;
            case RuleTier::Conditional: ++result.summary.byTier.conditional; break;
            case RuleTier::ContextDependent: ++result.summary.byTier.contextDependent; break;
        }
        switch (match.severity) {
            case Severity::Low: ++result.summary.bySeverity.low; break;
            case Severity::Medium: ++result.summary.bySeverity.medium; break;
            case Severity::High: ++result.summary.bySeverity.high; break;
            case Severity::Critical: ++result.summary.bySeverity.critical; break;
        }
        auto& unique = result.uniqueFlaggedKeywords;
        if (std::find(unique.begin(), unique.end(), match.keyword) == unique.end()) {
            unique.push_back(match.keyword);
        }
    }
    result.summary.total = matches.size();
    result.hasViolations = !matches.empty();
    result.matches = std::move(matches);
    return result;
}

} // namespace copycheck::domain::compliance
