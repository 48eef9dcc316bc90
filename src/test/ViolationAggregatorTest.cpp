#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "domain/compliance/ViolationAggregator.hpp"

using namespace copycheck::domain::compliance;

namespace {

KeywordMatch MakeMatch(const std::string& keyword, RuleTier tier, Severity severity, std::size_t start) {
    KeywordMatch match;
    match.keyword = keyword;
    match.ruleId = RuleTierToString(tier) + "." + keyword;
    match.tier = tier;
    match.severity = severity;
    match.position = {start, start + 2};
    return match;
}

AnnotationBinding MakeBinding(const std::string& keyword, bool valid) {
    AnnotationBinding binding;
    binding.keyword = keyword;
    binding.marker = "※1";
    binding.isValid = valid;
    if (valid) {
        binding.footnoteText = "保湿成分";
        binding.scope = AnnotationScope::Segment;
    }
    return binding;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ViolationAggregator Test..." << std::endl;
    ViolationAggregator aggregator;

    const std::vector<KeywordMatch> raw = {
        MakeMatch("改善", RuleTier::Absolute, Severity::Critical, 0),
        MakeMatch("クマ", RuleTier::Conditional, Severity::High, 3),
        MakeMatch("浸透", RuleTier::Conditional, Severity::High, 6),
        MakeMatch("若々しい", RuleTier::ContextDependent, Severity::High, 9),
        MakeMatch("改善", RuleTier::Absolute, Severity::Critical, 14),
    };
    const std::vector<AnnotationBinding> bindings = {
        MakeBinding("クマ", true),
        MakeBinding("浸透", false),
        MakeBinding("改善", true),
    };
    const auto rawCopy = raw;
    const auto bindingsCopy = bindings;

    // 1. Only conditional matches with a valid binding are removed
    const ValidationResult result = aggregator.Aggregate(raw, bindings);
    assert(result.hasViolations);
    assert(result.matches.size() == 4);
    assert(result.matches[0].keyword == "改善");
    assert(result.matches[1].keyword == "浸透");
    assert(result.matches[2].keyword == "若々しい");
    assert(result.matches[3].keyword == "改善" && result.matches[3].position.start == 14);
    assert(raw == rawCopy && bindings == bindingsCopy && "Inputs are not modified.");
    std::cout << "[PASS] Annotation suppression." << std::endl;

    // 2. Counts and unique keywords
    assert(result.summary.total == result.matches.size());
    assert(result.summary.byTier.absolute == 2);
    assert(result.summary.byTier.conditional == 1);
    assert(result.summary.byTier.contextDependent == 1);
    assert(result.summary.bySeverity.critical == 2);
    assert(result.summary.bySeverity.high == 2);
    assert(result.summary.bySeverity.medium == 0 && result.summary.bySeverity.low == 0);
    assert((result.uniqueFlaggedKeywords == std::vector<std::string>{"改善", "浸透", "若々しい"}));
    std::cout << "[PASS] Summary counts." << std::endl;

    // 3. Nothing left
    const ValidationResult clean = aggregator.Aggregate({raw[1]}, bindings);
    assert(!clean.hasViolations);
    assert(clean.matches.empty());
    assert(clean.summary.total == 0);
    assert(clean.uniqueFlaggedKeywords.empty());
    assert(aggregator.Aggregate({}, {}) == clean);
    std::cout << "[PASS] Empty result." << std::endl;

    // 4. Merging segment results
    const ValidationResult second = aggregator.Aggregate(
        {MakeMatch("返金保証", RuleTier::Conditional, Severity::Medium, 0), raw[3]}, {});
    const ValidationResult merged = aggregator.Merge({result, clean, second});
    assert(merged.summary.total == 6);
    assert(merged.summary.byTier.conditional == 2);
    assert(merged.summary.byTier.contextDependent == 2);
    assert(merged.summary.bySeverity.medium == 1);
    assert((merged.uniqueFlaggedKeywords == std::vector<std::string>{"改善", "浸透", "若々しい", "返金保証"}));
    assert(merged.matches.back().keyword == "若々しい");
    assert(!aggregator.Merge({}).hasViolations);
    std::cout << "[PASS] Merge." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
