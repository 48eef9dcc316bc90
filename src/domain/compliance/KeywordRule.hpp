/**
 * @file KeywordRule.hpp
 * @brief Declarative rule records for the three evaluation tiers.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace copycheck::domain::compliance {

/**
 * @enum RuleTier
 * @brief Evaluation policy applied to a rule's keywords.
 */
enum class RuleTier {
    Absolute,         ///< Forbidden in any context.
    Conditional,      ///< Allowed only with a correctly bound footnote.
    ContextDependent  ///< Allowed unless combined with a disallowed phrasing.
};

enum class Severity {
    Low,
    Medium,
    High,
    Critical
};

inline std::string RuleTierToString(RuleTier tier) {
    switch (tier) {
        case RuleTier::Absolute: return "absolute";
        case RuleTier::Conditional: return "conditional";
        case RuleTier::ContextDependent: return "context-dependent";
        default: return "absolute";
    }
}

inline std::optional<RuleTier> RuleTierFromString(const std::string& tier) {
    if (tier == "absolute") return RuleTier::Absolute;
    if (tier == "conditional") return RuleTier::Conditional;
    if (tier == "context-dependent" || tier == "contextDependent") return RuleTier::ContextDependent;
    return std::nullopt;
}

inline std::string SeverityToString(Severity severity) {
    switch (severity) {
        case Severity::Low: return "low";
        case Severity::Medium: return "medium";
        case Severity::High: return "high";
        case Severity::Critical: return "critical";
        default: return "high";
    }
}

inline std::optional<Severity> SeverityFromString(const std::string& severity) {
    if (severity == "low") return Severity::Low;
    if (severity == "medium") return Severity::Medium;
    if (severity == "high") return Severity::High;
    if (severity == "critical") return Severity::Critical;
    return std::nullopt;
}

/**
 * @struct AnnotationException
 * @brief Pattern that exempts a conditional keyword when found in the surrounding copy.
 */
struct AnnotationException {
    std::string condition;      ///< Why the exemption exists (e.g. general knowledge).
    std::string allowedPattern; ///< ECMAScript regex.
};

/**
 * @struct ContextPattern
 * @brief Disallowed phrasing that turns a context-dependent keyword into a violation.
 */
struct ContextPattern {
    std::string pattern; ///< ECMAScript regex.
    std::string reason;
    Severity severity = Severity::High;
};

/**
 * @struct KeywordRule
 * @brief One tagged rule record. All tiers share this shape; tier-specific fields stay empty elsewhere.
 */
struct KeywordRule {
    std::string id;                           ///< Stable identifier used in diagnostics.
    std::vector<std::string> keywords;        ///< The keyword and its synonyms, matched literally.
    RuleTier tier = RuleTier::Absolute;
    std::string category;                     ///< e.g. rejuvenation, penetration, youthful.
    Severity severity = Severity::High;
    std::string regulatoryClass;              ///< 薬機法違反, 景表法違反, 特商法違反, 社内基準違反.
    std::string rationale;
    std::optional<std::string> referenceHint; ///< Knowledge-base document backing the rule.
    std::optional<std::string> acceptableRewrite;

    // Conditional tier
    std::string requiredAnnotation;           ///< Regex the bound footnote text must satisfy.
    std::vector<AnnotationException> exceptions;
    std::vector<std::string> productCategories; ///< Empty means every product.

    // Context-dependent tier
    std::vector<ContextPattern> ngPatterns;
    std::vector<std::string> okPatterns;

    bool AppliesToProduct(const std::string& productId) const {
        if (productId.empty() || productCategories.empty()) return true;
        for (const auto& category : productCategories) {
            if (category == productId) return true;
        }
        return false;
    }
};

} // namespace copycheck::domain::compliance
