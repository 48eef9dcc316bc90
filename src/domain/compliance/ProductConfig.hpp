/**
 * @file ProductConfig.hpp
 * @brief Per-product settings that extend the conditional tier.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "domain/compliance/KeywordRule.hpp"

namespace copycheck::domain::compliance {

/**
 * @struct AnnotationRule
 * @brief Product-specific requirement that a keyword carries a footnote.
 */
struct AnnotationRule {
    bool required = false;
    std::string templateText; ///< Expected footnote, e.g. "※保湿成分".
    Severity severity = Severity::High;
    std::optional<std::string> referenceKnowledge;
};

/**
 * @struct ProductConfig
 * @brief Product identity plus its annotation rules.
 */
struct ProductConfig {
    std::string id;       ///< Two-letter product code ("HA", "SH").
    std::string name;
    std::string category; ///< 化粧品, 医薬部外品, 新指定医薬部外品, 食品.
    std::string approvedEffects;
    std::optional<std::string> activeIngredient;
    std::map<std::string, AnnotationRule> annotationRules; ///< Keyword -> rule.

    /** @brief Keywords whose footnote is mandatory for this product. */
    std::vector<std::string> RequiredKeywords() const {
        std::vector<std::string> keywords;
        for (const auto& [keyword, rule] : annotationRules) {
            if (rule.required) keywords.push_back(keyword);
        }
        return keywords;
    }
};

} // namespace copycheck::domain::compliance
