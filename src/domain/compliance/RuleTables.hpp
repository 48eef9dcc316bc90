/**
 * @file RuleTables.hpp
 * @brief Immutable, pre-compiled catalog of keyword rules for all tiers.
 */

#pragma once

#include <map>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "domain/compliance/GuinnessRecord.hpp"
#include "domain/compliance/KeywordRule.hpp"
#include "domain/compliance/ProductConfig.hpp"

namespace copycheck::domain::compliance {

/**
 * @struct CompiledPattern
 * @brief Regex source kept next to its compiled code point form.
 */
struct CompiledPattern {
    std::string source;
    std::wregex regex;
};

struct CompiledContextPattern {
    CompiledPattern pattern;
    std::string reason;
    Severity severity = Severity::High;
};

/**
 * @struct CompiledRule
 * @brief A KeywordRule with keywords decoded and every pattern compiled once.
 */
struct CompiledRule {
    KeywordRule rule;
    std::vector<std::wstring> keywords;
    std::optional<CompiledPattern> requiredAnnotation;
    std::vector<CompiledPattern> exceptions;
    std::vector<CompiledContextPattern> ngPatterns;
    std::vector<CompiledPattern> okPatterns;
};

/**
 * @class RuleTables
 * @brief Read-only rule configuration shared by every component.
 *
 * Built once at startup and never mutated, so it can be read from any number of
 * threads. Construction either succeeds completely or throws RuleTableLoadError.
 */
class RuleTables {
public:
    /**
     * @brief Compiles @p rules and derives the product-specific conditional rules.
     * @throws RuleTableLoadError when a pattern does not compile or a rule id repeats.
     */
    explicit RuleTables(std::vector<KeywordRule> rules, std::vector<ProductConfig> products = {},
                        std::optional<GuinnessRecord> record = std::nullopt);

    const std::vector<CompiledRule>& Absolute() const { return m_absolute; }
    const std::vector<CompiledRule>& ContextDependent() const { return m_contextDependent; }

    /**
     * @brief Conditional rules that apply to @p productId, product annotation rules included.
     * @param productId Product code, or empty for "every rule".
     */
    std::vector<const CompiledRule*> Conditional(const std::string& productId = {}) const;

    /** @brief Product configuration, or nullptr when the product is unknown. */
    const ProductConfig* FindProduct(const std::string& productId) const;

    std::vector<std::string> ProductIds() const;

    /** @brief Certified record for the record-claim checks, or nullptr when none is configured. */
    const GuinnessRecord* Record() const { return m_record ? &*m_record : nullptr; }

    std::size_t RuleCount() const;

    /**
     * @brief Compiles one ECMAScript pattern over code points.
     * @throws RuleTableLoadError naming @p ruleId when the pattern is invalid.
     */
    static CompiledPattern CompilePattern(const std::string& source, const std::string& ruleId);

    /** @brief Escapes regex metacharacters so @p literal matches itself. */
    static std::string EscapeRegex(const std::string& literal);

private:
    CompiledRule Compile(KeywordRule rule) const;
    KeywordRule RuleFromAnnotation(const ProductConfig& product, const std::string& keyword,
                                   const AnnotationRule& annotation) const;

    std::vector<CompiledRule> m_absolute;
    std::vector<CompiledRule> m_conditional;
    std::vector<CompiledRule> m_contextDependent;
    std::map<std::string, ProductConfig> m_products;
    std::map<std::string, std::vector<CompiledRule>> m_productRules; ///< Derived from annotationRules.
    std::optional<GuinnessRecord> m_record;
};

} // namespace copycheck::domain::compliance
