/**
 * @file KeywordMatcher.hpp
 * @brief Scans text against the absolute, conditional and context-dependent rule tiers.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "domain/compliance/AnnotationAnalyzer.hpp"
#include "domain/compliance/KeywordMatch.hpp"
#include "domain/compliance/RuleTables.hpp"

namespace copycheck::domain::compliance {

/**
 * @class KeywordMatcher
 * @brief Generic literal keyword scan, one evaluation policy per tier.
 *
 * Never throws for string input. Rules that cannot be evaluated are logged and skipped.
 * Matches from different tiers are never merged here.
 */
class KeywordMatcher {
public:
    explicit KeywordMatcher(std::shared_ptr<const RuleTables> rules);

    /**
     * @brief Raw matches of every tier, in tier order.
     * @param text Segment text to scan.
     * @param fullContext Whole advertisement for footnote lookup and exceptions.
     * @param productId Selects product-specific conditional rules; empty applies all.
     */
    std::vector<KeywordMatch> Match(const std::string& text,
                                    const std::optional<std::string>& fullContext = std::nullopt,
                                    const std::string& productId = {}) const;

    /**
     * @brief Raw matches of one segment of a document prepared with Prepare().
     * @param context Must have been prepared for the same @p productId.
     */
    std::vector<KeywordMatch> Match(const std::string& text, const DocumentContext& context,
                                    const std::string& productId) const;

    /**
     * @brief Resolves footnote requirements and exceptions against the whole text once.
     *
     * Expects the full text footnotes already extracted (AnnotationAnalyzer::Prepare).
     * Only conditional rules with a keyword in the text are resolved; the others are
     * resolved on demand by Match().
     */
    void Prepare(DocumentContext& context, const std::string& productId) const;

    std::vector<KeywordMatch> MatchAbsolute(const std::wstring& text) const;

    std::vector<KeywordMatch> MatchConditional(const std::wstring& text, const DocumentContext& context,
                                               const std::string& productId) const;

    std::vector<KeywordMatch> MatchContextDependent(const std::wstring& text) const;

private:
    std::shared_ptr<const RuleTables> m_rules;
    AnnotationAnalyzer m_analyzer;
};

} // namespace copycheck::domain::compliance
