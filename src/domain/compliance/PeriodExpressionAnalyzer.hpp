/**
 * @file PeriodExpressionAnalyzer.hpp
 * @brief Extracts period statements and checks that they agree with each other.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/compliance/ClaimViolation.hpp"
#include "domain/compliance/DocumentContext.hpp"
#include "domain/compliance/PeriodExpression.hpp"

namespace copycheck::domain::compliance {

/**
 * @class PeriodExpressionAnalyzer
 * @brief Compares "N年連続" and "満N年" claims with the year ranges stated for them.
 *
 * Ranges count inclusively: 2020年～2024年 covers five years. Period statements
 * inside ※ annotations of the full text count for every segment.
 */
class PeriodExpressionAnalyzer {
public:
    /**
     * @param text Segment text.
     * @param fullContext Whole advertisement whose ※ annotations are also read.
     */
    PeriodAnalysis Analyze(const std::string& text,
                           const std::optional<std::string>& fullContext = std::nullopt) const;

    /** @brief Same as above for a document prepared with Prepare(). */
    PeriodAnalysis Analyze(const std::string& text, const DocumentContext& context) const;

    /** @brief Collects the period statements of the ※ annotations in @p context once per document. */
    void Prepare(DocumentContext& context) const;

    /** @brief One period_mismatch violation per "N年連続" that disagrees with a stated range. */
    std::vector<ClaimViolation> Validate(const std::string& text,
                                         const std::optional<std::string>& fullContext = std::nullopt) const;

    std::vector<ClaimViolation> Validate(const std::string& text, const DocumentContext& context) const;

    /** @brief Every period statement written in @p text itself. */
    std::vector<PeriodExpression> ExtractFromText(const std::wstring& text) const;

    /** @brief Ranges and "N年連続" inside each "※…" annotation running to the end of its line. */
    std::vector<PeriodExpression> ExtractFromAnnotations(const std::wstring& text) const;

    /** @brief Fills isConsistent and issues of @p analysis from its expressions. */
    static void CheckConsistency(PeriodAnalysis& analysis);

    /** @brief Inclusive years of a range; one less when the end month falls before the start month. */
    static int YearsCovered(const PeriodExpression& range);

private:
    PeriodAnalysis AnalyzeDecoded(const std::wstring& text, const DocumentContext& context) const;
    std::vector<ClaimViolation> ViolationsOf(const PeriodAnalysis& analysis) const;
};

} // namespace copycheck::domain::compliance
