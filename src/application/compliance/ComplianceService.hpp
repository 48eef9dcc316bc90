/**
 * @file ComplianceService.hpp
 * @brief Runs segmentation, annotation analysis, matching and aggregation over advertising copy.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/compliance/EngineSettings.hpp"
#include "domain/compliance/AnnotationAnalyzer.hpp"
#include "domain/compliance/ClaimViolation.hpp"
#include "domain/compliance/DocumentContext.hpp"
#include "domain/compliance/GuinnessRecordValidator.hpp"
#include "domain/compliance/KeywordMatcher.hpp"
#include "domain/compliance/PeriodExpressionAnalyzer.hpp"
#include "domain/compliance/RuleTables.hpp"
#include "domain/compliance/Segment.hpp"
#include "domain/compliance/ValidationResult.hpp"
#include "domain/compliance/ViolationAggregator.hpp"

namespace copycheck::application::compliance {

/**
 * @struct SegmentEvaluation
 * @brief One segment together with what was found in it.
 */
struct SegmentEvaluation {
    domain::compliance::Segment segment;
    domain::compliance::AnnotationAnalysis annotations;
    domain::compliance::ValidationResult result;
    std::vector<domain::compliance::ClaimViolation> claimViolations; ///< Period and record claim findings.

    bool operator==(const SegmentEvaluation& other) const {
        return segment == other.segment && annotations == other.annotations && result == other.result &&
               claimViolations == other.claimViolations;
    }
};

/**
 * @struct DocumentReport
 * @brief Full evaluation of one advertisement.
 */
struct DocumentReport {
    std::string productId;
    std::vector<SegmentEvaluation> segments;     ///< Source order.
    domain::compliance::ValidationResult overall; ///< Merge of every segment result.
    std::vector<domain::compliance::ClaimViolation> claimViolations; ///< Distinct claim findings, first seen first.

    bool HasViolations() const { return overall.hasViolations || !claimViolations.empty(); }

    bool operator==(const DocumentReport& other) const {
        return productId == other.productId && segments == other.segments && overall == other.overall &&
               claimViolations == other.claimViolations;
    }
};

/**
 * @class ComplianceService
 * @brief Stateless pipeline over shared, read-only rule tables.
 *
 * Safe to call from several threads at once.
 */
class ComplianceService {
public:
    ComplianceService(std::shared_ptr<const domain::compliance::RuleTables> rules, EngineSettings settings = {});

    /**
     * @brief Splits @p text using the product's annotation keywords as claim cues.
     * @throws domain::compliance::InvalidInputError when the text is empty or too long.
     */
    std::vector<domain::compliance::Segment> SegmentText(const std::string& text,
                                                         const std::string& productId = {}) const;

    /** @brief Analyzer, matcher and aggregator for one segment. */
    domain::compliance::ValidationResult ValidateSegment(const std::string& segmentText,
                                                         const std::optional<std::string>& fullText = std::nullopt,
                                                         const std::string& productId = {}) const;

    /** @brief Period statement and record claim checks for one segment. */
    std::vector<domain::compliance::ClaimViolation> ValidateClaims(
        const std::string& segmentText, const std::optional<std::string>& fullText = std::nullopt) const;

    /**
     * @brief Evaluates a whole advertisement segment by segment.
     *
     * Whole-text lookups are done once up front. With parallel evaluation enabled the
     * segments are split into at most hardware_concurrency() contiguous chunks.
     * @throws domain::compliance::InvalidInputError when the text is empty or too long.
     */
    DocumentReport Evaluate(const std::string& text, const std::string& productId = {}) const;

    const EngineSettings& Settings() const { return m_settings; }
    const domain::compliance::RuleTables& Rules() const { return *m_rules; }

private:
    domain::compliance::DocumentContext PrepareContext(const std::string& text, const std::string& productId) const;
    std::vector<SegmentEvaluation> EvaluateRange(const std::vector<domain::compliance::Segment>& segments,
                                                 std::size_t begin, std::size_t end,
                                                 const domain::compliance::DocumentContext& context,
                                                 const std::string& productId) const;
    SegmentEvaluation EvaluateSegment(const domain::compliance::Segment& segment,
                                      const domain::compliance::DocumentContext& context,
                                      const std::string& productId) const;
    std::vector<domain::compliance::ClaimViolation> ValidateClaims(
        const std::string& segmentText, const domain::compliance::DocumentContext& context) const;
    void WarnIfUnknownProduct(const std::string& productId) const;

    std::shared_ptr<const domain::compliance::RuleTables> m_rules;
    EngineSettings m_settings;
    domain::compliance::AnnotationAnalyzer m_analyzer;
    domain::compliance::KeywordMatcher m_matcher;
    domain::compliance::PeriodExpressionAnalyzer m_periodAnalyzer;
    std::optional<domain::compliance::GuinnessRecordValidator> m_recordValidator; ///< Empty without a record.
    domain::compliance::ViolationAggregator m_aggregator;
};

} // namespace copycheck::application::compliance
