/**
 * @file GuinnessRecordValidator.hpp
 * @brief Checks world-record claims against the certified record.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/compliance/ClaimViolation.hpp"
#include "domain/compliance/DocumentContext.hpp"
#include "domain/compliance/GuinnessRecord.hpp"
#include "domain/compliance/PeriodExpressionAnalyzer.hpp"

namespace copycheck::domain::compliance {

/**
 * @class GuinnessRecordValidator
 * @brief Title, period and annotation checks for segments that claim the record.
 *
 * A segment claims the record when it contains one of the record's trigger
 * keywords. Footnote texts ("※1：…") are the evidence, not the claim, and are
 * not validated themselves.
 */
class GuinnessRecordValidator {
public:
    explicit GuinnessRecordValidator(GuinnessRecord record);

    /** @brief Trigger keywords present in @p text, in configuration order. */
    std::vector<std::string> DetectKeywords(const std::string& text) const;

    /**
     * @param text Segment text.
     * @param fullContext Whole advertisement. Without it the annotation contents are not checked.
     */
    std::vector<ClaimViolation> Validate(const std::string& text,
                                         const std::optional<std::string>& fullContext = std::nullopt) const;

    /** @brief Same as above for a document prepared with Prepare() and PeriodExpressionAnalyzer::Prepare(). */
    std::vector<ClaimViolation> Validate(const std::string& text, const DocumentContext& context) const;

    /** @brief Records whether any "※N：" annotation of the document names organisation, title and period. */
    void Prepare(DocumentContext& context) const;

    /** @brief True when @p annotation names the organisation, both certified years and the title. */
    bool IsCompleteAnnotation(const std::wstring& annotation) const;

    const GuinnessRecord& Record() const { return m_record; }

private:
    std::vector<ClaimViolation> Check(const std::string& text, const DocumentContext& context,
                                      bool checkAnnotationText) const;
    void CheckTitle(const std::wstring& text, std::vector<ClaimViolation>& violations) const;
    void CheckPeriod(const std::string& text, const DocumentContext& context,
                     std::vector<ClaimViolation>& violations) const;
    void CheckAnnotation(const std::wstring& text, const DocumentContext& context, bool checkAnnotationText,
                         std::vector<ClaimViolation>& violations) const;
    ClaimViolation MakeViolation(ClaimViolationType type, Severity severity) const;
    std::string RecommendedAnnotation() const;

    GuinnessRecord m_record;
    std::vector<std::wstring> m_triggers;
    PeriodExpressionAnalyzer m_periods;
};

} // namespace copycheck::domain::compliance
