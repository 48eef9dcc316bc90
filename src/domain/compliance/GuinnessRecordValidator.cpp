/**
 * @file GuinnessRecordValidator.cpp
 * @brief Implementation of GuinnessRecordValidator.
 */

#include "domain/compliance/GuinnessRecordValidator.hpp"

#include <algorithm>

#include "domain/text/Utf8Text.hpp"

namespace copycheck::domain::compliance {

namespace {

const wchar_t* const kSalesClaim = L"売上世界一";

bool IsDigit(wchar_t c) {
    return c >= L'0' && c <= L'9';
}

std::size_t SkipSpaces(const std::wstring& text, std::size_t pos) {
    while (pos < text.size() && text::IsSpace(text[pos])) ++pos;
    return pos;
}

// "※1", "* 2": a marker symbol, optional whitespace, then a digit at @p pos.
bool NumberedMarkerAt(const std::wstring& text, std::size_t pos) {
    if (pos >= text.size() || (text[pos] != L'※' && text[pos] != L'*')) return false;
    pos = SkipSpaces(text, pos + 1);
    return pos < text.size() && IsDigit(text[pos]);
}

bool HasNumberedMarker(const std::wstring& text) {
    for (std::size_t pos = 0; pos < text.size(); ++pos) {
        if (NumberedMarkerAt(text, pos)) return true;
    }
    return false;
}

bool IsFootnoteText(const std::wstring& text) {
    const std::wstring trimmed = text::Trim(text);
    return trimmed.size() >= 2 && trimmed[0] == L'※' && IsDigit(trimmed[1]);
}

std::string Str(int value) {
    return std::to_string(value);
}

} // namespace

GuinnessRecordValidator::GuinnessRecordValidator(GuinnessRecord record) : m_record(std::move(record)) {
    for (const auto& keyword : m_record.triggerKeywords) {
        if (!keyword.empty()) m_triggers.push_back(text::ToWide(keyword));
    }
}

std::vector<std::string> GuinnessRecordValidator::DetectKeywords(const std::string& text) const {
    const std::wstring wide = text::ToWide(text);
    std::vector<std::string> detected;
    for (const auto& trigger : m_triggers) {
        if (wide.find(trigger) != std::wstring::npos) detected.push_back(text::ToUtf8(trigger));
    }
    return detected;
}

std::vector<ClaimViolation> GuinnessRecordValidator::Validate(const std::string& text,
                                                              const std::optional<std::string>& fullContext) const {
    DocumentContext context;
    context.text = text::ToWide(fullContext ? *fullContext : text);
    m_periods.Prepare(context);
    Prepare(context);
    return Check(text, context, fullContext.has_value());
}

std::vector<ClaimViolation> GuinnessRecordValidator::Validate(const std::string& text,
                                                              const DocumentContext& context) const {
    return Check(text, context, true);
}

void GuinnessRecordValidator::Prepare(DocumentContext& context) const {
    const std::wstring& text = context.text;
    context.hasCompleteRecordAnnotation = false;

    // Annotations of the form "※1：<text to the end of the line>".
    std::size_t pos = 0;
    while ((pos = text.find(L'※', pos)) != std::wstring::npos) {
        std::size_t cursor = SkipSpaces(text, pos + 1);
        const std::size_t digits = cursor;
        while (cursor < text.size() && IsDigit(text[cursor])) ++cursor;
        if (cursor == digits || cursor >= text.size() || (text[cursor] != L'：' && text[cursor] != L':')) {
            ++pos;
            continue;
        }

        const std::size_t begin = SkipSpaces(text, cursor + 1);
        std::size_t end = text.find(L'\n', begin);
        if (end == std::wstring::npos) end = text.size();
        if (begin < end && IsCompleteAnnotation(text.substr(begin, end - begin))) {
            context.hasCompleteRecordAnnotation = true;
            return;
        }
        pos = std::max(end, pos + 1);
    }
}

bool GuinnessRecordValidator::IsCompleteAnnotation(const std::wstring& annotation) const {
    auto contains = [&](const std::string& part) {
        return !part.empty() && annotation.find(text::ToWide(part)) != std::wstring::npos;
    };

    const bool organization = contains(m_record.surveyOrganization);
    const bool period = contains(Str(m_record.period.startYear)) && contains(Str(m_record.period.endYear));
    const bool title = contains(m_record.officialTitle) ||
                       std::any_of(m_record.titleAliases.begin(), m_record.titleAliases.end(), contains);
    return organization && period && title;
}

std::vector<ClaimViolation> GuinnessRecordValidator::Check(const std::string& text, const DocumentContext& context,
                                                           bool checkAnnotationText) const {
    std::vector<ClaimViolation> violations;
    const std::wstring wide = text::ToWide(text);

    const bool claimed = std::any_of(m_triggers.begin(), m_triggers.end(), [&](const std::wstring& trigger) {
        return wide.find(trigger) != std::wstring::npos;
    });
    if (!claimed || IsFootnoteText(wide)) return violations;

    CheckTitle(wide, violations);
    CheckPeriod(text, context, violations);
    CheckAnnotation(wide, context, checkAnnotationText, violations);
    return violations;
}

void GuinnessRecordValidator::CheckTitle(const std::wstring& text, std::vector<ClaimViolation>& violations) const {
    const std::wstring claim = kSalesClaim;
    std::size_t pos = text.find(claim);
    if (pos != std::wstring::npos) {
        bool annotated = false;
        for (; pos != std::wstring::npos && !annotated; pos = text.find(claim, pos + claim.size())) {
            annotated = NumberedMarkerAt(text, SkipSpaces(text, pos + claim.size()));
        }
        if (!annotated) {
            ClaimViolation violation = MakeViolation(ClaimViolationType::AnnotationIncomplete, Severity::High);
            violation.description = "「売上世界一」の表現には、正確な認定名を記載した注釈が必須です。";
            violation.expected = "売上世界一※1\n※1：" + m_record.officialTitle;
            violation.actual = "売上世界一（注釈なし）";
            violation.correctionSuggestion = "「売上世界一※1」として、注釈に「" + RecommendedAnnotation() +
                                             "」を追加してください。";
            violations.push_back(std::move(violation));
        }
    }

    for (const auto& incorrect : m_record.incorrectTitles) {
        if (incorrect.empty() || text.find(text::ToWide(incorrect)) == std::wstring::npos) continue;
        ClaimViolation violation = MakeViolation(ClaimViolationType::TitleMismatch, Severity::High);
        violation.description = "認定名「" + incorrect + "」は正確ではありません。";
        violation.expected = m_record.officialTitle;
        violation.actual = incorrect;
        violation.correctionSuggestion = "正確な認定名「" + m_record.officialTitle + "」を使用してください。";
        violations.push_back(std::move(violation));
    }
}

void GuinnessRecordValidator::CheckPeriod(const std::string& text, const DocumentContext& context,
                                          std::vector<ClaimViolation>& violations) const {
    const CertificationPeriod& certified = m_record.period;
    const PeriodAnalysis analysis = m_periods.Analyze(text, context);

    std::vector<const PeriodExpression*> consecutive;
    std::vector<const PeriodExpression*> ranges;
    for (const auto& expression : analysis.expressions) {
        if (expression.type == PeriodExpressionType::ConsecutiveYears) consecutive.push_back(&expression);
        if (expression.IsRange()) ranges.push_back(&expression);
    }

    if (ranges.empty()) {
        ClaimViolation violation = MakeViolation(ClaimViolationType::AnnotationIncomplete, Severity::High);
        violation.description = m_record.trademark + "の認定には、認定期間の明記が必須です。";
        violation.expected = certified.description;
        violation.actual = "期間の記載なし";
        violation.correctionSuggestion = "注釈に認定期間「" + certified.description + "」を追加してください。";
        violations.push_back(std::move(violation));
        return;
    }

    const int years = certified.ConsecutiveYears();
    std::vector<std::string> errors;
    std::string actual;

    for (const PeriodExpression* claim : consecutive) {
        if (claim->value == years) continue;
        errors.push_back("連続年数: 広告「" + Str(claim->value.value_or(0)) + "年連続」vs 正「" + Str(years) +
                         "年連続」");
    }

    for (const PeriodExpression* range : ranges) {
        actual = range->description.empty() ? range->originalText : range->description;
        if (range->startYear && *range->startYear != certified.startYear) {
            errors.push_back("開始年: 広告「" + Str(*range->startYear) + "年」vs 正「" + Str(certified.startYear) +
                             "年」");
        }
        if (range->endYear && *range->endYear != certified.endYear) {
            errors.push_back("終了年: 広告「" + Str(*range->endYear) + "年」vs 正「" + Str(certified.endYear) + "年」");
        }

        const bool rangeHasMonths = range->startMonth || range->endMonth;
        if (rangeHasMonths && !certified.startMonth && !certified.endMonth) {
            errors.push_back("期間粒度: 広告は月単位を含むが、ナレッジは年単位のみ");
        } else if (rangeHasMonths) {
            if (range->startMonth != certified.startMonth) {
                errors.push_back("開始月: 広告「" + Str(range->startMonth.value_or(0)) + "月」vs 正「" +
                                 Str(certified.startMonth.value_or(0)) + "月」");
            }
            if (range->endMonth != certified.endMonth) {
                errors.push_back("終了月: 広告「" + Str(range->endMonth.value_or(0)) + "月」vs 正「" +
                                 Str(certified.endMonth.value_or(0)) + "月」");
            }
        }
    }

    if (errors.empty()) return;

    std::string details;
    for (const auto& error : errors) {
        if (!details.empty()) details += "、";
        details += error;
    }
    const std::string expected =
        consecutive.empty() ? certified.description : certified.description + "（" + Str(years) + "年連続）";

    ClaimViolation violation = MakeViolation(ClaimViolationType::PeriodMismatch, Severity::High);
    violation.description = "【景表法違反・優良誤認】期間が誤っています。" + details;
    violation.expected = expected;
    violation.actual = actual;
    violation.correctionSuggestion = "期間を正しい内容「" + expected + "」に修正してください。";
    violations.push_back(std::move(violation));
}

void GuinnessRecordValidator::CheckAnnotation(const std::wstring& text, const DocumentContext& context,
                                              bool checkAnnotationText,
                                              std::vector<ClaimViolation>& violations) const {
    const std::string elements = "調査機関（" + m_record.surveyOrganization + "）、正確な認定名（" +
                                 m_record.officialTitle + "）、認定期間（" + m_record.period.description + "）";

    if (!HasNumberedMarker(text)) {
        ClaimViolation violation = MakeViolation(ClaimViolationType::AnnotationIncomplete, Severity::High);
        violation.description = m_record.trademark + "への言及には注釈が必須です。";
        violation.expected = RecommendedAnnotation();
        violation.actual = "注釈なし";
        violation.correctionSuggestion = "注釈を追加し、" + elements + "を明記してください。";
        violations.push_back(std::move(violation));
        return;
    }

    if (!checkAnnotationText || context.hasCompleteRecordAnnotation) return;

    ClaimViolation violation = MakeViolation(ClaimViolationType::AnnotationIncomplete, Severity::Medium);
    violation.description = "注釈が不完全です。調査機関、認定名、認定期間のいずれかが欠けています。";
    violation.expected = RecommendedAnnotation();
    violation.actual = "注釈が不完全";
    violation.correctionSuggestion = "注釈に、" + elements + "をすべて含めてください。";
    violations.push_back(std::move(violation));
}

ClaimViolation GuinnessRecordValidator::MakeViolation(ClaimViolationType type, Severity severity) const {
    ClaimViolation violation;
    violation.validator = "guinnessRecord";
    violation.type = type;
    violation.severity = severity;
    violation.referenceHint = m_record.referenceHint;
    return violation;
}

std::string GuinnessRecordValidator::RecommendedAnnotation() const {
    return "※1：" + m_record.surveyOrganization + "のグローバル調査、" + m_record.officialTitle + "、" +
           m_record.period.description;
}

} // namespace copycheck::domain::compliance
