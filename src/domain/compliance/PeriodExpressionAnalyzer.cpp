/**
 * @file PeriodExpressionAnalyzer.cpp
 * @brief Implementation of PeriodExpressionAnalyzer.
 */

#include "domain/compliance/PeriodExpressionAnalyzer.hpp"

#include <algorithm>
#include <regex>

#include "domain/text/Utf8Text.hpp"

namespace copycheck::domain::compliance {

namespace {

// Every repetition is bounded so matching never recurses deeply on long input.
const std::wregex& ConsecutivePattern() {
    static const std::wregex pattern(L"([0-9]{1,9})年連続");
    return pattern;
}

const std::wregex& DateRangePattern() {
    static const std::wregex pattern(
        L"([0-9]{4})年([0-9]{1,2})月[\\s　]{0,8}[～〜~-][\\s　]{0,8}([0-9]{4})年([0-9]{1,2})月");
    return pattern;
}

const std::wregex& YearRangePattern() {
    static const std::wregex pattern(L"([0-9]{4})年[\\s　]{0,8}[～〜~-][\\s　]{0,8}([0-9]{4})年");
    return pattern;
}

const std::wregex& FullYearsPattern() {
    static const std::wregex pattern(L"満([0-9]{1,9})年");
    return pattern;
}

const std::wregex& YearsPattern() {
    static const std::wregex pattern(L"([0-9]{1,9})年間");
    return pattern;
}

int ToInt(const std::wssub_match& group) {
    return std::stoi(group.str());
}

std::string Str(int value) {
    return std::to_string(value);
}

PeriodExpression SingleValue(PeriodExpressionType type, const std::wsmatch& m, PeriodSource source,
                             const std::string& description) {
    PeriodExpression expression;
    expression.type = type;
    expression.value = ToInt(m[1]);
    expression.source = source;
    expression.originalText = text::ToUtf8(m.str(0));
    expression.description = description;
    return expression;
}

void AppendDateRanges(const std::wstring& text, PeriodSource source, const std::string& suffix,
                      std::vector<PeriodExpression>& out) {
    for (std::wsregex_iterator it(text.begin(), text.end(), DateRangePattern()), end; it != end; ++it) {
        const std::wsmatch& m = *it;
        PeriodExpression expression;
        expression.type = PeriodExpressionType::DateRange;
        expression.startYear = ToInt(m[1]);
        expression.startMonth = ToInt(m[2]);
        expression.endYear = ToInt(m[3]);
        expression.endMonth = ToInt(m[4]);
        expression.source = source;
        expression.originalText = text::ToUtf8(m.str(0));
        expression.description = Str(*expression.startYear) + "年" + Str(*expression.startMonth) + "月～" +
                                 Str(*expression.endYear) + "年" + Str(*expression.endMonth) + "月" + suffix;
        out.push_back(std::move(expression));
    }
}

// Year ranges are searched with the month-qualified ranges removed so they are not counted twice.
void AppendYearRanges(const std::wstring& text, PeriodSource source, const std::string& suffix,
                      std::vector<PeriodExpression>& out) {
    const std::wstring remaining = std::regex_replace(text, DateRangePattern(), L"");
    for (std::wsregex_iterator it(remaining.begin(), remaining.end(), YearRangePattern()), end; it != end; ++it) {
        const std::wsmatch& m = *it;
        PeriodExpression expression;
        expression.type = PeriodExpressionType::YearRange;
        expression.startYear = ToInt(m[1]);
        expression.endYear = ToInt(m[2]);
        expression.source = source;
        expression.originalText = text::ToUtf8(m.str(0));
        expression.description = Str(*expression.startYear) + "年～" + Str(*expression.endYear) + "年" + suffix;
        out.push_back(std::move(expression));
    }
}

void AppendConsecutive(const std::wstring& text, PeriodSource source, const std::string& suffix,
                       std::vector<PeriodExpression>& out) {
    for (std::wsregex_iterator it(text.begin(), text.end(), ConsecutivePattern()), end; it != end; ++it) {
        out.push_back(SingleValue(PeriodExpressionType::ConsecutiveYears, *it, source,
                                  text::ToUtf8((*it).str(1)) + "年連続" + suffix));
    }
}

std::vector<const PeriodExpression*> OfType(const std::vector<PeriodExpression>& expressions,
                                            PeriodExpressionType type) {
    std::vector<const PeriodExpression*> selected;
    for (const auto& expression : expressions) {
        if (expression.type == type) selected.push_back(&expression);
    }
    return selected;
}

std::vector<const PeriodExpression*> Ranges(const std::vector<PeriodExpression>& expressions) {
    std::vector<const PeriodExpression*> selected;
    for (const auto& expression : expressions) {
        if (expression.IsRange()) selected.push_back(&expression);
    }
    return selected;
}

} // namespace

PeriodAnalysis PeriodExpressionAnalyzer::Analyze(const std::string& text,
                                                 const std::optional<std::string>& fullContext) const {
    DocumentContext context;
    context.text = text::ToWide(fullContext ? *fullContext : text);
    Prepare(context);
    return AnalyzeDecoded(text::ToWide(text), context);
}

PeriodAnalysis PeriodExpressionAnalyzer::Analyze(const std::string& text, const DocumentContext& context) const {
    return AnalyzeDecoded(text::ToWide(text), context);
}

void PeriodExpressionAnalyzer::Prepare(DocumentContext& context) const {
    context.annotationPeriods = ExtractFromAnnotations(context.text);
}

std::vector<ClaimViolation> PeriodExpressionAnalyzer::Validate(const std::string& text,
                                                               const std::optional<std::string>& fullContext) const {
    return ViolationsOf(Analyze(text, fullContext));
}

std::vector<ClaimViolation> PeriodExpressionAnalyzer::Validate(const std::string& text,
                                                               const DocumentContext& context) const {
    return ViolationsOf(Analyze(text, context));
}

std::vector<PeriodExpression> PeriodExpressionAnalyzer::ExtractFromText(const std::wstring& text) const {
    std::vector<PeriodExpression> expressions;
    AppendConsecutive(text, PeriodSource::MainText, "", expressions);
    AppendDateRanges(text, PeriodSource::MainText, "", expressions);
    AppendYearRanges(text, PeriodSource::MainText, "", expressions);

    for (std::wsregex_iterator it(text.begin(), text.end(), FullYearsPattern()), end; it != end; ++it) {
        expressions.push_back(SingleValue(PeriodExpressionType::FullYears, *it, PeriodSource::MainText,
                                          "満" + text::ToUtf8((*it).str(1)) + "年"));
    }
    for (std::wsregex_iterator it(text.begin(), text.end(), YearsPattern()), end; it != end; ++it) {
        expressions.push_back(SingleValue(PeriodExpressionType::CalculatedYears, *it, PeriodSource::MainText,
                                          text::ToUtf8((*it).str(1)) + "年間"));
    }
    return expressions;
}

std::vector<PeriodExpression> PeriodExpressionAnalyzer::ExtractFromAnnotations(const std::wstring& text) const {
    static const std::string kSuffix = " (注釈)";

    std::vector<PeriodExpression> expressions;
    std::size_t pos = 0;
    while ((pos = text.find(L'※', pos)) != std::wstring::npos) {
        std::size_t end = text.find(L'\n', pos + 1);
        if (end == std::wstring::npos) end = text.size();
        if (end == pos + 1) {
            ++pos;
            continue;
        }

        const std::wstring annotation = text.substr(pos, end - pos);
        AppendDateRanges(annotation, PeriodSource::Annotation, kSuffix, expressions);
        AppendYearRanges(annotation, PeriodSource::Annotation, kSuffix, expressions);
        AppendConsecutive(annotation, PeriodSource::Annotation, kSuffix, expressions);
        pos = end;
    }
    return expressions;
}

void PeriodExpressionAnalyzer::CheckConsistency(PeriodAnalysis& analysis) {
    analysis.issues.clear();
    const auto ranges = Ranges(analysis.expressions);

    for (const PeriodExpression* consecutive : OfType(analysis.expressions, PeriodExpressionType::ConsecutiveYears)) {
        for (const PeriodExpression* range : ranges) {
            const int years = YearsCovered(*range);
            if (consecutive->value == years) continue;
            analysis.issues.push_back("「" + consecutive->originalText + "」と「" + range->originalText +
                                      "」が一致しません。期間範囲から算出される年数は" + Str(years) + "年ですが、" +
                                      Str(consecutive->value.value_or(0)) + "年連続と記載されています。");
        }
    }

    for (const PeriodExpression* full : OfType(analysis.expressions, PeriodExpressionType::FullYears)) {
        for (const PeriodExpression* range : ranges) {
            const int years = YearsCovered(*range);
            if (full->value == years) continue;
            analysis.issues.push_back("「" + full->originalText + "」と「" + range->originalText +
                                      "」が一致しません。期間範囲から算出される年数は" + Str(years) + "年です。");
        }
    }

    analysis.isConsistent = analysis.issues.empty();
}

int PeriodExpressionAnalyzer::YearsCovered(const PeriodExpression& range) {
    if (!range.startYear || !range.endYear) return 0;

    int years = *range.endYear - *range.startYear;
    if (range.startMonth.value_or(0) > 0 && range.endMonth.value_or(0) > 0 && *range.endMonth < *range.startMonth) {
        --years;
    }
    return years + 1;
}

PeriodAnalysis PeriodExpressionAnalyzer::AnalyzeDecoded(const std::wstring& text,
                                                        const DocumentContext& context) const {
    PeriodAnalysis analysis;
    analysis.expressions = ExtractFromText(text);
    if (context.text != text) {
        analysis.expressions.insert(analysis.expressions.end(), context.annotationPeriods.begin(),
                                    context.annotationPeriods.end());
    }

    analysis.hasConsecutiveYears = std::any_of(analysis.expressions.begin(), analysis.expressions.end(),
                                               [](const PeriodExpression& e) {
                                                   return e.type == PeriodExpressionType::ConsecutiveYears;
                                               });
    analysis.hasDateRange = std::any_of(analysis.expressions.begin(), analysis.expressions.end(),
                                        [](const PeriodExpression& e) { return e.IsRange(); });
    CheckConsistency(analysis);
    return analysis;
}

std::vector<ClaimViolation> PeriodExpressionAnalyzer::ViolationsOf(const PeriodAnalysis& analysis) const {
    std::vector<ClaimViolation> violations;
    if (analysis.isConsistent) return violations;

    const auto ranges = Ranges(analysis.expressions);
    for (const PeriodExpression* consecutive : OfType(analysis.expressions, PeriodExpressionType::ConsecutiveYears)) {
        const int claimed = consecutive->value.value_or(0);
        for (const PeriodExpression* range : ranges) {
            const int years = YearsCovered(*range);
            if (claimed == years) continue;

            const int start = range->startYear.value_or(0);
            ClaimViolation violation;
            violation.validator = "period";
            violation.type = ClaimViolationType::PeriodMismatch;
            violation.severity = Severity::High;
            violation.description = "記載期間「" + Str(start) + "年～" + Str(range->endYear.value_or(0)) +
                                    "年」から算出される年数（" + Str(years) + "年）と「" + Str(claimed) +
                                    "年連続」が一致しません。";
            violation.expected = Str(years) + "年連続";
            violation.actual = Str(claimed) + "年連続";
            violation.correctionSuggestion = "「" + Str(claimed) + "年連続」を「" + Str(years) +
                                             "年連続」に修正するか、期間を「" + Str(start) + "年～" +
                                             Str(start + claimed - 1) + "年」に修正してください。";

            if (std::find(violations.begin(), violations.end(), violation) == violations.end()) {
                violations.push_back(std::move(violation));
            }
        }
    }
    return violations;
}

} // namespace copycheck::domain::compliance
