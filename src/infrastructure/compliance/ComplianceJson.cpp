/**
 * @file ComplianceJson.cpp
 * @brief Implementation of the compliance JSON mapping.
 */

#include "infrastructure/compliance/ComplianceJson.hpp"

#include "application/compliance/ResultSummary.hpp"

namespace copycheck::infrastructure::compliance {

using json = nlohmann::json;
using namespace domain::compliance;

namespace {

template <typename T>
json OptionalValue(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

} // namespace

json ToJson(const Segment& segment) {
    return {
        {"id", segment.id},
        {"text", segment.text},
        {"type", SegmentTypeToString(segment.type)},
        {"position", {{"start", segment.position.start}, {"end", segment.position.end}}},
        {"line", segment.line}
    };
}

json ToJson(const std::vector<Segment>& segments) {
    json list = json::array();
    for (const auto& segment : segments) list.push_back(ToJson(segment));
    return list;
}

json ToJson(const KeywordMatch& match) {
    return {
        {"keyword", match.keyword},
        {"ruleId", match.ruleId},
        {"tier", RuleTierToString(match.tier)},
        {"category", match.category},
        {"severity", SeverityToString(match.severity)},
        {"regulatoryClass", match.regulatoryClass},
        {"rationale", match.rationale},
        {"reason", match.reason},
        {"referenceHint", OptionalValue(match.referenceHint)},
        {"acceptableRewrite", OptionalValue(match.acceptableRewrite)},
        {"position", {{"start", match.position.start}, {"end", match.position.end}}}
    };
}

json ToJson(const AnnotationAnalysis& analysis) {
    json occurrences = json::array();
    for (const auto& o : analysis.markerOccurrences) {
        occurrences.push_back({{"keyword", o.keyword}, {"marker", o.marker}, {"position", o.position}});
    }

    json footnotes = json::array();
    for (const auto& f : analysis.footnotes) {
        footnotes.push_back({
            {"marker", f.marker},
            {"footnoteText", f.footnoteText},
            {"position", f.position},
            {"scope", AnnotationScopeToString(f.scope)}
        });
    }

    json bindings = json::array();
    for (const auto& b : analysis.bindings) {
        bindings.push_back({
            {"keyword", b.keyword},
            {"marker", b.marker},
            {"footnoteText", OptionalValue(b.footnoteText)},
            {"scope", b.scope ? json(AnnotationScopeToString(*b.scope)) : json(nullptr)},
            {"isValid", b.isValid}
        });
    }

    return {
        {"markerOccurrences", occurrences},
        {"footnotes", footnotes},
        {"bindings", bindings},
        {"hasAnnotatedKeywords", analysis.hasAnnotatedKeywords}
    };
}

json ToJson(const ValidationResult& result) {
    json matches = json::array();
    for (const auto& match : result.matches) matches.push_back(ToJson(match));

    const auto& s = result.summary;
    return {
        {"hasViolations", result.hasViolations},
        {"matches", matches},
        {"summary", {
            {"byTier", {
                {"absolute", s.byTier.absolute},
                {"conditional", s.byTier.conditional},
                {"contextDependent", s.byTier.contextDependent}
            }},
            {"bySeverity", {
                {"low", s.bySeverity.low},
                {"medium", s.bySeverity.medium},
                {"high", s.bySeverity.high},
                {"critical", s.bySeverity.critical}
            }},
            {"total", s.total}
        }},
        {"uniqueFlaggedKeywords", result.uniqueFlaggedKeywords},
        {"summaryText", application::compliance::SummaryText(result)}
    };
}

json ToJson(const ClaimViolation& violation) {
    return {
        {"validator", violation.validator},
        {"type", ClaimViolationTypeToString(violation.type)},
        {"severity", SeverityToString(violation.severity)},
        {"regulatoryClass", violation.regulatoryClass},
        {"description", violation.description},
        {"expected", violation.expected},
        {"actual", violation.actual},
        {"correctionSuggestion", violation.correctionSuggestion},
        {"referenceHint", OptionalValue(violation.referenceHint)}
    };
}

json ToJson(const std::vector<ClaimViolation>& violations) {
    json list = json::array();
    for (const auto& violation : violations) list.push_back(ToJson(violation));
    return list;
}

json ToJson(const application::compliance::DocumentReport& report) {
    json segments = json::array();
    for (const auto& evaluation : report.segments) {
        json entry = ToJson(evaluation.segment);
        entry["annotations"] = ToJson(evaluation.annotations);
        entry["result"] = ToJson(evaluation.result);
        entry["claimViolations"] = ToJson(evaluation.claimViolations);
        segments.push_back(entry);
    }

    return {
        {"productId", report.productId.empty() ? json(nullptr) : json(report.productId)},
        {"segments", segments},
        {"overall", ToJson(report.overall)},
        {"claimViolations", ToJson(report.claimViolations)},
        {"hasViolations", report.HasViolations()}
    };
}

} // namespace copycheck::infrastructure::compliance
