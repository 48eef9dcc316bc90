/**
 * @file ComplianceService.cpp
 * @brief Implementation of ComplianceService.
 */

#include "application/compliance/ComplianceService.hpp"

#include <algorithm>
#include <future>
#include <iostream>
#include <set>
#include <thread>

#include "domain/compliance/Segmenter.hpp"
#include "domain/text/Utf8Text.hpp"

namespace copycheck::application::compliance {

using namespace domain::compliance;

namespace {

// Identical findings from several segments are reported once.
std::string ClaimKey(const ClaimViolation& violation) {
    return violation.validator + '\n' + ClaimViolationTypeToString(violation.type) + '\n' +
           SeverityToString(violation.severity) + '\n' + violation.description + '\n' + violation.expected + '\n' +
           violation.actual + '\n' + violation.correctionSuggestion;
}

} // namespace

ComplianceService::ComplianceService(std::shared_ptr<const RuleTables> rules, EngineSettings settings)
    : m_rules(rules), m_settings(std::move(settings)), m_matcher(rules) {
    if (const GuinnessRecord* record = m_rules->Record()) m_recordValidator.emplace(*record);
}

std::vector<Segment> ComplianceService::SegmentText(const std::string& text, const std::string& productId) const {
    Segmenter::Options options;
    options.maxInputLength = m_settings.maxInputLength;
    if (const ProductConfig* product = m_rules->FindProduct(productId)) {
        options.claimKeywords = product->RequiredKeywords();
    }
    return Segmenter(std::move(options)).SegmentText(text);
}

ValidationResult ComplianceService::ValidateSegment(const std::string& segmentText,
                                                    const std::optional<std::string>& fullText,
                                                    const std::string& productId) const {
    const DocumentContext context = PrepareContext(fullText ? *fullText : segmentText, productId);
    const AnnotationAnalysis analysis = m_analyzer.Analyze(segmentText, context);
    return m_aggregator.Aggregate(m_matcher.Match(segmentText, context, productId), analysis.bindings);
}

std::vector<ClaimViolation> ComplianceService::ValidateClaims(const std::string& segmentText,
                                                              const std::optional<std::string>& fullText) const {
    return ValidateClaims(segmentText, PrepareContext(fullText ? *fullText : segmentText, {}));
}

DocumentReport ComplianceService::Evaluate(const std::string& text, const std::string& productId) const {
    WarnIfUnknownProduct(productId);

    DocumentReport report;
    report.productId = productId;
    const std::vector<Segment> segments = SegmentText(text, productId);
    const DocumentContext context = PrepareContext(text, productId);

    std::size_t workers = 1;
    if (m_settings.parallelSegmentEvaluation) {
        workers = std::min<std::size_t>(std::max(1u, std::thread::hardware_concurrency()), segments.size());
    }

    if (workers > 1) {
        const std::size_t chunk = (segments.size() + workers - 1) / workers;
        std::vector<std::future<std::vector<SegmentEvaluation>>> pending;
        pending.reserve(workers);
        for (std::size_t begin = 0; begin < segments.size(); begin += chunk) {
            const std::size_t end = std::min(segments.size(), begin + chunk);
            pending.push_back(std::async(std::launch::async, [this, &segments, &context, &productId, begin, end]() {
                return EvaluateRange(segments, begin, end, context, productId);
            }));
        }
        // get() rethrows anything a task threw, in chunk order.
        report.segments.reserve(segments.size());
        for (auto& future : pending) {
            auto part = future.get();
            report.segments.insert(report.segments.end(), std::make_move_iterator(part.begin()),
                                   std::make_move_iterator(part.end()));
        }
    } else {
        report.segments = EvaluateRange(segments, 0, segments.size(), context, productId);
    }

    std::vector<ValidationResult> results;
    results.reserve(report.segments.size());
    std::set<std::string> seen;
    for (const auto& evaluation : report.segments) {
        results.push_back(evaluation.result);
        for (const auto& violation : evaluation.claimViolations) {
            if (seen.insert(ClaimKey(violation)).second) report.claimViolations.push_back(violation);
        }
    }
    report.overall = m_aggregator.Merge(results);

    std::cerr << "[ComplianceService] Evaluated " << report.segments.size() << " segments"
              << (productId.empty() ? std::string() : " for product " + productId) << " on " << workers
              << (workers == 1 ? " thread: " : " threads: ") << report.overall.summary.total << " violations, "
              << report.claimViolations.size() << " claim violations" << std::endl;
    return report;
}

DocumentContext ComplianceService::PrepareContext(const std::string& text, const std::string& productId) const {
    DocumentContext context;
    context.text = domain::text::ToWide(text);
    m_analyzer.Prepare(context);
    m_matcher.Prepare(context, productId);
    m_periodAnalyzer.Prepare(context);
    if (m_recordValidator) m_recordValidator->Prepare(context);
    return context;
}

std::vector<SegmentEvaluation> ComplianceService::EvaluateRange(const std::vector<Segment>& segments,
                                                                std::size_t begin, std::size_t end,
                                                                const DocumentContext& context,
                                                                const std::string& productId) const {
    std::vector<SegmentEvaluation> evaluations;
    evaluations.reserve(end - begin);
    for (std::size_t i = begin; i < end; ++i) evaluations.push_back(EvaluateSegment(segments[i], context, productId));
    return evaluations;
}

SegmentEvaluation ComplianceService::EvaluateSegment(const Segment& segment, const DocumentContext& context,
                                                     const std::string& productId) const {
    SegmentEvaluation evaluation;
    evaluation.segment = segment;
    evaluation.annotations = m_analyzer.Analyze(segment.text, context);
    evaluation.result = m_aggregator.Aggregate(m_matcher.Match(segment.text, context, productId),
                                               evaluation.annotations.bindings);
    evaluation.claimViolations = ValidateClaims(segment.text, context);
    return evaluation;
}

std::vector<ClaimViolation> ComplianceService::ValidateClaims(const std::string& segmentText,
                                                              const DocumentContext& context) const {
    std::vector<ClaimViolation> violations = m_periodAnalyzer.Validate(segmentText, context);
    if (m_recordValidator) {
        auto record = m_recordValidator->Validate(segmentText, context);
        violations.insert(violations.end(), std::make_move_iterator(record.begin()),
                          std::make_move_iterator(record.end()));
    }
    return violations;
}

void ComplianceService::WarnIfUnknownProduct(const std::string& productId) const {
    if (productId.empty() || m_rules->FindProduct(productId)) return;
    std::cerr << "[ComplianceService] Warning: unknown product '" << productId
              << "'; only rules without a product restriction apply." << std::endl;
}

} // namespace copycheck::application::compliance
