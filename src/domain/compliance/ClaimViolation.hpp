/**
 * @file ClaimViolation.hpp
 * @brief Findings of the claim validators (period statements, record claims).
 */

#pragma once

#include <optional>
#include <string>

#include "domain/compliance/KeywordRule.hpp"

namespace copycheck::domain::compliance {

enum class ClaimViolationType {
    PeriodMismatch,      ///< Stated years disagree with a stated or certified period.
    TitleMismatch,       ///< Record title differs from the certified one.
    AnnotationIncomplete ///< Required annotation missing or lacking elements.
};

inline std::string ClaimViolationTypeToString(ClaimViolationType type) {
    switch (type) {
        case ClaimViolationType::PeriodMismatch: return "periodMismatch";
        case ClaimViolationType::TitleMismatch: return "titleMismatch";
        case ClaimViolationType::AnnotationIncomplete: return "annotationIncomplete";
    }
    return "periodMismatch";
}

/**
 * @struct ClaimViolation
 * @brief One problem with a factual claim, reported next to the keyword matches.
 */
struct ClaimViolation {
    std::string validator; ///< "period" or "guinnessRecord".
    ClaimViolationType type = ClaimViolationType::PeriodMismatch;
    Severity severity = Severity::High;
    std::string regulatoryClass = "景表法違反";
    std::string description;
    std::string expected;
    std::string actual;
    std::string correctionSuggestion;
    std::optional<std::string> referenceHint;

    bool operator==(const ClaimViolation& o) const {
        return validator == o.validator && type == o.type && severity == o.severity &&
               regulatoryClass == o.regulatoryClass && description == o.description && expected == o.expected &&
               actual == o.actual && correctionSuggestion == o.correctionSuggestion &&
               referenceHint == o.referenceHint;
    }
};

} // namespace copycheck::domain::compliance
