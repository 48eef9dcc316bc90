/**
 * @file ViolationAggregator.hpp
 * @brief Filters raw matches through annotation bindings and counts what remains.
 */

#pragma once

#include <vector>

#include "domain/compliance/Annotation.hpp"
#include "domain/compliance/KeywordMatch.hpp"
#include "domain/compliance/ValidationResult.hpp"

namespace copycheck::domain::compliance {

/**
 * @class ViolationAggregator
 * @brief Stateless. Only conditional matches can be dropped by a valid binding.
 */
class ViolationAggregator {
public:
    ValidationResult Aggregate(const std::vector<KeywordMatch>& rawMatches,
                               const std::vector<AnnotationBinding>& bindings) const;

    /** @brief Document-level result from per-segment results, in segment order. */
    ValidationResult Merge(const std::vector<ValidationResult>& results) const;

private:
    static ValidationResult Summarize(std::vector<KeywordMatch> matches);
};

} // namespace copycheck::domain::compliance
