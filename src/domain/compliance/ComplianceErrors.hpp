/**
 * @file ComplianceErrors.hpp
 * @brief Error taxonomy of the compliance core.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace copycheck::domain::compliance {

/**
 * @class InvalidInputError
 * @brief Text is empty or longer than the configured maximum. Not retried.
 */
class InvalidInputError : public std::invalid_argument {
public:
    explicit InvalidInputError(const std::string& message) : std::invalid_argument(message) {}
};

/**
 * @class RuleTableLoadError
 * @brief A rule definition could not be parsed or compiled. Fatal at startup.
 */
class RuleTableLoadError : public std::runtime_error {
public:
    explicit RuleTableLoadError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @struct PatternEvaluationWarning
 * @brief A rule pattern failed while being evaluated against one text.
 *
 * Never thrown. The matcher logs it and treats the rule as not matching.
 */
struct PatternEvaluationWarning {
    std::string ruleId;
    std::string pattern;
    std::string message;

    std::string Describe() const {
        return "PatternEvaluationWarning rule=" + ruleId + " pattern=" + pattern + ": " + message;
    }
};

} // namespace copycheck::domain::compliance
