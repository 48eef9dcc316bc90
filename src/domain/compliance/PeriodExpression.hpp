/**
 * @file PeriodExpression.hpp
 * @brief Normalised period statements ("5年連続", "2020年～2024年", "満5年").
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace copycheck::domain::compliance {

enum class PeriodExpressionType {
    ConsecutiveYears, ///< X年連続
    DateRange,        ///< YYYY年MM月～YYYY年MM月
    CalculatedYears,  ///< X年間
    FullYears,        ///< 満X年
    YearRange         ///< YYYY年～YYYY年
};

inline std::string PeriodExpressionTypeToString(PeriodExpressionType type) {
    switch (type) {
        case PeriodExpressionType::ConsecutiveYears: return "consecutiveYears";
        case PeriodExpressionType::DateRange: return "dateRange";
        case PeriodExpressionType::CalculatedYears: return "calculatedYears";
        case PeriodExpressionType::FullYears: return "fullYears";
        case PeriodExpressionType::YearRange: return "yearRange";
    }
    return "consecutiveYears";
}

enum class PeriodSource {
    MainText,
    Annotation
};

struct PeriodExpression {
    PeriodExpressionType type = PeriodExpressionType::ConsecutiveYears;
    std::optional<int> value; ///< Years, for the single-number forms.
    std::optional<int> startYear;
    std::optional<int> startMonth;
    std::optional<int> endYear;
    std::optional<int> endMonth;
    PeriodSource source = PeriodSource::MainText;
    std::string originalText;
    std::string description;

    bool IsRange() const {
        return type == PeriodExpressionType::DateRange || type == PeriodExpressionType::YearRange;
    }

    bool operator==(const PeriodExpression& o) const {
        return type == o.type && value == o.value && startYear == o.startYear && startMonth == o.startMonth &&
               endYear == o.endYear && endMonth == o.endMonth && source == o.source &&
               originalText == o.originalText && description == o.description;
    }
};

/**
 * @struct PeriodAnalysis
 * @brief Period statements of one text and whether they agree with each other.
 */
struct PeriodAnalysis {
    std::vector<PeriodExpression> expressions;
    bool hasConsecutiveYears = false;
    bool hasDateRange = false;
    bool isConsistent = true;
    std::vector<std::string> issues;
};

} // namespace copycheck::domain::compliance
