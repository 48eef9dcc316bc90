/**
 * @file GuinnessRecord.hpp
 * @brief Certified record facts that record claims in the copy are checked against.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace copycheck::domain::compliance {

struct CertificationPeriod {
    int startYear = 0;
    std::optional<int> startMonth;
    int endYear = 0;
    std::optional<int> endMonth;
    std::string description; ///< "2020年～2024年"

    /** @brief Inclusive number of years, the figure an "N年連続" claim must state. */
    int ConsecutiveYears() const { return endYear - startYear + 1; }
};

/**
 * @struct GuinnessRecord
 * @brief One certified world record with the wording rules for claiming it.
 */
struct GuinnessRecord {
    std::string officialTitle;
    std::string certifiedProduct;
    CertificationPeriod period;
    std::string surveyOrganization;
    std::string trademark;
    std::string guidelines;
    std::vector<std::string> triggerKeywords;  ///< Any of these marks a segment as a record claim.
    std::vector<std::string> titleAliases;     ///< Shortened titles accepted inside the annotation.
    std::vector<std::string> incorrectTitles;  ///< Wordings that misstate the certified title.
    std::optional<std::string> referenceHint;
};

} // namespace copycheck::domain::compliance
