/**
 * @file DocumentContext.hpp
 * @brief Whole-advertisement facts computed once and read by every segment.
 */

#pragma once

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "domain/compliance/Annotation.hpp"
#include "domain/compliance/PeriodExpression.hpp"

namespace copycheck::domain::compliance {

/**
 * @struct DocumentContext
 * @brief Footnotes, rule exemptions and period statements of the full text.
 *
 * Filled before the segments are evaluated and only read afterwards, so one
 * instance is shared by all evaluation threads.
 */
struct DocumentContext {
    std::wstring text;                                  ///< Full advertisement, decoded.
    std::vector<AnnotationFootnote> footnotes;          ///< Every footnote of the text, scope FullText.
    std::map<std::string, std::size_t> firstFootnoteByMarker; ///< "※1" -> index into footnotes.
    std::map<std::wstring, std::wstring> footnotesByNumber; ///< "1" -> "※1保湿成分 ※1…".

    std::set<std::string> preparedRuleIds; ///< Conditional rules whose lookups below are filled.
    std::set<std::string> excusedRuleIds;  ///< An exception pattern of the rule occurs in the text.
    std::set<std::pair<std::string, std::wstring>> annotatedRules; ///< (rule id, marker number) satisfied by footnotes.

    std::vector<PeriodExpression> annotationPeriods; ///< Period statements inside ※ annotations.
    bool hasCompleteRecordAnnotation = false;         ///< A ※N: annotation names the full record certification.
};

} // namespace copycheck::domain::compliance
