/**
 * @file ResultSummary.hpp
 * @brief Human-readable one-line summary and detail list of a ValidationResult.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/compliance/ClaimViolation.hpp"
#include "domain/compliance/ValidationResult.hpp"

namespace copycheck::application::compliance {

/** @brief "NGキーワード検出: 完全NG: 1件, 条件付きNG: 2件 (合計3件)", listing only non-zero tiers. */
std::string SummaryText(const domain::compliance::ValidationResult& result);

/** @brief One "- 【tier】「keyword」: reason" line per match, or 検出なし. */
std::string DetailedList(const domain::compliance::ValidationResult& result);

/** @brief One "- 【type/severity】description" line per claim violation, or 検出なし. */
std::string ClaimList(const std::vector<domain::compliance::ClaimViolation>& violations);

} // namespace copycheck::application::compliance
