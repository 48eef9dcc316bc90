/**
 * @file ComplianceJson.hpp
 * @brief JSON mapping of segments, annotation analyses and validation results.
 */

#pragma once

#include <vector>

#include <nlohmann/json.hpp>

#include "application/compliance/ComplianceService.hpp"
#include "domain/compliance/Annotation.hpp"
#include "domain/compliance/ClaimViolation.hpp"
#include "domain/compliance/KeywordMatch.hpp"
#include "domain/compliance/Segment.hpp"
#include "domain/compliance/ValidationResult.hpp"

namespace copycheck::infrastructure::compliance {

nlohmann::json ToJson(const domain::compliance::Segment& segment);
nlohmann::json ToJson(const std::vector<domain::compliance::Segment>& segments);
nlohmann::json ToJson(const domain::compliance::KeywordMatch& match);
nlohmann::json ToJson(const domain::compliance::AnnotationAnalysis& analysis);
nlohmann::json ToJson(const domain::compliance::ValidationResult& result);
nlohmann::json ToJson(const domain::compliance::ClaimViolation& violation);
nlohmann::json ToJson(const std::vector<domain::compliance::ClaimViolation>& violations);

/** @brief Report with per-segment results and the document-level summary. */
nlohmann::json ToJson(const application::compliance::DocumentReport& report);

} // namespace copycheck::infrastructure::compliance
