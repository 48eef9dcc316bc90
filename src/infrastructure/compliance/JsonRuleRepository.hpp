/**
 * @file JsonRuleRepository.hpp
 * @brief Reads rule catalogs and product configurations from JSON files.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "domain/compliance/RuleRepository.hpp"

namespace copycheck::infrastructure::compliance {

/**
 * @class JsonRuleRepository
 * @brief File-system implementation of RuleRepository.
 *
 * Layout:
 *   <rulesDir>/absolute.json, conditional.json, context_dependent.json
 *   <productsDir>/<ID>.json
 *   <recordsDir>/guinness.json (optional)
 */
class JsonRuleRepository : public domain::compliance::RuleRepository {
public:
    JsonRuleRepository(std::filesystem::path rulesDir, std::filesystem::path productsDir,
                       std::filesystem::path recordsDir = {});

    /** @throws RuleTableLoadError when a catalog file is missing, unreadable or malformed. */
    std::vector<domain::compliance::KeywordRule> fetchRules() const override;

    /**
     * @brief Every *.json under the products directory, in file name order.
     * A missing products directory yields no products.
     * @throws RuleTableLoadError when a product file is malformed.
     */
    std::vector<domain::compliance::ProductConfig> fetchProducts() const override;

    /**
     * @brief Parses one catalog document: {"tier": "...", "rules": [...]}.
     * @param source File name used in error messages and synthesised rule ids.
     */
    static std::vector<domain::compliance::KeywordRule> ParseRules(const nlohmann::json& document,
                                                                   const std::string& source);

    static domain::compliance::ProductConfig ParseProduct(const nlohmann::json& document, const std::string& source);

    /** @brief No record when the records directory or its guinness.json is absent. */
    std::optional<domain::compliance::GuinnessRecord> fetchGuinnessRecord() const override;

    static domain::compliance::GuinnessRecord ParseGuinnessRecord(const nlohmann::json& document,
                                                                  const std::string& source);

private:
    static nlohmann::json ReadDocument(const std::filesystem::path& path);

    std::filesystem::path m_rulesDir;
    std::filesystem::path m_productsDir;
    std::filesystem::path m_recordsDir;
};

} // namespace copycheck::infrastructure::compliance
