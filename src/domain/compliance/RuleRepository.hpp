/**
 * @file RuleRepository.hpp
 * @brief Interface for loading rule catalogs and product configurations.
 */

#pragma once

#include <optional>
#include <vector>

#include "domain/compliance/GuinnessRecord.hpp"
#include "domain/compliance/KeywordRule.hpp"
#include "domain/compliance/ProductConfig.hpp"

namespace copycheck::domain::compliance {

/**
 * @class RuleRepository
 * @brief Abstract source of rule definitions, read once at startup.
 */
class RuleRepository {
public:
    virtual ~RuleRepository() = default;

    /**
     * @brief Every keyword rule of every tier.
     * @throws RuleTableLoadError when a definition is missing or malformed.
     */
    virtual std::vector<KeywordRule> fetchRules() const = 0;

    /**
     * @brief All known product configurations.
     * @throws RuleTableLoadError when a configuration is malformed.
     */
    virtual std::vector<ProductConfig> fetchProducts() const = 0;

    /**
     * @brief Certified record that record claims are checked against, if one is configured.
     * @throws RuleTableLoadError when the record definition is malformed.
     */
    virtual std::optional<GuinnessRecord> fetchGuinnessRecord() const = 0;
};

} // namespace copycheck::domain::compliance
