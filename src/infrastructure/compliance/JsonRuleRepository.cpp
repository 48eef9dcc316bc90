/**
 * @file JsonRuleRepository.cpp
 * @brief Implementation of JsonRuleRepository.
 */

#include "infrastructure/compliance/JsonRuleRepository.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <optional>

#include "domain/compliance/ComplianceErrors.hpp"

namespace copycheck::infrastructure::compliance {

using json = nlohmann::json;
using namespace domain::compliance;
namespace fs = std::filesystem;

namespace {

const char* const kCatalogFiles[] = {"absolute.json", "conditional.json", "context_dependent.json"};

[[noreturn]] void Fail(const std::string& source, const std::string& message) {
    throw RuleTableLoadError(source + ": " + message);
}

std::optional<std::string> OptionalString(const json& j, const char* key, const std::string& source) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    if (!j[key].is_string()) Fail(source, std::string("field '") + key + "' must be a string");
    return j[key].get<std::string>();
}

std::string RequiredString(const json& j, const char* key, const std::string& source) {
    auto value = OptionalString(j, key, source);
    if (!value || value->empty()) Fail(source, std::string("missing required field '") + key + "'");
    return *value;
}

std::vector<std::string> StringArray(const json& j, const char* key, const std::string& source) {
    std::vector<std::string> values;
    if (!j.contains(key) || j[key].is_null()) return values;
    if (!j[key].is_array()) Fail(source, std::string("field '") + key + "' must be an array of strings");
    for (const auto& item : j[key]) {
        if (!item.is_string()) Fail(source, std::string("field '") + key + "' must be an array of strings");
        values.push_back(item.get<std::string>());
    }
    return values;
}

Severity ParseSeverity(const json& j, const std::string& source) {
    const auto text = OptionalString(j, "severity", source);
    if (!text) return Severity::High;
    const auto severity = SeverityFromString(*text);
    if (!severity) Fail(source, "unknown severity '" + *text + "'");
    return *severity;
}

std::optional<int> OptionalInt(const json& j, const char* key, const std::string& source) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    if (!j[key].is_number_integer()) Fail(source, std::string("field '") + key + "' must be an integer");
    return j[key].get<int>();
}

int RequiredInt(const json& j, const char* key, const std::string& source) {
    auto value = OptionalInt(j, key, source);
    if (!value) Fail(source, std::string("missing required field '") + key + "'");
    return *value;
}

KeywordRule ParseRule(const json& j, RuleTier documentTier, const std::string& source, const std::string& fallbackId) {
    if (!j.is_object()) Fail(source, "rule entries must be objects");

    KeywordRule rule;
    rule.id = OptionalString(j, "id", source).value_or(fallbackId);
    const std::string where = source + " (" + rule.id + ")";

    rule.keywords = StringArray(j, "keywords", where);
    if (auto single = OptionalString(j, "keyword", where)) rule.keywords.insert(rule.keywords.begin(), *single);
    if (rule.keywords.empty()) Fail(where, "rule has no keywords");
    if (std::any_of(rule.keywords.begin(), rule.keywords.end(), [](const std::string& k) { return k.empty(); })) {
        Fail(where, "empty keyword");
    }

    rule.tier = documentTier;
    if (auto tier = OptionalString(j, "tier", where)) {
        auto parsed = RuleTierFromString(*tier);
        if (!parsed) Fail(where, "unknown tier '" + *tier + "'");
        rule.tier = *parsed;
    }

    rule.category = OptionalString(j, "category", where).value_or("");
    rule.severity = ParseSeverity(j, where);
    rule.regulatoryClass = OptionalString(j, "regulatoryClass", where).value_or("");
    rule.rationale = OptionalString(j, "rationale", where).value_or("");
    rule.referenceHint = OptionalString(j, "referenceHint", where);
    rule.acceptableRewrite = OptionalString(j, "acceptableRewrite", where);

    rule.requiredAnnotation = OptionalString(j, "requiredAnnotation", where).value_or("");
    rule.productCategories = StringArray(j, "productCategories", where);
    if (j.contains("exceptions")) {
        if (!j["exceptions"].is_array()) Fail(where, "field 'exceptions' must be an array");
        for (const auto& e : j["exceptions"]) {
            if (!e.is_object()) Fail(where, "exception entries must be objects");
            rule.exceptions.push_back({OptionalString(e, "condition", where).value_or(""),
                                       RequiredString(e, "allowedPattern", where)});
        }
    }

    if (j.contains("ngPatterns")) {
        if (!j["ngPatterns"].is_array()) Fail(where, "field 'ngPatterns' must be an array");
        for (const auto& ng : j["ngPatterns"]) {
            if (!ng.is_object()) Fail(where, "ngPatterns entries must be objects");
            rule.ngPatterns.push_back({RequiredString(ng, "pattern", where),
                                       OptionalString(ng, "reason", where).value_or(""),
                                       ParseSeverity(ng, where)});
        }
    }
    rule.okPatterns = StringArray(j, "okPatterns", where);

    if (rule.tier == RuleTier::ContextDependent && rule.ngPatterns.empty()) {
        Fail(where, "context-dependent rule without ngPatterns");
    }
    return rule;
}

} // namespace

JsonRuleRepository::JsonRuleRepository(fs::path rulesDir, fs::path productsDir, fs::path recordsDir)
    : m_rulesDir(std::move(rulesDir)), m_productsDir(std::move(productsDir)), m_recordsDir(std::move(recordsDir)) {}

std::vector<KeywordRule> JsonRuleRepository::fetchRules() const {
    std::vector<KeywordRule> rules;
    for (const char* name : kCatalogFiles) {
        const fs::path path = m_rulesDir / name;
        auto parsed = ParseRules(ReadDocument(path), path.filename().string());
        std::cerr << "[RuleRepository] Loaded " << parsed.size() << " rules from " << path.string() << std::endl;
        rules.insert(rules.end(), std::make_move_iterator(parsed.begin()), std::make_move_iterator(parsed.end()));
    }
    return rules;
}

std::vector<ProductConfig> JsonRuleRepository::fetchProducts() const {
    std::vector<ProductConfig> products;
    std::error_code ec;
    if (!fs::is_directory(m_productsDir, ec)) {
        std::cerr << "[RuleRepository] No products directory at " << m_productsDir.string() << std::endl;
        return products;
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(m_productsDir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") files.push_back(entry.path());
    }
    std::sort(files.begin(), files.end());

    for (const auto& path : files) {
        ProductConfig product = ParseProduct(ReadDocument(path), path.filename().string());
        if (product.id != path.stem().string()) {
            std::cerr << "[RuleRepository] Warning: " << path.filename().string() << " declares product id "
                      << product.id << std::endl;
        }
        std::cerr << "[RuleRepository] Loaded product " << product.id << ": " << product.name << std::endl;
        products.push_back(std::move(product));
    }
    return products;
}

std::vector<KeywordRule> JsonRuleRepository::ParseRules(const json& document, const std::string& source) {
    if (!document.is_object()) Fail(source, "catalog must be a JSON object");

    const std::string tierName = RequiredString(document, "tier", source);
    const auto tier = RuleTierFromString(tierName);
    if (!tier) Fail(source, "unknown tier '" + tierName + "'");

    if (!document.contains("rules") || !document["rules"].is_array()) {
        Fail(source, "missing 'rules' array");
    }

    std::vector<KeywordRule> rules;
    std::size_t index = 0;
    for (const auto& entry : document["rules"]) {
        ++index;
        rules.push_back(ParseRule(entry, *tier, source, RuleTierToString(*tier) + "." + std::to_string(index)));
    }
    return rules;
}

ProductConfig JsonRuleRepository::ParseProduct(const json& document, const std::string& source) {
    if (!document.is_object()) Fail(source, "product configuration must be a JSON object");

    ProductConfig product;
    product.id = RequiredString(document, "id", source);
    product.name = RequiredString(document, "name", source);
    product.category = RequiredString(document, "category", source);
    product.approvedEffects = RequiredString(document, "approvedEffects", source);
    product.activeIngredient = OptionalString(document, "activeIngredient", source);

    if (!document.contains("annotationRules") || !document["annotationRules"].is_object()) {
        Fail(source, "missing 'annotationRules' object");
    }

    for (const auto& [keyword, rule] : document["annotationRules"].items()) {
        const std::string where = source + " (" + keyword + ")";
        if (!rule.is_object()) Fail(where, "annotation rule must be an object");

        AnnotationRule annotation;
        if (rule.contains("required")) {
            if (!rule["required"].is_boolean()) Fail(where, "field 'required' must be a boolean");
            annotation.required = rule["required"].get<bool>();
        }
        annotation.templateText = RequiredString(rule, "template", where);
        annotation.severity = ParseSeverity(rule, where);
        annotation.referenceKnowledge = OptionalString(rule, "referenceKnowledge", where);

        if (annotation.templateText.rfind("※", 0) != 0) {
            std::cerr << "[RuleRepository] Warning: annotation template for " << where
                      << " does not start with ※: " << annotation.templateText << std::endl;
        }
        product.annotationRules.emplace(keyword, std::move(annotation));
    }
    return product;
}

std::optional<GuinnessRecord> JsonRuleRepository::fetchGuinnessRecord() const {
    const fs::path path = m_recordsDir / "guinness.json";
    std::error_code ec;
    if (m_recordsDir.empty() || !fs::is_regular_file(path, ec)) {
        std::cerr << "[RuleRepository] No record definition at " << path.string()
                  << "; record claims are not checked" << std::endl;
        return std::nullopt;
    }

    GuinnessRecord record = ParseGuinnessRecord(ReadDocument(path), path.filename().string());
    std::cerr << "[RuleRepository] Loaded record " << record.officialTitle << " (" << record.period.description << ")"
              << std::endl;
    return record;
}

GuinnessRecord JsonRuleRepository::ParseGuinnessRecord(const json& document, const std::string& source) {
    if (!document.is_object()) Fail(source, "record must be a JSON object");

    GuinnessRecord record;
    record.officialTitle = RequiredString(document, "officialTitle", source);
    record.certifiedProduct = RequiredString(document, "certifiedProduct", source);
    record.surveyOrganization = RequiredString(document, "surveyOrganization", source);
    record.trademark = OptionalString(document, "trademark", source).value_or("ギネス世界記録™");
    record.guidelines = OptionalString(document, "guidelines", source).value_or("");
    record.referenceHint = OptionalString(document, "referenceHint", source);

    if (!document.contains("certificationPeriod") || !document["certificationPeriod"].is_object()) {
        Fail(source, "missing 'certificationPeriod' object");
    }
    const json& period = document["certificationPeriod"];
    record.period.startYear = RequiredInt(period, "startYear", source);
    record.period.endYear = RequiredInt(period, "endYear", source);
    record.period.startMonth = OptionalInt(period, "startMonth", source);
    record.period.endMonth = OptionalInt(period, "endMonth", source);
    if (record.period.startYear > record.period.endYear) Fail(source, "certificationPeriod ends before it starts");
    for (const auto& month : {record.period.startMonth, record.period.endMonth}) {
        if (month && (*month < 1 || *month > 12)) Fail(source, "certificationPeriod month out of range");
    }
    record.period.description =
        OptionalString(period, "description", source)
            .value_or(std::to_string(record.period.startYear) + "年～" + std::to_string(record.period.endYear) + "年");

    record.triggerKeywords = StringArray(document, "triggerKeywords", source);
    if (record.triggerKeywords.empty()) Fail(source, "record has no triggerKeywords");
    record.titleAliases = StringArray(document, "titleAliases", source);
    record.incorrectTitles = StringArray(document, "incorrectTitles", source);
    return record;
}

json JsonRuleRepository::ReadDocument(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw RuleTableLoadError("Cannot open rule file " + path.string());
    }
    try {
        json document;
        in >> document;
        return document;
    } catch (const json::exception& e) {
        throw RuleTableLoadError("Invalid JSON in " + path.string() + ": " + e.what());
    }
}

} // namespace copycheck::infrastructure::compliance
