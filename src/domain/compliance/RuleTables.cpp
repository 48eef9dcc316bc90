/**
 * @file RuleTables.cpp
 * @brief Implementation of RuleTables.
 */

#include "domain/compliance/RuleTables.hpp"

#include <set>

#include "domain/compliance/ComplianceErrors.hpp"
#include "domain/text/Utf8Text.hpp"

namespace copycheck::domain::compliance {

namespace {

constexpr const char* kAnnotationMark = "※";

// "※1：保湿成分" -> "保湿成分"
std::string StripAnnotationMark(const std::string& templateText) {
    const std::wstring wide = text::ToWide(templateText);
    std::size_t pos = 0;
    if (pos < wide.size() && wide[pos] == L'※') ++pos;
    while (pos < wide.size() &&
           (text::IsSpace(wide[pos]) || (wide[pos] >= L'0' && wide[pos] <= L'9') ||
            wide[pos] == L':' || wide[pos] == L'：')) {
        ++pos;
    }
    return text::ToUtf8(wide, pos, wide.size());
}

} // namespace

RuleTables::RuleTables(std::vector<KeywordRule> rules, std::vector<ProductConfig> products,
                       std::optional<GuinnessRecord> record)
    : m_record(std::move(record)) {
    std::set<std::string> ids;
    for (auto& rule : rules) {
        if (!rule.id.empty() && !ids.insert(rule.id).second) {
            throw RuleTableLoadError("Duplicate rule id: " + rule.id);
        }
        switch (rule.tier) {
            case RuleTier::Absolute:
                m_absolute.push_back(Compile(std::move(rule)));
                break;
            case RuleTier::Conditional:
                m_conditional.push_back(Compile(std::move(rule)));
                break;
            case RuleTier::ContextDependent:
                m_contextDependent.push_back(Compile(std::move(rule)));
                break;
        }
    }

    std::set<std::string> conditionalKeywords;
    for (const auto& compiled : m_conditional) {
        for (const auto& keyword : compiled.rule.keywords) conditionalKeywords.insert(keyword);
    }

    for (auto& product : products) {
        if (product.id.empty()) {
            throw RuleTableLoadError("Product configuration without id");
        }
        if (m_products.count(product.id)) {
            throw RuleTableLoadError("Duplicate product configuration: " + product.id);
        }
        auto& derived = m_productRules[product.id];
        for (const auto& [keyword, annotation] : product.annotationRules) {
            if (!annotation.required || conditionalKeywords.count(keyword)) continue;
            derived.push_back(Compile(RuleFromAnnotation(product, keyword, annotation)));
        }
        m_products.emplace(product.id, std::move(product));
    }
}

std::vector<const CompiledRule*> RuleTables::Conditional(const std::string& productId) const {
    std::vector<const CompiledRule*> rules;
    rules.reserve(m_conditional.size());
    for (const auto& compiled : m_conditional) {
        if (compiled.rule.AppliesToProduct(productId)) rules.push_back(&compiled);
    }
    auto it = m_productRules.find(productId);
    if (it != m_productRules.end()) {
        for (const auto& compiled : it->second) rules.push_back(&compiled);
    }
    return rules;
}

const ProductConfig* RuleTables::FindProduct(const std::string& productId) const {
    auto it = m_products.find(productId);
    return it == m_products.end() ? nullptr : &it->second;
}

std::vector<std::string> RuleTables::ProductIds() const {
    std::vector<std::string> ids;
    for (const auto& [id, product] : m_products) ids.push_back(id);
    return ids;
}

std::size_t RuleTables::RuleCount() const {
    std::size_t count = m_absolute.size() + m_conditional.size() + m_contextDependent.size();
    for (const auto& [id, derived] : m_productRules) count += derived.size();
    return count;
}

CompiledPattern RuleTables::CompilePattern(const std::string& source, const std::string& ruleId) {
    try {
        return CompiledPattern{source, std::wregex(text::ToWide(source), std::regex_constants::ECMAScript)};
    } catch (const std::regex_error& e) {
        throw RuleTableLoadError("Rule '" + ruleId + "' has an invalid pattern '" + source + "': " + e.what());
    }
}

std::string RuleTables::EscapeRegex(const std::string& literal) {
    static const std::string kSpecial = "\\^$.|?*+()[]{}";
    std::string escaped;
    escaped.reserve(literal.size() * 2);
    for (char c : literal) {
        if (kSpecial.find(c) != std::string::npos) escaped.push_back('\\');
        escaped.push_back(c);
    }
    return escaped;
}

CompiledRule RuleTables::Compile(KeywordRule rule) const {
    CompiledRule compiled;
    for (const auto& keyword : rule.keywords) {
        compiled.keywords.push_back(text::ToWide(keyword));
    }
    if (!rule.requiredAnnotation.empty()) {
        compiled.requiredAnnotation = CompilePattern(rule.requiredAnnotation, rule.id);
    }
    for (const auto& exception : rule.exceptions) {
        compiled.exceptions.push_back(CompilePattern(exception.allowedPattern, rule.id));
    }
    for (const auto& ng : rule.ngPatterns) {
        compiled.ngPatterns.push_back({CompilePattern(ng.pattern, rule.id), ng.reason, ng.severity});
    }
    for (const auto& ok : rule.okPatterns) {
        compiled.okPatterns.push_back(CompilePattern(ok, rule.id));
    }
    compiled.rule = std::move(rule);
    return compiled;
}

KeywordRule RuleTables::RuleFromAnnotation(const ProductConfig& product, const std::string& keyword,
                                           const AnnotationRule& annotation) const {
    const std::string expected = StripAnnotationMark(annotation.templateText);

    KeywordRule rule;
    rule.id = "product." + product.id + "." + keyword;
    rule.keywords = {keyword};
    rule.tier = RuleTier::Conditional;
    rule.category = "product-annotation";
    rule.severity = annotation.severity;
    rule.regulatoryClass = "薬機法違反";
    rule.rationale = "「" + keyword + "」には注釈が必要です。";
    rule.referenceHint = annotation.referenceKnowledge
        ? annotation.referenceKnowledge
        : std::optional<std::string>("商品固有ルール（" + product.id + "）");
    rule.acceptableRewrite = keyword + "※1 ※1" + expected;
    // Footnotes are matched as "※N<text>", so allow the number and separators before the text.
    rule.requiredAnnotation = expected.empty() ? std::string(kAnnotationMark)
                                               : std::string(kAnnotationMark) + ".{0,30}" + EscapeRegex(expected);
    rule.productCategories = {product.id};
    return rule;
}

} // namespace copycheck::domain::compliance
