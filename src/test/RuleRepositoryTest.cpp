#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "domain/compliance/ComplianceErrors.hpp"
#include "domain/compliance/RuleTables.hpp"
#include "infrastructure/compliance/JsonRuleRepository.hpp"

using namespace copycheck::domain::compliance;
using copycheck::infrastructure::compliance::JsonRuleRepository;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

template <typename Fn>
bool ThrowsLoadError(Fn&& fn) {
    try {
        fn();
    } catch (const RuleTableLoadError& e) {
        std::cout << "  expected error: " << e.what() << std::endl;
        return true;
    }
    return false;
}

void WriteFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

const CompiledRule* FindRule(const std::vector<const CompiledRule*>& rules, const std::string& id) {
    auto it = std::find_if(rules.begin(), rules.end(), [&](const CompiledRule* rule) { return rule->rule.id == id; });
    return it == rules.end() ? nullptr : *it;
}

} // namespace

int main() {
    std::cout << "[Test] Starting RuleRepository Test..." << std::endl;

    // 1. Shipped catalog
    {
        const fs::path configDir(COPYCHECK_TEST_CONFIG_DIR);
        JsonRuleRepository repository(configDir / "rules", configDir / "products");
        const RuleTables tables(repository.fetchRules(), repository.fetchProducts());

        assert(tables.Absolute().size() == 28);
        assert(tables.Conditional().size() == 21);
        assert(tables.ContextDependent().size() == 6);
        assert((tables.ProductIds() == std::vector<std::string>{"HA", "SH"}));
        assert(tables.RuleCount() == 57 && "One derived rule per product.");
        assert(tables.FindProduct("HA") && tables.FindProduct("HA")->category == "化粧品");
        assert(tables.FindProduct("SH")->activeIngredient == std::optional<std::string>("イソプロピルメチルフェノール"));
        assert(!tables.FindProduct("ZZ"));

        const auto ha = tables.Conditional("HA");
        assert(FindRule(ha, "conditional.penetration.cosmetic"));
        assert(!FindRule(ha, "conditional.penetration.nail"));
        const CompiledRule* derived = FindRule(ha, "product.HA.マイクロニードル");
        assert(derived);
        assert(derived->rule.tier == RuleTier::Conditional);
        assert(derived->rule.category == "product-annotation");
        assert(derived->rule.requiredAnnotation == "※.{0,30}ヒアルロン酸を微細な針状に結晶化したもの");
        assert((derived->rule.productCategories == std::vector<std::string>{"HA"}));
        assert(!FindRule(ha, "product.HA.ヒアルロン酸") && "Keywords already in the catalog are not derived.");
        assert(!FindRule(ha, "product.HA.目元") && "Optional annotations are not derived.");

        assert(FindRule(tables.Conditional("SH"), "product.SH.爪の中"));
        assert(!FindRule(tables.Conditional("SH"), "product.HA.マイクロニードル"));
        assert(!FindRule(tables.Conditional(), "product.HA.マイクロニードル"));
        std::cout << "[PASS] Shipped catalog loads." << std::endl;
    }

    // 2. Catalog parsing
    {
        const json catalog = {
            {"tier", "absolute"},
            {"rules", json::array({
                {{"keywords", json::array({"若返り"})}},
                {{"id", "absolute.custom"}, {"keyword", "蘇る"}, {"keywords", json::array({"よみがえる"})},
                 {"severity", "medium"}, {"referenceHint", "knowledge/common/01.txt"}},
            })},
        };
        const auto rules = JsonRuleRepository::ParseRules(catalog, "absolute.json");
        assert(rules.size() == 2);
        assert(rules[0].id == "absolute.1" && "Missing ids are synthesised.");
        assert(rules[0].severity == Severity::High);
        assert(rules[0].tier == RuleTier::Absolute);
        assert(rules[1].id == "absolute.custom");
        assert((rules[1].keywords == std::vector<std::string>{"蘇る", "よみがえる"}));
        assert(rules[1].severity == Severity::Medium);
        assert(rules[1].referenceHint == std::optional<std::string>("knowledge/common/01.txt"));
        assert(!rules[1].acceptableRewrite);
        std::cout << "[PASS] Catalog parsing." << std::endl;
    }

    // 3. Malformed catalogs
    {
        auto parse = [](const json& rule, const std::string& tier = "absolute") {
            return [rule, tier] {
                JsonRuleRepository::ParseRules(json{{"tier", tier}, {"rules", json::array({rule})}}, "test.json");
            };
        };
        assert(ThrowsLoadError(parse(json{{"category", "x"}})));
        assert(ThrowsLoadError(parse(json{{"keywords", json::array({"ok", ""})}})));
        assert(ThrowsLoadError(parse(json{{"keywords", "not-an-array"}})));
        assert(ThrowsLoadError(parse(json{{"keywords", json::array({"x"})}, {"severity", "extreme"}})));
        assert(ThrowsLoadError(parse(json{{"keywords", json::array({"x"})}, {"tier", "forbidden"}})));
        assert(ThrowsLoadError(parse(json{{"keywords", json::array({"若々しい"})}}, "context-dependent")));
        const json exceptionWithoutPattern = {{"condition", "c"}};
        assert(ThrowsLoadError(parse(json{{"keywords", json::array({"x"})},
                                          {"exceptions", json::array({exceptionWithoutPattern})}},
                                     "conditional")));
        assert(ThrowsLoadError([] { JsonRuleRepository::ParseRules(json{{"rules", json::array()}}, "t.json"); }));
        assert(ThrowsLoadError([] { JsonRuleRepository::ParseRules(json{{"tier", "absolute"}}, "t.json"); }));
        assert(ThrowsLoadError([] { JsonRuleRepository::ParseRules(json::array(), "t.json"); }));
        std::cout << "[PASS] Malformed catalogs rejected." << std::endl;
    }

    // 4. Pattern compilation and ids
    {
        KeywordRule broken;
        broken.id = "conditional.broken";
        broken.keywords = {"浸透"};
        broken.tier = RuleTier::Conditional;
        broken.requiredAnnotation = "※(角質層";
        assert(ThrowsLoadError([&] { RuleTables tables({broken}); }));

        KeywordRule first;
        first.id = "absolute.same";
        first.keywords = {"治す"};
        KeywordRule second = first;
        second.keywords = {"治る"};
        assert(ThrowsLoadError([&] { RuleTables tables({first, second}); }));

        ProductConfig product;
        product.id = "HA";
        assert(ThrowsLoadError([&] { RuleTables tables({first}, {product, product}); }));

        assert(RuleTables::EscapeRegex("NO.1(a)") == "NO\\.1\\(a\\)");
        assert(RuleTables::EscapeRegex("背爪表面の角質層") == "背爪表面の角質層");
        std::cout << "[PASS] Compilation errors are load errors." << std::endl;
    }

    // 5. Product files
    {
        const json good = {
            {"id", "HA"},
            {"name", "ヒアロディープパッチ"},
            {"category", "化粧品"},
            {"approvedEffects", "肌にうるおいを与える。"},
            {"annotationRules", {
                {"浸透", {{"required", true}, {"template", "※角質層まで"}}},
                {"目元", {{"template", "目の周りの皮膚"}, {"severity", "low"}}},
            }},
        };
        const ProductConfig product = JsonRuleRepository::ParseProduct(good, "HA.json");
        assert(product.annotationRules.size() == 2);
        assert(product.annotationRules.at("浸透").required);
        assert(product.annotationRules.at("浸透").severity == Severity::High);
        assert(!product.annotationRules.at("目元").required);
        assert(product.annotationRules.at("目元").severity == Severity::Low);
        assert((product.RequiredKeywords() == std::vector<std::string>{"浸透"}));
        assert(!product.activeIngredient);

        json noName = good;
        noName.erase("name");
        assert(ThrowsLoadError([&] { JsonRuleRepository::ParseProduct(noName, "HA.json"); }));

        json badRequired = good;
        badRequired["annotationRules"]["浸透"]["required"] = "yes";
        assert(ThrowsLoadError([&] { JsonRuleRepository::ParseProduct(badRequired, "HA.json"); }));

        json noRules = good;
        noRules.erase("annotationRules");
        assert(ThrowsLoadError([&] { JsonRuleRepository::ParseProduct(noRules, "HA.json"); }));
        std::cout << "[PASS] Product parsing." << std::endl;
    }

    // 6. Files on disk
    {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        const fs::path root = fs::temp_directory_path() / ("copycheck_rule_repo_" + std::to_string(stamp));
        fs::create_directories(root / "rules");

        JsonRuleRepository repository(root / "rules", root / "products");
        assert(repository.fetchProducts().empty() && "Missing products directory is not an error.");
        assert(ThrowsLoadError([&] { repository.fetchRules(); }));

        WriteFile(root / "rules" / "absolute.json", R"({"tier": "absolute", "rules": [{"keywords": ["治す"]}]})");
        WriteFile(root / "rules" / "conditional.json", R"({"tier": "conditional", "rules": [)");
        WriteFile(root / "rules" / "context_dependent.json", R"({"tier": "context-dependent", "rules": []})");
        assert(ThrowsLoadError([&] { repository.fetchRules(); }));

        WriteFile(root / "rules" / "conditional.json", R"({"tier": "conditional", "rules": []})");
        assert(repository.fetchRules().size() == 1);

        fs::create_directories(root / "products");
        WriteFile(root / "products" / "XY.json",
                  R"({"id": "XY", "name": "n", "category": "化粧品", "approvedEffects": "e", "annotationRules": {}})");
        WriteFile(root / "products" / "notes.txt", "ignored");
        const auto products = repository.fetchProducts();
        assert(products.size() == 1 && products[0].id == "XY");

        fs::remove_all(root);
        std::cout << "[PASS] Catalog files on disk." << std::endl;
    }

    // 7. Record definitions
    {
        const json good = {
            {"officialTitle", "美容用マイクロニードルスキンパッチにおける最大のブランド"},
            {"certifiedProduct", "ディープパッチシリーズ"},
            {"certificationPeriod", {{"startYear", 2020}, {"endYear", 2024}}},
            {"surveyOrganization", "TFCO株式会社"},
            {"triggerKeywords", {"ギネス", "売上世界一"}},
        };
        const GuinnessRecord record = JsonRuleRepository::ParseGuinnessRecord(good, "guinness.json");
        assert(record.period.description == "2020年～2024年");
        assert(record.period.ConsecutiveYears() == 5);
        assert(!record.period.startMonth && !record.period.endMonth);
        assert(record.trademark == "ギネス世界記録™");
        assert(record.titleAliases.empty() && record.incorrectTitles.empty());
        assert(!record.referenceHint);

        json noTitle = good;
        noTitle.erase("officialTitle");
        assert(ThrowsLoadError([&] { JsonRuleRepository::ParseGuinnessRecord(noTitle, "guinness.json"); }));

        json reversed = good;
        reversed["certificationPeriod"]["startYear"] = 2025;
        assert(ThrowsLoadError([&] { JsonRuleRepository::ParseGuinnessRecord(reversed, "guinness.json"); }));

        json badMonth = good;
        badMonth["certificationPeriod"]["endMonth"] = 13;
        assert(ThrowsLoadError([&] { JsonRuleRepository::ParseGuinnessRecord(badMonth, "guinness.json"); }));

        json textYear = good;
        textYear["certificationPeriod"]["startYear"] = "2020";
        assert(ThrowsLoadError([&] { JsonRuleRepository::ParseGuinnessRecord(textYear, "guinness.json"); }));

        json noTriggers = good;
        noTriggers["triggerKeywords"] = json::array();
        assert(ThrowsLoadError([&] { JsonRuleRepository::ParseGuinnessRecord(noTriggers, "guinness.json"); }));

        const fs::path missing = fs::temp_directory_path() / "copycheck_no_such_records";
        JsonRuleRepository withoutRecords("rules", "products", missing);
        assert(!withoutRecords.fetchGuinnessRecord() && "A missing records directory is not an error.");
        std::cout << "[PASS] Record parsing." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
