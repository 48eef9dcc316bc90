#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "domain/compliance/KeywordMatcher.hpp"
#include "domain/compliance/RuleTables.hpp"
#include "infrastructure/compliance/JsonRuleRepository.hpp"

using namespace copycheck::domain::compliance;
using copycheck::infrastructure::compliance::JsonRuleRepository;

namespace {

std::shared_ptr<const RuleTables> LoadShippedRules() {
    const std::filesystem::path configDir(COPYCHECK_TEST_CONFIG_DIR);
    JsonRuleRepository repository(configDir / "rules", configDir / "products");
    return std::make_shared<const RuleTables>(repository.fetchRules(), repository.fetchProducts());
}

std::vector<KeywordMatch> OfTier(const std::vector<KeywordMatch>& matches, RuleTier tier) {
    std::vector<KeywordMatch> filtered;
    for (const auto& match : matches) {
        if (match.tier == tier) filtered.push_back(match);
    }
    return filtered;
}

bool HasKeyword(const std::vector<KeywordMatch>& matches, const std::string& keyword) {
    return std::any_of(matches.begin(), matches.end(),
                       [&](const KeywordMatch& match) { return match.keyword == keyword; });
}

bool HasRule(const std::vector<KeywordMatch>& matches, const std::string& ruleId) {
    return std::any_of(matches.begin(), matches.end(),
                       [&](const KeywordMatch& match) { return match.ruleId == ruleId; });
}

} // namespace

int main() {
    std::cout << "[Test] Starting KeywordMatcher Test..." << std::endl;

    const auto rules = LoadShippedRules();
    KeywordMatcher matcher(rules);

    // 1. Absolute tier
    {
        const auto matches = matcher.Match("老け見え印象対策");
        assert(matches.size() == 1);
        assert(matches[0].keyword == "老け見え");
        assert(matches[0].tier == RuleTier::Absolute);
        assert(matches[0].severity == Severity::Critical);
        assert(matches[0].reason == "完全NGキーワード「老け見え」を検出");
        assert(matches[0].position == (TextSpan{0, 4}));

        const auto positioned = matcher.Match("目元の改善");
        assert(positioned.size() == 1 && positioned[0].position == (TextSpan{3, 5}));

        // Footnotes do not excuse an absolute keyword.
        assert(HasKeyword(OfTier(matcher.Match("若返り※1 ※1保湿成分による印象"), RuleTier::Absolute), "若返り"));
        const auto footnoteLine = OfTier(matcher.Match("※1 必ず効果を保証するものではありません"), RuleTier::Absolute);
        assert(HasKeyword(footnoteLine, "必ず") && HasKeyword(footnoteLine, "保証"));
        std::cout << "[PASS] Absolute keywords." << std::endl;
    }

    // 2. Conditional keywords without a footnote
    {
        const auto conditional = OfTier(matcher.Match("ヒアルロン酸直注入で目元ケア"), RuleTier::Conditional);
        assert(conditional.size() == 2);
        assert(HasKeyword(conditional, "ヒアルロン酸"));
        assert(HasKeyword(conditional, "注入"));
        assert(!HasKeyword(conditional, "ヒアルロン") && "Shorter synonym inside a hit is shadowed.");
        for (const auto& match : conditional) {
            assert(match.reason == "条件付きNGキーワード「" + match.keyword + "」を検出（必須注釈なし）");
        }
        std::cout << "[PASS] Missing annotations flagged." << std::endl;
    }

    // 3. Conditional keywords with matching footnotes
    {
        const auto matches = matcher.Match("ヒアルロン酸※1直注入※2で目元ケア ※1保湿成分 ※2角質層まで");
        assert(matches.empty());

        // A bare ※ is checked against the text that follows it.
        assert(OfTier(matcher.Match("ヒアルロン酸※たっぷり配合 ※保湿成分"), RuleTier::Conditional).empty());
        assert(HasKeyword(matcher.Match("ヒアルロン酸※配合 ※美容成分"), "ヒアルロン酸"));

        // Footnote found elsewhere in the advertisement.
        const std::string full = "クマ※1対策に\n※1乾燥や古い角質によるくすみ、ハリが不足した暗い目の下";
        assert(matcher.Match("クマ※1対策に", full).empty());
        assert(HasKeyword(matcher.Match("クマ※1対策に"), "クマ"));
        std::cout << "[PASS] Bound footnotes satisfy the rule." << std::endl;
    }

    // 4. Exceptions
    {
        assert(OfTier(matcher.Match("ヒアルロン酸は保湿成分として知られています"), RuleTier::Conditional).empty());
        assert(matcher.Match("ヒアルロン酸配合", std::string("従来のヒアルロン酸配合化粧品とは違う")).empty());
        assert(!matcher.Match("ヒアルロン酸配合").empty());
        std::cout << "[PASS] Exceptions." << std::endl;
    }

    // 5. Only listed keywords are flagged
    {
        const auto matches = matcher.Match("刺すヒアルロン酸でクマ対策");
        assert(!HasKeyword(matches, "刺す"));
        assert(HasKeyword(matches, "クマ"));
        assert(HasKeyword(matches, "ヒアルロン酸"));
        std::cout << "[PASS] No invented keywords." << std::endl;
    }

    // 6. Footnote lines are not re-checked by the conditional and context tiers
    {
        assert(matcher.Match("※1保湿成分が角質層まで浸透").empty());
        std::cout << "[PASS] Footnote line skipped." << std::endl;
    }

    // 7. Context-dependent gating
    {
        const auto flagged = matcher.Match("週に1回貼って寝るだけで若々しい肌があなたのものに");
        assert(flagged.size() == 1);
        assert(flagged[0].tier == RuleTier::ContextDependent);
        assert(flagged[0].keyword == "若々しい");
        assert(flagged[0].severity == Severity::High);
        assert(flagged[0].reason.rfind("文脈依存NGキーワード「若々しい」を検出（", 0) == 0);

        assert(matcher.Match("ハリやツヤが出て、若々しい印象の目の下に導きます").empty());
        assert(matcher.Match("若々しい印象を叶える").empty() && "No NG pattern, no match.");
        std::cout << "[PASS] Context gating." << std::endl;
    }

    // 8. Product-specific rules
    {
        const auto cosmetic = matcher.Match("肌に浸透", std::nullopt, "HA");
        assert(cosmetic.size() == 1 && cosmetic[0].ruleId == "conditional.penetration.cosmetic");

        const auto nail = matcher.Match("肌に浸透", std::nullopt, "SH");
        assert(nail.size() == 1 && nail[0].ruleId == "conditional.penetration.nail");

        const auto any = matcher.Match("肌に浸透");
        assert(any.size() == 1 && "Identical spans from two rules are reported once.");

        assert(matcher.Match("肌に浸透", std::nullopt, "ZZ").empty());

        assert(HasRule(matcher.Match("マイクロニードルで届ける", std::nullopt, "HA"), "product.HA.マイクロニードル"));
        assert(!HasRule(matcher.Match("マイクロニードルで届ける", std::nullopt, "SH"), "product.HA.マイクロニードル"));
        assert(!HasRule(matcher.Match("マイクロニードル※1 ※1ヒアルロン酸を微細な針状に結晶化したもの",
                                      std::nullopt, "HA"),
                        "product.HA.マイクロニードル"));
        std::cout << "[PASS] Product filtering." << std::endl;
    }

    // 9. Hand-built tables: tiers are never merged, unusable rules are skipped
    {
        KeywordRule absolute;
        absolute.id = "absolute.test";
        absolute.keywords = {"保証", ""};
        absolute.tier = RuleTier::Absolute;
        absolute.severity = Severity::Critical;

        KeywordRule conditional;
        conditional.id = "conditional.test";
        conditional.keywords = {"保証"};
        conditional.tier = RuleTier::Conditional;
        conditional.requiredAnnotation = "※.{0,10}条件";

        KeywordRule contextual;
        contextual.id = "context.test";
        contextual.keywords = {"返金"};
        contextual.tier = RuleTier::ContextDependent;

        KeywordMatcher custom(std::make_shared<const RuleTables>(
            std::vector<KeywordRule>{absolute, conditional, contextual}));
        const auto matches = custom.Match("返金保証");
        assert(matches.size() == 2);
        assert(matches[0].tier == RuleTier::Absolute && matches[0].keyword == "保証");
        assert(matches[1].tier == RuleTier::Conditional && matches[1].keyword == "保証");
        assert(matches[0].position == matches[1].position);

        assert(custom.Match("返金保証※1 ※1条件あり").size() == 1);
        std::cout << "[PASS] Cross-tier matches kept separately." << std::endl;
    }

    // 10. Construction
    {
        bool threw = false;
        try {
            KeywordMatcher missing(nullptr);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
        std::cout << "[PASS] Matcher requires rule tables." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
