#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "application/compliance/ComplianceService.hpp"
#include "application/compliance/ResultSummary.hpp"
#include "domain/compliance/ComplianceErrors.hpp"
#include "infrastructure/compliance/ComplianceJson.hpp"
#include "infrastructure/compliance/JsonRuleRepository.hpp"

using namespace copycheck::application::compliance;
using namespace copycheck::domain::compliance;
using copycheck::infrastructure::compliance::JsonRuleRepository;
using copycheck::infrastructure::compliance::ToJson;

namespace {

std::shared_ptr<const RuleTables> LoadShippedRules() {
    const std::filesystem::path configDir(COPYCHECK_TEST_CONFIG_DIR);
    JsonRuleRepository repository(configDir / "rules", configDir / "products", configDir / "records");
    return std::make_shared<const RuleTables>(repository.fetchRules(), repository.fetchProducts(),
                                              repository.fetchGuinnessRecord());
}

const std::string kAdvertisement =
    "【目元のクマ※1対策に】\n"
    "ヒアルロン酸※2たっぷり配合で、角質層まで浸透※3。\n"
    "週に1回貼って寝るだけで若々しい肌があなたのものに\n"
    "※1乾燥や古い角質によるくすみ、ハリが不足した暗い目の下\n"
    "※2保湿成分\n"
    "※3角質層まで";

const std::string kRecordClaim =
    "6年連続売上世界一※1\n"
    "※1：TFCO株式会社のグローバル調査、美容用マイクロニードルスキンパッチにおける最大のブランド、"
    "2019年3月～2025年2月";

} // namespace

int main() {
    std::cout << "[Test] Starting ComplianceService Test..." << std::endl;
    ComplianceService service(LoadShippedRules());

    // 1. Whole advertisement
    {
        const DocumentReport report = service.Evaluate(kAdvertisement, "HA");
        assert(report.productId == "HA");
        assert(report.segments.size() == 6);

        std::string joined;
        for (const auto& evaluation : report.segments) joined += evaluation.segment.text;
        assert(joined == kAdvertisement);

        assert(!report.segments[0].result.hasViolations && "クマ is bound to its footnote.");
        assert(report.segments[0].annotations.bindings.size() == 1);
        assert(report.segments[0].annotations.bindings[0].scope == AnnotationScope::FullText);
        assert(!report.segments[1].result.hasViolations);
        assert(report.segments[2].result.hasViolations);
        assert(report.segments[3].segment.type == SegmentType::Disclaimer);

        assert(report.overall.summary.total == 1);
        assert(report.overall.summary.byTier.contextDependent == 1);
        assert((report.overall.uniqueFlaggedKeywords == std::vector<std::string>{"若々しい"}));
        assert(SummaryText(report.overall) == "NGキーワード検出: 文脈依存NG: 1件 (合計1件)");
        assert(service.Evaluate(kAdvertisement, "HA") == report && "Evaluation is repeatable.");
        std::cout << "[PASS] Document evaluation." << std::endl;
    }

    // 2. Single segment validation
    {
        assert(!service.ValidateSegment("ヒアルロン酸※1直注入※2で目元ケア ※1保湿成分 ※2角質層まで").hasViolations);

        const ValidationResult flagged = service.ValidateSegment("ヒアルロン酸直注入で目元ケア");
        assert(flagged.summary.byTier.conditional == 2);

        const ValidationResult absolute = service.ValidateSegment("老け見え印象対策");
        assert(DetailedList(absolute) == "- 【absolute】「老け見え」: 完全NGキーワード「老け見え」を検出");
        assert(SummaryText(absolute) == "NGキーワード検出: 完全NG: 1件 (合計1件)");

        const ValidationResult mixed = service.ValidateSegment("ヒアルロン酸直注入で若返り");
        assert(SummaryText(mixed) == "NGキーワード検出: 完全NG: 1件, 条件付きNG: 2件 (合計3件)");

        const ValidationResult clean = service.ValidateSegment("ハリやツヤが出て、若々しい印象の目の下に導きます");
        assert(SummaryText(clean) == "明示的なNGキーワードは検出されませんでした");
        assert(DetailedList(clean) == "検出なし");

        // A valid binding clears the conditional keyword it names.
        assert(service.ValidateSegment("クマ※1対策 ※1個人の感想です").summary.byTier.conditional == 0);
        std::cout << "[PASS] Segment validation and summaries." << std::endl;
    }

    // 3. Products
    {
        assert(service.Evaluate("肌に浸透", "HA").overall.summary.total == 1);
        assert(service.Evaluate("肌に浸透").overall.summary.total == 1);
        assert(service.Evaluate("肌に浸透", "ZZ").overall.summary.total == 0 &&
               "Unknown products only get unrestricted rules.");

        assert(service.SegmentText("マイクロニードル", "HA")[0].type == SegmentType::Claim);
        assert(service.SegmentText("マイクロニードル")[0].type == SegmentType::Unknown);
        std::cout << "[PASS] Product selection." << std::endl;
    }

    // 4. Input limits
    {
        bool threw = false;
        try {
            service.Evaluate("");
        } catch (const InvalidInputError&) {
            threw = true;
        }
        assert(threw);

        EngineSettings settings;
        settings.maxInputLength = 10;
        ComplianceService limited(LoadShippedRules(), settings);
        threw = false;
        try {
            limited.Evaluate("あいうえおかきくけこさ");
        } catch (const InvalidInputError&) {
            threw = true;
        }
        assert(threw);
        assert(limited.Evaluate("あいうえおかきくけこ").segments.size() == 1);
        std::cout << "[PASS] Invalid input rejected." << std::endl;
    }

    // 5. JSON report
    {
        const auto j = ToJson(service.Evaluate(kAdvertisement, "HA"));
        assert(j["productId"] == "HA");
        assert(j["segments"].size() == 6);
        assert(j["segments"][0]["type"] == "claim");
        assert(j["segments"][0]["annotations"]["bindings"][0]["scope"] == "fullText");
        assert(j["overall"]["summary"]["byTier"]["contextDependent"] == 1);
        assert(j["overall"]["matches"][0]["tier"] == "context-dependent");
        assert(j["overall"]["matches"][0]["referenceHint"].is_null() ||
               j["overall"]["matches"][0]["referenceHint"].is_string());
        assert(j["overall"]["summaryText"] == "NGキーワード検出: 文脈依存NG: 1件 (合計1件)");
        assert(ToJson(service.Evaluate("目元"))["productId"].is_null());
        std::cout << "[PASS] JSON report." << std::endl;
    }

    // 6. Claim checks
    {
        const DocumentReport report = service.Evaluate(kRecordClaim, "HA");
        assert(report.segments.size() == 2);
        assert(report.HasViolations());
        assert(!report.claimViolations.empty());
        assert(report.claimViolations[0].validator == "guinnessRecord");
        assert(report.claimViolations[0].type == ClaimViolationType::PeriodMismatch);
        assert(!report.segments[0].claimViolations.empty());
        assert(report.segments[1].claimViolations.empty() && "The footnote line is evidence, not a claim.");
        assert(ClaimList(report.claimViolations).find("【periodMismatch/high】") != std::string::npos);

        const auto j = ToJson(report);
        assert(j["claimViolations"][0]["type"] == "periodMismatch");
        assert(j["claimViolations"][0]["validator"] == "guinnessRecord");
        assert(j["hasViolations"] == true);
        assert(j["segments"][1]["claimViolations"].empty());

        const auto period = service.ValidateClaims("6年連続 ※1：2020年～2024年");
        assert(period.size() == 1);
        assert(period[0].validator == "period");
        assert(period[0].expected == "5年連続");

        const DocumentReport clean = service.Evaluate(kAdvertisement, "HA");
        assert(clean.claimViolations.empty());
        assert(ClaimList(clean.claimViolations) == "検出なし");
        assert(ToJson(clean)["hasViolations"] == true && "若々しい is still flagged.");
        std::cout << "[PASS] Claim checks." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
