#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "application/compliance/ComplianceService.hpp"
#include "infrastructure/compliance/JsonRuleRepository.hpp"

using namespace copycheck::application::compliance;
using namespace copycheck::domain::compliance;

int main() {
    std::cout << "[Test] Starting Concurrency Stress Test..." << std::endl;

    // Setup: one immutable rule table shared by every service and thread
    const std::filesystem::path configDir(COPYCHECK_TEST_CONFIG_DIR);
    copycheck::infrastructure::compliance::JsonRuleRepository repository(configDir / "rules", configDir / "products",
                                                                         configDir / "records");
    auto rules = std::make_shared<const RuleTables>(repository.fetchRules(), repository.fetchProducts(),
                                                    repository.fetchGuinnessRecord());

    EngineSettings parallelSettings;
    parallelSettings.parallelSegmentEvaluation = true;
    EngineSettings sequentialSettings;
    sequentialSettings.parallelSegmentEvaluation = false;

    ComplianceService parallel(rules, parallelSettings);
    ComplianceService sequential(rules, sequentialSettings);

    const std::vector<std::string> documents = {
        "【目元のクマ※1対策に】\nヒアルロン酸※2たっぷり配合で、角質層まで浸透※3。\n"
        "週に1回貼って寝るだけで若々しい肌があなたのものに\n"
        "※1乾燥や古い角質によるくすみ、ハリが不足した暗い目の下\n※2保湿成分\n※3角質層まで",
        "ヒアルロン酸直注入で目元ケア。老け見え印象対策！今なら半額の1,815円！\n※個人の感想です",
        "爪の中まで殺菌※1。\n※1殺菌は消毒の作用機序として",
        "6年連続売上世界一※1\n※1：ディープパッチシリーズとして売上世界一（TFCO株式会社のグローバル調査、"
        "美容用マイクロニードルスキンパッチにおける最大のブランド、2019年3月～2025年2月）",
    };
    const std::vector<std::string> products = {"HA", "HA", "SH", "HA"};

    // Parallel segment evaluation gives exactly the sequential report
    std::vector<DocumentReport> baseline;
    for (std::size_t i = 0; i < documents.size(); ++i) {
        baseline.push_back(sequential.Evaluate(documents[i], products[i]));
        assert(parallel.Evaluate(documents[i], products[i]) == baseline.back());
    }
    assert(!baseline.back().claimViolations.empty());
    std::cout << "[PASS] Parallel and sequential reports match." << std::endl;

    // A long advertisement of many short segments: work is split into a bounded number of chunks
    {
        std::string longDocument;
        for (int i = 0; i < 16000; ++i) longDocument += "注入。";

        const auto started = std::chrono::steady_clock::now();
        const DocumentReport report = parallel.Evaluate(longDocument);
        const auto took = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        std::cout << "[Test] 16000 segments in " << took.count() << " ms" << std::endl;

        assert(report.segments.size() == 16000);
        assert(report.segments.back().segment.id == "seg_16000");
        assert(report.overall.summary.byTier.conditional == 16000);
        assert(report.claimViolations.empty());
        assert(took < std::chrono::seconds(60));
        assert(sequential.Evaluate(longDocument) == report);
    }
    std::cout << "[PASS] Long documents evaluate in bounded time." << std::endl;

    // Stress Test: many threads evaluating through the same service
    const int NUM_THREADS = 16;
    const int ROUNDS = 5;
    std::vector<std::thread> threads;
    std::atomic<int> completed{0};
    std::atomic<int> mismatches{0};

    std::cout << "[Test] Spawning " << NUM_THREADS << " threads..." << std::endl;
    auto startTime = std::chrono::steady_clock::now();

    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([&, t]() {
            for (int round = 0; round < ROUNDS; ++round) {
                const std::size_t index = static_cast<std::size_t>(t + round) % documents.size();
                if (!(parallel.Evaluate(documents[index], products[index]) == baseline[index])) {
                    mismatches++;
                }
                completed++;
            }
        });
    }

    for (auto& thread : threads) {
        if (thread.joinable()) thread.join();
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);
    std::cout << "[Test] " << completed.load() << " evaluations in " << elapsed.count() << " ms" << std::endl;

    if (completed.load() != NUM_THREADS * ROUNDS) {
        std::cout << "[FAIL] Some evaluations did not finish." << std::endl;
        return 1;
    }
    if (mismatches.load() != 0) {
        std::cout << "[FAIL] " << mismatches.load() << " concurrent reports differ from the baseline." << std::endl;
        return 1;
    }

    std::cout << "[PASS] Concurrent evaluations are consistent." << std::endl;
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
