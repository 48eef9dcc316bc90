/**
 * @file CopyCheckApp.cpp
 * @brief Implementation of the CopyCheckApp class.
 */
#include "app/CopyCheckApp.hpp"

#include <cstdio>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

#include "application/compliance/ResultSummary.hpp"
#include "domain/compliance/ComplianceErrors.hpp"
#include "domain/compliance/RuleTables.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/compliance/ComplianceJson.hpp"
#include "infrastructure/compliance/JsonRuleRepository.hpp"

#ifndef COPYCHECK_DEFAULT_CONFIG_DIR
#define COPYCHECK_DEFAULT_CONFIG_DIR "config"
#endif

namespace copycheck::app {

namespace {

const char* kUsage = R"(
USAGE: %s [OPTIONS] [FILE|-]

Rule-based compliance pre-filter for Japanese advertising copy.
Reads the advertisement from FILE, or from standard input when FILE is '-' or omitted.

OPTIONS:
    --product <ID>          Product code selecting product rules (e.g. HA, SH)
    --config-dir <path>     Directory with settings.json, rules/, products/ and records/
    --segments-only         Print the segments only
    --summary               Print the summary and detail list instead of JSON
    --sequential            Evaluate segments one after another
    --compact               Print JSON on a single line
    --help                  Show this help message

CONFIG DIRECTORY:
    --config-dir, then $COPYCHECK_CONFIG_DIR, then $XDG_CONFIG_HOME/copycheck,
    then the built-in default.

EXIT CODES:
    0 - No violations
    1 - Violations found
    2 - Usage error or invalid input
    3 - Rule tables could not be loaded
    4 - Internal error
)";

std::string Dump(const nlohmann::json& j, bool compact) {
    return j.dump(compact ? -1 : 2, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace

void CopyCheckApp::PrintUsage(const char* program) {
    std::fprintf(stdout, kUsage, program);
}

std::optional<CliOptions> CopyCheckApp::ParseArguments(const std::vector<std::string>& args, std::string& error) {
    CliOptions options;
    bool haveInput = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            options.showHelp = true;
        } else if (arg == "--product" || arg == "--config-dir") {
            if (i + 1 >= args.size()) {
                error = "Option " + arg + " needs a value";
                return std::nullopt;
            }
            if (arg == "--product") {
                options.productId = args[++i];
            } else {
                options.configDir = args[++i];
            }
        } else if (arg == "--segments-only") {
            options.segmentsOnly = true;
        } else if (arg == "--summary") {
            options.summaryText = true;
        } else if (arg == "--sequential") {
            options.sequential = true;
        } else if (arg == "--compact") {
            options.compact = true;
        } else if (arg.size() > 1 && arg[0] == '-' && arg != "-") {
            error = "Unknown option: " + arg;
            return std::nullopt;
        } else if (haveInput) {
            error = "Only one input file may be given";
            return std::nullopt;
        } else {
            options.inputPath = arg;
            haveInput = true;
        }
    }

    return options;
}

int CopyCheckApp::Run(int argc, char** argv) {
    const char* program = argc > 0 ? argv[0] : "copycheck";
    std::string error;
    auto parsed = ParseArguments(std::vector<std::string>(argv + (argc > 0 ? 1 : 0), argv + argc), error);
    if (!parsed) {
        std::cerr << error << std::endl;
        PrintUsage(program);
        return ExitUsage;
    }
    m_options = *parsed;
    if (m_options.showHelp) {
        PrintUsage(program);
        return ExitClean;
    }

    try {
        Init();
    } catch (const domain::compliance::RuleTableLoadError& e) {
        std::cerr << "[CopyCheckApp] Failed to load rule tables: " << e.what() << std::endl;
        return ExitRuleTableError;
    } catch (const std::exception& e) {
        std::cerr << "[CopyCheckApp] Initialization failed: " << e.what() << std::endl;
        return ExitInternalError;
    }

    auto text = ReadInput();
    if (!text) {
        return ExitUsage;
    }

    try {
        if (m_options.segmentsOnly) {
            const auto segments = m_service->SegmentText(*text, m_options.productId);
            std::cout << Dump(infrastructure::compliance::ToJson(segments), m_options.compact) << std::endl;
            return ExitClean;
        }

        const auto report = m_service->Evaluate(*text, m_options.productId);
        if (m_options.summaryText) {
            std::cout << application::compliance::SummaryText(report.overall) << "\n"
                      << application::compliance::DetailedList(report.overall) << "\n"
                      << "表示内容の検証: " << report.claimViolations.size() << "件\n"
                      << application::compliance::ClaimList(report.claimViolations) << std::endl;
        } else {
            std::cout << Dump(infrastructure::compliance::ToJson(report), m_options.compact) << std::endl;
        }
        return report.HasViolations() ? ExitViolations : ExitClean;
    } catch (const domain::compliance::InvalidInputError& e) {
        std::cerr << "[CopyCheckApp] Invalid input: " << e.what() << std::endl;
        return ExitUsage;
    } catch (const std::exception& e) {
        std::cerr << "[CopyCheckApp] Evaluation failed: " << e.what() << std::endl;
        return ExitInternalError;
    }
}

void CopyCheckApp::Init() {
    // Composition root
    const auto configDir = infrastructure::ConfigLoader::ResolveConfigDirectory(m_options.configDir,
                                                                                COPYCHECK_DEFAULT_CONFIG_DIR);
    auto settings = infrastructure::ConfigLoader::LoadEngineSettings(configDir);
    if (m_options.sequential) settings.parallelSegmentEvaluation = false;

    infrastructure::compliance::JsonRuleRepository repository(
        infrastructure::ConfigLoader::ResolveRelative(configDir, settings.rulesDirectory),
        infrastructure::ConfigLoader::ResolveRelative(configDir, settings.productsDirectory),
        infrastructure::ConfigLoader::ResolveRelative(configDir, settings.recordsDirectory));

    auto rules = std::make_shared<const domain::compliance::RuleTables>(
        repository.fetchRules(), repository.fetchProducts(), repository.fetchGuinnessRecord());
    std::cerr << "[CopyCheckApp] " << rules->RuleCount() << " rules ready from " << configDir.string() << std::endl;

    m_service = std::make_unique<application::compliance::ComplianceService>(rules, settings);
}

std::optional<std::string> CopyCheckApp::ReadInput() const {
    if (m_options.inputPath == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    std::ifstream in(m_options.inputPath, std::ios::binary);
    if (!in) {
        std::cerr << "[CopyCheckApp] Cannot open " << m_options.inputPath << std::endl;
        return std::nullopt;
    }
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

} // namespace copycheck::app
