/**
 * @file CopyCheckApp.hpp
 * @brief Command line front end for the compliance pre-filter.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/compliance/ComplianceService.hpp"

namespace copycheck::app {

/**
 * @struct CliOptions
 * @brief Parsed command line.
 */
struct CliOptions {
    std::string productId;                ///< Empty applies rules of every product.
    std::optional<std::string> configDir; ///< Overrides $COPYCHECK_CONFIG_DIR.
    std::string inputPath = "-";          ///< "-" reads standard input.
    bool segmentsOnly = false;            ///< Print segments instead of a report.
    bool summaryText = false;             ///< Print the summary lines instead of JSON.
    bool sequential = false;              ///< Disable parallel segment evaluation.
    bool compact = false;                 ///< Single-line JSON.
    bool showHelp = false;
};

enum ExitCode : int {
    ExitClean = 0,          ///< No violations.
    ExitViolations = 1,     ///< At least one violation.
    ExitUsage = 2,          ///< Bad arguments, unreadable or invalid input.
    ExitRuleTableError = 3, ///< Rules could not be loaded.
    ExitInternalError = 4   ///< Unexpected failure while loading or evaluating.
};

/**
 * @class CopyCheckApp
 * @brief Owns the composition root and runs one evaluation.
 */
class CopyCheckApp {
public:
    /**
     * @brief Parses arguments, loads configuration and evaluates the input.
     * @return One of ExitCode.
     */
    int Run(int argc, char** argv);

    /**
     * @brief Parses arguments without the program name.
     * @param error Receives a message when parsing fails.
     * @return nullopt on a usage error.
     */
    static std::optional<CliOptions> ParseArguments(const std::vector<std::string>& args, std::string& error);

    static void PrintUsage(const char* program);

private:
    /**
     * @brief Builds settings, rule tables and the service.
     * @throws domain::compliance::RuleTableLoadError when the rules cannot be loaded.
     */
    void Init();

    std::optional<std::string> ReadInput() const;

    CliOptions m_options;
    std::unique_ptr<application::compliance::ComplianceService> m_service;
};

} // namespace copycheck::app
