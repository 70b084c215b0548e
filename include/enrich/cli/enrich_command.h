#pragma once

#include <enrich/config/runner_config.h>
#include <enrich/core/types.h>
#include <enrich/ingest/processor.h>

#include <CLI/CLI.hpp>
#include <spdlog/common.h>

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>

namespace enrich::cli {

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitDocumentFailure = 1;
inline constexpr int kExitSetupFailure = 2;

// Documents dispatched per worker thread before the runner waits for the oldest one.
inline constexpr std::size_t kInFlightPerWorker = 16;

// Raw command-line values; only options present on the command line override the config.
struct CliOptions {
    std::string configPath;
    std::string inputPath = "-";
    std::string policiesFile;
    std::string referenceDataFile;
    std::string policyName;
    std::string field;
    std::string targetField;
    int maxMatches = 1;
    std::size_t workers = 0;
    std::string logLevel;
    bool ignoreMissing = false;
    bool noOverride = false;
    bool ignoreFailure = false;
};

void add_enrich_options(CLI::App& app, CliOptions& options);

/**
 * @brief Overlay the options given on the command line onto a loaded configuration.
 *
 * @param app A parsed application whose options were registered by add_enrich_options.
 */
void apply_cli_overrides(const CLI::App& app, const CliOptions& options,
                         config::RunnerConfig& config);

// Accepts trace, debug, info, warn, error, critical and off.
Result<spdlog::level::level_enum> parse_log_level(std::string_view name);

struct StreamStats {
    std::size_t documents = 0;
    std::size_t failures = 0;
};

/**
 * @brief Enrich NDJSON documents from input and write them to output in input order.
 *
 * At most maxInFlight documents are dispatched ahead of the oldest unwritten one. A failed
 * document is written as its original line when ignoreFailure is set and dropped otherwise.
 * Blank lines are skipped.
 */
StreamStats enrich_stream(ingest::Processor& processor, std::istream& input, std::ostream& output,
                          bool ignoreFailure, std::size_t maxInFlight);

/**
 * @brief Load policies and reference data, build the processor and enrich the input.
 *
 * @return kExitSuccess, kExitDocumentFailure when any document failed without ignore_failure,
 *         or kExitSetupFailure when the runner could not be set up.
 */
int run(const config::RunnerConfig& config, std::istream& input, std::ostream& output);

} // namespace enrich::cli
