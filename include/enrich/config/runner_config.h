#pragma once

#include <enrich/config/config_helpers.h>
#include <enrich/core/types.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace enrich::config {

struct ProcessorSettings {
    std::string policyName;
    std::string field;
    std::string targetField;
    bool ignoreMissing = false;
    bool overrideEnabled = true;
    int maxMatches = 1;
    std::string tag;
};

/**
 * @brief Settings of the enrich command-line runner.
 *
 * Read from [logging], [runner] and [processor] sections; command-line options are applied on
 * top by the caller.
 */
struct RunnerConfig {
    std::string logLevel = "info";
    std::size_t workerThreads = 0; // 0 = hardware concurrency
    std::filesystem::path policiesFile;
    std::filesystem::path referenceDataFile;
    bool ignoreFailure = false;
    ProcessorSettings processor;
};

Result<RunnerConfig> load_runner_config(const ConfigSections& sections);
Result<RunnerConfig> load_runner_config(const std::filesystem::path& path);

// Processor configuration in the form accepted by EnrichProcessorFactory::create.
nlohmann::json processor_config_json(const ProcessorSettings& settings);

} // namespace enrich::config
