#include <enrich/cli/enrich_command.h>
#include <enrich/config/runner_config.h>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>

int main(int argc, char* argv[]) {
    CLI::App app{"enrich - add matching reference records to NDJSON documents"};

    enrich::cli::CliOptions options;
    enrich::cli::add_enrich_options(app, options);

    CLI11_PARSE(app, argc, argv);

    spdlog::set_default_logger(spdlog::stderr_color_mt("enrich"));

    enrich::config::RunnerConfig config;
    const auto resolvedConfig = enrich::config::get_config_path(options.configPath);
    if (!options.configPath.empty() || std::filesystem::exists(resolvedConfig)) {
        auto loaded = enrich::config::load_runner_config(resolvedConfig);
        if (!loaded) {
            spdlog::critical("Failed to load config: {}", loaded.error().message);
            return enrich::cli::kExitSetupFailure;
        }
        config = std::move(loaded).value();
    }

    // Command-line options take precedence over the config file
    enrich::cli::apply_cli_overrides(app, options, config);

    if (options.inputPath == "-") {
        return enrich::cli::run(config, std::cin, std::cout);
    }
    std::ifstream input(options.inputPath);
    if (!input) {
        spdlog::critical("Cannot open input {}", options.inputPath);
        return enrich::cli::kExitSetupFailure;
    }
    return enrich::cli::run(config, input, std::cout);
}
