#include <enrich/cli/enrich_command.h>
#include <enrich/ingest/enrich_processor_factory.h>
#include <enrich/ingest/ingest_document.h>
#include <enrich/policy/enrich_policy.h>
#include <enrich/search/reference_index.h>
#include <enrich/search/search_runner.h>

#include <spdlog/spdlog.h>

#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <array>
#include <deque>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <optional>
#include <thread>
#include <utility>

namespace enrich::cli {

namespace {

namespace fs = std::filesystem;

Result<nlohmann::json> read_json_file(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Error{ErrorCode::FileNotFound, "Cannot open " + path.string()};
    }
    auto parsed = nlohmann::json::parse(file, nullptr, false);
    if (parsed.is_discarded()) {
        return Error{ErrorCode::InvalidData, path.string() + " is not valid JSON"};
    }
    return parsed;
}

// A document in flight: the original line is kept for ignore_failure.
struct Pending {
    std::string original;
    std::unique_ptr<ingest::IngestDocument> document;
    std::future<std::optional<Error>> outcome;
};

bool given(const CLI::App& app, const char* name) {
    return app.count(name) > 0;
}

} // namespace

void add_enrich_options(CLI::App& app, CliOptions& options) {
    app.add_option("--config", options.configPath, "Configuration file path");
    app.add_option("-i,--input", options.inputPath, "NDJSON input file, '-' for stdin")
        ->default_val("-");
    app.add_option("--policies", options.policiesFile, "JSON file of enrich policies by name");
    app.add_option("--reference-data", options.referenceDataFile,
                   "JSON file of reference records keyed by policy name");
    app.add_option("--policy", options.policyName, "Enrich policy to match against");
    app.add_option("--field", options.field, "Field holding the lookup value");
    app.add_option("--target-field", options.targetField, "Field receiving the matched records");
    app.add_option("--match-max", options.maxMatches, "Maximum records per document (1-128)");
    app.add_option("--workers", options.workers, "Number of worker threads");
    app.add_option("--log-level", options.logLevel,
                   "Log level (trace/debug/info/warn/error/critical/off)");
    app.add_flag("--ignore-missing", options.ignoreMissing,
                 "Pass documents without the field through");
    app.add_flag("--no-override", options.noOverride, "Keep an existing target field untouched");
    app.add_flag("--ignore-failure", options.ignoreFailure,
                 "Emit failed documents unchanged instead of failing");
}

void apply_cli_overrides(const CLI::App& app, const CliOptions& options,
                         config::RunnerConfig& config) {
    if (given(app, "--log-level")) {
        config.logLevel = options.logLevel;
    }
    if (given(app, "--workers")) {
        config.workerThreads = options.workers;
    }
    if (given(app, "--policies")) {
        config.policiesFile = options.policiesFile;
    }
    if (given(app, "--reference-data")) {
        config.referenceDataFile = options.referenceDataFile;
    }
    if (given(app, "--ignore-failure")) {
        config.ignoreFailure = options.ignoreFailure;
    }

    auto& processor = config.processor;
    if (given(app, "--policy")) {
        processor.policyName = options.policyName;
    }
    if (given(app, "--field")) {
        processor.field = options.field;
    }
    if (given(app, "--target-field")) {
        processor.targetField = options.targetField;
    }
    if (given(app, "--match-max")) {
        processor.maxMatches = options.maxMatches;
    }
    if (given(app, "--ignore-missing")) {
        processor.ignoreMissing = options.ignoreMissing;
    }
    if (given(app, "--no-override")) {
        processor.overrideEnabled = !options.noOverride;
    }
}

Result<spdlog::level::level_enum> parse_log_level(std::string_view name) {
    static constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 7> kLevels =
        {{{"trace", spdlog::level::trace},
          {"debug", spdlog::level::debug},
          {"info", spdlog::level::info},
          {"warn", spdlog::level::warn},
          {"error", spdlog::level::err},
          {"critical", spdlog::level::critical},
          {"off", spdlog::level::off}}};
    for (const auto& [levelName, level] : kLevels) {
        if (levelName == name) {
            return level;
        }
    }
    return Error{ErrorCode::InvalidArgument,
                 "unknown log level [" + std::string(name) +
                     "], expected trace, debug, info, warn, error, critical or off"};
}

StreamStats enrich_stream(ingest::Processor& processor, std::istream& input, std::ostream& output,
                          bool ignoreFailure, std::size_t maxInFlight) {
    StreamStats stats;
    std::deque<Pending> pending;
    maxInFlight = std::max<std::size_t>(maxInFlight, 1);

    auto emitOldest = [&] {
        auto item = std::move(pending.front());
        pending.pop_front();
        auto error = item.outcome.get();
        if (!error) {
            output << item.document->source().dump() << '\n';
            return;
        }
        if (ignoreFailure) {
            spdlog::warn("Passing document through unchanged: {}", error->message);
            output << item.original << '\n';
            return;
        }
        ++stats.failures;
        spdlog::error("Enrichment failed ({}): {}", errorToString(error->code), error->message);
    };

    std::string line;
    std::size_t lineNo = 0;
    while (std::getline(input, line)) {
        ++lineNo;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        while (pending.size() >= maxInFlight) {
            emitOldest();
        }
        ++stats.documents;

        Pending item;
        item.original = line;
        auto promise = std::make_shared<std::promise<std::optional<Error>>>();
        item.outcome = promise->get_future();

        auto parsed = ingest::IngestDocument::parse(line);
        if (!parsed) {
            promise->set_value(Error{parsed.error().code, "line " + std::to_string(lineNo) +
                                                              ": " + parsed.error().message});
            pending.push_back(std::move(item));
            continue;
        }
        item.document = std::make_unique<ingest::IngestDocument>(std::move(parsed).value());
        auto& document = *item.document;
        pending.push_back(std::move(item));
        processor.execute(document,
                          [promise](ingest::IngestDocument*, std::optional<Error> error) {
                              promise->set_value(std::move(error));
                          });
    }
    while (!pending.empty()) {
        emitOldest();
    }
    output.flush();
    return stats;
}

int run(const config::RunnerConfig& config, std::istream& input, std::ostream& output) {
    auto level = parse_log_level(config.logLevel);
    if (!level) {
        spdlog::critical("{}", level.error().message);
        return kExitSetupFailure;
    }
    spdlog::set_level(level.value());

    if (config.policiesFile.empty()) {
        spdlog::critical("No policies file configured (--policies or [runner] policies_file)");
        return kExitSetupFailure;
    }
    auto policyJson = read_json_file(config.policiesFile);
    if (!policyJson) {
        spdlog::critical("{}", policyJson.error().message);
        return kExitSetupFailure;
    }
    auto policies = std::make_shared<policy::PolicyRegistry>();
    if (auto loaded = policies->loadJson(policyJson.value()); !loaded) {
        spdlog::critical("Invalid policies: {}", loaded.error().message);
        return kExitSetupFailure;
    } else {
        spdlog::info("Loaded {} enrich policies", loaded.value());
    }

    auto store = std::make_shared<search::ReferenceIndexStore>();
    if (!config.referenceDataFile.empty()) {
        auto data = read_json_file(config.referenceDataFile);
        if (!data) {
            spdlog::critical("{}", data.error().message);
            return kExitSetupFailure;
        }
        auto loaded = store->loadPolicyData(data.value());
        if (!loaded) {
            spdlog::critical("Invalid reference data: {}", loaded.error().message);
            return kExitSetupFailure;
        }
        spdlog::info("Loaded {} reference records", loaded.value());
    } else {
        spdlog::warn("No reference data configured; every lookup will fail");
    }

    std::size_t threads = config.workerThreads;
    if (threads == 0) {
        threads = std::max(1u, std::thread::hardware_concurrency());
    }
    boost::asio::thread_pool pool(threads);

    ingest::EnrichProcessorFactory factory(
        search::makeAsyncSearchRunner(pool.get_executor(), store), policies);
    auto created = factory.create(config::processor_config_json(config.processor));
    if (!created) {
        spdlog::critical("Cannot create enrich processor: {}", created.error().message);
        pool.join();
        return kExitSetupFailure;
    }
    auto processor = std::move(created).value();

    const auto stats = enrich_stream(*processor, input, output, config.ignoreFailure,
                                     threads * kInFlightPerWorker);
    pool.join();

    if (stats.failures > 0) {
        spdlog::error("{} of {} documents failed", stats.failures, stats.documents);
        return kExitDocumentFailure;
    }
    return kExitSuccess;
}

} // namespace enrich::cli
