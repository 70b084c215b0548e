#pragma once

#include <enrich/core/types.h>
#include <enrich/ingest/processor.h>
#include <enrich/policy/enrich_policy.h>
#include <enrich/search/search_runner.h>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace enrich::ingest {

/**
 * @brief Creates enrich processors from pipeline configuration.
 *
 * Recognised keys: policy_name, field, target_field (required), ignore_missing (false),
 * override (true), max_matches (1, between 1 and 128) and tag. The match field is taken from
 * the named policy. Unknown keys are rejected.
 */
class EnrichProcessorFactory {
public:
    static constexpr int kMaxMatchesLimit = 128;

    EnrichProcessorFactory(search::SearchRunner searchRunner,
                           std::shared_ptr<const policy::PolicyRegistry> policies);

    Result<std::unique_ptr<Processor>> create(const nlohmann::json& config) const;

private:
    search::SearchRunner searchRunner_;
    std::shared_ptr<const policy::PolicyRegistry> policies_;
};

} // namespace enrich::ingest
