#include <enrich/ingest/enrich_processor_factory.h>
#include <enrich/ingest/match_processor.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdint>
#include <limits>
#include <string_view>

namespace enrich::ingest {

namespace {

constexpr std::array<std::string_view, 7> kKnownKeys = {
    "policy_name", "field", "target_field", "ignore_missing", "override", "max_matches", "tag"};

Error propertyError(std::string_view key, std::string_view reason) {
    return Error{ErrorCode::InvalidArgument, "[" + std::string(key) + "] " + std::string(reason)};
}

Result<std::string> requiredString(const nlohmann::json& config, std::string_view key) {
    auto it = config.find(std::string(key));
    if (it == config.end() || it->is_null()) {
        return propertyError(key, "required property is missing");
    }
    if (!it->is_string()) {
        return propertyError(key, "property isn't a string, but of type [" + jsonTypeName(*it) +
                                      "]");
    }
    return it->get<std::string>();
}

Result<bool> optionalBool(const nlohmann::json& config, std::string_view key, bool fallback) {
    auto it = config.find(std::string(key));
    if (it == config.end() || it->is_null()) {
        return fallback;
    }
    if (it->is_boolean()) {
        return it->get<bool>();
    }
    if (it->is_string()) {
        const auto& text = it->get_ref<const std::string&>();
        if (text == "true") {
            return true;
        }
        if (text == "false") {
            return false;
        }
    }
    return propertyError(key, "property isn't a boolean");
}

Result<int> optionalInt(const nlohmann::json& config, std::string_view key, int fallback) {
    auto it = config.find(std::string(key));
    if (it == config.end() || it->is_null()) {
        return fallback;
    }
    if (it->is_number_unsigned()) {
        const auto value = it->get<std::uint64_t>();
        if (value <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            return static_cast<int>(value);
        }
    } else if (it->is_number_integer()) {
        const auto value = it->get<std::int64_t>();
        if (value >= std::numeric_limits<int>::min() && value <= std::numeric_limits<int>::max()) {
            return static_cast<int>(value);
        }
    } else if (it->is_string()) {
        const auto& text = it->get_ref<const std::string&>();
        int parsed = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
        if (ec == std::errc{} && ptr == text.data() + text.size()) {
            return parsed;
        }
    }
    return propertyError(key, "property isn't an integer");
}

} // namespace

EnrichProcessorFactory::EnrichProcessorFactory(
    search::SearchRunner searchRunner, std::shared_ptr<const policy::PolicyRegistry> policies)
    : searchRunner_(std::move(searchRunner)), policies_(std::move(policies)) {}

Result<std::unique_ptr<Processor>>
EnrichProcessorFactory::create(const nlohmann::json& config) const {
    if (!config.is_object()) {
        return Error{ErrorCode::InvalidArgument, "processor configuration must be an object"};
    }
    for (auto it = config.begin(); it != config.end(); ++it) {
        if (std::find(kKnownKeys.begin(), kKnownKeys.end(), it.key()) == kKnownKeys.end()) {
            return Error{ErrorCode::InvalidArgument,
                         "processor [enrich] doesn't support the configuration parameter [" +
                             it.key() + "]"};
        }
    }

    auto policyName = requiredString(config, "policy_name");
    if (!policyName) {
        return policyName.error();
    }
    auto field = requiredString(config, "field");
    if (!field) {
        return field.error();
    }
    auto targetField = requiredString(config, "target_field");
    if (!targetField) {
        return targetField.error();
    }
    auto ignoreMissing = optionalBool(config, "ignore_missing", false);
    if (!ignoreMissing) {
        return ignoreMissing.error();
    }
    auto overrideEnabled = optionalBool(config, "override", true);
    if (!overrideEnabled) {
        return overrideEnabled.error();
    }
    auto maxMatches = optionalInt(config, "max_matches", 1);
    if (!maxMatches) {
        return maxMatches.error();
    }
    if (maxMatches.value() <= 0 || maxMatches.value() > kMaxMatchesLimit) {
        return propertyError("max_matches",
                             "should be between 1 and " + std::to_string(kMaxMatchesLimit));
    }

    std::string tag;
    if (auto it = config.find("tag"); it != config.end() && it->is_string()) {
        tag = it->get<std::string>();
    }

    if (!policies_) {
        return Error{ErrorCode::InvalidState, "no enrich policies are available"};
    }
    auto policy = policies_->get(policyName.value());
    if (!policy) {
        return Error{ErrorCode::NotFound, "policy [" + policyName.value() + "] does not exist"};
    }
    if (policy->type != policy::kMatchType) {
        return Error{ErrorCode::NotSupported, "unsupported policy type [" + policy->type + "]"};
    }

    spdlog::debug("EnrichProcessorFactory: {} -> {} via policy [{}] on [{}] (max_matches={})",
                  field.value(), targetField.value(), policyName.value(), policy->matchField,
                  maxMatches.value());

    std::unique_ptr<Processor> processor = std::make_unique<MatchProcessor>(
        std::move(tag), searchRunner_, policyName.value(), field.value(), targetField.value(),
        policy->matchField, ignoreMissing.value(), overrideEnabled.value(), maxMatches.value());
    return Result<std::unique_ptr<Processor>>(std::move(processor));
}

} // namespace enrich::ingest
