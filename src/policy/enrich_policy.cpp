#include <enrich/policy/enrich_policy.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <mutex>

namespace enrich::policy {

namespace {

constexpr std::string_view kInvalidNameChars = "\\/*?\"<>|,# ";

Result<std::vector<std::string>> stringList(const nlohmann::json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end()) {
        return Error{ErrorCode::InvalidArgument, std::string("[") + key + "] is missing"};
    }
    std::vector<std::string> out;
    if (it->is_string()) {
        out.push_back(it->get<std::string>());
        return out;
    }
    if (!it->is_array()) {
        return Error{ErrorCode::InvalidArgument,
                     std::string("[") + key + "] must be a string or a list of strings"};
    }
    for (const auto& item : *it) {
        if (!item.is_string()) {
            return Error{ErrorCode::InvalidArgument,
                         std::string("[") + key + "] must only contain strings"};
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

} // namespace

std::string getBaseName(std::string_view policyName) {
    std::string name(kEnrichIndexPrefix);
    name.append(policyName);
    return name;
}

Result<void> validatePolicyName(std::string_view name) {
    if (name.empty()) {
        return Error{ErrorCode::InvalidArgument, "name is missing or empty"};
    }
    const std::string quoted = "[" + std::string(name) + "]";
    if (name == "." || name == "..") {
        return Error{ErrorCode::InvalidArgument,
                     "invalid policy name " + quoted + ", must not be '.' or '..'"};
    }
    if (name.front() == '_' || name.front() == '-' || name.front() == '+') {
        return Error{ErrorCode::InvalidArgument,
                     "invalid policy name " + quoted + ", must not start with '_', '-', or '+'"};
    }
    for (unsigned char c : name) {
        if (kInvalidNameChars.find(static_cast<char>(c)) != std::string_view::npos ||
            std::isspace(c)) {
            return Error{ErrorCode::InvalidArgument,
                         "invalid policy name " + quoted + ", must not contain the character [" +
                             std::string(1, static_cast<char>(c)) + "]"};
        }
        if (std::isupper(c)) {
            return Error{ErrorCode::InvalidArgument,
                         "invalid policy name " + quoted + ", must be lowercase"};
        }
    }
    return {};
}

Result<EnrichPolicy> EnrichPolicy::fromJson(const nlohmann::json& json) {
    if (!json.is_object() || json.size() != 1) {
        return Error{ErrorCode::InvalidArgument,
                     "policy must be an object with exactly one policy type"};
    }
    auto entry = json.begin();
    EnrichPolicy policy;
    policy.type = entry.key();
    const auto& body = entry.value();
    if (!body.is_object()) {
        return Error{ErrorCode::InvalidArgument, "policy [" + policy.type + "] must be an object"};
    }

    auto indices = stringList(body, "indices");
    if (!indices) {
        return indices.error();
    }
    policy.indices = std::move(indices).value();

    auto matchField = body.find("match_field");
    if (matchField == body.end() || !matchField->is_string()) {
        return Error{ErrorCode::InvalidArgument, "[match_field] must be a string"};
    }
    policy.matchField = matchField->get<std::string>();

    auto enrichFields = stringList(body, "enrich_fields");
    if (!enrichFields) {
        return enrichFields.error();
    }
    policy.enrichFields = std::move(enrichFields).value();

    if (auto valid = policy.validate(); !valid) {
        return valid.error();
    }
    return policy;
}

nlohmann::json EnrichPolicy::toJson() const {
    return {{type,
             {{"indices", indices}, {"match_field", matchField}, {"enrich_fields", enrichFields}}}};
}

Result<void> EnrichPolicy::validate() const {
    if (type != kMatchType) {
        return Error{ErrorCode::NotSupported, "unsupported policy type [" + type +
                                                  "], supported types are [match]"};
    }
    if (indices.empty()) {
        return Error{ErrorCode::InvalidArgument, "[indices] must not be empty"};
    }
    if (matchField.empty()) {
        return Error{ErrorCode::InvalidArgument, "[match_field] must not be empty"};
    }
    if (enrichFields.empty()) {
        return Error{ErrorCode::InvalidArgument, "[enrich_fields] must not be empty"};
    }
    return {};
}

Result<void> PolicyRegistry::put(const std::string& name, EnrichPolicy policy) {
    if (auto valid = validatePolicyName(name); !valid) {
        return valid.error();
    }
    if (auto valid = policy.validate(); !valid) {
        return valid.error();
    }
    std::unique_lock lock(mutex_);
    policies_.insert_or_assign(name, std::move(policy));
    spdlog::debug("PolicyRegistry: stored policy [{}]", name);
    return {};
}

std::optional<EnrichPolicy> PolicyRegistry::get(std::string_view name) const {
    std::shared_lock lock(mutex_);
    auto it = policies_.find(name);
    if (it == policies_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool PolicyRegistry::remove(std::string_view name) {
    std::unique_lock lock(mutex_);
    auto it = policies_.find(name);
    if (it == policies_.end()) {
        return false;
    }
    policies_.erase(it);
    return true;
}

std::vector<std::string> PolicyRegistry::names() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> out;
    out.reserve(policies_.size());
    for (const auto& [name, _] : policies_) {
        out.push_back(name);
    }
    return out;
}

Result<size_t> PolicyRegistry::loadJson(const nlohmann::json& policies) {
    if (!policies.is_object()) {
        return Error{ErrorCode::InvalidData, "policies must be a JSON object keyed by name"};
    }
    size_t loaded = 0;
    for (auto it = policies.begin(); it != policies.end(); ++it) {
        auto policy = EnrichPolicy::fromJson(it.value());
        if (!policy) {
            return Error{policy.error().code,
                         "policy [" + it.key() + "]: " + policy.error().message};
        }
        if (auto stored = put(it.key(), std::move(policy).value()); !stored) {
            return stored.error();
        }
        ++loaded;
    }
    return loaded;
}

} // namespace enrich::policy
