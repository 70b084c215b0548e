#pragma once

#include <enrich/core/types.h>

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace enrich::policy {

// Reference indices are named after the policy that populates them.
inline constexpr std::string_view kEnrichIndexPrefix = ".enrich-";

inline constexpr std::string_view kMatchType = "match";

// Name of the reference index a policy's lookups run against, e.g. "users" -> ".enrich-users".
std::string getBaseName(std::string_view policyName);

Result<void> validatePolicyName(std::string_view name);

/**
 * @brief Definition of how a reference index is built and matched.
 *
 * Parsed from the {"match": {"indices": [...], "match_field": "...", "enrich_fields": [...]}}
 * form. Only the match type is supported.
 */
struct EnrichPolicy {
    std::string type{kMatchType};
    std::vector<std::string> indices;
    std::string matchField;
    std::vector<std::string> enrichFields;

    static Result<EnrichPolicy> fromJson(const nlohmann::json& json);
    nlohmann::json toJson() const;

    Result<void> validate() const;

    bool operator==(const EnrichPolicy&) const = default;
};

// Thread-safe name -> policy map consulted when processors are created.
class PolicyRegistry {
public:
    Result<void> put(const std::string& name, EnrichPolicy policy);
    std::optional<EnrichPolicy> get(std::string_view name) const;
    bool remove(std::string_view name);
    std::vector<std::string> names() const;

    // Load every policy of a {"name": {"match": {...}}, ...} document.
    Result<size_t> loadJson(const nlohmann::json& policies);

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, EnrichPolicy, std::less<>> policies_;
};

} // namespace enrich::policy
