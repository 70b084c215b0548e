#pragma once

#include <enrich/core/types.h>
#include <enrich/search/search_request.h>
#include <enrich/search/search_runner.h>

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace enrich::search {

/**
 * @brief In-memory keyed reference data, one record list per index name.
 *
 * Indices are replaced wholesale so readers never observe a partially refreshed index.
 * Searches take a snapshot of the index and run without holding the lock.
 */
class ReferenceIndexStore {
public:
    using Records = std::vector<nlohmann::json>;

    void putIndex(std::string name, Records records);
    bool removeIndex(std::string_view name);
    bool hasIndex(std::string_view name) const;
    std::vector<std::string> indexNames() const;

    // Load a {"policy": [records...], ...} document into the reference index of each policy.
    Result<size_t> loadPolicyData(const nlohmann::json& data);

    Result<SearchResponse> search(const SearchRequest& request) const;

private:
    std::shared_ptr<const Records> snapshot(std::string_view name) const;

    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<const Records>, std::less<>> indices_;
};

// Keyword comparison used by term queries: strings by value, other scalars by their JSON text,
// arrays when any element matches.
bool termMatches(const nlohmann::json& fieldValue, std::string_view value);

} // namespace enrich::search
