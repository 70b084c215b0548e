#pragma once

#include <enrich/core/types.h>
#include <enrich/search/search_request.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/any_io_executor.hpp>

namespace enrich::search {

class ReferenceIndexStore;

struct SearchHit {
    std::string index;
    std::string id;
    nlohmann::json source = nlohmann::json::object();
};

struct SearchResponse {
    std::vector<SearchHit> hits;
    std::uint64_t totalHits = 0;
    std::chrono::milliseconds took{0};
};

// Invoked exactly once with either the response or the error that prevented it.
using SearchCallback = std::function<void(Result<SearchResponse>)>;

// Asynchronous query execution. Implementations must not block the caller and must invoke
// the callback exactly once.
using SearchRunner = std::function<void(SearchRequest, SearchCallback)>;

/**
 * @brief SearchRunner backed by an in-process reference index store.
 *
 * Each request is posted onto @p executor; the search and the callback both run there, never
 * on the dispatching thread.
 */
SearchRunner makeAsyncSearchRunner(boost::asio::any_io_executor executor,
                                   std::shared_ptr<const ReferenceIndexStore> store);

} // namespace enrich::search
