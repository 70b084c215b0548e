#include <enrich/search/reference_index.h>
#include <enrich/search/search_runner.h>

#include <spdlog/spdlog.h>

#include <boost/asio/post.hpp>

#include <exception>

namespace enrich::search {

namespace {

Result<SearchResponse> runSearch(const ReferenceIndexStore* store, const SearchRequest& request) {
    if (store == nullptr) {
        return Error{ErrorCode::InvalidState, "no reference index store configured"};
    }
    try {
        return store->search(request);
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError, std::string("search failed: ") + e.what()};
    }
}

} // namespace

SearchRunner makeAsyncSearchRunner(boost::asio::any_io_executor executor,
                                   std::shared_ptr<const ReferenceIndexStore> store) {
    return [executor = std::move(executor), store = std::move(store)](SearchRequest request,
                                                                       SearchCallback callback) {
        boost::asio::post(executor, [store, request = std::move(request),
                                     callback = std::move(callback)]() {
            auto response = runSearch(store.get(), request);
            if (!response) {
                spdlog::debug("search {} failed: {}", request.toJson().dump(),
                              response.error().message);
            }
            callback(std::move(response));
        });
    };
}

} // namespace enrich::search
