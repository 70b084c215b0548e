#include <enrich/ingest/match_processor.h>
#include <enrich/search/search_request.h>

#include <algorithm>
#include <exception>
#include <memory>
#include <stdexcept>

namespace enrich::ingest {

MatchProcessor::MatchProcessor(std::string tag, search::SearchRunner searchRunner,
                               std::string policyName, std::string field, std::string targetField,
                               std::string matchField, bool ignoreMissing, bool overrideEnabled,
                               int maxMatches)
    : Processor(std::move(tag)), searchRunner_(std::move(searchRunner)),
      policyName_(std::move(policyName)), field_(std::move(field)),
      targetField_(std::move(targetField)), matchField_(std::move(matchField)),
      ignoreMissing_(ignoreMissing), overrideEnabled_(overrideEnabled), maxMatches_(maxMatches) {}

void MatchProcessor::execute(IngestDocument& document, Handler handler) {
    auto completion = std::make_shared<CompletionGuard>(std::move(handler));
    try {
        auto value = document.getFieldValue<std::string>(field_, ignoreMissing_);
        if (!value) {
            completion->fail(value.error());
            return;
        }
        // No lookup key: pass the document through unchanged
        if (!value.value()) {
            completion->succeed(document);
            return;
        }

        auto request =
            search::buildMatchRequest(policyName_, matchField_, *value.value(), maxMatches_);

        auto continued = std::make_shared<std::atomic<bool>>(false);
        searchRunner_(std::move(request), [completion, continued, &document,
                                           targetField = targetField_,
                                           overrideEnabled = overrideEnabled_,
                                           maxMatches = maxMatches_](
                                              Result<search::SearchResponse> response) {
            if (continued->exchange(true)) {
                throw std::logic_error("search callback invoked more than once");
            }
            try {
                if (!response) {
                    completion->fail(response.error());
                    return;
                }
                const auto& hits = response.value().hits;
                if (hits.empty()) {
                    completion->succeed(document);
                    return;
                }
                if (overrideEnabled || !document.hasField(targetField)) {
                    const auto limit =
                        std::min(hits.size(), static_cast<std::size_t>(std::max(maxMatches, 0)));
                    auto matches = nlohmann::json::array();
                    for (std::size_t i = 0; i < limit; ++i) {
                        matches.push_back(hits[i].source);
                    }
                    if (auto set = document.setFieldValue(targetField, std::move(matches)); !set) {
                        completion->fail(set.error());
                        return;
                    }
                }
                completion->succeed(document);
            } catch (const std::exception& e) {
                if (completion->consumed()) {
                    throw;
                }
                completion->fail(Error{ErrorCode::InternalError, e.what()});
            } catch (...) {
                if (completion->consumed()) {
                    throw;
                }
                completion->fail(Error{ErrorCode::InternalError, "unknown exception"});
            }
        });
    } catch (const std::exception& e) {
        if (completion->consumed()) {
            throw;
        }
        completion->fail(Error{ErrorCode::InternalError, e.what()});
    } catch (...) {
        if (completion->consumed()) {
            throw;
        }
        completion->fail(Error{ErrorCode::InternalError, "unknown exception"});
    }
}

Result<void> MatchProcessor::execute(IngestDocument&) {
    return Error{ErrorCode::NotSupported, "enrich processor only runs asynchronously"};
}

} // namespace enrich::ingest
