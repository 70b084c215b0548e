#include <enrich/ingest/ingest_document.h>
#include <enrich/policy/enrich_policy.h>
#include <enrich/search/reference_index.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <mutex>

namespace enrich::search {

bool termMatches(const nlohmann::json& fieldValue, std::string_view value) {
    if (fieldValue.is_string()) {
        return fieldValue.get_ref<const std::string&>() == value;
    }
    if (fieldValue.is_array()) {
        for (const auto& element : fieldValue) {
            if (!element.is_array() && termMatches(element, value)) {
                return true;
            }
        }
        return false;
    }
    if (fieldValue.is_number() || fieldValue.is_boolean()) {
        return fieldValue.dump() == value;
    }
    return false;
}

void ReferenceIndexStore::putIndex(std::string name, Records records) {
    auto snapshot = std::make_shared<const Records>(std::move(records));
    std::unique_lock lock(mutex_);
    spdlog::debug("ReferenceIndexStore: index [{}] now holds {} records", name, snapshot->size());
    indices_.insert_or_assign(std::move(name), std::move(snapshot));
}

bool ReferenceIndexStore::removeIndex(std::string_view name) {
    std::unique_lock lock(mutex_);
    auto it = indices_.find(name);
    if (it == indices_.end()) {
        return false;
    }
    indices_.erase(it);
    return true;
}

bool ReferenceIndexStore::hasIndex(std::string_view name) const {
    std::shared_lock lock(mutex_);
    return indices_.find(name) != indices_.end();
}

std::vector<std::string> ReferenceIndexStore::indexNames() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> names;
    names.reserve(indices_.size());
    for (const auto& [name, _] : indices_) {
        names.push_back(name);
    }
    return names;
}

std::shared_ptr<const ReferenceIndexStore::Records>
ReferenceIndexStore::snapshot(std::string_view name) const {
    std::shared_lock lock(mutex_);
    auto it = indices_.find(name);
    return it == indices_.end() ? nullptr : it->second;
}

Result<size_t> ReferenceIndexStore::loadPolicyData(const nlohmann::json& data) {
    if (!data.is_object()) {
        return Error{ErrorCode::InvalidData,
                     "reference data must be a JSON object keyed by policy"};
    }
    size_t total = 0;
    for (auto it = data.begin(); it != data.end(); ++it) {
        if (auto valid = policy::validatePolicyName(it.key()); !valid) {
            return valid.error();
        }
        if (!it.value().is_array()) {
            return Error{ErrorCode::InvalidData,
                         "reference data for policy [" + it.key() + "] must be a list"};
        }
        Records records;
        records.reserve(it.value().size());
        for (const auto& record : it.value()) {
            if (!record.is_object()) {
                return Error{ErrorCode::InvalidData, "reference data for policy [" + it.key() +
                                                         "] must only hold objects"};
            }
            records.push_back(record);
        }
        total += records.size();
        putIndex(policy::getBaseName(it.key()), std::move(records));
    }
    return total;
}

Result<SearchResponse> ReferenceIndexStore::search(const SearchRequest& request) const {
    const auto started = std::chrono::steady_clock::now();
    if (request.indices.empty()) {
        return Error{ErrorCode::InvalidArgument, "search request does not name any index"};
    }

    const auto& term = request.source.query.filter;
    SearchResponse response;
    for (const auto& name : request.indices) {
        auto records = snapshot(name);
        if (!records) {
            return Error{ErrorCode::NotFound, "no such index [" + name + "]"};
        }
        for (size_t i = 0; i < records->size(); ++i) {
            const auto& record = (*records)[i];
            const nlohmann::json* field = ingest::findField(record, term.field);
            if (field == nullptr || !termMatches(*field, term.value)) {
                continue;
            }
            const auto position = response.totalHits++;
            if (position < request.source.from || response.hits.size() >= request.source.size) {
                continue;
            }
            SearchHit hit;
            hit.index = name;
            hit.id = std::to_string(i);
            if (request.source.fetchSource) {
                hit.source = record;
            }
            response.hits.push_back(std::move(hit));
        }
    }

    response.took = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    spdlog::trace("ReferenceIndexStore: {}={} matched {} record(s)", term.field, term.value,
                  response.totalHits);
    return response;
}

} // namespace enrich::search
