#include <enrich/policy/enrich_policy.h>
#include <enrich/search/search_request.h>

namespace enrich::search {

nlohmann::json SearchRequest::toJson() const {
    nlohmann::json term = nlohmann::json::object();
    term[source.query.filter.field] = {{"value", source.query.filter.value}};

    nlohmann::json body = {
        {"from", source.from},
        {"size", source.size},
        {"track_scores", source.trackScores},
        {"_source", source.fetchSource},
        {"query",
         {{"constant_score", {{"filter", {{"term", term}}}, {"boost", source.query.boost}}}}}};

    nlohmann::json out = {{"indices", indices}, {"body", body}};
    if (!preference.empty()) {
        out["preference"] = preference;
    }
    return out;
}

SearchRequest buildMatchRequest(std::string_view policyName, std::string_view matchField,
                                std::string_view value, int maxMatches) {
    SearchRequest request;
    request.indices.push_back(policy::getBaseName(policyName));
    request.preference = std::string(kPreferenceLocal);

    request.source.from = 0;
    request.source.size = static_cast<std::size_t>(maxMatches);
    request.source.trackScores = false;
    request.source.fetchSource = true;
    request.source.query.filter.field = std::string(matchField);
    request.source.query.filter.value = std::string(value);
    return request;
}

} // namespace enrich::search
