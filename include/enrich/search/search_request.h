#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace enrich::search {

// Routing hint asking the runner to prefer a co-located copy of the index.
inline constexpr std::string_view kPreferenceLocal = "_local";

/**
 * @brief Exact match of a keyword field against a single value.
 */
struct TermQuery {
    std::string field;
    std::string value;

    bool operator==(const TermQuery&) const = default;
};

/**
 * @brief Wraps a filter so every match scores the same (boolean match, no ranking).
 */
struct ConstantScoreQuery {
    TermQuery filter;
    float boost = 1.0f;

    bool operator==(const ConstantScoreQuery&) const = default;
};

struct SearchSource {
    std::size_t from = 0;
    std::size_t size = 10;
    bool trackScores = false;
    bool fetchSource = true;
    ConstantScoreQuery query;

    bool operator==(const SearchSource&) const = default;
};

/**
 * @brief Query descriptor handed to a SearchRunner.
 */
struct SearchRequest {
    std::vector<std::string> indices;
    std::string preference;
    SearchSource source;

    // Search DSL rendering, used for logging and debugging.
    nlohmann::json toJson() const;

    bool operator==(const SearchRequest&) const = default;
};

/**
 * @brief Build the lookup issued by a match processor.
 *
 * Targets the reference index of @p policyName, filters on matchField == value without
 * scoring, pages from offset 0 with at most @p maxMatches hits and asks for full sources.
 */
SearchRequest buildMatchRequest(std::string_view policyName, std::string_view matchField,
                                std::string_view value, int maxMatches);

} // namespace enrich::search
