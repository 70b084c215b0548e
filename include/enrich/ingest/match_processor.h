#pragma once

#include <enrich/ingest/processor.h>
#include <enrich/search/search_runner.h>

#include <string>
#include <string_view>

namespace enrich::ingest {

/**
 * @brief Enriches a document with the reference records whose match field equals one of its
 * field values.
 *
 * The value at field() is looked up in the policy's reference index with an unscored exact
 * match capped at maxMatches() hits. Hits are written to targetField() as a list, in response
 * order, unless the target already exists and override is disabled. A missing key or an empty
 * result leaves the document untouched.
 */
class MatchProcessor final : public Processor {
public:
    static constexpr std::string_view kType = "enrich";

    MatchProcessor(std::string tag, search::SearchRunner searchRunner, std::string policyName,
                   std::string field, std::string targetField, std::string matchField,
                   bool ignoreMissing, bool overrideEnabled, int maxMatches);

    void execute(IngestDocument& document, Handler handler) override;

    Result<void> execute(IngestDocument& document) override;

    std::string_view type() const override { return kType; }

    const std::string& policyName() const { return policyName_; }
    const std::string& field() const { return field_; }
    const std::string& targetField() const { return targetField_; }
    const std::string& matchField() const { return matchField_; }
    bool ignoreMissing() const { return ignoreMissing_; }
    bool overrideEnabled() const { return overrideEnabled_; }
    int maxMatches() const { return maxMatches_; }

private:
    search::SearchRunner searchRunner_;
    std::string policyName_;
    std::string field_;
    std::string targetField_;
    std::string matchField_;
    bool ignoreMissing_;
    bool overrideEnabled_;
    int maxMatches_;
};

} // namespace enrich::ingest
