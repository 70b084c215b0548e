#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <memory>
#include <stdexcept>
#include <vector>

#include <boost/asio/thread_pool.hpp>

#include <common/stub_search_runner.h>
#include <enrich/ingest/match_processor.h>
#include <enrich/policy/enrich_policy.h>
#include <enrich/search/reference_index.h>

using enrich::Error;
using enrich::ErrorCode;
using enrich::ingest::IngestDocument;
using enrich::ingest::MatchProcessor;
using enrich::test::responseWith;
using enrich::test::StubSearchRunner;
using testing::_;
using testing::IsNull;
using testing::MockFunction;
using testing::SaveArg;

namespace {

MATCHER(NoError, "completes without an error") {
    return !arg.has_value();
}

MATCHER_P(HasErrorCode, code, "completes with the given error code") {
    return arg.has_value() && arg->code == code;
}

struct ProcessorOptions {
    bool ignoreMissing = false;
    bool overrideEnabled = true;
    int maxMatches = 1;
    std::string field = "email";
    std::string targetField = "user";
};

class MatchProcessorTest : public ::testing::Test {
protected:
    MatchProcessor makeProcessor(const ProcessorOptions& options = {}) {
        return MatchProcessor("tag", stub_.runner(), "users", options.field, options.targetField,
                              "email", options.ignoreMissing, options.overrideEnabled,
                              options.maxMatches);
    }

    StubSearchRunner stub_;
    MockFunction<void(IngestDocument*, std::optional<Error>)> done_;
};

TEST_F(MatchProcessorTest, MissingFieldWithIgnoreMissingPassesDocumentThrough) {
    auto processor = makeProcessor({.ignoreMissing = true});
    IngestDocument document(nlohmann::json{{"name", "x"}});
    const IngestDocument original = document;

    EXPECT_CALL(done_, Call(&document, NoError())).Times(1);
    processor.execute(document, done_.AsStdFunction());

    EXPECT_TRUE(stub_.requests.empty());
    EXPECT_EQ(document, original);
}

TEST_F(MatchProcessorTest, MissingFieldWithoutIgnoreMissingFails) {
    auto processor = makeProcessor();
    IngestDocument document(nlohmann::json{{"name", "x"}});

    std::optional<Error> error;
    EXPECT_CALL(done_, Call(IsNull(), HasErrorCode(ErrorCode::FieldNotFound)))
        .WillOnce(SaveArg<1>(&error));
    processor.execute(document, done_.AsStdFunction());

    EXPECT_TRUE(stub_.requests.empty());
    ASSERT_TRUE(error.has_value());
    EXPECT_NE(error->message.find("email"), std::string::npos);
}

TEST_F(MatchProcessorTest, NonStringFieldFailsWithTypeMismatch) {
    auto processor = makeProcessor({.ignoreMissing = true});
    IngestDocument document(nlohmann::json{{"email", 42}});

    EXPECT_CALL(done_, Call(IsNull(), HasErrorCode(ErrorCode::FieldTypeMismatch))).Times(1);
    processor.execute(document, done_.AsStdFunction());

    EXPECT_TRUE(stub_.requests.empty());
}

TEST_F(MatchProcessorTest, NullFieldIsTreatedAsAbsent) {
    auto processor = makeProcessor();
    IngestDocument document(nlohmann::json{{"email", nullptr}});
    const IngestDocument original = document;

    EXPECT_CALL(done_, Call(&document, NoError())).Times(1);
    processor.execute(document, done_.AsStdFunction());

    EXPECT_TRUE(stub_.requests.empty());
    EXPECT_EQ(document, original);
}

TEST_F(MatchProcessorTest, MalformedFieldPathIsReportedThroughHandler) {
    auto processor = makeProcessor({.field = "a..b"});
    IngestDocument document(nlohmann::json{{"a", {{"b", "x"}}}});

    EXPECT_CALL(done_, Call(IsNull(), HasErrorCode(ErrorCode::InvalidArgument))).Times(1);
    EXPECT_NO_THROW(processor.execute(document, done_.AsStdFunction()));
}

TEST_F(MatchProcessorTest, DispatchesUnscoredExactMatchRequest) {
    auto processor = makeProcessor({.maxMatches = 7});
    IngestDocument document(nlohmann::json{{"email", "a@example.com"}});

    processor.execute(document, done_.AsStdFunction());

    ASSERT_EQ(stub_.requests.size(), 1u);
    const auto& request = stub_.requests.front();
    ASSERT_EQ(request.indices.size(), 1u);
    EXPECT_EQ(request.indices.front(), enrich::policy::getBaseName("users"));
    EXPECT_EQ(request.preference, "_local");
    EXPECT_EQ(request.source.from, 0u);
    EXPECT_EQ(request.source.size, 7u);
    EXPECT_FALSE(request.source.trackScores);
    EXPECT_TRUE(request.source.fetchSource);
    EXPECT_EQ(request.source.query.filter.field, "email");
    EXPECT_EQ(request.source.query.filter.value, "a@example.com");

    EXPECT_CALL(done_, Call(&document, NoError())).Times(1);
    stub_.completeLast(responseWith({}));
}

TEST_F(MatchProcessorTest, HandlerWaitsForSearchToComplete) {
    auto processor = makeProcessor();
    IngestDocument document(nlohmann::json{{"email", "a@example.com"}});

    EXPECT_CALL(done_, Call(_, _)).Times(0);
    processor.execute(document, done_.AsStdFunction());
    testing::Mock::VerifyAndClearExpectations(&done_);

    EXPECT_CALL(done_, Call(&document, NoError())).Times(1);
    stub_.completeLast(responseWith({{{"email", "a@example.com"}}}));
}

TEST_F(MatchProcessorTest, EmptyResultLeavesDocumentUnchanged) {
    for (bool overrideEnabled : {true, false}) {
        auto processor = makeProcessor({.overrideEnabled = overrideEnabled});
        IngestDocument document(nlohmann::json{{"email", "nobody@example.com"}});
        const IngestDocument original = document;

        EXPECT_CALL(done_, Call(&document, NoError())).Times(1);
        processor.execute(document, done_.AsStdFunction());
        stub_.completeLast(responseWith({}));
        testing::Mock::VerifyAndClearExpectations(&done_);

        EXPECT_EQ(document, original);
        EXPECT_FALSE(document.hasField("user"));
    }
}

TEST_F(MatchProcessorTest, SingleMatchIsWrittenAsList) {
    auto processor = makeProcessor({.maxMatches = 3});
    IngestDocument document(nlohmann::json{{"email", "X"}});

    EXPECT_CALL(done_, Call(&document, NoError())).Times(1);
    processor.execute(document, done_.AsStdFunction());
    stub_.completeLast(responseWith({{{"a", 1}}}));

    EXPECT_EQ(document.source()["user"], nlohmann::json::parse(R"([{"a":1}])"));
}

TEST_F(MatchProcessorTest, MatchesAreWrittenInResponseOrder) {
    auto processor = makeProcessor({.maxMatches = 3});
    IngestDocument document(nlohmann::json{{"email", "X"}});

    EXPECT_CALL(done_, Call(&document, NoError())).Times(1);
    processor.execute(document, done_.AsStdFunction());
    stub_.completeLast(responseWith({{{"id", 3}}, {{"id", 1}}, {{"id", 2}}}));

    const auto& user = document.source()["user"];
    ASSERT_TRUE(user.is_array());
    ASSERT_EQ(user.size(), 3u);
    EXPECT_EQ(user[0]["id"], 3);
    EXPECT_EQ(user[1]["id"], 1);
    EXPECT_EQ(user[2]["id"], 2);
}

TEST_F(MatchProcessorTest, NestedTargetFieldIsCreated) {
    auto processor = makeProcessor({.targetField = "enriched.user"});
    IngestDocument document(nlohmann::json{{"email", "X"}});

    EXPECT_CALL(done_, Call(&document, NoError())).Times(1);
    processor.execute(document, done_.AsStdFunction());
    stub_.completeLast(responseWith({{{"name", "x"}}}));

    auto value = document.getFieldValue<nlohmann::json>("enriched.user.0.name");
    ASSERT_TRUE(value);
    ASSERT_TRUE(value.value().has_value());
    EXPECT_EQ(*value.value(), "x");
}

TEST_F(MatchProcessorTest, OverrideDisabledKeepsExistingTarget) {
    auto processor = makeProcessor({.overrideEnabled = false, .maxMatches = 2});
    IngestDocument document(
        nlohmann::json{{"email", "X"}, {"user", {{"kept", true}, {"n", {1, 2}}}}});
    const auto before = document.source()["user"].dump();

    EXPECT_CALL(done_, Call(&document, NoError())).Times(1);
    processor.execute(document, done_.AsStdFunction());
    stub_.completeLast(responseWith({{{"a", 1}}, {{"a", 2}}}));

    EXPECT_EQ(document.source()["user"].dump(), before);
}

TEST_F(MatchProcessorTest, OverrideDisabledWritesAbsentTarget) {
    auto processor = makeProcessor({.overrideEnabled = false});
    IngestDocument document(nlohmann::json{{"email", "X"}});

    EXPECT_CALL(done_, Call(&document, NoError())).Times(1);
    processor.execute(document, done_.AsStdFunction());
    stub_.completeLast(responseWith({{{"a", 1}}}));

    EXPECT_EQ(document.source()["user"], nlohmann::json::parse(R"([{"a":1}])"));
}

TEST_F(MatchProcessorTest, OverrideEnabledReplacesExistingTarget) {
    auto processor = makeProcessor();
    IngestDocument document(nlohmann::json{{"email", "X"}, {"user", "old"}});

    EXPECT_CALL(done_, Call(&document, NoError())).Times(1);
    processor.execute(document, done_.AsStdFunction());
    stub_.completeLast(responseWith({{{"a", 1}}}));

    EXPECT_EQ(document.source()["user"], nlohmann::json::parse(R"([{"a":1}])"));
}

TEST_F(MatchProcessorTest, ExtraHitsFromBackendAreCapped) {
    auto processor = makeProcessor({.maxMatches = 2});
    IngestDocument document(nlohmann::json{{"email", "X"}});

    EXPECT_CALL(done_, Call(&document, NoError())).Times(1);
    processor.execute(document, done_.AsStdFunction());
    stub_.completeLast(responseWith({{{"i", 0}}, {{"i", 1}}, {{"i", 2}}, {{"i", 3}}}));

    const auto& user = document.source()["user"];
    ASSERT_EQ(user.size(), 2u);
    EXPECT_EQ(user[0]["i"], 0);
    EXPECT_EQ(user[1]["i"], 1);
}

TEST_F(MatchProcessorTest, SearchErrorIsForwardedUnmodified) {
    auto processor = makeProcessor();
    IngestDocument document(nlohmann::json{{"email", "X"}});
    const IngestDocument original = document;

    std::optional<Error> error;
    EXPECT_CALL(done_, Call(IsNull(), HasErrorCode(ErrorCode::Timeout)))
        .WillOnce(SaveArg<1>(&error));
    processor.execute(document, done_.AsStdFunction());
    stub_.completeLast(Error{ErrorCode::Timeout, "search timed out after 30s"});

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->message, "search timed out after 30s");
    EXPECT_EQ(document, original);
}

TEST_F(MatchProcessorTest, TargetWriteFailureIsReported) {
    auto processor = makeProcessor({.targetField = "email.user"});
    IngestDocument document(nlohmann::json{{"email", "X"}});

    EXPECT_CALL(done_, Call(IsNull(), HasErrorCode(ErrorCode::InvalidArgument))).Times(1);
    processor.execute(document, done_.AsStdFunction());
    stub_.completeLast(responseWith({{{"a", 1}}}));
}

TEST_F(MatchProcessorTest, RunnerThrowingBeforeCallbackIsReportedThroughHandler) {
    MatchProcessor processor(
        "tag",
        [](enrich::search::SearchRequest, enrich::search::SearchCallback) {
            throw std::runtime_error("connection refused");
        },
        "users", "email", "user", "email", false, true, 1);
    IngestDocument document(nlohmann::json{{"email", "X"}});

    EXPECT_CALL(done_, Call(IsNull(), HasErrorCode(ErrorCode::InternalError))).Times(1);
    EXPECT_NO_THROW(processor.execute(document, done_.AsStdFunction()));
}

TEST_F(MatchProcessorTest, NonStandardExceptionFromRunnerIsReportedThroughHandler) {
    MatchProcessor processor(
        "tag", [](enrich::search::SearchRequest, enrich::search::SearchCallback) { throw 42; },
        "users", "email", "user", "email", false, true, 1);
    IngestDocument document(nlohmann::json{{"email", "X"}});

    EXPECT_CALL(done_, Call(IsNull(), HasErrorCode(ErrorCode::InternalError))).Times(1);
    EXPECT_NO_THROW(processor.execute(document, done_.AsStdFunction()));
}

TEST_F(MatchProcessorTest, NonStandardExceptionAfterCompletionPropagates) {
    auto processor = makeProcessor();
    IngestDocument document(nlohmann::json{{"email", "X"}});

    EXPECT_CALL(done_, Call(&document, NoError()))
        .WillOnce([](IngestDocument*, std::optional<Error>) { throw 7; });
    processor.execute(document, done_.AsStdFunction());
    EXPECT_THROW(stub_.completeLast(responseWith({{{"a", 1}}})), int);
}

TEST_F(MatchProcessorTest, SecondSearchCallbackIsAProgrammingError) {
    auto processor = makeProcessor();
    IngestDocument document(nlohmann::json{{"email", "X"}});

    EXPECT_CALL(done_, Call(&document, NoError())).Times(1);
    processor.execute(document, done_.AsStdFunction());
    stub_.completeLast(responseWith({{{"a", 1}}}));

    EXPECT_THROW(stub_.completeLast(responseWith({{{"a", 2}}})), std::logic_error);
    EXPECT_EQ(document.source()["user"], nlohmann::json::parse(R"([{"a":1}])"));
}

TEST_F(MatchProcessorTest, SynchronousExecuteIsNotSupported) {
    auto processor = makeProcessor();
    IngestDocument document(nlohmann::json{{"email", "X"}});

    auto result = processor.execute(document);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::NotSupported);
    EXPECT_TRUE(stub_.requests.empty());
}

TEST_F(MatchProcessorTest, IdenticalDocumentsProduceIdenticalOutput) {
    auto processor = makeProcessor({.maxMatches = 2});
    const nlohmann::json input = {{"email", "X"}, {"other", {1, 2, 3}}};
    IngestDocument first(input);
    IngestDocument second(input);

    EXPECT_CALL(done_, Call(_, NoError())).Times(2);
    processor.execute(first, done_.AsStdFunction());
    processor.execute(second, done_.AsStdFunction());
    stub_.complete(0, responseWith({{{"a", 1}}, {{"b", 2}}}));
    stub_.complete(1, responseWith({{{"a", 1}}, {{"b", 2}}}));

    EXPECT_EQ(first, second);
}

TEST_F(MatchProcessorTest, ExposesConfiguration) {
    auto processor = makeProcessor({.ignoreMissing = true, .overrideEnabled = false,
                                    .maxMatches = 5, .field = "src", .targetField = "dst"});
    EXPECT_EQ(processor.type(), "enrich");
    EXPECT_EQ(processor.tag(), "tag");
    EXPECT_EQ(processor.policyName(), "users");
    EXPECT_EQ(processor.field(), "src");
    EXPECT_EQ(processor.targetField(), "dst");
    EXPECT_EQ(processor.matchField(), "email");
    EXPECT_TRUE(processor.ignoreMissing());
    EXPECT_FALSE(processor.overrideEnabled());
    EXPECT_EQ(processor.maxMatches(), 5);
}

TEST(MatchProcessorAsyncTest, ConcurrentDocumentsEachCompleteOnce) {
    auto store = std::make_shared<enrich::search::ReferenceIndexStore>();
    store->putIndex(enrich::policy::getBaseName("users"),
                    {{{"email", "a@example.com"}, {"name", "A"}},
                     {{"email", "b@example.com"}, {"name", "B"}}});

    boost::asio::thread_pool pool(4);
    MatchProcessor processor("tag",
                             enrich::search::makeAsyncSearchRunner(pool.get_executor(), store),
                             "users", "email", "user", "email", false, true, 1);

    constexpr int kDocuments = 64;
    std::vector<std::unique_ptr<IngestDocument>> documents;
    std::vector<std::atomic<int>> completions(kDocuments);
    std::vector<std::promise<std::optional<Error>>> promises(kDocuments);
    std::vector<std::future<std::optional<Error>>> futures;
    for (int i = 0; i < kDocuments; ++i) {
        const char* email = (i % 3 == 0) ? "a@example.com"
                            : (i % 3 == 1) ? "b@example.com"
                                           : "c@example.com";
        documents.push_back(std::make_unique<IngestDocument>(nlohmann::json{{"email", email}}));
        futures.push_back(promises[i].get_future());
    }

    for (int i = 0; i < kDocuments; ++i) {
        processor.execute(*documents[i],
                          [&, i](IngestDocument* document, std::optional<Error> error) {
                              EXPECT_EQ(document, documents[i].get());
                              if (completions[i].fetch_add(1) == 0) {
                                  promises[i].set_value(std::move(error));
                              }
                          });
    }

    for (int i = 0; i < kDocuments; ++i) {
        EXPECT_FALSE(futures[i].get().has_value());
    }
    pool.join();

    for (int i = 0; i < kDocuments; ++i) {
        EXPECT_EQ(completions[i].load(), 1);
        const auto& source = documents[i]->source();
        if (i % 3 == 2) {
            EXPECT_FALSE(source.contains("user"));
        } else {
            ASSERT_TRUE(source.contains("user"));
            EXPECT_EQ(source["user"].size(), 1u);
            EXPECT_EQ(source["user"][0]["email"], source["email"]);
        }
    }
}

TEST(MatchProcessorAsyncTest, MissingReferenceIndexSurfacesAsError) {
    auto store = std::make_shared<enrich::search::ReferenceIndexStore>();
    boost::asio::thread_pool pool(1);
    MatchProcessor processor("tag",
                             enrich::search::makeAsyncSearchRunner(pool.get_executor(), store),
                             "users", "email", "user", "email", false, true, 1);

    IngestDocument document(nlohmann::json{{"email", "a@example.com"}});
    std::promise<std::pair<IngestDocument*, std::optional<Error>>> promise;
    auto future = promise.get_future();
    processor.execute(document, [&](IngestDocument* doc, std::optional<Error> error) {
        promise.set_value({doc, std::move(error)});
    });

    auto [doc, error] = future.get();
    pool.join();
    EXPECT_EQ(doc, nullptr);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code, ErrorCode::NotFound);
}

} // namespace
