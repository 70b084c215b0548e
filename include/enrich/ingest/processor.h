#pragma once

#include <enrich/core/types.h>
#include <enrich/ingest/ingest_document.h>

#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace enrich::ingest {

/**
 * @brief One step of an ingest pipeline.
 *
 * The asynchronous execute() reports through the handler: (document, nullopt) on success or
 * (nullptr, error) on failure, exactly once per call.
 */
class Processor {
public:
    using Handler = std::function<void(IngestDocument*, std::optional<Error>)>;

    explicit Processor(std::string tag) : tag_(std::move(tag)) {}
    virtual ~Processor() = default;

    virtual void execute(IngestDocument& document, Handler handler) = 0;

    // Synchronous form; processors that can only run asynchronously return NotSupported.
    virtual Result<void> execute(IngestDocument& document) = 0;

    virtual std::string_view type() const = 0;

    const std::string& tag() const { return tag_; }

private:
    std::string tag_;
};

/**
 * @brief One-shot completion of a Processor::Handler.
 *
 * A second completion is a programming error and throws std::logic_error without reaching
 * the handler.
 */
class CompletionGuard {
public:
    explicit CompletionGuard(Processor::Handler handler) : handler_(std::move(handler)) {}

    CompletionGuard(const CompletionGuard&) = delete;
    CompletionGuard& operator=(const CompletionGuard&) = delete;

    void succeed(IngestDocument& document);
    void fail(Error error);

    bool consumed() const noexcept { return consumed_.load(std::memory_order_acquire); }

private:
    void claim();

    Processor::Handler handler_;
    std::atomic<bool> consumed_{false};
};

} // namespace enrich::ingest
