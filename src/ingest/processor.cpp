#include <enrich/ingest/processor.h>

#include <stdexcept>

namespace enrich::ingest {

void CompletionGuard::claim() {
    if (consumed_.exchange(true, std::memory_order_acq_rel)) {
        throw std::logic_error("processor completion handler invoked more than once");
    }
}

void CompletionGuard::succeed(IngestDocument& document) {
    claim();
    handler_(&document, std::nullopt);
}

void CompletionGuard::fail(Error error) {
    claim();
    handler_(nullptr, std::move(error));
}

} // namespace enrich::ingest
