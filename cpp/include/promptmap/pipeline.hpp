#pragma once

#include "promptmap/parse/events.hpp"
#include "promptmap/tokenize/registry.hpp"
#include "promptmap/tokenize/walker.hpp"
#include "promptmap/worker.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace promptmap {

using RequestId = uint64_t;

// Events arrive on the stage's worker thread, tagged with the request they belong to
using ParseRequestSink = std::function<void(RequestId, const parse::ParseEvent&)>;
using TokenizeRequestSink = std::function<void(RequestId, const tokenize::TokenizeEvent&)>;

/**
 * Orchestrates parse and tokenize requests on two background workers.
 *
 * Owns the adapter registry, so every tokenize request sees the same
 * per-family caches. Request ids are unique and increasing across both
 * stages; a caller that issues a newer request simply ignores events
 * carrying an older id. The transformer is not part of the pipeline:
 * callers run it synchronously against their own cache.
 */
class Pipeline {
public:
    explicit Pipeline(std::unique_ptr<tokenize::AdapterRegistry> registry,
                      parse::ParserTuning parser_tuning = parse::ParserTuning{},
                      tokenize::WalkerTuning walker_tuning = tokenize::WalkerTuning{});

    // Registry, parser and walker tuning from the configuration
    static std::unique_ptr<Pipeline> from_config();

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    RequestId submit_parse(std::string text, parse::ParseOptions options, ParseRequestSink sink);

    RequestId submit_tokenize(ParsedNodePtr root, std::string model_id, TokenizeRequestSink sink);

    // Block until both workers are idle
    void wait_idle();

    // Adapters are used from the tokenize worker; do not replace them while
    // requests are in flight
    tokenize::AdapterRegistry& registry() noexcept { return *registry_; }

private:
    std::atomic<RequestId> next_id_{1};
    std::unique_ptr<tokenize::AdapterRegistry> registry_;
    parse::ParserTuning parser_tuning_;
    tokenize::WalkerTuning walker_tuning_;

    // Declared after the registry: destroyed (drained and joined) first
    BackgroundWorker parse_worker_{"parse"};
    BackgroundWorker tokenize_worker_{"tokenize"};
};

} // namespace promptmap
