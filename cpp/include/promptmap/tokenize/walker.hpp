#pragma once

#include "promptmap/tokenize/registry.hpp"
#include "promptmap/tokenize/token_cache.hpp"
#include "promptmap/types.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace promptmap::tokenize {

struct WalkerTuning {
    std::chrono::milliseconds batch_interval{16};

    static WalkerTuning from_config();
};

// =============================================================================
// Event stream
// =============================================================================

struct TokenizeProgress {
    size_t processed = 0;
    size_t total = 0;
};

struct TokenizePartial {
    std::vector<TokenUpdate> updates;
};

// total_tokens is advisory; the cache stays the source of truth
struct TokenizeDone {
    std::string model_id;
    uint64_t total_tokens = 0;
    bool approximate = false;  // some node was counted from its character count
};

struct TokenizeFailure {
    std::string message;
};

using TokenizeEvent = std::variant<TokenizeProgress, TokenizePartial, TokenizeDone, TokenizeFailure>;
using TokenizeSink = std::function<void(const TokenizeEvent&)>;

/**
 * Breadth-first token counting over a parsed tree.
 *
 * Every visited node yields one TokenUpdate, cache hit or not. Updates are
 * flushed as a batch once per batch window and at the end, each flush
 * followed by a progress event; after a mid-walk flush the thread yields
 * once. Emits exactly one TokenizeDone or TokenizeFailure.
 */
class TokenizationWalker {
public:
    explicit TokenizationWalker(AdapterRegistry& registry, WalkerTuning tuning = WalkerTuning{});

    void run(const ParsedNodePtr& root, const std::string& model_id, const TokenizeSink& sink);

private:
    void walk(const ParsedNode& root, const std::string& model_id, const TokenizeSink& sink);

    AdapterRegistry& registry_;
    WalkerTuning tuning_;
};

} // namespace promptmap::tokenize
