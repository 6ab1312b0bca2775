#include "promptmap/tokenize/walker.hpp"
#include "promptmap/config.hpp"
#include "promptmap/error.hpp"
#include "promptmap/logging.hpp"

#include <deque>
#include <thread>

namespace promptmap::tokenize {

WalkerTuning WalkerTuning::from_config() {
    WalkerTuning tuning;
    int ms = Config::getInstance().get<int>("tokenizer.batch_interval_ms",
                                            static_cast<int>(tuning.batch_interval.count()));
    if (ms >= 0) {
        tuning.batch_interval = std::chrono::milliseconds(ms);
    }
    return tuning;
}

TokenizationWalker::TokenizationWalker(AdapterRegistry& registry, WalkerTuning tuning)
    : registry_(registry)
    , tuning_(tuning) {}

void TokenizationWalker::run(const ParsedNodePtr& root, const std::string& model_id,
                             const TokenizeSink& sink) {
    if (!root) {
        sink(TokenizeFailure{"No document to tokenize"});
        return;
    }

    try {
        walk(*root, model_id, sink);
    } catch (const PromptmapException& e) {
        LOG_WARN("Tokenization for '", model_id, "' failed: ", e.message());
        sink(TokenizeFailure{e.message()});
    } catch (const std::exception& e) {
        LOG_ERROR("Tokenization for '", model_id, "' aborted: ", e.what());
        sink(TokenizeFailure{e.what()});
    }
}

void TokenizationWalker::walk(const ParsedNode& root, const std::string& model_id,
                              const TokenizeSink& sink) {
    using Clock = std::chrono::steady_clock;

    TokenizerAdapter& adapter = registry_.adapter_for_model(model_id);
    adapter.ensure_ready();
    if (!adapter.is_exact()) {
        LOG_DEBUG("Model '", model_id, "' uses the ", family_to_string(adapter.family()),
                  " character heuristic");
    }

    const size_t total = count_nodes(root);
    size_t processed = 0;
    uint64_t total_tokens = 0;
    bool any_approximate = false;

    std::vector<TokenUpdate> batch;
    auto last_flush = Clock::now();

    auto flush = [&](bool force) {
        auto now = Clock::now();
        if (!force && now - last_flush < tuning_.batch_interval) return false;
        if (!batch.empty()) {
            TokenizePartial partial;
            partial.updates.swap(batch);
            sink(partial);
        }
        sink(TokenizeProgress{processed, total});
        last_flush = now;
        return true;
    };

    std::deque<const ParsedNode*> queue{&root};
    while (!queue.empty()) {
        const ParsedNode* node = queue.front();
        queue.pop_front();

        for (const auto& child : node->children) {
            queue.push_back(child.get());
        }

        CountRequest request;
        request.hash = node->hash;
        request.model_id = model_id;
        if (node->text) request.text = std::string_view(*node->text);
        request.allow_approx = !node->text.has_value();
        request.char_count = node->char_count;

        TokenLookup lookup = adapter.get_or_count(request);
        uint64_t tokens = lookup.value_or_zero();

        batch.push_back(TokenUpdate{node->id(), node->hash, tokens, lookup.approximate});
        any_approximate = any_approximate || lookup.approximate;

        ++processed;
        total_tokens += tokens;

        if (flush(false)) {
            std::this_thread::yield();
        }
    }

    flush(true);

    LOG_DEBUG("Tokenized ", processed, " nodes for '", model_id, "': ", total_tokens, " tokens",
              any_approximate ? " (partly approximate)" : "", ", cache holds ", adapter.cache().size());

    sink(TokenizeDone{model_id, total_tokens, any_approximate});
}

} // namespace promptmap::tokenize
