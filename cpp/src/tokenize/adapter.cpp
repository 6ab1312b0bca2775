#include "promptmap/tokenize/adapter.hpp"
#include "promptmap/util/utf8.hpp"
#include "promptmap/error.hpp"
#include "promptmap/logging.hpp"

namespace promptmap::tokenize {

uint64_t approximate_tokens(uint64_t chars, uint64_t chars_per_token) noexcept {
    if (chars == 0) return 0;
    if (chars_per_token == 0) chars_per_token = 1;
    return (chars + chars_per_token - 1) / chars_per_token;
}

PretokenizerStyle pretokenizer_for(TokenizerFamily family) noexcept {
    return family == TokenizerFamily::O200kBase ? PretokenizerStyle::O200k : PretokenizerStyle::Cl100k;
}

// =============================================================================
// BaseAdapter
// =============================================================================

uint64_t BaseAdapter::approximate_from_chars(uint64_t chars) const {
    return approximate_tokens(chars, 4);
}

std::optional<uint64_t> BaseAdapter::cache_get(const ContentHash& hash, std::string_view model_id) const {
    return cache_.get(hash, model_id);
}

void BaseAdapter::cache_set(const ContentHash& hash, std::string_view model_id, uint64_t tokens) {
    cache_.insert(hash, model_id, tokens);
}

TokenLookup BaseAdapter::get_or_count(const CountRequest& request) {
    if (auto cached = cache_get(request.hash, request.model_id)) {
        return {cached, false};
    }

    if (request.text) {
        uint64_t tokens = count_text(*request.text);
        cache_set(request.hash, request.model_id, tokens);
        return {tokens, false};
    }

    if (request.allow_approx && request.char_count) {
        return {approximate_from_chars(*request.char_count), true};
    }

    return {};
}

// =============================================================================
// HeuristicAdapter
// =============================================================================

HeuristicAdapter::HeuristicAdapter(TokenizerFamily family, uint64_t chars_per_token)
    : BaseAdapter(family)
    , chars_per_token_(chars_per_token == 0 ? 4 : chars_per_token) {}

uint64_t HeuristicAdapter::count_text(std::string_view text) {
    return approximate_tokens(util::count_codepoints(text), chars_per_token_);
}

uint64_t HeuristicAdapter::approximate_from_chars(uint64_t chars) const {
    return approximate_tokens(chars, chars_per_token_);
}

// =============================================================================
// BpeAdapter
// =============================================================================

BpeAdapter::BpeAdapter(TokenizerFamily family, std::filesystem::path vocab_dir)
    : BaseAdapter(family)
    , vocab_dir_(std::move(vocab_dir)) {}

BpeAdapter::BpeAdapter(TokenizerFamily family, BpeEncoder encoder)
    : BaseAdapter(family)
    , encoder_(std::make_unique<BpeEncoder>(std::move(encoder))) {}

std::filesystem::path BpeAdapter::vocab_path() const {
    return vocab_dir_ / (std::string(family_to_string(family())) + ".tiktoken");
}

void BpeAdapter::ensure_ready() {
    std::lock_guard<std::mutex> lock(load_mutex_);
    if (encoder_) return;

    if (vocab_dir_.empty()) {
        throw TokenizerUnavailableError(
            std::string("No vocabulary directory configured for ") + family_to_string(family()),
            "", "Set tokenizer.vocab_dir or PM_VOCAB_DIR");
    }

    encoder_ = std::make_unique<BpeEncoder>(
        BpeEncoder::load_tiktoken_file(vocab_path(), pretokenizer_for(family())));
}

uint64_t BpeAdapter::count_text(std::string_view text) {
    ensure_ready();
    return encoder_->count(text);
}

} // namespace promptmap::tokenize
