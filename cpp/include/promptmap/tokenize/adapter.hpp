#pragma once

#include "promptmap/tokenize/bpe.hpp"
#include "promptmap/tokenize/models.hpp"
#include "promptmap/tokenize/token_cache.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>

namespace promptmap::tokenize {

// Result of a count-or-fetch. An approximate value was derived from a
// character count and is never cached.
struct TokenLookup {
    std::optional<uint64_t> tokens;
    bool approximate = false;

    bool known() const noexcept { return tokens.has_value(); }
    uint64_t value_or_zero() const noexcept { return tokens.value_or(0); }
};

struct CountRequest {
    ContentHash hash;
    std::string_view model_id;
    std::optional<std::string_view> text;  // exact text when the caller has it
    bool allow_approx = false;
    std::optional<uint64_t> char_count;
};

/**
 * Token counting for one tokenizer family.
 *
 * An adapter owns its encoder and a TokenCache shared by every model of the
 * family. get_or_count() resolves in order: cache hit, exact count of the
 * supplied text (cached), approximation from a character count (not cached),
 * unknown.
 */
class TokenizerAdapter {
public:
    virtual ~TokenizerAdapter() = default;

    virtual TokenizerFamily family() const noexcept = 0;

    // false when "exact" counts are themselves a heuristic
    virtual bool is_exact() const noexcept = 0;

    // Load whatever the encoder needs; throws TokenizerUnavailableError
    virtual void ensure_ready() = 0;

    virtual uint64_t count_text(std::string_view text) = 0;
    virtual uint64_t approximate_from_chars(uint64_t chars) const = 0;

    virtual std::optional<uint64_t> cache_get(const ContentHash& hash, std::string_view model_id) const = 0;
    virtual void cache_set(const ContentHash& hash, std::string_view model_id, uint64_t tokens) = 0;

    virtual TokenLookup get_or_count(const CountRequest& request) = 0;

    virtual const TokenCache& cache() const noexcept = 0;
};

// ceil(chars / chars_per_token), at least 1 for positive input
uint64_t approximate_tokens(uint64_t chars, uint64_t chars_per_token = 4) noexcept;

/**
 * Cache handling and the default approximation policy. Subclasses provide
 * count_text() and, when they load resources, ensure_ready().
 */
class BaseAdapter : public TokenizerAdapter {
public:
    explicit BaseAdapter(TokenizerFamily family) : family_(family) {}

    TokenizerFamily family() const noexcept override { return family_; }
    void ensure_ready() override {}

    uint64_t approximate_from_chars(uint64_t chars) const override;

    std::optional<uint64_t> cache_get(const ContentHash& hash, std::string_view model_id) const override;
    void cache_set(const ContentHash& hash, std::string_view model_id, uint64_t tokens) override;

    TokenLookup get_or_count(const CountRequest& request) override;

    const TokenCache& cache() const noexcept override { return cache_; }

private:
    TokenizerFamily family_;
    TokenCache cache_;
};

// Character heuristic for families without an open tokenizer (claude, gemini, custom)
class HeuristicAdapter final : public BaseAdapter {
public:
    explicit HeuristicAdapter(TokenizerFamily family, uint64_t chars_per_token = 4);

    bool is_exact() const noexcept override { return false; }

    uint64_t count_text(std::string_view text) override;
    uint64_t approximate_from_chars(uint64_t chars) const override;

private:
    uint64_t chars_per_token_;
};

// Exact byte-level BPE (cl100k_base, o200k_base), vocabulary loaded on first use
class BpeAdapter final : public BaseAdapter {
public:
    // Reads <vocab_dir>/<family>.tiktoken lazily
    BpeAdapter(TokenizerFamily family, std::filesystem::path vocab_dir);

    // Ready-made encoder, no file access
    BpeAdapter(TokenizerFamily family, BpeEncoder encoder);

    bool is_exact() const noexcept override { return true; }

    void ensure_ready() override;
    uint64_t count_text(std::string_view text) override;

    std::filesystem::path vocab_path() const;

private:
    std::filesystem::path vocab_dir_;
    std::mutex load_mutex_;
    std::unique_ptr<BpeEncoder> encoder_;
};

PretokenizerStyle pretokenizer_for(TokenizerFamily family) noexcept;

} // namespace promptmap::tokenize
