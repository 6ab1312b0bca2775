#pragma once

#include "promptmap/types.hpp"

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace promptmap::tokenize {

// One observed count, as reported by the tokenization walker
struct TokenUpdate {
    std::string id;
    ContentHash hash;
    uint64_t tokens = 0;
    bool approximate = false;  // derived from a character count, never cached
};

// Read-only access to exact counts keyed by (content hash, model id)
class TokenCacheView {
public:
    virtual ~TokenCacheView() = default;

    virtual std::optional<uint64_t> get(const ContentHash& hash, std::string_view model_id) const = 0;
};

/**
 * Append-only token count store.
 *
 * Entries are added and never removed or replaced: insert() on an existing
 * key keeps the first value. Readers and the writer may run on different
 * threads.
 */
class TokenCache : public TokenCacheView {
public:
    std::optional<uint64_t> get(const ContentHash& hash, std::string_view model_id) const override;

    // false when the key was already present (the stored value is kept)
    bool insert(const ContentHash& hash, std::string_view model_id, uint64_t tokens);

    // Fold walker updates into this cache, skipping approximate ones.
    // Returns the number of new entries.
    size_t merge_updates(const std::vector<TokenUpdate>& updates, std::string_view model_id);

    size_t size() const;

private:
    static std::string make_key(const ContentHash& hash, std::string_view model_id);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, uint64_t> entries_;
};

} // namespace promptmap::tokenize
