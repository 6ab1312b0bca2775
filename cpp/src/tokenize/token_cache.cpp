#include "promptmap/tokenize/token_cache.hpp"

#include <mutex>

namespace promptmap::tokenize {

std::string TokenCache::make_key(const ContentHash& hash, std::string_view model_id) {
    std::string key;
    key.reserve(ContentHash::size() + 1 + model_id.size());
    key.append(reinterpret_cast<const char*>(hash.data()), ContentHash::size());
    key.push_back(':');
    key.append(model_id);
    return key;
}

std::optional<uint64_t> TokenCache::get(const ContentHash& hash, std::string_view model_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(make_key(hash, model_id));
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

bool TokenCache::insert(const ContentHash& hash, std::string_view model_id, uint64_t tokens) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return entries_.emplace(make_key(hash, model_id), tokens).second;
}

size_t TokenCache::merge_updates(const std::vector<TokenUpdate>& updates, std::string_view model_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    size_t added = 0;
    for (const auto& update : updates) {
        if (update.approximate) continue;
        if (entries_.emplace(make_key(update.hash, model_id), update.tokens).second) {
            ++added;
        }
    }
    return added;
}

size_t TokenCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

} // namespace promptmap::tokenize
