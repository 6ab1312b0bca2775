#pragma once

#include "promptmap/tokenize/adapter.hpp"
#include "promptmap/tokenize/models.hpp"

#include <array>
#include <filesystem>
#include <memory>
#include <string_view>

namespace promptmap::tokenize {

/**
 * Exactly one adapter per tokenizer family for the registry's lifetime.
 *
 * Owned by whoever orchestrates requests and passed by reference to the
 * walker; there is no process-wide instance. BPE families read their
 * vocabulary from `vocab_dir` on first use.
 */
class AdapterRegistry {
public:
    explicit AdapterRegistry(std::filesystem::path vocab_dir = {},
                             ModelCatalog catalog = ModelCatalog::builtin());

    AdapterRegistry(const AdapterRegistry&) = delete;
    AdapterRegistry& operator=(const AdapterRegistry&) = delete;

    // Uses tokenizer.vocab_dir from the configuration
    static std::unique_ptr<AdapterRegistry> from_config();

    TokenizerAdapter& adapter_for_family(TokenizerFamily family);

    // Throws UnknownModelError when the catalog has no such model
    TokenizerAdapter& adapter_for_model(std::string_view model_id);

    // Swap in a different adapter for a family (the old cache goes with it)
    void replace_adapter(TokenizerFamily family, std::unique_ptr<TokenizerAdapter> adapter);

    const ModelCatalog& catalog() const noexcept { return catalog_; }

private:
    static constexpr size_t kFamilyCount = sizeof(kAllFamilies) / sizeof(kAllFamilies[0]);

    ModelCatalog catalog_;
    std::array<std::unique_ptr<TokenizerAdapter>, kFamilyCount> adapters_;
};

} // namespace promptmap::tokenize
