#include "promptmap/tokenize/registry.hpp"
#include "promptmap/config.hpp"
#include "promptmap/error.hpp"
#include "promptmap/logging.hpp"

namespace promptmap::tokenize {

AdapterRegistry::AdapterRegistry(std::filesystem::path vocab_dir, ModelCatalog catalog)
    : catalog_(std::move(catalog)) {
    for (TokenizerFamily family : kAllFamilies) {
        auto& slot = adapters_[static_cast<size_t>(family)];
        switch (family) {
            case TokenizerFamily::Cl100kBase:
            case TokenizerFamily::O200kBase:
                slot = std::make_unique<BpeAdapter>(family, vocab_dir);
                break;
            case TokenizerFamily::Claude:
            case TokenizerFamily::Gemini:
            case TokenizerFamily::Custom:
                slot = std::make_unique<HeuristicAdapter>(family);
                break;
        }
        LOG_DEBUG("Created ", slot->is_exact() ? "BPE" : "heuristic", " adapter for ",
                  family_to_string(family));
    }
}

std::unique_ptr<AdapterRegistry> AdapterRegistry::from_config() {
    std::string vocab_dir = Config::getInstance().get<std::string>("tokenizer.vocab_dir");
    LOG_INFO("Tokenizer vocabulary directory: ", vocab_dir.empty() ? "(none)" : vocab_dir);
    return std::make_unique<AdapterRegistry>(vocab_dir);
}

TokenizerAdapter& AdapterRegistry::adapter_for_family(TokenizerFamily family) {
    return *adapters_[static_cast<size_t>(family)];
}

TokenizerAdapter& AdapterRegistry::adapter_for_model(std::string_view model_id) {
    return adapter_for_family(catalog_.require(model_id).family);
}

void AdapterRegistry::replace_adapter(TokenizerFamily family, std::unique_ptr<TokenizerAdapter> adapter) {
    PROMPTMAP_CHECK_ARGUMENT(adapter != nullptr, "Adapter must not be null");
    PROMPTMAP_CHECK_ARGUMENT(adapter->family() == family, "Adapter family does not match its slot");
    adapters_[static_cast<size_t>(family)] = std::move(adapter);
}

} // namespace promptmap::tokenize
