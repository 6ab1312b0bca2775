#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace promptmap::tokenize {

// One adapter exists per family; models of a family share its cache
enum class TokenizerFamily : uint8_t {
    Cl100kBase = 0,
    O200kBase,
    Claude,
    Gemini,
    Custom
};

constexpr TokenizerFamily kAllFamilies[] = {
    TokenizerFamily::Cl100kBase, TokenizerFamily::O200kBase, TokenizerFamily::Claude,
    TokenizerFamily::Gemini, TokenizerFamily::Custom,
};

constexpr const char* family_to_string(TokenizerFamily family) noexcept {
    switch (family) {
        case TokenizerFamily::Cl100kBase: return "cl100k_base";
        case TokenizerFamily::O200kBase:  return "o200k_base";
        case TokenizerFamily::Claude:     return "claude";
        case TokenizerFamily::Gemini:     return "gemini";
        case TokenizerFamily::Custom:     return "custom";
    }
    return "custom";
}

std::optional<TokenizerFamily> family_from_string(std::string_view name);

struct ModelConfig {
    std::string id;
    std::string name;
    uint64_t context_limit = 0;
    TokenizerFamily family = TokenizerFamily::Custom;
    uint64_t overhead_tokens = 0;  // wrapper tokens added around every prompt
};

/**
 * Known models by id. The built-in catalog covers the GPT-4, GPT-4o,
 * Claude 3 and Gemini 1.5 context sizes; callers may extend a copy.
 */
class ModelCatalog {
public:
    ModelCatalog() = default;
    explicit ModelCatalog(std::vector<ModelConfig> models);

    static const ModelCatalog& builtin();

    // nullptr when the id is unknown
    const ModelConfig* find(std::string_view id) const noexcept;

    // Throws UnknownModelError when the id is unknown
    const ModelConfig& require(std::string_view id) const;

    // Replaces an existing entry with the same id
    void add(ModelConfig model);

    const std::vector<ModelConfig>& models() const noexcept { return models_; }

private:
    std::vector<ModelConfig> models_;
};

// Percentage of the model's context window used by `tokens` plus overhead, in [0, 100]
double context_usage(uint64_t tokens, const ModelConfig& model) noexcept;

} // namespace promptmap::tokenize
