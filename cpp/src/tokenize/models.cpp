#include "promptmap/tokenize/models.hpp"
#include "promptmap/error.hpp"

#include <algorithm>

namespace promptmap::tokenize {

std::optional<TokenizerFamily> family_from_string(std::string_view name) {
    for (TokenizerFamily family : kAllFamilies) {
        if (name == family_to_string(family)) return family;
    }
    return std::nullopt;
}

ModelCatalog::ModelCatalog(std::vector<ModelConfig> models) {
    for (auto& model : models) {
        add(std::move(model));
    }
}

const ModelCatalog& ModelCatalog::builtin() {
    static const ModelCatalog catalog({
        {"gpt-4-128k",             "GPT-4 (128k)",             128000,  TokenizerFamily::Cl100kBase, 0},
        {"gpt-4o-128k",            "GPT-4o (128k)",            128000,  TokenizerFamily::O200kBase,  0},
        {"claude-3-opus-200k",     "Claude 3 Opus (200k)",     200000,  TokenizerFamily::Claude,     0},
        {"claude-3.5-sonnet-200k", "Claude 3.5 Sonnet (200k)", 200000,  TokenizerFamily::Claude,     0},
        {"gemini-1.5-pro-1m",      "Gemini 1.5 Pro (1M)",      1000000, TokenizerFamily::Gemini,     0},
    });
    return catalog;
}

const ModelConfig* ModelCatalog::find(std::string_view id) const noexcept {
    auto it = std::find_if(models_.begin(), models_.end(),
                           [id](const ModelConfig& m) { return m.id == id; });
    return it == models_.end() ? nullptr : &*it;
}

const ModelConfig& ModelCatalog::require(std::string_view id) const {
    const ModelConfig* model = find(id);
    if (!model) {
        throw UnknownModelError(std::string(id));
    }
    return *model;
}

void ModelCatalog::add(ModelConfig model) {
    auto it = std::find_if(models_.begin(), models_.end(),
                           [&](const ModelConfig& m) { return m.id == model.id; });
    if (it != models_.end()) {
        *it = std::move(model);
    } else {
        models_.push_back(std::move(model));
    }
}

double context_usage(uint64_t tokens, const ModelConfig& model) noexcept {
    if (model.context_limit == 0) return 0.0;
    double used = static_cast<double>(tokens + model.overhead_tokens);
    double pct = used / static_cast<double>(model.context_limit) * 100.0;
    return std::clamp(pct, 0.0, 100.0);
}

} // namespace promptmap::tokenize
