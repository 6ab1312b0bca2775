// =============================================================================
// Tokenizer Adapter, Cache and Registry Tests
// =============================================================================

#include <gtest/gtest.h>
#include "promptmap/error.hpp"
#include "promptmap/hashing.hpp"
#include "promptmap/tokenize/adapter.hpp"
#include "promptmap/tokenize/registry.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace promptmap;
using namespace promptmap::tokenize;

namespace {

// Exact adapter that records every text it is asked to encode
class RecordingAdapter : public BaseAdapter {
public:
    explicit RecordingAdapter(TokenizerFamily family) : BaseAdapter(family) {}

    bool is_exact() const noexcept override { return true; }

    uint64_t count_text(std::string_view text) override {
        encoded.emplace_back(text);
        return text.size();
    }

    std::vector<std::string> encoded;
};

std::vector<std::string> pieces(std::string_view text, PretokenizerStyle style) {
    std::vector<std::string> out;
    for (auto piece : pretokenize(text, style)) out.emplace_back(piece);
    return out;
}

RankMap small_ranks() {
    RankMap ranks;
    ranks["a"] = 0;
    ranks["b"] = 1;
    ranks["c"] = 2;
    ranks[" "] = 3;
    ranks["ab"] = 4;
    ranks["abc"] = 5;
    return ranks;
}

} // namespace

class TokenizerTest : public ::testing::Test {
protected:
    ContentHash hash_a = content_hash(AttributeMap{}, "alpha");
    ContentHash hash_b = content_hash(AttributeMap{}, "beta");
};

// =============================================================================
// Cache
// =============================================================================

TEST_F(TokenizerTest, CacheIsAppendOnly) {
    TokenCache cache;
    EXPECT_FALSE(cache.get(hash_a, "m").has_value());

    EXPECT_TRUE(cache.insert(hash_a, "m", 7));
    EXPECT_FALSE(cache.insert(hash_a, "m", 9));
    EXPECT_EQ(cache.get(hash_a, "m"), std::optional<uint64_t>(7));
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(TokenizerTest, CacheKeysIncludeModel) {
    TokenCache cache;
    cache.insert(hash_a, "m1", 1);
    cache.insert(hash_a, "m2", 2);
    EXPECT_EQ(cache.get(hash_a, "m1"), std::optional<uint64_t>(1));
    EXPECT_EQ(cache.get(hash_a, "m2"), std::optional<uint64_t>(2));
    EXPECT_FALSE(cache.get(hash_b, "m1").has_value());
}

TEST_F(TokenizerTest, MergeSkipsApproximateUpdates) {
    TokenCache cache;
    std::vector<TokenUpdate> updates = {
        {"r[1]", hash_a, 5, false},
        {"r[1]/x[1]", hash_b, 3, true},
        {"r[1]/y[1]", hash_a, 99, false},
    };
    EXPECT_EQ(cache.merge_updates(updates, "m"), 1u);
    EXPECT_EQ(cache.get(hash_a, "m"), std::optional<uint64_t>(5));
    EXPECT_FALSE(cache.get(hash_b, "m").has_value());
}

// =============================================================================
// Adapters
// =============================================================================

TEST_F(TokenizerTest, ApproximateTokens) {
    EXPECT_EQ(approximate_tokens(0), 0u);
    EXPECT_EQ(approximate_tokens(1), 1u);
    EXPECT_EQ(approximate_tokens(4), 1u);
    EXPECT_EQ(approximate_tokens(5), 2u);
    EXPECT_EQ(approximate_tokens(400), 100u);
}

TEST_F(TokenizerTest, ExactCountIsComputedOnceThenCached) {
    RecordingAdapter adapter(TokenizerFamily::Custom);

    CountRequest request;
    request.hash = hash_a;
    request.model_id = "m";
    request.text = std::string_view("alpha");

    TokenLookup first = adapter.get_or_count(request);
    TokenLookup second = adapter.get_or_count(request);

    EXPECT_EQ(first.tokens, std::optional<uint64_t>(5));
    EXPECT_FALSE(first.approximate);
    EXPECT_EQ(second.tokens, first.tokens);
    EXPECT_EQ(adapter.encoded.size(), 1u);
    EXPECT_EQ(adapter.cache().size(), 1u);
}

TEST_F(TokenizerTest, ApproximationIsNeverCached) {
    RecordingAdapter adapter(TokenizerFamily::Custom);

    CountRequest request;
    request.hash = hash_a;
    request.model_id = "m";
    request.allow_approx = true;
    request.char_count = 10;

    TokenLookup lookup = adapter.get_or_count(request);
    EXPECT_EQ(lookup.tokens, std::optional<uint64_t>(3));
    EXPECT_TRUE(lookup.approximate);
    EXPECT_EQ(adapter.cache().size(), 0u);
    EXPECT_TRUE(adapter.encoded.empty());

    // A later exact count for the same content is still stored
    request.text = std::string_view("0123456789");
    TokenLookup exact = adapter.get_or_count(request);
    EXPECT_FALSE(exact.approximate);
    EXPECT_EQ(exact.tokens, std::optional<uint64_t>(10));
    EXPECT_EQ(adapter.cache_get(hash_a, "m"), std::optional<uint64_t>(10));
}

TEST_F(TokenizerTest, UnknownWithoutTextOrApproximation) {
    RecordingAdapter adapter(TokenizerFamily::Custom);

    CountRequest request;
    request.hash = hash_a;
    request.model_id = "m";
    request.char_count = 10;  // allow_approx is false

    TokenLookup lookup = adapter.get_or_count(request);
    EXPECT_FALSE(lookup.known());
    EXPECT_EQ(lookup.value_or_zero(), 0u);
}

TEST_F(TokenizerTest, HeuristicAdapterCountsCodePoints) {
    HeuristicAdapter adapter(TokenizerFamily::Claude);
    EXPECT_FALSE(adapter.is_exact());
    EXPECT_EQ(adapter.family(), TokenizerFamily::Claude);
    EXPECT_EQ(adapter.count_text("héllo!!!"), 2u);  // 8 code points
    EXPECT_EQ(adapter.count_text(""), 0u);
    EXPECT_EQ(adapter.approximate_from_chars(9), 3u);
}

TEST_F(TokenizerTest, BpeAdapterWithoutVocabularyIsUnavailable) {
    BpeAdapter no_dir(TokenizerFamily::Cl100kBase, std::filesystem::path{});
    EXPECT_THROW(no_dir.ensure_ready(), TokenizerUnavailableError);

    BpeAdapter missing(TokenizerFamily::O200kBase, "/nonexistent/promptmap/vocab");
    EXPECT_EQ(missing.vocab_path().filename(), "o200k_base.tiktoken");
    EXPECT_THROW(missing.ensure_ready(), TokenizerUnavailableError);
}

TEST_F(TokenizerTest, BpeAdapterWithEncoder) {
    BpeAdapter adapter(TokenizerFamily::Cl100kBase, BpeEncoder(small_ranks(), PretokenizerStyle::Cl100k));
    EXPECT_TRUE(adapter.is_exact());
    EXPECT_NO_THROW(adapter.ensure_ready());
    EXPECT_EQ(adapter.count_text("abc"), 1u);
}

// =============================================================================
// BPE
// =============================================================================

TEST_F(TokenizerTest, Base64Decode) {
    EXPECT_EQ(base64_decode("aGVsbG8="), "hello");
    EXPECT_EQ(base64_decode("IQ=="), "!");
    EXPECT_EQ(base64_decode(""), "");
}

TEST_F(TokenizerTest, ParseTiktokenRanks) {
    std::istringstream in("YQ== 0\nYg== 1\r\n\nYWI= 2\n");
    RankMap ranks = BpeEncoder::parse_tiktoken(in);
    ASSERT_EQ(ranks.size(), 3u);
    EXPECT_EQ(ranks.at("a"), 0u);
    EXPECT_EQ(ranks.at("b"), 1u);
    EXPECT_EQ(ranks.at("ab"), 2u);

    std::istringstream bad("YQ==\n");
    EXPECT_THROW(BpeEncoder::parse_tiktoken(bad), TokenizerUnavailableError);

    std::istringstream bad_rank("YQ== x\n");
    EXPECT_THROW(BpeEncoder::parse_tiktoken(bad_rank), TokenizerUnavailableError);
}

TEST_F(TokenizerTest, BpeMergesLowestRankFirst) {
    BpeEncoder encoder(small_ranks(), PretokenizerStyle::Cl100k);
    EXPECT_EQ(encoder.vocab_size(), 6u);
    EXPECT_EQ(encoder.count(""), 0u);
    EXPECT_EQ(encoder.count("abc"), 1u);    // whole piece ranked
    EXPECT_EQ(encoder.count("abab"), 2u);   // ab + ab
    EXPECT_EQ(encoder.count("ab ab"), 3u);  // "ab", " ab" -> " " + "ab"
    EXPECT_EQ(encoder.count("xyz"), 3u);    // unranked bytes count one each
}

TEST_F(TokenizerTest, PretokenizeCl100k) {
    EXPECT_EQ(pieces("Hello world's 1234!!\n", PretokenizerStyle::Cl100k),
              (std::vector<std::string>{"Hello", " world", "'s", " ", "123", "4", "!!\n"}));
    EXPECT_EQ(pieces("a  b", PretokenizerStyle::Cl100k),
              (std::vector<std::string>{"a", " ", " b"}));
    EXPECT_EQ(pieces("x\n\n  y", PretokenizerStyle::Cl100k),
              (std::vector<std::string>{"x", "\n\n", " ", " y"}));
    EXPECT_EQ(pieces("HelloWorld", PretokenizerStyle::Cl100k),
              (std::vector<std::string>{"HelloWorld"}));
}

TEST_F(TokenizerTest, PretokenizeO200kSplitsCaseChanges) {
    EXPECT_EQ(pieces("HelloWorld", PretokenizerStyle::O200k),
              (std::vector<std::string>{"Hello", "World"}));
    EXPECT_EQ(pieces("parseHTTPRequest", PretokenizerStyle::O200k),
              (std::vector<std::string>{"parse", "HTTPRequest"}));
    EXPECT_EQ(pieces("don't", PretokenizerStyle::O200k),
              (std::vector<std::string>{"don't"}));
}

TEST_F(TokenizerTest, PretokenizePiecesCoverInput) {
    const std::string text = "fn main() {\n    let x = \"héllo\"; // 42\n}\n";
    for (auto style : {PretokenizerStyle::Cl100k, PretokenizerStyle::O200k}) {
        std::string joined;
        for (auto piece : pretokenize(text, style)) {
            EXPECT_FALSE(piece.empty());
            joined.append(piece);
        }
        EXPECT_EQ(joined, text);
    }
}

// =============================================================================
// Models and registry
// =============================================================================

TEST_F(TokenizerTest, BuiltinCatalog) {
    const auto& catalog = ModelCatalog::builtin();
    EXPECT_EQ(catalog.models().size(), 5u);

    const ModelConfig* gpt4o = catalog.find("gpt-4o-128k");
    ASSERT_NE(gpt4o, nullptr);
    EXPECT_EQ(gpt4o->family, TokenizerFamily::O200kBase);
    EXPECT_EQ(gpt4o->context_limit, 128000u);

    EXPECT_EQ(catalog.find("no-such-model"), nullptr);
    EXPECT_THROW(catalog.require("no-such-model"), UnknownModelError);
}

TEST_F(TokenizerTest, CatalogAddReplacesById) {
    ModelCatalog catalog = ModelCatalog::builtin();
    catalog.add({"local-8k", "Local 8k", 8000, TokenizerFamily::Custom, 0});
    catalog.add({"gpt-4-128k", "GPT-4 (trimmed)", 32000, TokenizerFamily::Cl100kBase, 0});

    EXPECT_EQ(catalog.models().size(), 6u);
    ASSERT_NE(catalog.find("local-8k"), nullptr);
    EXPECT_EQ(catalog.require("gpt-4-128k").context_limit, 32000u);
    EXPECT_EQ(ModelCatalog::builtin().require("gpt-4-128k").context_limit, 128000u);
}

TEST_F(TokenizerTest, FamilyNamesRoundTrip) {
    for (TokenizerFamily family : kAllFamilies) {
        EXPECT_EQ(family_from_string(family_to_string(family)), family);
    }
    EXPECT_FALSE(family_from_string("p50k_base").has_value());
}

TEST_F(TokenizerTest, ContextUsageIsClamped) {
    ModelConfig model{"m", "M", 1000, TokenizerFamily::Custom, 100};
    EXPECT_DOUBLE_EQ(context_usage(400, model), 50.0);
    EXPECT_DOUBLE_EQ(context_usage(5000, model), 100.0);

    model.context_limit = 0;
    EXPECT_DOUBLE_EQ(context_usage(5, model), 0.0);
}

TEST_F(TokenizerTest, RegistryOwnsOneAdapterPerFamily) {
    AdapterRegistry registry;

    TokenizerAdapter& opus = registry.adapter_for_model("claude-3-opus-200k");
    TokenizerAdapter& sonnet = registry.adapter_for_model("claude-3.5-sonnet-200k");
    EXPECT_EQ(&opus, &sonnet);
    EXPECT_EQ(&opus, &registry.adapter_for_family(TokenizerFamily::Claude));

    EXPECT_TRUE(registry.adapter_for_model("gpt-4-128k").is_exact());
    EXPECT_FALSE(registry.adapter_for_model("gemini-1.5-pro-1m").is_exact());
    EXPECT_THROW(registry.adapter_for_model("gpt-2"), UnknownModelError);
}

TEST_F(TokenizerTest, RegistryReplaceAdapter) {
    AdapterRegistry registry;

    auto recorder = std::make_unique<RecordingAdapter>(TokenizerFamily::Gemini);
    RecordingAdapter* raw = recorder.get();
    registry.replace_adapter(TokenizerFamily::Gemini, std::move(recorder));
    EXPECT_EQ(&registry.adapter_for_model("gemini-1.5-pro-1m"), raw);

    EXPECT_THROW(registry.replace_adapter(TokenizerFamily::Claude,
                                          std::make_unique<RecordingAdapter>(TokenizerFamily::Gemini)),
                 InvalidArgumentError);
    EXPECT_THROW(registry.replace_adapter(TokenizerFamily::Claude, nullptr), InvalidArgumentError);
}
