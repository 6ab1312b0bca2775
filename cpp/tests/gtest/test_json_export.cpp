// =============================================================================
// JSON Export Tests
// =============================================================================

#include <gtest/gtest.h>
#include "promptmap/json_export.hpp"
#include "promptmap/parse/parser.hpp"

#include <string>

using namespace promptmap;

class JsonExportTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = parse::parse_document("<doc kind=\"demo\"><p>hello</p><p>world!</p></doc>");
    }

    ParsedNodePtr root_;
    tokenize::TokenCache cache_;
};

TEST_F(JsonExportTest, ParsedTree) {
    auto obj = json::to_json(*root_);

    EXPECT_EQ(obj.at("path").as_string(), "doc[1]");
    EXPECT_EQ(obj.at("tag").as_string(), "doc");
    EXPECT_EQ(obj.at("kind").as_string(), "container");
    EXPECT_EQ(obj.at("charCount").to_number<uint64_t>(), 0u);
    EXPECT_EQ(obj.at("hash").as_string(), root_->hash.to_hex());
    EXPECT_EQ(obj.at("attributes").as_object().at("kind").as_string(), "demo");
    EXPECT_FALSE(obj.contains("text"));

    const auto& children = obj.at("children").as_array();
    ASSERT_EQ(children.size(), 2u);
    EXPECT_EQ(children[1].as_object().at("path").as_string(), "doc[1]/p[2]");
    EXPECT_EQ(children[1].as_object().at("charCount").to_number<uint64_t>(), 6u);
}

TEST_F(JsonExportTest, ParsedTreeWithText) {
    auto obj = json::to_json(*root_, true);
    const auto& first = obj.at("children").as_array()[0].as_object();
    EXPECT_EQ(first.at("text").as_string(), "hello");
}

TEST_F(JsonExportTest, TransformResultWithModel) {
    const auto& model = tokenize::ModelCatalog::builtin().require("claude-3-opus-200k");
    transform::TransformOptions options;
    options.aggregation_threshold = 0.0;

    auto result = transform::transform(*root_, SizeBasis::Tokens, model.id, cache_, options);
    auto obj = json::to_json(result, SizeBasis::Tokens, &model);

    EXPECT_EQ(obj.at("basis").as_string(), "tokens");
    EXPECT_EQ(obj.at("model").as_string(), model.id);
    EXPECT_EQ(obj.at("totals").as_object().at("chars").to_number<uint64_t>(), 11u);
    EXPECT_EQ(obj.at("visibleNodes").to_number<uint64_t>(), 3u);
    EXPECT_EQ(obj.at("contextLimit").to_number<uint64_t>(), model.context_limit);
    EXPECT_TRUE(obj.contains("contextUsage"));

    const auto& tree = obj.at("tree").as_object();
    EXPECT_EQ(tree.at("id").as_string(), "doc[1]");
    EXPECT_EQ(tree.at("totalValue").to_number<uint64_t>(), 11u);
    EXPECT_FALSE(tree.contains("aggregate"));
    EXPECT_EQ(tree.at("children").as_array().size(), 2u);
}

TEST_F(JsonExportTest, TransformResultWithoutModel) {
    auto result = transform::transform(*root_, SizeBasis::Chars, "", cache_);
    auto obj = json::to_json(result, SizeBasis::Chars, nullptr);

    EXPECT_EQ(obj.at("basis").as_string(), "chars");
    EXPECT_TRUE(obj.at("model").is_null());
    EXPECT_FALSE(obj.contains("contextUsage"));
}

TEST_F(JsonExportTest, AggregateFlag) {
    DisplayNode other;
    other.id = "doc[1]::other";
    other.name = "Other (2 items)";
    other.aggregate = true;

    auto obj = json::to_json(other);
    EXPECT_TRUE(obj.at("aggregate").as_bool());
    EXPECT_FALSE(obj.contains("content"));
    EXPECT_TRUE(obj.at("children").as_array().empty());
}

TEST_F(JsonExportTest, TokenUpdate) {
    tokenize::TokenUpdate update{"doc[1]/p[1]", root_->children[0]->hash, 7, true};
    auto obj = json::to_json(update);
    EXPECT_EQ(obj.at("id").as_string(), "doc[1]/p[1]");
    EXPECT_EQ(obj.at("tokens").to_number<uint64_t>(), 7u);
    EXPECT_TRUE(obj.at("approximate").as_bool());
    EXPECT_EQ(obj.at("hash").as_string().size(), 64u);
}

TEST_F(JsonExportTest, SearchResultsAndCatalog) {
    std::vector<SearchResult> results{{"doc[1]", "doc[1]", "doc", 997}};
    auto arr = json::to_json(results);
    ASSERT_EQ(arr.size(), 1u);
    EXPECT_EQ(arr[0].as_object().at("score").to_number<int>(), 997);

    auto models = json::to_json(tokenize::ModelCatalog::builtin());
    EXPECT_EQ(models.size(), tokenize::ModelCatalog::builtin().models().size());
    for (const auto& entry : models) {
        EXPECT_TRUE(entry.as_object().contains("family"));
    }
}
