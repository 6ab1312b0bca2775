// =============================================================================
// Display Tree Transformer Tests
// =============================================================================

#include <gtest/gtest.h>
#include "promptmap/error.hpp"
#include "promptmap/hashing.hpp"
#include "promptmap/parse/parser.hpp"
#include "promptmap/transform/tree_transform.hpp"
#include "promptmap/util/utf8.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <vector>

using namespace promptmap;
using namespace promptmap::transform;

namespace {

std::shared_ptr<ParsedNode> make_node(const std::string& path, const std::string& tag, const std::string& text,
                                      std::vector<ParsedNodePtr> children = {}) {
    auto node = std::make_shared<ParsedNode>();
    node->path = path;
    node->tag = tag;
    node->text = text;
    node->char_count = util::count_codepoints(text);
    node->hash = content_hash(AttributeMap{}, text);
    node->kind = children.empty() ? NodeKind::Text : NodeKind::Container;
    node->children = std::move(children);
    return node;
}

// Deterministic pseudo-random tree with uneven fan-out and sizes
ParsedNodePtr make_tree(const std::string& path, uint32_t& seed, int depth) {
    auto next = [&seed]() {
        seed = seed * 1664525u + 1013904223u;
        return seed >> 8;
    };

    std::string text(next() % 200, 'x');
    std::vector<ParsedNodePtr> children;
    if (depth > 0) {
        size_t fanout = next() % 12;
        for (size_t i = 0; i < fanout; ++i) {
            children.push_back(make_tree(path + "/n[" + std::to_string(i + 1) + "]", seed, depth - 1));
        }
    }
    return make_node(path, "n", text, std::move(children));
}

size_t count_display(const DisplayNode& node) {
    size_t n = 1;
    for (const auto& child : node.children) n += count_display(child);
    return n;
}

size_t display_depth(const DisplayNode& node) {
    size_t d = 0;
    for (const auto& child : node.children) d = std::max(d, 1 + display_depth(child));
    return d;
}

void expect_value_invariant(const DisplayNode& node) {
    uint64_t sum = 0;
    for (const auto& child : node.children) {
        sum += child.total_value;
        expect_value_invariant(child);
    }
    EXPECT_EQ(node.total_value, node.value + sum) << node.path;
}

void expect_equal(const DisplayNode& a, const DisplayNode& b) {
    EXPECT_EQ(a.id, b.id);
    EXPECT_EQ(a.name, b.name);
    EXPECT_EQ(a.path, b.path);
    EXPECT_EQ(a.value, b.value);
    EXPECT_EQ(a.total_value, b.total_value);
    EXPECT_EQ(a.content, b.content);
    EXPECT_EQ(a.attributes, b.attributes);
    EXPECT_EQ(a.aggregate, b.aggregate);
    ASSERT_EQ(a.children.size(), b.children.size());
    for (size_t i = 0; i < a.children.size(); ++i) expect_equal(a.children[i], b.children[i]);
}

} // namespace

class TransformTest : public ::testing::Test {
protected:
    static TransformOptions unlimited() {
        TransformOptions options;
        options.aggregation_threshold = 0.0;
        options.max_visible_nodes = std::numeric_limits<size_t>::max();
        return options;
    }

    tokenize::TokenCache cache_;
};

TEST_F(TransformTest, SimpleDocumentByChars) {
    auto root = parse::parse_document("<a><b>hi</b><c>bye</c></a>");
    auto result = promptmap::transform::transform(*root, SizeBasis::Chars, "", cache_, unlimited());

    EXPECT_EQ(result.tree.total_value, 5u);
    EXPECT_EQ(result.tree.value, 0u);
    ASSERT_EQ(result.tree.children.size(), 2u);

    // Largest first
    EXPECT_EQ(result.tree.children[0].path, "a[1]/c[1]");
    EXPECT_EQ(result.tree.children[0].value, 3u);
    EXPECT_EQ(result.tree.children[1].path, "a[1]/b[1]");
    EXPECT_EQ(result.tree.children[1].value, 2u);

    EXPECT_EQ(result.totals.total_chars, 5u);
    EXPECT_EQ(result.visible_nodes, 3u);
}

TEST_F(TransformTest, SmallChildrenCollapseIntoOther) {
    std::vector<ParsedNodePtr> children;
    for (int i = 0; i < 100; ++i) {
        std::string path = "r[1]/item[" + std::to_string(i + 1) + "]";
        children.push_back(make_node(path, "item", std::string(10, 'y')));
    }
    auto root = make_node("r[1]", "r", std::string(9000, 'x'), std::move(children));

    TransformOptions options;
    options.aggregation_threshold = 0.0075;
    auto result = promptmap::transform::transform(*root, SizeBasis::Chars, "", cache_, options);

    ASSERT_EQ(result.tree.children.size(), 1u);
    const DisplayNode& other = result.tree.children[0];
    EXPECT_TRUE(other.aggregate);
    EXPECT_EQ(other.name, "Other (100 items)");
    EXPECT_EQ(other.id, "r[1]::other");
    EXPECT_EQ(other.path, "r[1]/other");
    EXPECT_EQ(other.value, 1000u);
    EXPECT_EQ(other.total_value, 1000u);
    EXPECT_TRUE(other.attributes.empty());
    EXPECT_TRUE(other.children.empty());

    EXPECT_EQ(result.tree.value, 9000u);
    EXPECT_EQ(result.tree.total_value, 10000u);
}

TEST_F(TransformTest, SingleAggregatedItemName) {
    auto root = make_node("r[1]", "r", std::string(1000, 'x'),
                          {make_node("r[1]/big[1]", "big", std::string(500, 'b')),
                           make_node("r[1]/tiny[1]", "tiny", "t")});

    TransformOptions options;
    options.aggregation_threshold = 0.01;
    auto result = promptmap::transform::transform(*root, SizeBasis::Chars, "", cache_, options);

    ASSERT_EQ(result.tree.children.size(), 2u);
    EXPECT_EQ(result.tree.children[0].path, "r[1]/big[1]");
    EXPECT_EQ(result.tree.children[1].name, "Other (1 item)");
    EXPECT_EQ(result.tree.children[1].total_value, 1u);
}

TEST_F(TransformTest, ValueInvariantHoldsEverywhere) {
    uint32_t seed = 12345;
    auto root = make_tree("n[1]", seed, 4);
    uint64_t lossless = 0;
    {
        std::vector<const ParsedNode*> stack{root.get()};
        while (!stack.empty()) {
            const ParsedNode* n = stack.back();
            stack.pop_back();
            lossless += n->char_count;
            for (const auto& c : n->children) stack.push_back(c.get());
        }
    }

    for (size_t budget : {size_t{1}, size_t{2}, size_t{3}, size_t{10}, size_t{50}, size_t{2000}}) {
        for (double threshold : {0.0, 0.0075, 0.05, 1.0}) {
            for (std::optional<size_t> depth : {std::optional<size_t>{}, std::optional<size_t>{0},
                                                std::optional<size_t>{2}}) {
                TransformOptions options;
                options.max_visible_nodes = budget;
                options.aggregation_threshold = threshold;
                options.max_depth = depth;

                auto result = promptmap::transform::transform(*root, SizeBasis::Chars, "", cache_, options);
                expect_value_invariant(result.tree);
                EXPECT_EQ(result.tree.total_value, lossless);
                EXPECT_LE(count_display(result.tree), budget);
                EXPECT_EQ(count_display(result.tree), result.visible_nodes);
                if (depth) {
                    EXPECT_LE(display_depth(result.tree), *depth + 1);
                }
            }
        }
    }
}

TEST_F(TransformTest, BudgetOfOneCollapsesRoot) {
    auto root = parse::parse_document("<a><b>hi</b><c>bye</c></a>");
    TransformOptions options = unlimited();
    options.max_visible_nodes = 1;

    auto result = promptmap::transform::transform(*root, SizeBasis::Chars, "", cache_, options);
    EXPECT_TRUE(result.tree.children.empty());
    EXPECT_EQ(result.tree.value, 5u);
    EXPECT_EQ(result.tree.total_value, 5u);
}

TEST_F(TransformTest, BudgetReservesSlotForOther) {
    auto root = make_node("r[1]", "r", "",
                          {make_node("r[1]/a[1]", "a", "aaaa"),
                           make_node("r[1]/b[1]", "b", "bbb"),
                           make_node("r[1]/c[1]", "c", "cc")});

    TransformOptions options = unlimited();
    options.max_visible_nodes = 3;
    auto result = promptmap::transform::transform(*root, SizeBasis::Chars, "", cache_, options);

    ASSERT_EQ(result.tree.children.size(), 2u);
    EXPECT_EQ(result.tree.children[0].path, "r[1]/a[1]");
    EXPECT_TRUE(result.tree.children[1].aggregate);
    EXPECT_EQ(result.tree.children[1].name, "Other (2 items)");
    EXPECT_EQ(result.tree.children[1].total_value, 5u);

    options.max_visible_nodes = 2;
    result = promptmap::transform::transform(*root, SizeBasis::Chars, "", cache_, options);
    ASSERT_EQ(result.tree.children.size(), 1u);
    EXPECT_EQ(result.tree.children[0].name, "Other (3 items)");
    EXPECT_EQ(result.tree.children[0].total_value, 9u);
}

TEST_F(TransformTest, DepthLimitFoldsSubtrees) {
    auto root = parse::parse_document("<r><a>x<b>yy<c>zzz</c></b></a></r>");
    TransformOptions options = unlimited();
    options.max_depth = 1;

    auto result = promptmap::transform::transform(*root, SizeBasis::Chars, "", cache_, options);
    ASSERT_EQ(result.tree.children.size(), 1u);
    const DisplayNode& a = result.tree.children[0];
    EXPECT_TRUE(a.children.empty());
    EXPECT_EQ(a.value, 6u);
    EXPECT_EQ(a.total_value, 6u);

    options.max_depth = 0;
    result = promptmap::transform::transform(*root, SizeBasis::Chars, "", cache_, options);
    EXPECT_TRUE(result.tree.children.empty());
    EXPECT_EQ(result.tree.value, 6u);
}

TEST_F(TransformTest, TokenBasisUsesCacheWithCharFallback) {
    auto root = parse::parse_document("<r><a>hello</a><b>world!</b></r>");
    const auto& a = *root->children[0];

    cache_.insert(a.hash, "m", 1);
    auto result = promptmap::transform::transform(*root, SizeBasis::Tokens, "m", cache_, unlimited());

    // a: 1 cached token; b: 6 chars as fallback; r: 0
    EXPECT_EQ(result.tree.total_value, 7u);
    EXPECT_EQ(result.totals.total_tokens, 7u);
    EXPECT_EQ(result.totals.total_chars, 11u);

    // Other models do not see the entry
    auto other = promptmap::transform::transform(*root, SizeBasis::Tokens, "other-model", cache_, unlimited());
    EXPECT_EQ(other.tree.total_value, 11u);
}

TEST_F(TransformTest, CharBasisIgnoresCache) {
    auto root = parse::parse_document("<r><a>hello</a></r>");
    cache_.insert(root->children[0]->hash, "m", 1);

    auto result = promptmap::transform::transform(*root, SizeBasis::Chars, "m", cache_, unlimited());
    EXPECT_EQ(result.tree.total_value, 5u);
}

TEST_F(TransformTest, Deterministic) {
    uint32_t seed = 99;
    auto root = make_tree("n[1]", seed, 3);

    TransformOptions options;
    options.max_visible_nodes = 40;
    auto first = promptmap::transform::transform(*root, SizeBasis::Chars, "", cache_, options);
    auto second = promptmap::transform::transform(*root, SizeBasis::Chars, "", cache_, options);
    expect_equal(first.tree, second.tree);
}

TEST_F(TransformTest, EqualTotalsKeepDocumentOrder) {
    auto root = make_node("r[1]", "r", "",
                          {make_node("r[1]/x[1]", "x", "aa"),
                           make_node("r[1]/y[1]", "y", "bb"),
                           make_node("r[1]/z[1]", "z", "cc")});
    auto result = promptmap::transform::transform(*root, SizeBasis::Chars, "", cache_, unlimited());
    ASSERT_EQ(result.tree.children.size(), 3u);
    EXPECT_EQ(result.tree.children[0].path, "r[1]/x[1]");
    EXPECT_EQ(result.tree.children[1].path, "r[1]/y[1]");
    EXPECT_EQ(result.tree.children[2].path, "r[1]/z[1]");
}

TEST_F(TransformTest, DisplayAttributesAndPreview) {
    auto root = parse::parse_document(
        "<prompt><file path=\"src/app/main.cpp\" lang=\"cpp\">int  main()\n{ return 0; }</file></prompt>");
    TransformOptions options = unlimited();
    options.preview_length = 10;

    auto result = promptmap::transform::transform(*root, SizeBasis::Chars, "", cache_, options);
    ASSERT_EQ(result.tree.children.size(), 1u);
    const DisplayNode& file = result.tree.children[0];

    EXPECT_EQ(file.name, "main.cpp");
    EXPECT_EQ(file.attributes.at("path"), "src/app/main.cpp");
    EXPECT_EQ(file.attributes.at("lang"), "cpp");
    EXPECT_EQ(file.attributes.at("__tag"), "file");
    EXPECT_EQ(file.attributes.at("__group"), "src/app/main.cpp");
    EXPECT_EQ(file.attributes.at("__kind"), "text");
    EXPECT_EQ(file.attributes.at("__semantic"), "files");
    EXPECT_EQ(file.content, std::optional<std::string>("int main()…"));

    // Container without own text has no preview
    EXPECT_FALSE(result.tree.content.has_value());
    EXPECT_EQ(result.tree.attributes.at("__group"), "prompt[1]");
}

TEST_F(TransformTest, InvalidOptionsRejected) {
    auto root = parse::parse_document("<r/>");

    TransformOptions options;
    options.aggregation_threshold = -0.1;
    EXPECT_THROW(promptmap::transform::transform(*root, SizeBasis::Chars, "", cache_, options), InvalidArgumentError);

    options.aggregation_threshold = 1.5;
    EXPECT_THROW(promptmap::transform::transform(*root, SizeBasis::Chars, "", cache_, options), InvalidArgumentError);

    options.aggregation_threshold = std::nan("");
    EXPECT_THROW(promptmap::transform::transform(*root, SizeBasis::Chars, "", cache_, options), InvalidArgumentError);

    options = TransformOptions{};
    options.max_visible_nodes = 0;
    EXPECT_THROW(options.validate(), InvalidArgumentError);
}

TEST_F(TransformTest, EmptyDocument) {
    auto root = parse::parse_document("");
    auto result = promptmap::transform::transform(*root, SizeBasis::Tokens, "m", cache_);
    EXPECT_EQ(result.tree.id, "document[1]");
    EXPECT_EQ(result.tree.total_value, 0u);
    EXPECT_TRUE(result.tree.children.empty());
}
