// =============================================================================
// Display Label and Classification Tests
// =============================================================================

#include <gtest/gtest.h>
#include "promptmap/parse/classify.hpp"
#include "promptmap/transform/labels.hpp"

#include <string>

using namespace promptmap;
using namespace promptmap::transform;

class LabelsTest : public ::testing::Test {
protected:
    static ParsedNode node(const std::string& tag, AttributeMap attrs = {}) {
        ParsedNode n;
        n.tag = tag;
        n.path = tag + "[1]";
        n.attributes = std::move(attrs);
        return n;
    }
};

TEST_F(LabelsTest, OpaqueIds) {
    EXPECT_FALSE(is_opaque_id(""));
    EXPECT_FALSE(is_opaque_id("main.cpp"));
    EXPECT_FALSE(is_opaque_id("deadbeef"));
    EXPECT_TRUE(is_opaque_id("deadbeefdeadbeef"));
    EXPECT_TRUE(is_opaque_id("QUJDREVGR0hJSktMTU5PUA=="));
    EXPECT_TRUE(is_opaque_id(std::string(41, '-')));
    EXPECT_FALSE(is_opaque_id("a readable title!"));
}

TEST_F(LabelsTest, Basename) {
    EXPECT_EQ(promptmap::transform::basename("src/app/main.cpp"), "main.cpp");
    EXPECT_EQ(promptmap::transform::basename("C:\\work\\notes.txt"), "notes.txt");
    EXPECT_EQ(promptmap::transform::basename("plain"), "plain");
    EXPECT_EQ(promptmap::transform::basename("trailing/"), "trailing/");
}

TEST_F(LabelsTest, FriendlyNamePrefersNameAttributes) {
    EXPECT_EQ(friendly_name(node("section", {{"title", "Overview"}})), "Overview");
    EXPECT_EQ(friendly_name(node("file", {{"name", "README"}, {"path", "docs/README.md"}})), "README");
}

TEST_F(LabelsTest, FriendlyNameUsesPathBasename) {
    EXPECT_EQ(friendly_name(node("file", {{"path", "src/app/main.cpp"}})), "main.cpp");
    EXPECT_EQ(friendly_name(node("link", {{"url", "https://example.com/guide.html"}})), "guide.html");
}

TEST_F(LabelsTest, FriendlyNameSkipsOpaqueValues) {
    EXPECT_EQ(friendly_name(node("chunk", {{"name", "0123456789abcdef0123"}})), "chunk");
}

TEST_F(LabelsTest, FriendlyNameFallsBackToId) {
    EXPECT_EQ(friendly_name(node("promptnode", {{"id", "intro"}})), "intro");
    EXPECT_EQ(friendly_name(node("PromptNode", {{"id", "0123456789abcdef0123"}})), "PromptNode");
    EXPECT_EQ(friendly_name(node("", {})), "node");
}

TEST_F(LabelsTest, GroupKey) {
    EXPECT_EQ(group_key(node("file", {{"filepath", "a/b.py"}})), "a/b.py");
    EXPECT_EQ(group_key(node("section")), "section[1]");
}

TEST_F(LabelsTest, PreviewCollapsesWhitespace) {
    EXPECT_EQ(make_preview("  one\n\ttwo   three  ", 100), std::optional<std::string>("one two three"));
    EXPECT_FALSE(make_preview("", 100).has_value());
    EXPECT_FALSE(make_preview(" \n\t ", 100).has_value());
}

TEST_F(LabelsTest, PreviewTruncatesByCodePoint) {
    EXPECT_EQ(make_preview("h\xC3\xA9llo w\xC3\xB6rld", 4), std::optional<std::string>("h\xC3\xA9ll…"));
    EXPECT_EQ(make_preview("exact", 5), std::optional<std::string>("exact"));
}

TEST_F(LabelsTest, PreviewEscapesHtml) {
    EXPECT_EQ(make_preview("a < b & \"c\"", 100), std::optional<std::string>("a &lt; b &amp; &quot;c&quot;"));
    EXPECT_EQ(make_preview("<<<<", 2), std::optional<std::string>("&lt;&lt;…"));
}

// =============================================================================
// Classification
// =============================================================================

TEST_F(LabelsTest, KindRules) {
    using parse::classify_kind;
    EXPECT_EQ(classify_kind("p", "hello", 0), NodeKind::Text);
    EXPECT_EQ(classify_kind("code", "", 0), NodeKind::Code);
    EXPECT_EQ(classify_kind("sourcecode", "", 2), NodeKind::Code);
    EXPECT_EQ(classify_kind("meta", "  ", 0), NodeKind::Metadata);
    EXPECT_EQ(classify_kind("div", "", 3), NodeKind::Container);
    EXPECT_EQ(classify_kind("br", "", 0), NodeKind::Other);
}

TEST_F(LabelsTest, SemanticRules) {
    using parse::classify_semantic;
    EXPECT_EQ(classify_semantic("suggestions", {}), SemanticType::Suggestions);
    EXPECT_EQ(classify_semantic("file_tree", {}), SemanticType::FileTree);
    EXPECT_EQ(classify_semantic("codemap", {}), SemanticType::Codemap);
    EXPECT_EQ(classify_semantic("user_instructions", {}), SemanticType::Instructions);
    EXPECT_EQ(classify_semantic("prompt", {{"role", "user"}}), SemanticType::Instructions);
    EXPECT_EQ(classify_semantic("prompt", {{"type", "system"}}), SemanticType::MetaPrompt);
    EXPECT_EQ(classify_semantic("meta_prompt", {}), SemanticType::MetaPrompt);
    EXPECT_EQ(classify_semantic("a", {{"href", "x"}}), SemanticType::References);
    EXPECT_EQ(classify_semantic("ns:file", {}), SemanticType::Files);
    EXPECT_EQ(classify_semantic("entry", {{"path", "src/x.cpp"}}), SemanticType::Files);
    EXPECT_EQ(classify_semantic("div", {}), SemanticType::Other);
}
