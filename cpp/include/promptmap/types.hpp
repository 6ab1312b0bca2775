#pragma once

#include <cstdint>
#include <array>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace promptmap {

// =============================================================================
// Content digest
// =============================================================================

// 256-bit BLAKE3 digest of a node's canonical (attributes, own text) form.
// Used as a cache key and for duplicate detection, never as identity.
struct ContentHash {
    std::array<uint8_t, 32> bytes;

    constexpr ContentHash() noexcept : bytes{} {}

    bool operator==(const ContentHash& other) const noexcept {
        return bytes == other.bytes;
    }

    bool operator!=(const ContentHash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const ContentHash& other) const noexcept {
        return bytes < other.bytes;
    }

    // Hex string representation
    std::string to_hex() const {
        static constexpr char hex_chars[] = "0123456789abcdef";
        std::string result;
        result.reserve(64);
        for (uint8_t b : bytes) {
            result.push_back(hex_chars[b >> 4]);
            result.push_back(hex_chars[b & 0x0F]);
        }
        return result;
    }

    static ContentHash from_hex(std::string_view hex) {
        ContentHash result;
        if (hex.size() != 64) return result;

        auto hex_to_nibble = [](char c) -> uint8_t {
            if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
            if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(10 + c - 'a');
            if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(10 + c - 'A');
            return 0;
        };
        for (size_t i = 0; i < 32; ++i) {
            result.bytes[i] = static_cast<uint8_t>((hex_to_nibble(hex[i * 2]) << 4) |
                                                   hex_to_nibble(hex[i * 2 + 1]));
        }
        return result;
    }

    constexpr const uint8_t* data() const noexcept { return bytes.data(); }
    constexpr uint8_t* data() noexcept { return bytes.data(); }
    static constexpr size_t size() noexcept { return 32; }
};

// =============================================================================
// Classification
// =============================================================================

enum class NodeKind : uint8_t {
    Text = 0,
    Code,
    Metadata,
    Container,
    Other
};

constexpr const char* kind_to_string(NodeKind kind) noexcept {
    switch (kind) {
        case NodeKind::Text:      return "text";
        case NodeKind::Code:      return "code";
        case NodeKind::Metadata:  return "metadata";
        case NodeKind::Container: return "container";
        case NodeKind::Other:     return "other";
    }
    return "other";
}

// Role of an element inside a prompt-style document (file dumps, instructions, ...)
enum class SemanticType : uint8_t {
    Files = 0,
    Instructions,
    MetaPrompt,
    FileTree,
    Codemap,
    References,
    Suggestions,
    Other
};

constexpr const char* semantic_to_string(SemanticType type) noexcept {
    switch (type) {
        case SemanticType::Files:        return "files";
        case SemanticType::Instructions: return "instructions";
        case SemanticType::MetaPrompt:   return "meta_prompt";
        case SemanticType::FileTree:     return "file_tree";
        case SemanticType::Codemap:      return "codemap";
        case SemanticType::References:   return "references";
        case SemanticType::Suggestions:  return "suggestions";
        case SemanticType::Other:        return "other";
    }
    return "other";
}

enum class SizeBasis : uint8_t {
    Tokens = 0,
    Chars
};

constexpr const char* basis_to_string(SizeBasis basis) noexcept {
    return basis == SizeBasis::Tokens ? "tokens" : "chars";
}

// Ordered by name so iteration is already canonical
using AttributeMap = std::map<std::string, std::string>;

// =============================================================================
// Parsed tree
// =============================================================================

struct ParsedNode;
using ParsedNodePtr = std::shared_ptr<const ParsedNode>;

/**
 * One element of the source document.
 *
 * Built once by the parser and immutable afterwards; shared between the
 * parse and tokenize contexts through ParsedNodePtr. Token counts never live
 * here, they are kept in the per-model TokenCache keyed by (hash, model).
 */
struct ParsedNode {
    std::string path;             // e.g. "section[2]/title[1]", doubles as id
    std::string tag;              // qualified name as it appears in the path
    AttributeMap attributes;
    NodeKind kind = NodeKind::Other;
    SemanticType semantic = SemanticType::Other;
    size_t char_count = 0;        // code points of own text, descendants excluded
    ContentHash hash;
    std::optional<std::string> text;  // own merged text, when retained
    std::vector<ParsedNodePtr> children;

    const std::string& id() const noexcept { return path; }
    bool is_leaf() const noexcept { return children.empty(); }
};

// Number of nodes in the subtree rooted at `root` (root included)
size_t count_nodes(const ParsedNode& root);

// =============================================================================
// Display tree
// =============================================================================

/**
 * Render-ready node produced by the tree transformer.
 * Invariant: total_value == value + sum(children.total_value).
 */
struct DisplayNode {
    std::string id;
    std::string name;
    std::string path;
    uint64_t value = 0;
    uint64_t total_value = 0;
    std::optional<std::string> content;
    AttributeMap attributes;
    bool aggregate = false;
    std::vector<DisplayNode> children;
};

} // namespace promptmap
