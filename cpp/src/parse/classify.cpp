#include "promptmap/parse/classify.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace promptmap::parse {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_blank(std::string_view s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

bool contains(const std::vector<std::string>& tokens, std::string_view word) {
    return std::find(tokens.begin(), tokens.end(), word) != tokens.end();
}

bool any_of(const std::vector<std::string>& tokens, std::initializer_list<std::string_view> words) {
    for (auto w : words) {
        if (contains(tokens, w)) return true;
    }
    return false;
}

bool all_of(const std::vector<std::string>& tokens, std::initializer_list<std::string_view> words) {
    for (auto w : words) {
        if (!contains(tokens, w)) return false;
    }
    return true;
}

const std::string* find_attr(const AttributeMap& attrs, const char* key) {
    auto it = attrs.find(key);
    return it == attrs.end() ? nullptr : &it->second;
}

// Any of `keys` holds a value containing any of `needles` (case-insensitive)
bool attr_value_includes(const AttributeMap& attrs,
                         std::initializer_list<const char*> keys,
                         std::initializer_list<std::string_view> needles) {
    for (const char* key : keys) {
        const std::string* value = find_attr(attrs, key);
        if (!value) continue;
        std::string lower = to_lower(*value);
        for (auto needle : needles) {
            if (lower.find(needle) != std::string::npos) return true;
        }
    }
    return false;
}

bool has_any_attr(const AttributeMap& attrs, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (attrs.count(key)) return true;
    }
    return false;
}

// Path-like value: has a separator or ends in a short extension
bool looks_like_file_path(const AttributeMap& attrs) {
    for (const char* key : {"file", "filepath", "path", "src", "url", "uri"}) {
        const std::string* value = find_attr(attrs, key);
        if (!value || value->empty()) continue;

        std::string lower = to_lower(*value);
        if (lower.find('/') != std::string::npos || lower.find('\\') != std::string::npos) {
            return true;
        }
        size_t dot = lower.rfind('.');
        if (dot != std::string::npos) {
            size_t ext_len = lower.size() - dot - 1;
            bool alnum = std::all_of(lower.begin() + static_cast<std::ptrdiff_t>(dot) + 1, lower.end(),
                                     [](unsigned char c) { return std::isalnum(c) != 0; });
            if (ext_len >= 1 && ext_len <= 8 && alnum) return true;
        }
    }
    return false;
}

} // namespace

NodeKind classify_kind(std::string_view tag, std::string_view text, size_t child_count) {
    if (child_count == 0 && !is_blank(text)) return NodeKind::Text;

    std::string lower = to_lower(tag);
    if (lower == "script" || lower == "style" || lower.find("code") != std::string::npos) {
        return NodeKind::Code;
    }
    if (lower == "meta" || lower == "head" ||
        (!lower.empty() && (lower[0] == '?' || lower[0] == '!')) ||
        lower.find("meta") != std::string::npos) {
        return NodeKind::Metadata;
    }
    if (child_count > 0) return NodeKind::Container;
    return NodeKind::Other;
}

std::vector<std::string> tokenize_words(std::string_view input) {
    std::vector<std::string> tokens;
    std::string current;

    auto flush = [&]() {
        if (!current.empty() && !contains(tokens, current)) {
            tokens.push_back(current);
        }
        current.clear();
    };

    for (char ch : input) {
        unsigned char c = static_cast<unsigned char>(std::tolower(static_cast<unsigned char>(ch)));
        if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
            current.push_back(static_cast<char>(c));
        } else {
            flush();
        }
    }
    flush();
    return tokens;
}

NormalizedTag normalize_tag(std::string_view tag) {
    while (!tag.empty() && std::isspace(static_cast<unsigned char>(tag.front()))) tag.remove_prefix(1);
    while (!tag.empty() && std::isspace(static_cast<unsigned char>(tag.back()))) tag.remove_suffix(1);

    size_t colon = tag.rfind(':');
    if (colon != std::string_view::npos) tag = tag.substr(colon + 1);

    NormalizedTag result;
    result.base = to_lower(tag);
    result.tokens = tokenize_words(result.base);
    return result;
}

SemanticType classify_semantic(std::string_view tag, const AttributeMap& attrs) {
    const NormalizedTag norm = normalize_tag(tag);
    const std::string& base = norm.base;
    const auto& tokens = norm.tokens;

    std::string hints;
    for (const char* key : {"class", "type", "role", "name"}) {
        const std::string* value = find_attr(attrs, key);
        if (value && !value->empty()) {
            if (!hints.empty()) hints.push_back(' ');
            hints += *value;
        }
    }
    const auto attr_tokens = tokenize_words(hints);

    if (base.rfind("sugg", 0) == 0 ||
        any_of(tokens, {"suggestion", "suggestions", "sugg"}) ||
        any_of(attr_tokens, {"sugg", "suggestion", "suggestions"})) {
        return SemanticType::Suggestions;
    }

    if (all_of(tokens, {"file", "map"}) ||
        all_of(tokens, {"file", "tree"}) ||
        (any_of(tokens, {"filetree", "file_map", "directory", "dir", "tree"}) && contains(tokens, "file")) ||
        base == "file_map" || base == "filetree" || base == "file_tree" ||
        all_of(attr_tokens, {"file", "tree"}) ||
        all_of(attr_tokens, {"file", "map"})) {
        return SemanticType::FileTree;
    }

    if (contains(tokens, "codemap") || all_of(tokens, {"code", "map"}) ||
        contains(attr_tokens, "codemap") || all_of(attr_tokens, {"code", "map"})) {
        return SemanticType::Codemap;
    }

    if (any_of(tokens, {"user_instructions", "instructions", "instruction"}) ||
        any_of(attr_tokens, {"user_instructions", "instructions", "instruction"}) ||
        (base == "prompt" && (contains(attr_tokens, "user") ||
                              attr_value_includes(attrs, {"role", "type"}, {"user"})))) {
        return SemanticType::Instructions;
    }

    if (all_of(tokens, {"meta", "prompt"}) ||
        any_of(tokens, {"metaprompt", "meta_prompt"}) ||
        all_of(attr_tokens, {"meta", "prompt"}) ||
        (base == "prompt" && attr_value_includes(attrs, {"type", "role"}, {"meta", "system", "template"}))) {
        return SemanticType::MetaPrompt;
    }

    if (any_of(tokens, {"references", "reference", "refs", "links", "link", "docs", "documentation"}) ||
        any_of(attr_tokens, {"references", "reference", "refs", "links", "link", "docs", "documentation"}) ||
        has_any_attr(attrs, {"href", "url", "link"})) {
        return SemanticType::References;
    }

    if (base == "file" ||
        any_of(tokens, {"file", "files", "file_contents", "filecontents", "filecontent"}) ||
        any_of(attr_tokens, {"file", "files", "file_contents", "filecontent", "filecontents"}) ||
        looks_like_file_path(attrs)) {
        return SemanticType::Files;
    }

    return SemanticType::Other;
}

} // namespace promptmap::parse
