#include "promptmap/transform/labels.hpp"
#include "promptmap/unicode_categorization.hpp"
#include "promptmap/util/utf8.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace promptmap::transform {

namespace {

const std::string* first_readable_attr(const AttributeMap& attrs,
                                       std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = attrs.find(key);
        if (it != attrs.end() && !it->second.empty() && !is_opaque_id(it->second)) {
            return &it->second;
        }
    }
    return nullptr;
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

} // namespace

bool is_opaque_id(std::string_view value) {
    if (value.empty()) return false;
    if (value.size() > 40) return true;
    if (value.size() < 16) return false;

    bool hex = std::all_of(value.begin(), value.end(),
                           [](unsigned char c) { return std::isxdigit(c) != 0; });
    bool b64 = value.size() % 4 == 0 &&
               std::all_of(value.begin(), value.end(), [](unsigned char c) {
                   return std::isalnum(c) != 0 || c == '+' || c == '/' || c == '=';
               });
    return hex || b64;
}

std::string basename(std::string_view path) {
    size_t sep = path.find_last_of("/\\");
    if (sep == std::string_view::npos) return std::string(path);
    std::string_view last = path.substr(sep + 1);
    return last.empty() ? std::string(path) : std::string(last);
}

std::string friendly_name(const ParsedNode& node) {
    const AttributeMap& attrs = node.attributes;

    if (const auto* v = first_readable_attr(attrs, {"name", "title", "file", "filepath"})) {
        return *v;
    }
    if (const auto* v = first_readable_attr(attrs, {"path", "src", "uri", "url"})) {
        return basename(*v);
    }
    if (!node.tag.empty() && !iequals(node.tag, "promptnode")) {
        return node.tag;
    }
    if (const auto* v = first_readable_attr(attrs, {"id"})) {
        return *v;
    }
    return node.tag.empty() ? "node" : node.tag;
}

std::string group_key(const ParsedNode& node) {
    if (const auto* v = first_readable_attr(
            node.attributes, {"file", "filepath", "path", "src", "source", "uri", "url", "module"})) {
        return *v;
    }
    return node.path.empty() ? node.tag : node.path;
}

std::string escape_html(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    for (char c : input) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default:   out.push_back(c);
        }
    }
    return out;
}

std::optional<std::string> make_preview(std::string_view text, size_t max_codepoints) {
    if (text.empty()) return std::nullopt;

    // Collapse whitespace runs to one space, drop leading/trailing whitespace
    std::string normalized;
    normalized.reserve(text.size());
    bool pending_space = false;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t start = pos;
        uint32_t cp = util::next_codepoint(text, pos);
        if (UnicodeCategorizer::is_space(cp)) {
            pending_space = !normalized.empty();
            continue;
        }
        if (pending_space) {
            normalized.push_back(' ');
            pending_space = false;
        }
        normalized.append(text.substr(start, pos - start));
    }

    if (normalized.empty()) return std::nullopt;

    std::string_view head = util::prefix_codepoints(normalized, max_codepoints);
    if (head.size() < normalized.size()) {
        return escape_html(std::string(head) + "…");
    }
    return escape_html(normalized);
}

} // namespace promptmap::transform
