#include "promptmap/parse/sanitizer.hpp"
#include "promptmap/logging.hpp"

#include <cctype>

namespace promptmap::parse {

namespace {

bool starts_with_ci(std::string_view s, size_t pos, std::string_view prefix) {
    if (s.size() - pos < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(s[pos + i])) !=
            std::toupper(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

bool is_xml_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

// End (one past '>') of a DOCTYPE starting at `pos`, or npos when malformed.
// Quoted literals are opaque; inside the internal subset so are comments and
// processing instructions, and ']' closes the subset.
size_t doctype_end(std::string_view s, size_t pos) {
    size_t i = pos + 9;  // "<!DOCTYPE"
    bool in_subset = false;

    while (i < s.size()) {
        char c = s[i];
        if (c == '"' || c == '\'') {
            size_t close = s.find(c, i + 1);
            if (close == std::string_view::npos) return std::string_view::npos;
            i = close + 1;
            continue;
        }

        if (in_subset) {
            if (s.compare(i, 4, "<!--") == 0) {
                size_t close = s.find("-->", i + 4);
                if (close == std::string_view::npos) return std::string_view::npos;
                i = close + 3;
                continue;
            }
            if (s.compare(i, 2, "<?") == 0) {
                size_t close = s.find("?>", i + 2);
                if (close == std::string_view::npos) return std::string_view::npos;
                i = close + 2;
                continue;
            }
            if (c == ']') in_subset = false;
            ++i;
            continue;
        }

        if (c == '>') return i + 1;
        if (c == '[') {
            in_subset = true;
        } else if (c == '<' || c == ']') {
            return std::string_view::npos;
        }
        ++i;
    }
    return std::string_view::npos;
}

// Leading XML declaration: only whitespace (or a BOM) may precede it
bool is_leading_declaration(std::string_view s, size_t pos) {
    if (!(starts_with_ci(s, pos, "<?xml") && pos + 5 < s.size() && is_xml_space(s[pos + 5]))) {
        return false;
    }
    size_t start = 0;
    if (s.size() >= 3 && s.substr(0, 3) == "\xEF\xBB\xBF") start = 3;
    for (size_t i = start; i < pos; ++i) {
        if (!is_xml_space(s[i])) return false;
    }
    return true;
}

} // namespace

std::string sanitize_markup(std::string_view input, SanitizeStats* stats) {
    SanitizeStats local;
    std::string out;
    out.reserve(input.size());

    size_t pos = 0;
    while (pos < input.size()) {
        size_t lt = input.find('<', pos);
        if (lt == std::string_view::npos) {
            out.append(input.substr(pos));
            break;
        }
        out.append(input.substr(pos, lt - pos));

        // Comments and CDATA pass through verbatim
        if (input.compare(lt, 4, "<!--") == 0) {
            size_t end = input.find("-->", lt + 4);
            size_t stop = end == std::string_view::npos ? input.size() : end + 3;
            out.append(input.substr(lt, stop - lt));
            pos = stop;
            continue;
        }
        if (input.compare(lt, 9, "<![CDATA[") == 0) {
            size_t end = input.find("]]>", lt + 9);
            size_t stop = end == std::string_view::npos ? input.size() : end + 3;
            out.append(input.substr(lt, stop - lt));
            pos = stop;
            continue;
        }

        if (starts_with_ci(input, lt, "<!DOCTYPE")) {
            size_t end = doctype_end(input, lt);
            if (end != std::string_view::npos) {
                ++local.doctypes_removed;
                pos = end;
                continue;
            }
        } else if (input.compare(lt, 2, "<?") == 0 && !is_leading_declaration(input, lt)) {
            size_t end = input.find("?>", lt + 2);
            if (end != std::string_view::npos) {
                ++local.instructions_removed;
                pos = end + 2;
                continue;
            }
        }

        out.push_back('<');
        pos = lt + 1;
    }

    if (local.doctypes_removed > 0 || local.instructions_removed > 0) {
        LOG_DEBUG("Sanitizer removed ", local.doctypes_removed, " doctype(s) and ",
                  local.instructions_removed, " processing instruction(s)");
    }
    if (stats) *stats = local;
    return out;
}

} // namespace promptmap::parse
