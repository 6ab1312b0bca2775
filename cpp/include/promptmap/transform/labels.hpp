#pragma once

#include "promptmap/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace promptmap::transform {

// Machine identifiers that make poor labels: 16+ hex chars, 16+ base64 chars
// with a length divisible by 4, or anything longer than 40 bytes
bool is_opaque_id(std::string_view value);

// Last component of a '/' or '\' separated path
std::string basename(std::string_view path);

/**
 * Best human label for a node: name/title/file/filepath, then the basename
 * of path/src/uri/url, then the tag, then a readable id attribute, then
 * "node". Opaque values are skipped.
 */
std::string friendly_name(const ParsedNode& node);

// Grouping key: file-ish attribute, else path, else tag
std::string group_key(const ParsedNode& node);

std::string escape_html(std::string_view input);

// Whitespace-collapsed, trimmed, truncated to max_codepoints with a trailing
// ellipsis, HTML-escaped. nullopt when there is no visible text.
std::optional<std::string> make_preview(std::string_view text, size_t max_codepoints);

} // namespace promptmap::transform
