#pragma once

#include "promptmap/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace promptmap::parse {

/**
 * Structural kind of an element, a pure function of its tag, own text and
 * child count:
 *   leaf with non-blank text      -> text
 *   script / style / *code*       -> code
 *   meta / head / *meta*          -> metadata
 *   has children                  -> container
 *   otherwise                     -> other
 */
NodeKind classify_kind(std::string_view tag, std::string_view text, size_t child_count);

struct NormalizedTag {
    std::string base;                 // prefix stripped, lower-cased
    std::vector<std::string> tokens;  // alphanumeric runs of base, first occurrence order
};

NormalizedTag normalize_tag(std::string_view tag);

// Lower-cased alphanumeric runs, duplicates dropped
std::vector<std::string> tokenize_words(std::string_view input);

/**
 * Role of an element in a prompt-style document. Rules are checked in
 * priority order: suggestions, file_tree, codemap, instructions,
 * meta_prompt, references, files; anything else is other.
 */
SemanticType classify_semantic(std::string_view tag, const AttributeMap& attrs);

} // namespace promptmap::parse
