#pragma once

#include "promptmap/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace promptmap {

struct SearchResult {
    std::string id;
    std::string path;
    std::string tag;
    int score = 0;  // lower is better: tag hits rank ahead of path hits
};

/**
 * Breadth-first substring search over tags and paths.
 *
 * The query is lower-cased and split on whitespace. Each part found in a
 * node's lower-cased tag adds its length to the tag score, likewise for the
 * path. A tag hit is reported as 1000 - tagScore, otherwise a path hit as
 * 2000 - pathScore. Scanning stops after 2 * limit hits; the hits are then
 * stable-sorted by score and truncated to `limit`.
 */
std::vector<SearchResult> search_nodes(const ParsedNode& root, std::string_view query,
                                       size_t limit = 50);

} // namespace promptmap
