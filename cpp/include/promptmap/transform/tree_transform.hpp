#pragma once

#include "promptmap/tokenize/token_cache.hpp"
#include "promptmap/types.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace promptmap::transform {

struct TransformOptions {
    double aggregation_threshold = 0.0075;  // fraction of the root total
    size_t max_visible_nodes = 2000;
    std::optional<size_t> max_depth;        // unbounded when empty
    size_t preview_length = 160;            // code points

    // Throws InvalidArgumentError for a non-finite or out-of-range
    // threshold or a zero node budget
    void validate() const;

    // transform.* keys, falling back to the defaults above
    static TransformOptions from_config();
};

struct TransformTotals {
    uint64_t total_tokens = 0;  // exact counts where cached, characters elsewhere
    uint64_t total_chars = 0;
};

struct TransformResult {
    DisplayNode tree;
    TransformTotals totals;
    size_t visible_nodes = 0;
};

/**
 * Build the bounded display tree.
 *
 * Pass 1 computes subtree totals for every node (tokens from `cache` for
 * `model_id`, falling back to the node's character count). Pass 2 expands
 * from the root: children sorted by subtree total (descending, stable),
 * those under threshold * root total folded into one "Other" leaf, and the
 * visible-node budget enforced by demoting the tail of the sorted list.
 *
 * A node that is not expanded, or whose children could not all be shown,
 * carries the missing subtree totals in its own value so that
 * total_value == value + sum(children.total_value) holds everywhere.
 * Pure and deterministic; never reads token data off the nodes.
 */
TransformResult transform(const ParsedNode& root,
                          SizeBasis basis,
                          std::string_view model_id,
                          const tokenize::TokenCacheView& cache,
                          const TransformOptions& options = TransformOptions{});

} // namespace promptmap::transform
