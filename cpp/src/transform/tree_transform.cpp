#include "promptmap/transform/tree_transform.hpp"
#include "promptmap/transform/labels.hpp"
#include "promptmap/config.hpp"
#include "promptmap/error.hpp"
#include "promptmap/logging.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <utility>
#include <vector>

namespace promptmap::transform {

void TransformOptions::validate() const {
    PROMPTMAP_CHECK_ARGUMENT(std::isfinite(aggregation_threshold),
                             "aggregation_threshold must be a finite number");
    PROMPTMAP_CHECK_ARGUMENT(aggregation_threshold >= 0.0 && aggregation_threshold <= 1.0,
                             "aggregation_threshold must be within [0, 1], got " +
                                 std::to_string(aggregation_threshold));
    PROMPTMAP_CHECK_ARGUMENT(max_visible_nodes >= 1, "max_visible_nodes must be at least 1");
}

TransformOptions TransformOptions::from_config() {
    Config& config = Config::getInstance();
    TransformOptions options;
    options.aggregation_threshold =
        config.get<double>("transform.aggregation_threshold", options.aggregation_threshold);
    options.max_visible_nodes = config.get<size_t>("transform.max_visible_nodes", options.max_visible_nodes);
    return options;
}

namespace {

struct NodeStats {
    uint64_t value_chars = 0;
    std::optional<uint64_t> value_tokens;
    uint64_t total_chars = 0;
    uint64_t total_tokens = 0;  // cached tokens, own chars where missing
};

using StatsMap = std::unordered_map<const ParsedNode*, NodeStats>;

// Pass 1: post-order subtree totals
StatsMap precompute_stats(const ParsedNode& root, std::string_view model_id,
                          const tokenize::TokenCacheView& cache) {
    StatsMap stats;
    std::vector<std::pair<const ParsedNode*, bool>> stack{{&root, false}};

    while (!stack.empty()) {
        auto [node, expanded] = stack.back();
        stack.pop_back();

        if (!expanded) {
            stack.emplace_back(node, true);
            for (const auto& child : node->children) {
                stack.emplace_back(child.get(), false);
            }
            continue;
        }

        NodeStats s;
        s.value_chars = node->char_count;
        s.value_tokens = cache.get(node->hash, model_id);
        s.total_chars = s.value_chars;
        s.total_tokens = s.value_tokens.value_or(s.value_chars);
        for (const auto& child : node->children) {
            const NodeStats& cs = stats.at(child.get());
            s.total_chars += cs.total_chars;
            s.total_tokens += cs.total_tokens;
        }
        stats.emplace(node, s);
    }
    return stats;
}

// Pass 2: expansion under the aggregation threshold and node budget
class DisplayBuilder {
public:
    DisplayBuilder(const StatsMap& stats, SizeBasis basis, const TransformOptions& options,
                   uint64_t root_total)
        : stats_(stats)
        , basis_(basis)
        , options_(options)
        , threshold_(options.aggregation_threshold * static_cast<double>(root_total)) {}

    DisplayNode build(const ParsedNode& node, size_t depth) {
        ++visible_;

        const NodeStats& s = stats_.at(&node);

        DisplayNode out;
        out.id = node.id();
        out.name = friendly_name(node);
        out.path = node.path;
        out.value = own_value(s);
        out.total_value = subtree_total(s);
        if (node.text) {
            out.content = make_preview(*node.text, options_.preview_length);
        }
        out.attributes = node.attributes;
        out.attributes["__tag"] = node.tag;
        out.attributes["__group"] = group_key(node);
        out.attributes["__kind"] = kind_to_string(node.kind);
        out.attributes["__semantic"] = semantic_to_string(node.semantic);

        bool can_expand_depth = !options_.max_depth || depth < *options_.max_depth;
        bool can_expand_budget = visible_ < options_.max_visible_nodes;

        if (node.children.empty() || !can_expand_depth || !can_expand_budget) {
            // Collapsed: the whole subtree is this node's own weight
            out.value = out.total_value;
            return out;
        }

        struct Entry {
            const ParsedNode* node;
            uint64_t total;
        };

        std::vector<Entry> entries;
        entries.reserve(node.children.size());
        for (const auto& child : node.children) {
            entries.push_back({child.get(), subtree_total(stats_.at(child.get()))});
        }
        std::stable_sort(entries.begin(), entries.end(),
                         [](const Entry& a, const Entry& b) { return a.total > b.total; });

        std::vector<Entry> keep;
        std::vector<Entry> aggregate;
        for (const auto& entry : entries) {
            if (static_cast<double>(entry.total) < threshold_) {
                aggregate.push_back(entry);
            } else {
                keep.push_back(entry);
            }
        }

        const size_t remaining = options_.max_visible_nodes - visible_;

        // One slot goes to the aggregate whenever there will be one. If the
        // kept list does not fit, its tail (in sorted order) is demoted,
        // which itself creates the aggregate and so reserves the slot.
        size_t allowed_keep = aggregate.empty() ? remaining : remaining - 1;
        if (keep.size() > allowed_keep) {
            allowed_keep = remaining - 1;
            aggregate.insert(aggregate.end(),
                             keep.begin() + static_cast<std::ptrdiff_t>(allowed_keep), keep.end());
            keep.resize(allowed_keep);
        }

        uint64_t folded = 0;
        for (size_t i = 0; i < keep.size(); ++i) {
            if (visible_ >= options_.max_visible_nodes) {
                for (size_t j = i; j < keep.size(); ++j) folded += keep[j].total;
                break;
            }
            out.children.push_back(build(*keep[i].node, depth + 1));
        }

        if (!aggregate.empty()) {
            uint64_t aggregate_total = 0;
            for (const auto& entry : aggregate) aggregate_total += entry.total;

            if (visible_ < options_.max_visible_nodes) {
                ++visible_;
                out.children.push_back(make_aggregate(node, aggregate.size(), aggregate_total));
            } else {
                folded += aggregate_total;
            }
        }

        if (folded > 0) {
            LOG_DEBUG("Node budget exhausted under ", node.path, ", folded ", folded, " into its value");
            out.value += folded;
        }
        return out;
    }

    size_t visible() const noexcept { return visible_; }

private:
    uint64_t own_value(const NodeStats& s) const {
        if (basis_ == SizeBasis::Tokens) return s.value_tokens.value_or(s.value_chars);
        return s.value_chars;
    }

    uint64_t subtree_total(const NodeStats& s) const {
        return basis_ == SizeBasis::Tokens ? s.total_tokens : s.total_chars;
    }

    static DisplayNode make_aggregate(const ParsedNode& parent, size_t count, uint64_t total) {
        DisplayNode other;
        other.id = parent.id() + "::other";
        other.name = "Other (" + std::to_string(count) + (count == 1 ? " item)" : " items)");
        other.path = parent.path + "/other";
        other.value = total;
        other.total_value = total;
        other.aggregate = true;
        return other;
    }

    const StatsMap& stats_;
    SizeBasis basis_;
    const TransformOptions& options_;
    double threshold_;
    size_t visible_ = 0;
};

} // namespace

TransformResult transform(const ParsedNode& root,
                          SizeBasis basis,
                          std::string_view model_id,
                          const tokenize::TokenCacheView& cache,
                          const TransformOptions& options) {
    options.validate();

    StatsMap stats = precompute_stats(root, model_id, cache);
    const NodeStats& root_stats = stats.at(&root);

    TransformResult result;
    result.totals.total_tokens = root_stats.total_tokens;
    result.totals.total_chars = root_stats.total_chars;

    uint64_t root_total = basis == SizeBasis::Tokens ? root_stats.total_tokens : root_stats.total_chars;

    DisplayBuilder builder(stats, basis, options, root_total);
    result.tree = builder.build(root, 0);
    result.visible_nodes = builder.visible();
    return result;
}

} // namespace promptmap::transform
