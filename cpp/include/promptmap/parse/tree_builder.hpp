#pragma once

#include "promptmap/parse/events.hpp"
#include "promptmap/types.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace promptmap::parse {

/**
 * Time-windowed emission of progress and partial events.
 * An event is forwarded only when its window has elapsed since the last one
 * of the same type; forced progress always goes through.
 */
class ParseEmitter {
public:
    ParseEmitter(const ParseSink& sink, const ParserTuning& tuning);

    void progress(size_t done, std::optional<size_t> total, ParseStage stage, bool force = false);
    void partial(const ParsedNodePtr& subtree);

private:
    using Clock = std::chrono::steady_clock;

    const ParseSink& sink_;
    std::chrono::milliseconds partial_interval_;
    std::chrono::milliseconds progress_interval_;
    Clock::time_point last_partial_{};
    Clock::time_point last_progress_{};
};

/**
 * Stack-of-frames tree construction shared by both parse strategies.
 *
 * Callers report elements in document order (open, text fragments, close);
 * the builder assigns sibling-indexed paths on open and finalizes the node on
 * close (merged text, code point count, content hash, kind, semantic type).
 * Because both strategies go through this one class, path, hash and
 * charCount are identical whichever strategy ran.
 */
class TreeBuilder {
public:
    using NodeCallback = std::function<void(const ParsedNodePtr&)>;

    explicit TreeBuilder(const ParseOptions& options, NodeCallback on_node_closed = {});

    void open_element(std::string tag, AttributeMap attributes);
    void append_text(std::string_view text);
    void close_element();

    size_t depth() const noexcept { return stack_.size(); }
    size_t completed() const noexcept { return completed_; }
    bool has_root() const noexcept { return root_ != nullptr; }

    // Finished root, or the empty-document root when no element was seen.
    // Throws ParseError if elements are still open.
    ParsedNodePtr finish();

    // Root produced for empty or whitespace-only input
    static ParsedNodePtr empty_document();

private:
    struct Frame {
        std::string tag;
        AttributeMap attributes;
        std::string path;
        std::string text;
        std::vector<ParsedNodePtr> children;
        std::map<std::string, size_t> sibling_counts;
    };

    ParseOptions options_;
    NodeCallback on_node_closed_;
    std::vector<Frame> stack_;
    std::map<std::string, size_t> root_counts_;
    ParsedNodePtr root_;
    size_t completed_ = 0;
};

} // namespace promptmap::parse
