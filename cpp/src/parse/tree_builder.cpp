#include "promptmap/parse/tree_builder.hpp"
#include "promptmap/parse/classify.hpp"
#include "promptmap/hashing.hpp"
#include "promptmap/error.hpp"
#include "promptmap/util/utf8.hpp"

namespace promptmap::parse {

// =============================================================================
// ParseEmitter
// =============================================================================

ParseEmitter::ParseEmitter(const ParseSink& sink, const ParserTuning& tuning)
    : sink_(sink)
    , partial_interval_(tuning.partial_interval)
    , progress_interval_(tuning.progress_interval) {}

void ParseEmitter::progress(size_t done, std::optional<size_t> total, ParseStage stage, bool force) {
    auto now = Clock::now();
    if (!force && now - last_progress_ <= progress_interval_) return;
    last_progress_ = now;
    sink_(ParseProgress{done, total, stage});
}

void ParseEmitter::partial(const ParsedNodePtr& subtree) {
    auto now = Clock::now();
    if (now - last_partial_ <= partial_interval_) return;
    last_partial_ = now;
    sink_(ParsePartial{subtree});
}

// =============================================================================
// TreeBuilder
// =============================================================================

TreeBuilder::TreeBuilder(const ParseOptions& options, NodeCallback on_node_closed)
    : options_(options)
    , on_node_closed_(std::move(on_node_closed)) {}

void TreeBuilder::open_element(std::string tag, AttributeMap attributes) {
    auto& counts = stack_.empty() ? root_counts_ : stack_.back().sibling_counts;
    size_t index = ++counts[tag];

    std::string segment = tag + "[" + std::to_string(index) + "]";

    Frame frame;
    frame.path = stack_.empty() ? std::move(segment) : stack_.back().path + "/" + segment;
    frame.tag = std::move(tag);
    if (options_.preserve_attributes) {
        frame.attributes = std::move(attributes);
    }
    stack_.push_back(std::move(frame));
}

void TreeBuilder::append_text(std::string_view text) {
    // Prolog and epilog text has no owner
    if (stack_.empty()) return;
    stack_.back().text.append(text);
}

void TreeBuilder::close_element() {
    if (stack_.empty()) {
        throw ParseError("Unbalanced end of element");
    }

    Frame frame = std::move(stack_.back());
    stack_.pop_back();

    auto node = std::make_shared<ParsedNode>();
    node->char_count = util::count_codepoints(frame.text);
    node->hash = content_hash(frame.attributes, frame.text);
    node->kind = classify_kind(frame.tag, frame.text, frame.children.size());
    node->semantic = classify_semantic(frame.tag, frame.attributes);
    if (options_.retain_text) {
        node->text = std::move(frame.text);
    }
    node->path = std::move(frame.path);
    node->tag = std::move(frame.tag);
    node->attributes = std::move(frame.attributes);
    node->children = std::move(frame.children);

    ParsedNodePtr finished = std::move(node);
    ++completed_;

    if (stack_.empty()) {
        root_ = finished;
    } else {
        stack_.back().children.push_back(finished);
    }

    if (on_node_closed_) {
        on_node_closed_(finished);
    }
}

ParsedNodePtr TreeBuilder::finish() {
    if (!stack_.empty()) {
        throw ParseError("Premature end of document, '" + stack_.back().tag + "' is not closed");
    }
    return root_ ? root_ : empty_document();
}

ParsedNodePtr TreeBuilder::empty_document() {
    auto node = std::make_shared<ParsedNode>();
    node->path = "document[1]";
    node->tag = "document";
    node->kind = NodeKind::Other;
    node->char_count = 0;
    node->hash = content_hash(AttributeMap{}, "");
    node->text = std::string();
    return node;
}

} // namespace promptmap::parse
