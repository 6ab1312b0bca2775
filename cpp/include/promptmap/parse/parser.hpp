#pragma once

#include "promptmap/parse/events.hpp"
#include "promptmap/parse/tree_builder.hpp"

#include <memory>
#include <string_view>

namespace promptmap::parse {

/**
 * One way of turning sanitized markup into a ParsedNode tree.
 *
 * parse() reports progress and partial subtrees through the emitter and
 * returns the finished root; malformed markup throws ParseError. Terminal
 * events are emitted by parse_markup(), never by a strategy.
 */
class ParseStrategy {
public:
    virtual ~ParseStrategy() = default;

    virtual const char* name() const noexcept = 0;

    virtual ParsedNodePtr parse(std::string_view markup,
                                const ParseOptions& options,
                                ParseEmitter& emitter) = 0;
};

// Whole document in memory (libxml2 tree), then one walk to build nodes
class DocumentStrategy final : public ParseStrategy {
public:
    const char* name() const noexcept override { return "document"; }

    ParsedNodePtr parse(std::string_view markup,
                        const ParseOptions& options,
                        ParseEmitter& emitter) override;
};

// Push parser fed in fixed-size chunks; nodes are finalized on each end tag
class StreamingStrategy final : public ParseStrategy {
public:
    explicit StreamingStrategy(size_t chunk_size);

    const char* name() const noexcept override { return "streaming"; }

    ParsedNodePtr parse(std::string_view markup,
                        const ParseOptions& options,
                        ParseEmitter& emitter) override;

private:
    size_t chunk_size_;
};

// Streaming at or above the threshold, whole-document below it
std::unique_ptr<ParseStrategy> select_strategy(size_t input_size, const ParserTuning& tuning);

/**
 * Sanitize, select a strategy and parse.
 *
 * Emits zero or more progress/partial events, then exactly one ParseDone or
 * ParseFailure. Never throws for malformed input.
 */
void parse_markup(std::string_view text,
                  const ParseOptions& options,
                  const ParseSink& sink,
                  const ParserTuning& tuning = ParserTuning{});

// Blocking convenience wrapper: the root, or ParseError on malformed input
ParsedNodePtr parse_document(std::string_view text,
                             const ParseOptions& options = ParseOptions{},
                             const ParserTuning& tuning = ParserTuning{});

} // namespace promptmap::parse
