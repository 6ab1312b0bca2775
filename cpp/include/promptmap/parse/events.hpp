#pragma once

#include "promptmap/types.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <variant>

namespace promptmap::parse {

// =============================================================================
// Request options
// =============================================================================

struct ParseOptions {
    bool preserve_attributes = true;  // false: every attribute map is empty
    bool honor_namespaces = true;     // keep prefixes and xmlns declarations
    bool retain_text = true;          // keep merged own text on each node
};

/**
 * Strategy selection and event pacing. Defaults match the built-in
 * configuration; from_config() reads parse.* keys.
 */
struct ParserTuning {
    size_t streaming_threshold = 2 * 1024 * 1024;
    size_t chunk_size = 64 * 1024;
    std::chrono::milliseconds partial_interval{30};
    std::chrono::milliseconds progress_interval{60};

    static ParserTuning from_config();
};

// =============================================================================
// Event stream
// =============================================================================

enum class ParseStage : uint8_t {
    Parsing = 0,
    Hashing
};

constexpr const char* stage_to_string(ParseStage stage) noexcept {
    return stage == ParseStage::Parsing ? "parsing" : "hashing";
}

struct ParseProgress {
    size_t done = 0;
    std::optional<size_t> total;
    ParseStage stage = ParseStage::Parsing;
};

// A completed subtree, delivered while the rest of the document is still pending
struct ParsePartial {
    ParsedNodePtr subtree;
};

struct ParseDone {
    ParsedNodePtr root;
};

// Terminal failure. line/column are 1-based, 0 when the parser did not report one.
struct ParseFailure {
    std::string message;
    int line = 0;
    int column = 0;
};

using ParseEvent = std::variant<ParseProgress, ParsePartial, ParseDone, ParseFailure>;

// Receives every event of one request, in order, on the parsing thread
using ParseSink = std::function<void(const ParseEvent&)>;

} // namespace promptmap::parse
