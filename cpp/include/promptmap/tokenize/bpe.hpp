#pragma once

#include <cstdint>
#include <functional>
#include <filesystem>
#include <istream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace promptmap::tokenize {

// Heterogeneous lookup so pre-token views need no temporary string
struct RankHash {
    using is_transparent = void;
    size_t operator()(std::string_view s) const noexcept { return std::hash<std::string_view>{}(s); }
};

using RankMap = std::unordered_map<std::string, uint32_t, RankHash, std::equal_to<>>;

// Split rules of the two tiktoken encodings
enum class PretokenizerStyle : uint8_t {
    Cl100k = 0,  // letter runs with one optional leading non-letter
    O200k        // additionally splits letter runs at lower-to-upper case changes
};

/**
 * Split text into pre-tokens following the tiktoken pattern classes:
 * contractions, letter runs, 1-3 digit runs, punctuation runs with trailing
 * newlines, newline runs and whitespace. Pieces are views into `text`.
 */
std::vector<std::string_view> pretokenize(std::string_view text, PretokenizerStyle style);

// Standard alphabet; characters outside it are skipped
std::string base64_decode(std::string_view encoded);

/**
 * Byte-level BPE over a tiktoken rank table.
 *
 * Every pre-token is looked up whole first; otherwise adjacent parts are
 * merged lowest rank first until no ranked pair remains. Bytes missing from
 * the table count as one token each.
 */
class BpeEncoder {
public:
    BpeEncoder(RankMap ranks, PretokenizerStyle style);

    // Lines of "<base64 token> <rank>"; throws TokenizerUnavailableError on malformed data
    static RankMap parse_tiktoken(std::istream& in);

    // Throws TokenizerUnavailableError when the file is missing or unreadable
    static BpeEncoder load_tiktoken_file(const std::filesystem::path& path, PretokenizerStyle style);

    size_t count(std::string_view text) const;

    size_t vocab_size() const noexcept { return ranks_.size(); }
    PretokenizerStyle style() const noexcept { return style_; }

private:
    // Boundaries of the merged parts of one pre-token (parts.size() - 1 tokens)
    std::vector<size_t> merge_piece(std::string_view piece) const;

    RankMap ranks_;
    PretokenizerStyle style_;
};

} // namespace promptmap::tokenize
