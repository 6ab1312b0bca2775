#include "promptmap/tokenize/bpe.hpp"
#include "promptmap/unicode_categorization.hpp"
#include "promptmap/util/utf8.hpp"
#include "promptmap/error.hpp"
#include "promptmap/logging.hpp"

#include <climits>
#include <fstream>
#include <limits>

namespace promptmap::tokenize {

// =============================================================================
// base64
// =============================================================================

namespace {

constexpr int8_t kBase64Table[128] = {
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, 62, -1, -1, -1, 63,  // + /
    52, 53, 54, 55, 56, 57, 58, 59, 60, 61, -1, -1, -1, -1, -1, -1,  // 0-9
    -1,  0,  1,  2,  3,  4,  5,  6,  7,  8,  9, 10, 11, 12, 13, 14,  // A-O
    15, 16, 17, 18, 19, 20, 21, 22, 23, 24, 25, -1, -1, -1, -1, -1,  // P-Z
    -1, 26, 27, 28, 29, 30, 31, 32, 33, 34, 35, 36, 37, 38, 39, 40,  // a-o
    41, 42, 43, 44, 45, 46, 47, 48, 49, 50, 51, -1, -1, -1, -1, -1   // p-z
};

} // namespace

std::string base64_decode(std::string_view encoded) {
    std::string out;
    out.reserve(encoded.size() * 3 / 4 + 2);

    uint32_t acc = 0;
    int bits = -8;
    for (unsigned char c : encoded) {
        if (c >= 128 || kBase64Table[c] < 0) continue;
        acc = (acc << 6) | static_cast<uint32_t>(kBase64Table[c]);
        bits += 6;
        if (bits >= 0) {
            out.push_back(static_cast<char>((acc >> bits) & 0xFF));
            bits -= 8;
        }
    }
    return out;
}

// =============================================================================
// Pre-tokenizer
// =============================================================================

namespace {

struct Cp {
    uint32_t value;
    size_t offset;  // byte offset in the source text
};

class Splitter {
public:
    Splitter(std::string_view text, PretokenizerStyle style) : text_(text), style_(style) {
        size_t pos = 0;
        while (pos < text.size()) {
            size_t start = pos;
            uint32_t cp = util::next_codepoint(text, pos);
            cps_.push_back({cp, start});
        }
    }

    std::vector<std::string_view> run() {
        std::vector<std::string_view> pieces;
        size_t i = 0;
        while (i < cps_.size()) {
            size_t end = match_at(i);
            if (end <= i) end = i + 1;
            pieces.push_back(slice(i, end));
            i = end;
        }
        return pieces;
    }

private:
    uint32_t at(size_t i) const { return cps_[i].value; }
    size_t size() const { return cps_.size(); }

    std::string_view slice(size_t begin, size_t end) const {
        size_t b = cps_[begin].offset;
        size_t e = end < cps_.size() ? cps_[end].offset : text_.size();
        return text_.substr(b, e - b);
    }

    bool letter(size_t i) const { return UnicodeCategorizer::is_letter(at(i)); }
    bool number(size_t i) const { return UnicodeCategorizer::is_number(at(i)); }
    bool space(size_t i) const { return UnicodeCategorizer::is_space(at(i)); }
    bool newline(size_t i) const { return UnicodeCategorizer::is_newline(at(i)); }

    // [^\s\p{L}\p{N}]
    bool symbol(size_t i) const { return !space(i) && !letter(i) && !number(i); }

    // [^\r\n\p{L}\p{N}]
    bool word_prefix(size_t i) const { return !newline(i) && !letter(i) && !number(i); }

    // Case classes for o200k; non-ASCII letters count as caseless and join either side
    bool upper_like(size_t i) const {
        uint32_t c = at(i);
        if (c < 0x80) return c >= 'A' && c <= 'Z';
        return letter(i);
    }
    bool lower_like(size_t i) const {
        uint32_t c = at(i);
        if (c < 0x80) return c >= 'a' && c <= 'z';
        return letter(i);
    }

    // 's 't 're 've 'm 'll 'd, case-insensitive; returns the end or `i` on no match
    size_t contraction(size_t i) const {
        if (i >= size() || at(i) != '\'') return i;
        auto lower = [&](size_t k) -> uint32_t {
            if (k >= size()) return 0;
            uint32_t c = at(k);
            return (c >= 'A' && c <= 'Z') ? c + 32 : c;
        };
        uint32_t a = lower(i + 1);
        uint32_t b = lower(i + 2);
        if (a == 's' || a == 't' || a == 'm' || a == 'd') return i + 2;
        if ((a == 'r' && b == 'e') || (a == 'v' && b == 'e') || (a == 'l' && b == 'l')) return i + 3;
        return i;
    }

    size_t run_of(size_t i, bool (Splitter::*pred)(size_t) const) const {
        while (i < size() && (this->*pred)(i)) ++i;
        return i;
    }

    size_t match_at(size_t i) const {
        size_t end;
        if (style_ == PretokenizerStyle::Cl100k) {
            if ((end = contraction(i)) > i) return end;
            if ((end = letters_cl100k(i)) > i) return end;
        } else {
            if ((end = letters_o200k(i)) > i) return end;
        }

        // \p{N}{1,3}
        if (number(i)) {
            end = i;
            while (end < size() && end - i < 3 && number(end)) ++end;
            return end;
        }

        // " ?[^\s\p{L}\p{N}]+[\r\n]*"
        size_t start = i;
        if (at(i) == ' ' && i + 1 < size() && symbol(i + 1)) start = i + 1;
        if (symbol(start)) {
            end = run_of(start, &Splitter::symbol);
            while (end < size() && (newline(end) ||
                                    (style_ == PretokenizerStyle::O200k && at(end) == '/'))) {
                ++end;
            }
            return end;
        }

        if (space(i)) {
            size_t ws_end = run_of(i, &Splitter::space);

            // \s*[\r\n]+ : through the last newline of the run
            for (size_t k = ws_end; k > i; --k) {
                if (newline(k - 1)) return k;
            }
            // \s+(?!\S) : leave the last space for the following word
            if (ws_end == size()) return ws_end;
            if (ws_end - i > 1) return ws_end - 1;
            // \s+
            return ws_end;
        }

        return i + 1;
    }

    // [^\r\n\p{L}\p{N}]?\p{L}+
    size_t letters_cl100k(size_t i) const {
        size_t start = i;
        if (word_prefix(i) && i + 1 < size() && letter(i + 1)) start = i + 1;
        if (!letter(start)) return i;
        return run_of(start, &Splitter::letter);
    }

    // [^\r\n\p{L}\p{N}]?[UPPER]*[lower]+(contraction)?  |  [^\r\n\p{L}\p{N}]?[UPPER]+[lower]*(contraction)?
    size_t letters_o200k(size_t i) const {
        size_t start = i;
        if (word_prefix(i) && i + 1 < size() && letter(i + 1)) start = i + 1;
        if (!letter(start)) return i;

        size_t upper_end = run_of(start, &Splitter::upper_like);

        // First form: backtrack the upper run until a lower run can follow
        for (size_t k = upper_end + 1; k-- > start;) {
            if (k < size() && lower_like(k)) {
                size_t end = run_of(k, &Splitter::lower_like);
                return contraction(end);
            }
        }

        // Second form
        if (upper_end > start) {
            size_t end = run_of(upper_end, &Splitter::lower_like);
            return contraction(end);
        }
        return i;
    }

    std::string_view text_;
    PretokenizerStyle style_;
    std::vector<Cp> cps_;
};

} // namespace

std::vector<std::string_view> pretokenize(std::string_view text, PretokenizerStyle style) {
    if (text.empty()) return {};
    return Splitter(text, style).run();
}

// =============================================================================
// BpeEncoder
// =============================================================================

BpeEncoder::BpeEncoder(RankMap ranks, PretokenizerStyle style)
    : ranks_(std::move(ranks))
    , style_(style) {}

RankMap BpeEncoder::parse_tiktoken(std::istream& in) {
    RankMap ranks;
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        size_t space = line.find(' ');
        if (space == std::string::npos || space == 0 || space + 1 >= line.size()) {
            throw TokenizerUnavailableError("Malformed vocabulary line " + std::to_string(line_no),
                                            line.substr(0, 64));
        }

        unsigned long rank = 0;
        try {
            rank = std::stoul(line.substr(space + 1));
        } catch (const std::exception&) {
            throw TokenizerUnavailableError("Invalid rank on vocabulary line " + std::to_string(line_no),
                                            line.substr(0, 64));
        }
        if (rank > std::numeric_limits<uint32_t>::max()) {
            throw TokenizerUnavailableError("Rank out of range on vocabulary line " + std::to_string(line_no));
        }

        ranks.emplace(base64_decode(std::string_view(line).substr(0, space)),
                      static_cast<uint32_t>(rank));
    }
    return ranks;
}

BpeEncoder BpeEncoder::load_tiktoken_file(const std::filesystem::path& path, PretokenizerStyle style) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw TokenizerUnavailableError("Cannot open vocabulary file", path.string(),
                                        "Set tokenizer.vocab_dir (PM_VOCAB_DIR) to a directory holding <family>.tiktoken files");
    }

    RankMap ranks = parse_tiktoken(in);
    if (ranks.empty()) {
        throw TokenizerUnavailableError("Vocabulary file is empty", path.string());
    }

    LOG_INFO("Loaded ", ranks.size(), " BPE ranks from ", path.string());
    return BpeEncoder(std::move(ranks), style);
}

std::vector<size_t> BpeEncoder::merge_piece(std::string_view piece) const {
    constexpr uint32_t kNone = std::numeric_limits<uint32_t>::max();

    std::vector<size_t> bounds(piece.size() + 1);
    for (size_t i = 0; i < bounds.size(); ++i) bounds[i] = i;

    // rank_of(i): rank of the pair starting at part i, spanning parts i and i+1
    auto rank_of = [&](size_t i) -> uint32_t {
        if (i + 2 >= bounds.size()) return kNone;
        auto it = ranks_.find(piece.substr(bounds[i], bounds[i + 2] - bounds[i]));
        return it == ranks_.end() ? kNone : it->second;
    };

    std::vector<uint32_t> pair_ranks(bounds.size(), kNone);
    for (size_t i = 0; i < pair_ranks.size(); ++i) pair_ranks[i] = rank_of(i);

    while (bounds.size() > 2) {
        uint32_t best = kNone;
        size_t best_i = 0;
        for (size_t i = 0; i + 2 < bounds.size(); ++i) {
            if (pair_ranks[i] < best) {
                best = pair_ranks[i];
                best_i = i;
            }
        }
        if (best == kNone) break;

        bounds.erase(bounds.begin() + static_cast<std::ptrdiff_t>(best_i) + 1);
        pair_ranks.erase(pair_ranks.begin() + static_cast<std::ptrdiff_t>(best_i) + 1);

        pair_ranks[best_i] = rank_of(best_i);
        if (best_i > 0) pair_ranks[best_i - 1] = rank_of(best_i - 1);
    }
    return bounds;
}

size_t BpeEncoder::count(std::string_view text) const {
    size_t tokens = 0;
    for (std::string_view piece : pretokenize(text, style_)) {
        if (ranks_.find(piece) != ranks_.end()) {
            ++tokens;
            continue;
        }
        tokens += merge_piece(piece).size() - 1;
    }
    return tokens;
}

} // namespace promptmap::tokenize
