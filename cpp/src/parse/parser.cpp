#include "promptmap/parse/parser.hpp"
#include "promptmap/parse/sanitizer.hpp"
#include "promptmap/config.hpp"
#include "promptmap/error.hpp"
#include "promptmap/logging.hpp"
#include "libxml_support.hpp"

#include <cctype>
#include <chrono>

namespace promptmap::parse {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Offset past a BOM, leading whitespace and an XML declaration
size_t skip_declaration(std::string_view s) {
    size_t pos = 0;
    if (s.substr(0, 3) == "\xEF\xBB\xBF") pos = 3;
    while (pos < s.size() && is_space(s[pos])) ++pos;
    if (s.compare(pos, 5, "<?xml") == 0) {
        size_t close = s.find("?>", pos);
        if (close != std::string_view::npos) pos = close + 2;
    }
    return pos;
}

// True when nothing but the declaration, whitespace and complete comments remain
bool has_no_elements(std::string_view s) {
    size_t pos = skip_declaration(s);
    while (pos < s.size()) {
        if (is_space(s[pos])) {
            ++pos;
        } else if (s.compare(pos, 4, "<!--") == 0) {
            size_t close = s.find("-->", pos + 4);
            if (close == std::string_view::npos) return false;
            pos = close + 3;
        } else {
            return false;
        }
    }
    return true;
}

// Several top-level nodes become children of one synthetic root
std::string wrap_in_document(std::string_view s) {
    std::string wrapped = "<document>";
    wrapped.append(s.substr(skip_declaration(s)));
    wrapped.append("</document>");
    return wrapped;
}

} // namespace

ParserTuning ParserTuning::from_config() {
    Config& config = Config::getInstance();
    ParserTuning tuning;
    tuning.streaming_threshold = config.get<size_t>("parse.streaming_threshold", tuning.streaming_threshold);
    tuning.chunk_size = config.get<size_t>("parse.chunk_size", tuning.chunk_size);
    return tuning;
}

std::unique_ptr<ParseStrategy> select_strategy(size_t input_size, const ParserTuning& tuning) {
    if (input_size >= tuning.streaming_threshold) {
        return std::make_unique<StreamingStrategy>(tuning.chunk_size);
    }
    return std::make_unique<DocumentStrategy>();
}

void parse_markup(std::string_view text,
                  const ParseOptions& options,
                  const ParseSink& sink,
                  const ParserTuning& tuning) {
    const std::string sanitized = sanitize_markup(text);

    if (has_no_elements(sanitized)) {
        LOG_DEBUG("No elements in input, emitting empty document root");
        sink(ParseProgress{0, size_t{0}, ParseStage::Hashing});
        sink(ParseDone{TreeBuilder::empty_document()});
        return;
    }

    auto strategy = select_strategy(sanitized.size(), tuning);
    ParseEmitter emitter(sink, tuning);

    auto start = std::chrono::steady_clock::now();
    ParsedNodePtr root;
    try {
        try {
            root = strategy->parse(sanitized, options, emitter);
        } catch (const detail::ExtraContentError& e) {
            LOG_DEBUG("Content after the root element at ", e.line(), ":", e.column(),
                      ", wrapping in a document root");
            root = strategy->parse(wrap_in_document(sanitized), options, emitter);
        }
    } catch (const ParseError& e) {
        LOG_WARN("Parse failed (", strategy->name(), " strategy) at ", e.line(), ":", e.column(),
                 ": ", e.message());
        sink(ParseFailure{e.message(), e.line(), e.column()});
        return;
    } catch (const std::exception& e) {
        LOG_ERROR("Parse aborted (", strategy->name(), " strategy): ", e.what());
        sink(ParseFailure{e.what(), 0, 0});
        return;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    LOG_INFO("Parsed ", sanitized.size(), " bytes into ", count_nodes(*root), " nodes with the ",
             strategy->name(), " strategy in ", elapsed.count(), " ms");

    sink(ParseDone{std::move(root)});
}

ParsedNodePtr parse_document(std::string_view text,
                             const ParseOptions& options,
                             const ParserTuning& tuning) {
    ParsedNodePtr root;
    std::optional<ParseFailure> failure;

    parse_markup(text, options, [&](const ParseEvent& event) {
        if (const auto* done = std::get_if<ParseDone>(&event)) {
            root = done->root;
        } else if (const auto* error = std::get_if<ParseFailure>(&event)) {
            failure = *error;
        }
    }, tuning);

    if (failure) {
        throw ParseError(failure->message, failure->line, failure->column);
    }
    return root;
}

} // namespace promptmap::parse
