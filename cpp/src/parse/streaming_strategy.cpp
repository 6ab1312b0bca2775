#include "promptmap/parse/parser.hpp"
#include "libxml_support.hpp"

#include <algorithm>
#include <climits>
#include <cstring>
#include <exception>

namespace promptmap::parse {

namespace {

struct StreamState : detail::ContextState {
    TreeBuilder* builder = nullptr;
    const ParseOptions* options = nullptr;
    std::exception_ptr failure;

    bool active() const noexcept { return !failure && !error.failed; }
};

StreamState& state_of(void* ctx) {
    auto* ctxt = static_cast<xmlParserCtxtPtr>(ctx);
    return *static_cast<StreamState*>(static_cast<detail::ContextState*>(ctxt->_private));
}

// Exceptions must not unwind through libxml2 frames: park them and stop.
template<typename Fn>
void guarded(void* ctx, Fn&& fn) {
    StreamState& state = state_of(ctx);
    if (!state.active()) return;
    try {
        fn(state);
    } catch (const std::exception&) {
        state.failure = std::current_exception();
        xmlStopParser(static_cast<xmlParserCtxtPtr>(ctx));
    }
}

void on_start_element(void* ctx, const xmlChar* localname, const xmlChar* prefix,
                      const xmlChar* uri, int nb_namespaces, const xmlChar** namespaces,
                      int nb_attributes, int /*nb_defaulted*/, const xmlChar** attributes) {
    guarded(ctx, [&](StreamState& state) {
        const ParseOptions& options = *state.options;

        AttributeMap attrs;
        if (options.preserve_attributes) {
            if (options.honor_namespaces) {
                for (int i = 0; i < nb_namespaces; ++i) {
                    attrs[detail::xmlns_attribute(namespaces[i * 2])] =
                        detail::to_string(namespaces[i * 2 + 1]);
                }
            }
            // localname, prefix, URI, value begin, value end
            for (int i = 0; i < nb_attributes; ++i) {
                const xmlChar** a = attributes + i * 5;
                std::string name = detail::qualified_name(a[0], a[1], a[2] != nullptr,
                                                          options.honor_namespaces);
                attrs[name] = detail::attribute_value(a[3], a[4]);
            }
        }

        state.builder->open_element(
            detail::qualified_name(localname, prefix, uri != nullptr, options.honor_namespaces),
            std::move(attrs));
    });
}

void on_end_element(void* ctx, const xmlChar* /*localname*/, const xmlChar* /*prefix*/,
                    const xmlChar* /*uri*/) {
    guarded(ctx, [](StreamState& state) { state.builder->close_element(); });
}

void on_characters(void* ctx, const xmlChar* ch, int len) {
    guarded(ctx, [&](StreamState& state) {
        state.builder->append_text(
            std::string_view(reinterpret_cast<const char*>(ch), static_cast<size_t>(len)));
    });
}

xmlSAXHandler make_handler() {
    xmlSAXHandler handler;
    std::memset(&handler, 0, sizeof(handler));
    handler.initialized = XML_SAX2_MAGIC;
    handler.startElementNs = on_start_element;
    handler.endElementNs = on_end_element;
    handler.characters = on_characters;
    handler.ignorableWhitespace = on_characters;
    handler.cdataBlock = on_characters;
    handler.serror = detail::capture_error;
    return handler;
}

bool root_closed(const StreamState& state) {
    return state.builder->has_root() && state.builder->depth() == 0;
}

void check_chunk(xmlParserCtxtPtr ctxt, const StreamState& state, int rc) {
    if (state.failure) std::rethrow_exception(state.failure);
    if (state.error.failed || rc != 0) {
        detail::throw_parse_error(ctxt, state.error, root_closed(state));
    }
}

} // namespace

StreamingStrategy::StreamingStrategy(size_t chunk_size)
    : chunk_size_(std::clamp<size_t>(chunk_size, 1, static_cast<size_t>(INT_MAX))) {}

ParsedNodePtr StreamingStrategy::parse(std::string_view markup,
                                       const ParseOptions& options,
                                       ParseEmitter& emitter) {
    const size_t total = markup.size();

    detail::ensure_libxml_initialized();
    emitter.progress(0, total, ParseStage::Parsing, true);

    TreeBuilder builder(options, [&](const ParsedNodePtr& node) { emitter.partial(node); });

    StreamState state;
    state.builder = &builder;
    state.options = &options;

    // Null user data makes libxml2 hand the context itself to every callback
    xmlSAXHandler handler = make_handler();
    detail::ParserCtxtHandle ctxt(xmlCreatePushParserCtxt(&handler, nullptr, nullptr, 0, nullptr));
    if (!ctxt) {
        PROMPTMAP_THROW(ErrorCode::INTERNAL_ERROR, "Could not allocate libxml2 push parser");
    }
    xmlCtxtUseOptions(ctxt.get(), detail::kParseFlags);
    ctxt->_private = static_cast<detail::ContextState*>(&state);

    size_t offset = 0;
    while (offset < total) {
        size_t len = std::min(chunk_size_, total - offset);
        int rc = xmlParseChunk(ctxt.get(), markup.data() + offset, static_cast<int>(len), 0);
        check_chunk(ctxt.get(), state, rc);
        offset += len;
        emitter.progress(offset, total, ParseStage::Parsing);
    }

    int rc = xmlParseChunk(ctxt.get(), nullptr, 0, 1);
    check_chunk(ctxt.get(), state, rc);
    if (!ctxt->wellFormed) {
        detail::throw_parse_error(ctxt.get(), state.error, root_closed(state));
    }

    emitter.progress(total, total, ParseStage::Hashing, true);
    return builder.finish();
}

} // namespace promptmap::parse
