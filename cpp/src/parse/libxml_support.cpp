#include "libxml_support.hpp"
#include "promptmap/logging.hpp"

#include <mutex>
#include <string_view>

namespace promptmap::parse::detail {

namespace {

std::string trim_message(const char* message) {
    std::string text = message ? message : "";
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
        text.pop_back();
    }
    return text;
}

} // namespace

void ensure_libxml_initialized() {
    static std::once_flag once;
    std::call_once(once, [] {
        xmlInitParser();
        LOG_DEBUG("libxml2 ", LIBXML_DOTTED_VERSION, " initialized");
    });
}

void capture_error(void* ctx, XmlErrorArg error) {
    if (!ctx || !error) return;

    auto* ctxt = static_cast<xmlParserCtxtPtr>(ctx);
    auto* state = static_cast<ContextState*>(ctxt->_private);
    if (!state) return;

    // Namespace problems and warnings do not make a document malformed
    if (error->level != XML_ERR_FATAL) {
        LOG_DEBUG("libxml2 diagnostic at ", error->line, ":", error->int2, ": ",
                  trim_message(error->message));
        return;
    }

    if (!state->error.failed) {
        state->error.failed = true;
        state->error.code = error->code;
        state->error.message = trim_message(error->message);
        state->error.line = error->line;
        state->error.column = error->int2;
    }
}

void throw_parse_error(xmlParserCtxtPtr ctxt, const ErrorCapture& capture, bool root_closed) {
    ErrorCapture error = capture;
    if (!error.failed) {
        XmlErrorArg last = ctxt ? xmlCtxtGetLastError(ctxt) : nullptr;
        if (!last || !last->message) {
            throw ParseError("Markup is not well-formed");
        }
        error.code = last->code;
        error.message = trim_message(last->message);
        error.line = last->line;
        error.column = last->int2;
    }

    if (root_closed && error.code == XML_ERR_DOCUMENT_END) {
        throw ExtraContentError(error.message, error.line, error.column);
    }
    throw ParseError(error.message, error.line, error.column);
}

std::string attribute_value(const xmlChar* begin, const xmlChar* end) {
    static constexpr std::string_view kEscapedAmp = "&#38;";

    std::string_view raw(reinterpret_cast<const char*>(begin), static_cast<size_t>(end - begin));
    std::string value;
    value.reserve(raw.size());

    size_t pos = 0;
    while (pos < raw.size()) {
        size_t amp = raw.find(kEscapedAmp, pos);
        if (amp == std::string_view::npos) {
            value.append(raw.substr(pos));
            break;
        }
        value.append(raw.substr(pos, amp - pos));
        value.push_back('&');
        pos = amp + kEscapedAmp.size();
    }
    return value;
}

} // namespace promptmap::parse::detail
