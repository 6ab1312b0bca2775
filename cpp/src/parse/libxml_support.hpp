#pragma once

// libxml2 glue shared by the document and streaming strategies

#include "promptmap/error.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>
#include <libxml/xmlversion.h>

#include <memory>
#include <string>

namespace promptmap::parse::detail {

// No network, no DTD loading and no entity substitution: only predefined and
// character references expand. HUGE lifts the per-node text size limit.
#if LIBXML_VERSION >= 21300
constexpr int kParseFlags = XML_PARSE_NONET | XML_PARSE_NO_XXE | XML_PARSE_HUGE;
#else
constexpr int kParseFlags = XML_PARSE_NONET | XML_PARSE_HUGE;
#endif

#if LIBXML_VERSION >= 21200
using XmlErrorArg = const xmlError*;
#else
using XmlErrorArg = xmlErrorPtr;
#endif

// First fatal diagnostic seen on a parser context
struct ErrorCapture {
    bool failed = false;
    int code = 0;  // xmlParserErrors
    std::string message;
    int line = 0;
    int column = 0;
};

// Reached through xmlParserCtxt::_private from the error handler
struct ContextState {
    ErrorCapture error;
};

struct ParserCtxtDeleter {
    void operator()(xmlParserCtxtPtr ctxt) const noexcept { xmlFreeParserCtxt(ctxt); }
};
using ParserCtxtHandle = std::unique_ptr<xmlParserCtxt, ParserCtxtDeleter>;

struct DocDeleter {
    void operator()(xmlDocPtr doc) const noexcept { xmlFreeDoc(doc); }
};
using DocHandle = std::unique_ptr<xmlDoc, DocDeleter>;

/**
 * A complete root element followed by more content, e.g. several top-level
 * elements. The caller may retry with the content wrapped in one root.
 */
class ExtraContentError : public ParseError {
public:
    using ParseError::ParseError;
};

void ensure_libxml_initialized();

// Structured error handler; the callback's user data is the parser context
void capture_error(void* ctx, XmlErrorArg error);

// Throws ParseError from the captured diagnostic, or the context's last error.
// With `root_closed`, content after the root throws ExtraContentError instead.
[[noreturn]] void throw_parse_error(xmlParserCtxtPtr ctxt, const ErrorCapture& capture,
                                    bool root_closed = false);

inline std::string to_string(const xmlChar* s) {
    return s ? std::string(reinterpret_cast<const char*>(s)) : std::string();
}

inline std::string to_string(const xmlChar* begin, const xmlChar* end) {
    return std::string(reinterpret_cast<const char*>(begin), static_cast<size_t>(end - begin));
}

// SAX2 attribute value as the tree builder would store it. Without entity
// substitution libxml2 keeps every '&' of a value escaped as "&#38;".
std::string attribute_value(const xmlChar* begin, const xmlChar* end);

/**
 * Name as it appears in paths and attribute maps. An undeclared prefix is
 * kept literally (libxml2 does the same when building a tree); a bound
 * prefix is kept only when namespaces are honored.
 */
inline std::string qualified_name(const xmlChar* local, const xmlChar* prefix,
                                  bool prefix_bound, bool honor_namespaces) {
    if (prefix && (!prefix_bound || honor_namespaces)) {
        return to_string(prefix) + ":" + to_string(local);
    }
    return to_string(local);
}

// Attribute name for a namespace declaration: "xmlns" or "xmlns:p"
inline std::string xmlns_attribute(const xmlChar* prefix) {
    return prefix ? "xmlns:" + to_string(prefix) : std::string("xmlns");
}

} // namespace promptmap::parse::detail
