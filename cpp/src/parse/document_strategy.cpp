#include "promptmap/parse/parser.hpp"
#include "libxml_support.hpp"

#include <climits>
#include <vector>

namespace promptmap::parse {

namespace {

AttributeMap element_attributes(xmlNodePtr node, const ParseOptions& options) {
    AttributeMap attrs;
    if (!options.preserve_attributes) return attrs;

    if (options.honor_namespaces) {
        for (xmlNsPtr ns = node->nsDef; ns; ns = ns->next) {
            attrs[detail::xmlns_attribute(ns->prefix)] = detail::to_string(ns->href);
        }
    }

    for (xmlAttrPtr attr = node->properties; attr; attr = attr->next) {
        const xmlChar* prefix = attr->ns ? attr->ns->prefix : nullptr;
        std::string name = detail::qualified_name(attr->name, prefix, true, options.honor_namespaces);

        xmlChar* value = xmlNodeGetContent(reinterpret_cast<xmlNodePtr>(attr));
        attrs[name] = detail::to_string(value);
        if (value) xmlFree(value);
    }
    return attrs;
}

std::string element_name(xmlNodePtr node, const ParseOptions& options) {
    const xmlChar* prefix = node->ns ? node->ns->prefix : nullptr;
    return detail::qualified_name(node->name, prefix, true, options.honor_namespaces);
}

} // namespace

ParsedNodePtr DocumentStrategy::parse(std::string_view markup,
                                      const ParseOptions& options,
                                      ParseEmitter& emitter) {
    const size_t total = markup.size();
    if (total > static_cast<size_t>(INT_MAX)) {
        throw InvalidArgumentError("Input too large for the whole-document strategy",
                                   std::to_string(total) + " bytes",
                                   "Lower parse.streaming_threshold");
    }

    detail::ensure_libxml_initialized();
    emitter.progress(0, total, ParseStage::Parsing, true);

    detail::ParserCtxtHandle ctxt(xmlNewParserCtxt());
    if (!ctxt || !ctxt->sax) {
        PROMPTMAP_THROW(ErrorCode::INTERNAL_ERROR, "Could not allocate libxml2 parser context");
    }

    detail::ContextState state;
    ctxt->_private = &state;
    ctxt->sax->serror = detail::capture_error;

    detail::DocHandle doc(xmlCtxtReadMemory(ctxt.get(), markup.data(), static_cast<int>(total),
                                            nullptr, nullptr, detail::kParseFlags));
    // The pull parser only reports XML_ERR_DOCUMENT_END once the root has closed
    if (!doc || !ctxt->wellFormed || state.error.failed) {
        detail::throw_parse_error(ctxt.get(), state.error, true);
    }

    emitter.progress(total * 6 / 10, total, ParseStage::Hashing, true);

    xmlNodePtr root = xmlDocGetRootElement(doc.get());
    if (!root) {
        return TreeBuilder::empty_document();
    }

    TreeBuilder builder(options, [&](const ParsedNodePtr& node) {
        emitter.partial(node);
        emitter.progress(builder.completed(), std::nullopt, ParseStage::Hashing);
    });

    // Iterative pre-order walk; each stack entry is the next sibling to visit
    // at that depth, and an exhausted entry closes its parent element.
    builder.open_element(element_name(root, options), element_attributes(root, options));
    std::vector<xmlNodePtr> cursors{root->children};

    while (!cursors.empty()) {
        xmlNodePtr node = cursors.back();
        if (!node) {
            cursors.pop_back();
            builder.close_element();
            continue;
        }
        cursors.back() = node->next;

        switch (node->type) {
            case XML_ELEMENT_NODE:
                builder.open_element(element_name(node, options), element_attributes(node, options));
                cursors.push_back(node->children);
                break;
            case XML_TEXT_NODE:
            case XML_CDATA_SECTION_NODE:
                if (node->content) {
                    builder.append_text(reinterpret_cast<const char*>(node->content));
                }
                break;
            case XML_ENTITY_REF_NODE:
                // Declared entities are never substituted
                break;
            default:
                // Comments; nothing else survives sanitization
                break;
        }
    }

    ParsedNodePtr result = builder.finish();
    emitter.progress(total, total, ParseStage::Hashing, true);
    return result;
}

} // namespace promptmap::parse
