#include "promptmap/json_export.hpp"

namespace promptmap::json {

namespace {

boost::json::object attributes_to_json(const AttributeMap& attributes) {
    boost::json::object obj;
    for (const auto& [key, value] : attributes) {
        obj[key] = value;
    }
    return obj;
}

} // namespace

boost::json::object to_json(const ParsedNode& node, bool include_text) {
    boost::json::object obj;
    obj["path"] = node.path;
    obj["tag"] = node.tag;
    obj["kind"] = kind_to_string(node.kind);
    obj["semantic"] = semantic_to_string(node.semantic);
    obj["charCount"] = node.char_count;
    obj["hash"] = node.hash.to_hex();
    obj["attributes"] = attributes_to_json(node.attributes);
    if (include_text && node.text) {
        obj["text"] = *node.text;
    }

    boost::json::array children;
    children.reserve(node.children.size());
    for (const auto& child : node.children) {
        children.push_back(to_json(*child, include_text));
    }
    obj["children"] = std::move(children);
    return obj;
}

boost::json::object to_json(const DisplayNode& node) {
    boost::json::object obj;
    obj["id"] = node.id;
    obj["name"] = node.name;
    obj["path"] = node.path;
    obj["value"] = node.value;
    obj["totalValue"] = node.total_value;
    if (node.content) {
        obj["content"] = *node.content;
    }
    obj["attributes"] = attributes_to_json(node.attributes);
    if (node.aggregate) {
        obj["aggregate"] = true;
    }

    boost::json::array children;
    children.reserve(node.children.size());
    for (const auto& child : node.children) {
        children.push_back(to_json(child));
    }
    obj["children"] = std::move(children);
    return obj;
}

boost::json::object to_json(const transform::TransformResult& result,
                            SizeBasis basis,
                            const tokenize::ModelConfig* model) {
    boost::json::object obj;
    obj["basis"] = basis_to_string(basis);
    obj["model"] = model ? boost::json::value(model->id) : boost::json::value(nullptr);

    boost::json::object totals;
    totals["tokens"] = result.totals.total_tokens;
    totals["chars"] = result.totals.total_chars;
    obj["totals"] = std::move(totals);
    obj["visibleNodes"] = result.visible_nodes;

    if (model) {
        obj["contextLimit"] = model->context_limit;
        obj["contextUsage"] = tokenize::context_usage(result.totals.total_tokens, *model);
    }

    obj["tree"] = to_json(result.tree);
    return obj;
}

boost::json::object to_json(const tokenize::TokenUpdate& update) {
    boost::json::object obj;
    obj["id"] = update.id;
    obj["hash"] = update.hash.to_hex();
    obj["tokens"] = update.tokens;
    obj["approximate"] = update.approximate;
    return obj;
}

boost::json::array to_json(const std::vector<SearchResult>& results) {
    boost::json::array arr;
    arr.reserve(results.size());
    for (const auto& result : results) {
        boost::json::object obj;
        obj["id"] = result.id;
        obj["path"] = result.path;
        obj["tag"] = result.tag;
        obj["score"] = result.score;
        arr.push_back(std::move(obj));
    }
    return arr;
}

boost::json::array to_json(const tokenize::ModelCatalog& catalog) {
    boost::json::array arr;
    for (const auto& model : catalog.models()) {
        boost::json::object obj;
        obj["id"] = model.id;
        obj["name"] = model.name;
        obj["contextLimit"] = model.context_limit;
        obj["family"] = tokenize::family_to_string(model.family);
        obj["overheadTokens"] = model.overhead_tokens;
        arr.push_back(std::move(obj));
    }
    return arr;
}

} // namespace promptmap::json
