#pragma once

#include "promptmap/search.hpp"
#include "promptmap/tokenize/models.hpp"
#include "promptmap/tokenize/token_cache.hpp"
#include "promptmap/transform/tree_transform.hpp"
#include "promptmap/types.hpp"

#include <boost/json.hpp>

#include <vector>

namespace promptmap::json {

// {path, tag, kind, semantic, charCount, hash, attributes, [text], children}
boost::json::object to_json(const ParsedNode& node, bool include_text = false);

// {id, name, path, value, totalValue, [content], attributes, [aggregate], children}
boost::json::object to_json(const DisplayNode& node);

// {basis, model, totals, visibleNodes, [contextUsage], tree}
boost::json::object to_json(const transform::TransformResult& result,
                            SizeBasis basis,
                            const tokenize::ModelConfig* model);

boost::json::object to_json(const tokenize::TokenUpdate& update);

boost::json::array to_json(const std::vector<SearchResult>& results);

boost::json::array to_json(const tokenize::ModelCatalog& catalog);

} // namespace promptmap::json
