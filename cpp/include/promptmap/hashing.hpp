#pragma once

#include "promptmap/types.hpp"
#include <string>
#include <string_view>

namespace promptmap {

/**
 * Canonical attribute serialization: "k1=v1|k2=v2", keys in byte order.
 * Empty for an empty map.
 */
std::string stable_attr_string(const AttributeMap& attrs);

/**
 * Content hash of an element: BLAKE3 over stable_attr_string(attrs) + "|" + text.
 * Deterministic, independent of attribute insertion order and of the
 * element's position in the document.
 */
ContentHash content_hash(const AttributeMap& attrs, std::string_view text);

} // namespace promptmap
