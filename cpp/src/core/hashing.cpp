#include "promptmap/hashing.hpp"
#include "promptmap/blake3.hpp"

namespace promptmap {

std::string stable_attr_string(const AttributeMap& attrs) {
    std::string out;
    bool first = true;
    for (const auto& [key, value] : attrs) {
        if (!first) out.push_back('|');
        out.append(key);
        out.push_back('=');
        out.append(value);
        first = false;
    }
    return out;
}

ContentHash content_hash(const AttributeMap& attrs, std::string_view text) {
    Blake3Hasher::Incremental hasher;
    hasher.update(stable_attr_string(attrs));
    hasher.update(std::string_view("|"));
    hasher.update(text);
    return hasher.finalize();
}

} // namespace promptmap
