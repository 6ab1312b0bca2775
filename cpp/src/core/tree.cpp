#include "promptmap/types.hpp"

#include <vector>

namespace promptmap {

size_t count_nodes(const ParsedNode& root) {
    size_t count = 0;
    std::vector<const ParsedNode*> stack{&root};
    while (!stack.empty()) {
        const ParsedNode* node = stack.back();
        stack.pop_back();
        ++count;
        for (const auto& child : node->children) {
            stack.push_back(child.get());
        }
    }
    return count;
}

} // namespace promptmap
