#include "promptmap/search.hpp"

#include <algorithm>
#include <cctype>
#include <deque>
#include <sstream>

namespace promptmap {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

int match_score(const std::string& haystack, const std::vector<std::string>& parts) {
    int score = 0;
    for (const auto& part : parts) {
        if (haystack.find(part) != std::string::npos) {
            score += static_cast<int>(part.size());
        }
    }
    return score;
}

} // namespace

std::vector<SearchResult> search_nodes(const ParsedNode& root, std::string_view query, size_t limit) {
    std::vector<std::string> parts;
    std::istringstream words(to_lower(query));
    for (std::string word; words >> word;) {
        parts.push_back(std::move(word));
    }

    std::vector<SearchResult> results;
    if (parts.empty() || limit == 0) return results;

    const size_t cap = limit * 2;
    std::deque<const ParsedNode*> queue{&root};

    while (!queue.empty() && results.size() < cap) {
        const ParsedNode* node = queue.front();
        queue.pop_front();

        int tag_score = match_score(to_lower(node->tag), parts);
        int path_score = match_score(to_lower(node->path), parts);

        if (tag_score > 0) {
            results.push_back({node->id(), node->path, node->tag, 1000 - tag_score});
        } else if (path_score > 0) {
            results.push_back({node->id(), node->path, node->tag, 2000 - path_score});
        }

        for (const auto& child : node->children) {
            queue.push_back(child.get());
        }
    }

    std::stable_sort(results.begin(), results.end(),
                     [](const SearchResult& a, const SearchResult& b) { return a.score < b.score; });
    if (results.size() > limit) results.resize(limit);
    return results;
}

} // namespace promptmap
