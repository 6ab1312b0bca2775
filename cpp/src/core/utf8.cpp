#include "promptmap/util/utf8.hpp"

namespace promptmap::util {

uint32_t next_codepoint(std::string_view data, size_t& pos) noexcept {
    const auto* p = reinterpret_cast<const uint8_t*>(data.data()) + pos;
    const size_t remaining = data.size() - pos;
    uint32_t cp = 0xFFFD;
    size_t len = 1;

    if (p[0] < 0x80) {
        cp = p[0];
    } else if ((p[0] & 0xE0) == 0xC0 && remaining >= 2 && (p[1] & 0xC0) == 0x80) {
        uint32_t v = ((p[0] & 0x1Fu) << 6) | (p[1] & 0x3Fu);
        if (v >= 0x80) { cp = v; len = 2; }
    } else if ((p[0] & 0xF0) == 0xE0 && remaining >= 3 &&
               (p[1] & 0xC0) == 0x80 && (p[2] & 0xC0) == 0x80) {
        uint32_t v = ((p[0] & 0x0Fu) << 12) | ((p[1] & 0x3Fu) << 6) | (p[2] & 0x3Fu);
        if (v >= 0x800 && (v < 0xD800 || v > 0xDFFF)) { cp = v; len = 3; }
    } else if ((p[0] & 0xF8) == 0xF0 && remaining >= 4 &&
               (p[1] & 0xC0) == 0x80 && (p[2] & 0xC0) == 0x80 && (p[3] & 0xC0) == 0x80) {
        uint32_t v = ((p[0] & 0x07u) << 18) | ((p[1] & 0x3Fu) << 12) |
                     ((p[2] & 0x3Fu) << 6) | (p[3] & 0x3Fu);
        if (v >= 0x10000 && v <= 0x10FFFF) { cp = v; len = 4; }
    }

    pos += len;
    return cp;
}

size_t count_codepoints(std::string_view data) noexcept {
    size_t count = 0;
    size_t pos = 0;
    while (pos < data.size()) {
        // ASCII fast path
        if (static_cast<uint8_t>(data[pos]) < 0x80) {
            ++pos;
        } else {
            next_codepoint(data, pos);
        }
        ++count;
    }
    return count;
}

std::string_view prefix_codepoints(std::string_view data, size_t max_codepoints) noexcept {
    size_t pos = 0;
    for (size_t n = 0; n < max_codepoints && pos < data.size(); ++n) {
        next_codepoint(data, pos);
    }
    return data.substr(0, pos);
}

} // namespace promptmap::util
