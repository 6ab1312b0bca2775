#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace promptmap::util {

// Decode the code point starting at byte offset `pos` and advance `pos` past it.
// Invalid or truncated sequences yield U+FFFD and consume one byte.
uint32_t next_codepoint(std::string_view data, size_t& pos) noexcept;

// Number of code points; the unit of every charCount
size_t count_codepoints(std::string_view data) noexcept;

// Longest prefix holding at most `max_codepoints` code points
std::string_view prefix_codepoints(std::string_view data, size_t max_codepoints) noexcept;

} // namespace promptmap::util
