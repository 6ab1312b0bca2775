#include "promptmap/unicode_categorization.hpp"

namespace promptmap {

CharClass UnicodeCategorizer::categorize(uint32_t codepoint) noexcept
{
    size_t lo = 0, hi = num_unicode_blocks;
    while (lo < hi) {
        size_t mid = lo + (hi - lo) / 2;
        if (codepoint > unicode_blocks[mid].end) {
            lo = mid + 1;
        } else if (codepoint < unicode_blocks[mid].start) {
            hi = mid;
        } else {
            return unicode_blocks[mid].category;
        }
    }

    if (codepoint <= 0x10FFFF) {
        return CharClass::Letter;
    }
    return CharClass::Other;
}

} // namespace promptmap
