#pragma once

#include <cstddef>
#include <cstdint>

namespace promptmap {

// Coarse code point classes used by the BPE pre-tokenizer (\p{L}, \p{N}, \s)
enum class CharClass : uint8_t {
    Letter = 0,
    Mark,
    Number,
    Newline,
    Space,
    Punctuation,
    Other
};

/**
 * Block-table categorization of Unicode code points.
 * Unlisted assigned ranges default to Letter, which is what the pre-tokenizer
 * wants for the long tail of scripts.
 */
class UnicodeCategorizer {
public:
    static CharClass categorize(uint32_t codepoint) noexcept;

    static bool is_letter(uint32_t cp) noexcept {
        CharClass c = categorize(cp);
        return c == CharClass::Letter || c == CharClass::Mark;
    }
    static bool is_number(uint32_t cp) noexcept { return categorize(cp) == CharClass::Number; }
    static bool is_space(uint32_t cp) noexcept {
        CharClass c = categorize(cp);
        return c == CharClass::Space || c == CharClass::Newline;
    }
    static bool is_newline(uint32_t cp) noexcept { return cp == '\n' || cp == '\r'; }

private:
    struct UnicodeBlock {
        uint32_t start;
        uint32_t end;
        CharClass category;
    };

    // Sorted, non-overlapping
    static constexpr UnicodeBlock unicode_blocks[] = {
        {0x0000, 0x0008, CharClass::Other},
        {0x0009, 0x0009, CharClass::Space},
        {0x000A, 0x000A, CharClass::Newline},
        {0x000B, 0x000C, CharClass::Space},
        {0x000D, 0x000D, CharClass::Newline},
        {0x000E, 0x001F, CharClass::Other},
        {0x0020, 0x0020, CharClass::Space},
        {0x0021, 0x002F, CharClass::Punctuation},
        {0x0030, 0x0039, CharClass::Number},
        {0x003A, 0x0040, CharClass::Punctuation},
        {0x0041, 0x005A, CharClass::Letter},
        {0x005B, 0x0060, CharClass::Punctuation},
        {0x0061, 0x007A, CharClass::Letter},
        {0x007B, 0x007E, CharClass::Punctuation},
        {0x007F, 0x0084, CharClass::Other},
        {0x0085, 0x0085, CharClass::Space},
        {0x0086, 0x009F, CharClass::Other},
        {0x00A0, 0x00A0, CharClass::Space},
        {0x00A1, 0x00A9, CharClass::Punctuation},
        {0x00AA, 0x00AA, CharClass::Letter},
        {0x00AB, 0x00B1, CharClass::Punctuation},
        {0x00B2, 0x00B3, CharClass::Number},
        {0x00B4, 0x00B4, CharClass::Punctuation},
        {0x00B5, 0x00B5, CharClass::Letter},
        {0x00B6, 0x00B8, CharClass::Punctuation},
        {0x00B9, 0x00B9, CharClass::Number},
        {0x00BA, 0x00BA, CharClass::Letter},
        {0x00BB, 0x00BB, CharClass::Punctuation},
        {0x00BC, 0x00BE, CharClass::Number},
        {0x00BF, 0x00BF, CharClass::Punctuation},
        {0x00C0, 0x00D6, CharClass::Letter},
        {0x00D7, 0x00D7, CharClass::Punctuation},
        {0x00D8, 0x00F6, CharClass::Letter},
        {0x00F7, 0x00F7, CharClass::Punctuation},
        {0x00F8, 0x02FF, CharClass::Letter},
        {0x0300, 0x036F, CharClass::Mark},
        {0x0370, 0x0482, CharClass::Letter},
        {0x0483, 0x0489, CharClass::Mark},
        {0x048A, 0x058F, CharClass::Letter},
        {0x0591, 0x05C7, CharClass::Mark},
        {0x05D0, 0x05FF, CharClass::Letter},
        {0x0600, 0x065F, CharClass::Letter},
        {0x0660, 0x0669, CharClass::Number},
        {0x066A, 0x06EF, CharClass::Letter},
        {0x06F0, 0x06F9, CharClass::Number},
        {0x06FA, 0x08FF, CharClass::Letter},
        {0x0966, 0x096F, CharClass::Number},
        {0x1680, 0x1680, CharClass::Space},
        {0x2000, 0x200A, CharClass::Space},
        {0x200B, 0x200F, CharClass::Other},
        {0x2010, 0x2027, CharClass::Punctuation},
        {0x2028, 0x2029, CharClass::Space},
        {0x202A, 0x202E, CharClass::Other},
        {0x202F, 0x202F, CharClass::Space},
        {0x2030, 0x205E, CharClass::Punctuation},
        {0x205F, 0x205F, CharClass::Space},
        {0x2060, 0x206F, CharClass::Other},
        {0x2070, 0x2079, CharClass::Number},
        {0x207A, 0x207F, CharClass::Punctuation},
        {0x2080, 0x2089, CharClass::Number},
        {0x208A, 0x20CF, CharClass::Punctuation},
        {0x20D0, 0x20FF, CharClass::Mark},
        {0x2100, 0x214F, CharClass::Punctuation},
        {0x2150, 0x218F, CharClass::Number},
        {0x2190, 0x245F, CharClass::Punctuation},
        {0x2460, 0x24FF, CharClass::Number},
        {0x2500, 0x2BFF, CharClass::Punctuation},
        {0x2E00, 0x2E7F, CharClass::Punctuation},
        {0x3000, 0x3000, CharClass::Space},
        {0x3001, 0x3003, CharClass::Punctuation},
        {0x3008, 0x3020, CharClass::Punctuation},
        {0xD800, 0xDFFF, CharClass::Other},
        {0xE000, 0xF8FF, CharClass::Other},
        {0xFE00, 0xFE0F, CharClass::Mark},
        {0xFE10, 0xFE6F, CharClass::Punctuation},
        {0xFEFF, 0xFEFF, CharClass::Other},
        {0xFF01, 0xFF0F, CharClass::Punctuation},
        {0xFF10, 0xFF19, CharClass::Number},
        {0xFF1A, 0xFF20, CharClass::Punctuation},
        {0xFFF0, 0xFFFF, CharClass::Other},
        {0x1F000, 0x1FAFF, CharClass::Punctuation},
        {0xE0000, 0xE007F, CharClass::Other},
        {0xF0000, 0x10FFFF, CharClass::Other},
    };

    static constexpr size_t num_unicode_blocks = sizeof(unicode_blocks) / sizeof(unicode_blocks[0]);
};

} // namespace promptmap
