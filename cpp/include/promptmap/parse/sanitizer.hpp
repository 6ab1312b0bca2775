#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace promptmap::parse {

struct SanitizeStats {
    size_t doctypes_removed = 0;
    size_t instructions_removed = 0;
};

/**
 * Remove every document type declaration (internal subset included) and every
 * processing instruction, keeping a leading <?xml ...?> declaration.
 *
 * Comments and CDATA sections are copied through untouched, so markup-looking
 * text inside them survives. Never throws: a construct without a proper end
 * is left in place for the parser to report.
 */
std::string sanitize_markup(std::string_view input, SanitizeStats* stats = nullptr);

} // namespace promptmap::parse
