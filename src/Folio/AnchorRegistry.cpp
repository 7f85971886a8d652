// =================================================================
// src/Folio/AnchorRegistry.cpp
// =================================================================
// Implementation for heading-to-anchor conversion.

#include "Folio/AnchorRegistry.hpp"
#include "Folio/Utf8.hpp"
#include <unicode/uchar.h>
#include <unicode/unistr.h>

namespace Folio {

std::string AnchorRegistry::registerHeading(const std::string& heading_text) {
    const std::string slug = slugify(heading_text);

    std::string anchor = slug;
    while (m_counts.count(anchor) > 0) {
        size_t& occurrences = m_counts[slug];
        ++occurrences;
        anchor = slug + "-" + std::to_string(occurrences);
    }
    m_counts[anchor] = 0;

    return anchor;
}

std::string AnchorRegistry::slugify(const std::string& text) {
    const std::string lowered = toLowerUtf8(text);
    const icu::UnicodeString unicode = icu::UnicodeString::fromUTF8(
        icu::StringPiece(lowered.data(), static_cast<int32_t>(lowered.size())));

    icu::UnicodeString slug;
    bool pending_separator = false;

    for (int32_t i = 0; i < unicode.length(); i = unicode.moveIndex32(i, 1)) {
        UChar32 c = unicode.char32At(i);

        if (c == '/' || c == '_' || c == ' ' || c == '-') {
            // Runs of spaces and hyphens collapse into one hyphen
            pending_separator = true;
            continue;
        }

        // Word characters are letters and numbers of any script; everything
        // else, including other whitespace and combining marks, is dropped
        if ((U_GET_GC_MASK(c) & (U_GC_L_MASK | U_GC_N_MASK)) == 0) {
            continue;
        }

        if (pending_separator && !slug.isEmpty()) {
            slug.append(static_cast<UChar>('-'));
        }
        pending_separator = false;
        slug.append(c);
    }

    std::string result;
    slug.toUTF8String(result);
    return result;
}

} // namespace Folio
