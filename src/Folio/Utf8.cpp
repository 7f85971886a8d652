// =================================================================
// src/Folio/Utf8.cpp
// =================================================================
// Implementation for Unicode-aware UTF-8 helpers.

#include "Folio/Utf8.hpp"
#include <unicode/locid.h>
#include <unicode/unistr.h>

namespace Folio {

std::string toLowerUtf8(const std::string& text) {
    // Plain ASCII needs no round trip through UTF-16
    bool ascii = true;
    for (unsigned char c : text) {
        if (c >= 0x80) {
            ascii = false;
            break;
        }
    }

    std::string lowered;
    if (ascii) {
        lowered.reserve(text.size());
        for (unsigned char c : text) {
            lowered += (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : static_cast<char>(c);
        }
        return lowered;
    }

    icu::UnicodeString unicode = icu::UnicodeString::fromUTF8(icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));
    unicode.toLower(icu::Locale::getRoot());
    unicode.toUTF8String(lowered);
    return lowered;
}

} // namespace Folio
