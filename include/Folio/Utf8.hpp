// =================================================================
// include/Folio/Utf8.hpp
// =================================================================
// Unicode-aware helpers for UTF-8 names and headings.

#pragma once

#include <string>

namespace Folio {

/**
 * @brief Full Unicode lower-casing of UTF-8 text (root locale)
 *
 * "Über" becomes "über", "ÉCLAIR" becomes "éclair". Invalid byte sequences
 * come back as U+FFFD.
 */
std::string toLowerUtf8(const std::string& text);

} // namespace Folio
