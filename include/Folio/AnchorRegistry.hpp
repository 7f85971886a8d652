// =================================================================
// include/Folio/AnchorRegistry.hpp
// =================================================================
// Header for heading-to-anchor conversion.

#pragma once

#include <string>
#include <unordered_map>

namespace Folio {

/**
 * @brief Hands out unique, GitHub-compatible anchor slugs for heading text
 *
 * The first heading with a given slug gets the bare slug, later ones get
 * "slug-1", "slug-2", ... Generated suffixed slugs are reserved as well, so
 * a heading that literally slugifies to "slug-1" can never collide with a
 * suffix handed out earlier. One registry belongs to one document.
 */
class AnchorRegistry {
public:
    /**
     * @brief Register heading text and return its anchor
     * @param heading_text Text shown in the heading
     * @return Anchor unique within this registry
     */
    std::string registerHeading(const std::string& heading_text);

    /**
     * @brief Convert text to a slug without registering it
     *
     * Lower-cases (full Unicode), turns '/' and '_' into spaces, drops
     * everything that is not a letter, number, '-' or ' ', then joins the
     * remaining words with single hyphens. Letters and numbers of every
     * script count, so "Über/Straße.md" gives "über-straßemd".
     */
    static std::string slugify(const std::string& text);

    size_t size() const { return m_counts.size(); }

private:
    std::unordered_map<std::string, size_t> m_counts;
};

} // namespace Folio
