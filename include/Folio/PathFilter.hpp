// =================================================================
// include/Folio/PathFilter.hpp
// =================================================================
// Header for the include/exclude decision made for every directory entry.

#pragma once

#include <filesystem>
#include <string>
#include <unordered_set>
#include "IgnorePattern.hpp"

namespace Folio {

/// Extension that is embedded verbatim instead of fenced
inline constexpr const char* MARKDOWN_EXTENSION = ".md";

/**
 * @brief Everything PathFilter needs to judge an entry
 */
struct FilterConfig {
    std::filesystem::path root;           ///< Resolved scan root
    std::filesystem::path output_path;    ///< Resolved destination document
    std::unordered_set<std::string> extensions;    ///< Lower-case, dot-prefixed
    std::unordered_set<std::string> ignored_dirs;
    std::unordered_set<std::string> ignored_files;
    IgnorePatternSet ignore_patterns;     ///< Empty set means no pattern predicate
    bool follow_symlinks = false;
};

/**
 * @brief Decides whether a filesystem entry takes part in the document
 *
 * Rules are applied in order and the first one that matches wins:
 *  1. the entry resolves to the output document itself
 *  2. the entry is a symlink and symlinks are not followed
 *  3. the entry no longer exists
 *  4. the root-relative path matches an ignore pattern
 *  5. directories: ignored name or leading '.'
 *  6. files: ignored name or leading '.', otherwise the extension must be
 *     ".md" or in the allow-list
 *
 * Nothing is cached; each call looks at the filesystem as it is now.
 */
class PathFilter {
public:
    explicit PathFilter(FilterConfig config);

    /**
     * @brief Check whether an entry below the root should be included
     * @param entry Path of the entry (root / ... / name)
     * @return true if the entry survives every rule
     */
    bool shouldInclude(const std::filesystem::path& entry) const;

    /**
     * @brief Root-relative path using '/' separators
     */
    std::string getRelativePath(const std::filesystem::path& entry) const;

    const FilterConfig& getConfig() const { return m_config; }

    /**
     * @brief Lower-case an extension and make sure it starts with a dot
     * @param extension "py", ".PY" or ".py"
     * @return ".py"
     */
    static std::string normalizeExtension(const std::string& extension);

    /**
     * @brief Lower-case extension of a path including the dot, or "" if none
     */
    static std::string getExtension(const std::filesystem::path& path);

    static bool isMarkdownFile(const std::filesystem::path& path);

private:
    FilterConfig m_config;

    bool isOutputFile(const std::filesystem::path& entry) const;
    bool matchesIgnorePatterns(const std::filesystem::path& entry, bool is_directory) const;
    bool isIgnoredDirectory(const std::string& name) const;
    bool isIncludedFile(const std::filesystem::path& entry) const;
};

} // namespace Folio
