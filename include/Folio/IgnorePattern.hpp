// =================================================================
// include/Folio/IgnorePattern.hpp
// =================================================================
// Header for gitignore-style pattern matching.

#pragma once

#include <string>
#include <vector>
#include <regex>

namespace Folio {

/**
 * @brief A single gitignore-style pattern compiled to a regular expression
 *
 * Supported syntax:
 * - Wildcards: * and ? (never cross a '/'), character classes [a-z] and [!a-z]
 * - ** as a whole path segment: a leading ** / matches any number of
 *   leading directories, a trailing / ** matches everything inside
 * - Negation: !pattern
 * - Directory-only patterns: pattern/
 * - Anchoring: a leading '/' or any '/' inside the pattern ties it to the root
 * - Comment lines: # comment
 *
 * A pattern that matches a directory also matches every path below it.
 */
class IgnorePattern {
public:
    /**
     * @brief Compile a gitignore-style pattern
     * @param pattern The pattern string
     */
    explicit IgnorePattern(const std::string& pattern);

    /**
     * @brief Check if a path matches this pattern
     * @param path Root-relative path using '/' separators; a trailing '/'
     *             marks the path as a directory
     * @param is_directory True if the path is a directory
     * @return true if path matches the pattern
     */
    bool matches(const std::string& path, bool is_directory = false) const;

    bool isNegation() const { return m_is_negation; }
    bool isDirectoryOnly() const { return m_directory_only; }
    bool isAnchored() const { return m_is_anchored; }

    /**
     * @brief Check if pattern is blank, a comment, or failed to compile
     * @return true if pattern never matches anything
     */
    bool isEmpty() const { return m_is_empty; }

private:
    bool m_is_negation;
    bool m_directory_only;
    bool m_is_anchored;
    bool m_is_empty;
    std::regex m_regex;

    void processPattern(const std::string& pattern);

    /**
     * @brief Convert the body of a glob (without !, leading / and trailing /) to regex
     * @param glob_pattern Glob pattern string
     * @return Regex fragment matching exactly the entry the glob names
     */
    std::string globToRegex(const std::string& glob_pattern) const;
};

/**
 * @brief Ordered collection of ignore patterns
 *
 * Patterns are evaluated in insertion order and the last one that matches
 * decides; a matching negation pattern re-includes the path.
 */
class IgnorePatternSet {
public:
    /**
     * @brief Add a pattern to the set; blank and comment lines are dropped
     * @param pattern Pattern string
     * @return true if the pattern was kept
     */
    bool addPattern(const std::string& pattern);

    /**
     * @brief Load patterns from a file (one per line, gitignore syntax)
     * @param file_path Path to ignore file
     * @return Number of patterns loaded
     */
    size_t loadFromFile(const std::string& file_path);

    /**
     * @brief Check if a path should be ignored
     * @param path Root-relative path using '/' separators
     * @param is_directory True if path is a directory
     * @return true if path should be ignored
     */
    bool shouldIgnore(const std::string& path, bool is_directory = false) const;

    size_t size() const { return m_patterns.size(); }
    bool empty() const { return m_patterns.empty(); }

private:
    std::vector<IgnorePattern> m_patterns;
};

} // namespace Folio
