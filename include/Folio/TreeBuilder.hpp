// =================================================================
// include/Folio/TreeBuilder.hpp
// =================================================================
// Header for building the pruned directory tree.

#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "PathFilter.hpp"
#include "TreeNode.hpp"

namespace Folio {

/**
 * @brief Walks a directory recursively and builds the pruned node tree
 *
 * The walk is post-order: a directory is only kept once at least one of its
 * entries has survived, so branches holding nothing but excluded files
 * disappear entirely. Entries are ordered by case-insensitive name at every
 * level. Directories that cannot be listed contribute nothing.
 */
class TreeBuilder {
public:
    /**
     * @brief Construct a builder
     * @param filter Filter applied to every entry below the root
     */
    explicit TreeBuilder(const PathFilter& filter);

    /**
     * @brief Build the tree rooted at a directory
     * @param root Resolved root directory (depth 0)
     * @return Root node, or nullptr if nothing below it survived
     */
    std::unique_ptr<TreeNode> build(const std::filesystem::path& root);

    /// Directories kept by the last build, excluding the root
    size_t getDirectoryCount() const { return m_directory_count; }

    /// Files kept by the last build
    size_t getFileCount() const { return m_file_count; }

    /**
     * @brief List a directory's entries sorted by case-insensitive name
     * @param directory Directory to list
     * @param entries Receives the sorted entries
     * @return false if the directory could not be listed
     */
    static bool listSortedEntries(const std::filesystem::path& directory,
                                  std::vector<std::filesystem::path>& entries);

private:
    const PathFilter& m_filter;
    size_t m_directory_count;
    size_t m_file_count;
    std::vector<std::filesystem::path> m_active_directories;

    std::unique_ptr<TreeNode> buildDirectory(const std::filesystem::path& directory, size_t depth);
    bool isDirectoryCycle(const std::filesystem::path& directory) const;
};

} // namespace Folio
