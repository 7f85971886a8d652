// =================================================================
// include/Folio/TreeNode.hpp
// =================================================================
// A directory or file retained in the aggregation tree.

#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace Folio {

/**
 * @brief One filesystem entry that survived filtering
 *
 * Nodes are created by TreeBuilder with their children already sorted,
 * receive heading_text and anchor once from HeadingAssigner, and are only
 * read afterwards. A directory node always owns at least one child; the
 * root (depth 0) never gets a heading.
 */
struct TreeNode {
    std::filesystem::path path;
    bool is_directory;
    size_t depth;
    std::vector<std::unique_ptr<TreeNode>> children;

    std::string anchor;        ///< Empty until assigned; stays empty for the root
    std::string heading_text;  ///< "dir/sub/" for directories, "dir/file.ext" for files
    bool is_markdown;

    TreeNode(std::filesystem::path node_path, bool directory, size_t node_depth, bool markdown = false)
        : path(std::move(node_path)), is_directory(directory), depth(node_depth), is_markdown(markdown) {}

    bool hasHeading() const { return !heading_text.empty() && !anchor.empty(); }
};

} // namespace Folio
