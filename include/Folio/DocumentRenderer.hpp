// =================================================================
// include/Folio/DocumentRenderer.hpp
// =================================================================
// Header for rendering the annotated tree as one Markdown document.

#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "SysInteraction.hpp"
#include "TreeNode.hpp"

namespace Folio {

inline constexpr const char* TOP_ANCHOR = "document-top";
inline constexpr const char* TOC_ANCHOR = "table-of-contents";

/// Deepest Markdown heading level
inline constexpr size_t MAX_HEADING_LEVEL = 6;

/**
 * @brief Renders a tree with assigned headings into Markdown lines
 *
 * Layout:
 * - "# title" and the document-top anchor
 * - the table of contents, one nested bullet per node, mirroring the tree
 * - one section per node in pre-order: directories only carry a heading,
 *   Markdown files are embedded between comment markers, every other file
 *   is placed in a fenced block tagged with its language
 *
 * Every file section ends with a line linking back to the top and to the
 * table of contents.
 */
class DocumentRenderer {
public:
    /**
     * @brief Construct a renderer
     * @param root Resolved scan root, used for relative paths in markers
     * @param title Document title
     */
    DocumentRenderer(const std::filesystem::path& root, const std::string& title);

    /**
     * @brief Render the whole document
     * @param root Root node with headings assigned
     * @return Document lines without trailing newlines
     */
    std::vector<std::string> render(const TreeNode& root);

    /**
     * @brief Table of contents bullets for a subtree (children of node, recursively)
     */
    std::vector<std::string> buildToc(const TreeNode& node) const;

    /// Files that could not be read during the last render
    size_t getUnreadableFileCount() const { return m_unreadable_files; }

    /**
     * @brief Join lines with '\n' and terminate the document with a newline
     */
    static std::string joinLines(const std::vector<std::string>& lines);

    /**
     * @brief Fence tag for a file, e.g. "python" for ".py"; "" if unknown
     */
    static std::string getLanguageHint(const std::filesystem::path& file_path);

    static std::string getBackLink();

private:
    std::filesystem::path m_root;
    std::string m_title;
    SysInteraction m_sys;
    size_t m_unreadable_files;

    void renderNode(const TreeNode& node, std::vector<std::string>& lines);
    void renderMarkdownFile(const TreeNode& node, std::vector<std::string>& lines);
    void renderSourceFile(const TreeNode& node, std::vector<std::string>& lines);

    /**
     * @brief Read a file's text with trailing newlines removed
     *
     * A file that cannot be read renders as empty content.
     */
    std::string readContent(const TreeNode& node);
};

} // namespace Folio
