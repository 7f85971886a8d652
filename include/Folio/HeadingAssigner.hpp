// =================================================================
// include/Folio/HeadingAssigner.hpp
// =================================================================
// Header for assigning headings and anchors to tree nodes.

#pragma once

#include <filesystem>
#include "AnchorRegistry.hpp"
#include "TreeNode.hpp"

namespace Folio {

/**
 * @brief Gives every node below the root its heading text and anchor
 *
 * Nodes are visited in pre-order (a directory before its children, siblings
 * in the order TreeBuilder produced). Anchors are registered in exactly that
 * order, which decides which of two identical headings gets the bare slug.
 */
class HeadingAssigner {
public:
    HeadingAssigner(const std::filesystem::path& root, AnchorRegistry& registry);

    /**
     * @brief Assign headings to the whole tree
     * @param root Root node returned by TreeBuilder; it keeps no heading
     */
    void assign(TreeNode& root);

    size_t getAssignedCount() const { return m_assigned_count; }

private:
    std::filesystem::path m_root;
    AnchorRegistry& m_registry;
    size_t m_assigned_count;

    void assignNode(TreeNode& node);
};

} // namespace Folio
