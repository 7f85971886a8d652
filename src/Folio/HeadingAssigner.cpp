// =================================================================
// src/Folio/HeadingAssigner.cpp
// =================================================================
// Implementation for heading and anchor assignment.

#include "Folio/HeadingAssigner.hpp"

namespace Folio {

HeadingAssigner::HeadingAssigner(const std::filesystem::path& root, AnchorRegistry& registry)
    : m_root(root), m_registry(registry), m_assigned_count(0)
{
}

void HeadingAssigner::assign(TreeNode& root) {
    m_assigned_count = 0;
    assignNode(root);
}

void HeadingAssigner::assignNode(TreeNode& node) {
    if (node.depth > 0) {
        std::string relative = node.path.lexically_relative(m_root).generic_string();
        node.heading_text = node.is_directory ? relative + "/" : relative;
        node.anchor = m_registry.registerHeading(node.heading_text);
        m_assigned_count++;
    }

    for (auto& child : node.children) {
        assignNode(*child);
    }
}

} // namespace Folio
