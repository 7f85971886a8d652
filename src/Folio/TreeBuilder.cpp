// =================================================================
// src/Folio/TreeBuilder.cpp
// =================================================================
// Implementation for the post-order directory walk.

#include "Folio/TreeBuilder.hpp"
#include "Folio/Logger.hpp"
#include "Folio/Utf8.hpp"
#include <algorithm>

namespace fs = std::filesystem;

namespace Folio {

TreeBuilder::TreeBuilder(const PathFilter& filter)
    : m_filter(filter), m_directory_count(0), m_file_count(0)
{
}

std::unique_ptr<TreeNode> TreeBuilder::build(const fs::path& root) {
    m_directory_count = 0;
    m_file_count = 0;
    m_active_directories.clear();

    return buildDirectory(root, 0);
}

bool TreeBuilder::listSortedEntries(const fs::path& directory, std::vector<fs::path>& entries) {
    entries.clear();

    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        LOG_DEBUG("TreeBuilder", "Cannot list " + directory.string() + ": " + ec.message());
        return false;
    }

    for (fs::directory_iterator end; it != end; ) {
        entries.push_back(it->path());
        it.increment(ec);
        if (ec) {
            break;
        }
    }
    if (ec) {
        LOG_DEBUG("TreeBuilder", "Listing interrupted in " + directory.string() + ": " + ec.message());
        entries.clear();
        return false;
    }

    std::vector<std::pair<std::string, fs::path>> keyed;
    keyed.reserve(entries.size());
    for (auto& entry : entries) {
        keyed.emplace_back(toLowerUtf8(entry.filename().string()), std::move(entry));
    }

    // Ties on the lower-cased name fall back to the exact name so that the
    // order never depends on what the filesystem returns first.
    std::sort(keyed.begin(), keyed.end(),
              [](const auto& a, const auto& b) {
                  if (a.first != b.first) {
                      return a.first < b.first;
                  }
                  return a.second.filename().string() < b.second.filename().string();
              });

    entries.clear();
    for (auto& item : keyed) {
        entries.push_back(std::move(item.second));
    }
    return true;
}

std::unique_ptr<TreeNode> TreeBuilder::buildDirectory(const fs::path& directory, size_t depth) {
    if (isDirectoryCycle(directory)) {
        LOG_WARNING("TreeBuilder", "Skipping symlink cycle at " + directory.string());
        return nullptr;
    }

    std::vector<fs::path> entries;
    if (!listSortedEntries(directory, entries)) {
        return nullptr;
    }

    std::error_code ec;
    m_active_directories.push_back(fs::canonical(directory, ec));

    auto node = std::make_unique<TreeNode>(directory, true, depth);

    for (const auto& entry : entries) {
        if (!m_filter.shouldInclude(entry)) {
            continue;
        }

        if (fs::is_directory(entry, ec)) {
            auto child = buildDirectory(entry, depth + 1);
            if (child) {
                node->children.push_back(std::move(child));
            }
        } else {
            node->children.push_back(std::make_unique<TreeNode>(
                entry, false, depth + 1, PathFilter::isMarkdownFile(entry)));
            m_file_count++;
        }
    }

    m_active_directories.pop_back();

    if (node->children.empty()) {
        return nullptr;
    }

    if (depth > 0) {
        m_directory_count++;
    }
    return node;
}

bool TreeBuilder::isDirectoryCycle(const fs::path& directory) const {
    if (!m_filter.getConfig().follow_symlinks || m_active_directories.empty()) {
        return false;
    }

    std::error_code ec;
    fs::path resolved = fs::canonical(directory, ec);
    if (ec) {
        return false;
    }
    return std::find(m_active_directories.begin(), m_active_directories.end(), resolved)
           != m_active_directories.end();
}

} // namespace Folio
