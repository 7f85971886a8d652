// =================================================================
// src/Folio/PathFilter.cpp
// =================================================================
// Implementation for per-entry include/exclude decisions.

#include "Folio/PathFilter.hpp"
#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

namespace Folio {

PathFilter::PathFilter(FilterConfig config)
    : m_config(std::move(config))
{
}

bool PathFilter::shouldInclude(const fs::path& entry) const {
    if (isOutputFile(entry)) {
        return false;
    }

    std::error_code ec;
    fs::file_status link_status = fs::symlink_status(entry, ec);
    if (ec) {
        return false;
    }
    if (fs::is_symlink(link_status) && !m_config.follow_symlinks) {
        return false;
    }

    // Follows symlinks, so a dangling link reports not_found
    fs::file_status status = fs::status(entry, ec);
    if (ec || !fs::exists(status)) {
        return false;
    }

    bool is_directory = fs::is_directory(status);

    if (matchesIgnorePatterns(entry, is_directory)) {
        return false;
    }

    const std::string name = entry.filename().string();

    if (is_directory) {
        return !isIgnoredDirectory(name);
    }

    if (fs::is_regular_file(status)) {
        if (m_config.ignored_files.count(name) > 0 || (!name.empty() && name[0] == '.')) {
            return false;
        }
        return isIncludedFile(entry);
    }

    return false;
}

std::string PathFilter::getRelativePath(const fs::path& entry) const {
    return entry.lexically_relative(m_config.root).generic_string();
}

std::string PathFilter::normalizeExtension(const std::string& extension) {
    std::string normalized = extension;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (normalized.empty() || normalized[0] != '.') {
        normalized.insert(normalized.begin(), '.');
    }
    return normalized;
}

std::string PathFilter::getExtension(const fs::path& path) {
    std::string extension = path.extension().string();
    if (extension == ".") {
        return "";
    }
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return extension;
}

bool PathFilter::isMarkdownFile(const fs::path& path) {
    return getExtension(path) == MARKDOWN_EXTENSION;
}

bool PathFilter::isOutputFile(const fs::path& entry) const {
    if (m_config.output_path.empty()) {
        return false;
    }
    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(entry, ec);
    if (ec) {
        return false;
    }
    return resolved == m_config.output_path;
}

bool PathFilter::matchesIgnorePatterns(const fs::path& entry, bool is_directory) const {
    if (m_config.ignore_patterns.empty() || entry == m_config.root) {
        return false;
    }

    std::string relative = getRelativePath(entry);
    if (m_config.ignore_patterns.shouldIgnore(relative, false)) {
        return true;
    }
    return is_directory && m_config.ignore_patterns.shouldIgnore(relative + "/", true);
}

bool PathFilter::isIgnoredDirectory(const std::string& name) const {
    return m_config.ignored_dirs.count(name) > 0 || (!name.empty() && name[0] == '.');
}

bool PathFilter::isIncludedFile(const fs::path& entry) const {
    std::string extension = getExtension(entry);
    if (extension == MARKDOWN_EXTENSION) {
        return true;
    }
    return !extension.empty() && m_config.extensions.count(extension) > 0;
}

} // namespace Folio
