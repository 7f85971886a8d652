// =================================================================
// src/Folio/DocumentRenderer.cpp
// =================================================================
// Implementation for Markdown document rendering.

#include "Folio/DocumentRenderer.hpp"
#include "Folio/Logger.hpp"
#include "Folio/PathFilter.hpp"
#include <algorithm>
#include <stdexcept>
#include <unordered_map>

namespace Folio {

static const std::unordered_map<std::string, std::string>& languageHints() {
    static const std::unordered_map<std::string, std::string> hints = {
        {".c", "c"},
        {".cc", "cpp"},
        {".cpp", "cpp"},
        {".cs", "csharp"},
        {".csx", "csharp"},
        {".cxx", "cpp"},
        {".go", "go"},
        {".h", "c"},
        {".hh", "cpp"},
        {".hpp", "cpp"},
        {".hs", "haskell"},
        {".java", "java"},
        {".jl", "julia"},
        {".js", "javascript"},
        {".json", "json"},
        {".jsx", "jsx"},
        {".kt", "kotlin"},
        {".m", "objectivec"},
        {".mm", "objectivec"},
        {".php", "php"},
        {".pl", "perl"},
        {".ps1", "powershell"},
        {".py", "python"},
        {".r", "r"},
        {".rb", "ruby"},
        {".rs", "rust"},
        {".scala", "scala"},
        {".sh", "bash"},
        {".sql", "sql"},
        {".swift", "swift"},
        {".toml", "toml"},
        {".ts", "typescript"},
        {".tsx", "tsx"},
        {".vue", "vue"},
        {".yaml", "yaml"},
        {".yml", "yaml"},
        {".zig", "zig"}
    };
    return hints;
}

static std::string anchorTag(const std::string& anchor) {
    return "<a id=\"" + anchor + "\"></a>";
}

DocumentRenderer::DocumentRenderer(const std::filesystem::path& root, const std::string& title)
    : m_root(root), m_title(title), m_unreadable_files(0)
{
}

std::vector<std::string> DocumentRenderer::render(const TreeNode& root) {
    m_unreadable_files = 0;

    std::vector<std::string> lines;
    lines.push_back("# " + m_title);
    lines.push_back(anchorTag(TOP_ANCHOR));
    lines.push_back("");

    std::vector<std::string> toc_lines = buildToc(root);
    if (!toc_lines.empty()) {
        lines.push_back("## Table of Contents");
        lines.push_back(anchorTag(TOC_ANCHOR));
        lines.push_back("");
        lines.insert(lines.end(), toc_lines.begin(), toc_lines.end());
        lines.push_back("");
    }

    for (const auto& child : root.children) {
        renderNode(*child, lines);
    }

    if (m_unreadable_files > 0) {
        LOG_WARNING("DocumentRenderer",
            std::to_string(m_unreadable_files) + " file(s) could not be read and were rendered empty");
    }

    return lines;
}

std::vector<std::string> DocumentRenderer::buildToc(const TreeNode& node) const {
    std::vector<std::string> lines;

    for (const auto& child : node.children) {
        if (child->hasHeading()) {
            std::string indent(2 * (child->depth > 0 ? child->depth - 1 : 0), ' ');
            lines.push_back(indent + "- [" + child->heading_text + "](#" + child->anchor + ")");
        }
        if (child->is_directory) {
            std::vector<std::string> nested = buildToc(*child);
            lines.insert(lines.end(), nested.begin(), nested.end());
        }
    }

    return lines;
}

std::string DocumentRenderer::joinLines(const std::vector<std::string>& lines) {
    size_t total = 0;
    for (const auto& line : lines) {
        total += line.size() + 1;
    }

    std::string document;
    document.reserve(total);
    for (const auto& line : lines) {
        document += line;
        document += '\n';
    }
    return document;
}

std::string DocumentRenderer::getLanguageHint(const std::filesystem::path& file_path) {
    const auto& hints = languageHints();
    auto it = hints.find(PathFilter::getExtension(file_path));
    if (it != hints.end()) {
        return it->second;
    }
    return "";
}

std::string DocumentRenderer::getBackLink() {
    return std::string("[Back to Top](#") + TOP_ANCHOR + ") \xE2\x80\xA2 [Back to TOC](#" + TOC_ANCHOR + ")";
}

void DocumentRenderer::renderNode(const TreeNode& node, std::vector<std::string>& lines) {
    size_t level = std::min(node.depth + 1, MAX_HEADING_LEVEL);
    if (!node.heading_text.empty()) {
        lines.push_back(std::string(level, '#') + " " + node.heading_text);
        if (!node.anchor.empty()) {
            lines.push_back(anchorTag(node.anchor));
        }
    }
    lines.push_back("");

    if (node.is_directory) {
        for (const auto& child : node.children) {
            renderNode(*child, lines);
        }
        return;
    }

    if (node.is_markdown) {
        renderMarkdownFile(node, lines);
    } else {
        renderSourceFile(node, lines);
    }
}

void DocumentRenderer::renderMarkdownFile(const TreeNode& node, std::vector<std::string>& lines) {
    std::string relative = node.path.lexically_relative(m_root).generic_string();

    lines.push_back("<!-- Begin " + relative + " -->");
    std::string content = readContent(node);
    if (!content.empty()) {
        lines.push_back(content);
    }
    lines.push_back("<!-- End " + relative + " -->");
    lines.push_back(getBackLink());
    lines.push_back("");
}

void DocumentRenderer::renderSourceFile(const TreeNode& node, std::vector<std::string>& lines) {
    lines.push_back("```" + getLanguageHint(node.path));
    lines.push_back(readContent(node));
    lines.push_back("```");
    lines.push_back(getBackLink());
    lines.push_back("");
}

std::string DocumentRenderer::readContent(const TreeNode& node) {
    std::string content;
    try {
        content = m_sys.readTextFile(node.path.string());
    } catch (const std::runtime_error& e) {
        m_unreadable_files++;
        Logger::getInstance().warning("DocumentRenderer", "Rendering unreadable file as empty", e.what());
        return "";
    }

    size_t end = content.find_last_not_of('\n');
    if (end == std::string::npos) {
        return "";
    }
    content.erase(end + 1);
    return content;
}

} // namespace Folio
