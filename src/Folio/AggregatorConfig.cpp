// =================================================================
// src/Folio/AggregatorConfig.cpp
// =================================================================
// Implementation for aggregation configuration management.

#include "Folio/AggregatorConfig.hpp"
#include "Folio/Commands.hpp"
#include "Folio/ConfigParser.hpp"
#include "Folio/Logger.hpp"
#include "Folio/PathFilter.hpp"

namespace Folio {

static void appendAll(std::vector<std::string>& target, const std::vector<std::string>& values) {
    target.insert(target.end(), values.begin(), values.end());
}

void AggregatorConfig::loadFromConfig(const ConfigParser& config) {
    if (!config.isLoaded()) {
        return;
    }

    std::string title_str = config.getStringValue("title");
    if (!title_str.empty()) {
        title = title_str;
    }

    follow_symlinks = config.getBoolValue("follow_symlinks", follow_symlinks);

    std::vector<std::string> configured_extensions = config.getStringList("extensions");
    if (!configured_extensions.empty()) {
        extensions = configured_extensions;
    }

    appendAll(ignore_dirs, config.getStringList("ignore_dirs"));
    appendAll(ignore_files, config.getStringList("ignore_files"));
    appendAll(ignore_patterns, config.getStringList("ignore_patterns"));

    LOG_DEBUG("AggregatorConfig", "Loaded configuration from " + config.getPath());
}

void AggregatorConfig::applyCommandOverrides(const Commands& commands) {
    if (!commands.input_dir.empty()) {
        input_dir = commands.input_dir;
    }
    if (!commands.output_file.empty()) {
        output_file = commands.output_file;
    }
    if (!commands.title.empty()) {
        title = commands.title;
    }
    if (!commands.extensions.empty()) {
        extensions = commands.extensions;
    }

    appendAll(ignore_dirs, commands.ignore_dirs);
    appendAll(ignore_files, commands.ignore_files);
    appendAll(ignore_patterns, commands.ignore_patterns);

    if (commands.follow_symlinks) {
        follow_symlinks = true;
    }
}

std::unordered_set<std::string> AggregatorConfig::getMergedExtensions() const {
    const std::vector<std::string>& source = extensions.empty() ? getDefaultExtensions() : extensions;

    std::unordered_set<std::string> merged;
    for (const auto& ext : source) {
        merged.insert(PathFilter::normalizeExtension(ext));
    }
    return merged;
}

std::unordered_set<std::string> AggregatorConfig::getMergedIgnoredDirs() const {
    std::vector<std::string> defaults = getDefaultIgnoredDirs();
    std::unordered_set<std::string> merged(defaults.begin(), defaults.end());
    merged.insert(ignore_dirs.begin(), ignore_dirs.end());
    return merged;
}

std::unordered_set<std::string> AggregatorConfig::getMergedIgnoredFiles() const {
    std::vector<std::string> defaults = getDefaultIgnoredFiles();
    std::unordered_set<std::string> merged(defaults.begin(), defaults.end());
    merged.insert(ignore_files.begin(), ignore_files.end());
    return merged;
}

std::string AggregatorConfig::getEffectiveTitle(const std::filesystem::path& resolved_input) const {
    if (!title.empty()) {
        return title;
    }
    return resolved_input.filename().string() + " Source Archive";
}

bool AggregatorConfig::validate() const {
    bool valid = true;

    if (input_dir.empty()) {
        LOG_ERROR("AggregatorConfig", "An input directory is required");
        valid = false;
    }

    for (const auto& ext : extensions) {
        if (PathFilter::normalizeExtension(ext).size() < 2) {
            LOG_ERROR("AggregatorConfig", "Invalid extension '" + ext + "'");
            valid = false;
        }
    }

    return valid;
}

std::vector<std::string> AggregatorConfig::getDefaultExtensions() {
    static const std::vector<std::string> defaults = {
        ".c", ".cc", ".cpp", ".cs", ".csx", ".cxx",
        ".go",
        ".h", ".hh", ".hpp", ".hs",
        ".java", ".jl", ".js", ".json", ".jsx",
        ".kt",
        ".m", ".mm",
        ".php", ".pl", ".ps1", ".py",
        ".r", ".rb", ".rs",
        ".scala", ".sh", ".sql", ".swift",
        ".toml", ".ts", ".tsx",
        ".vue",
        ".yaml", ".yml",
        ".zig"
    };
    return defaults;
}

std::vector<std::string> AggregatorConfig::getDefaultIgnoredDirs() {
    return {
        ".git",
        ".hg",
        ".svn",
        ".tox",
        ".venv",
        ".idea",
        ".vscode",
        "__pycache__",
        "node_modules",
        "dist",
        "build",
        "target",
        "venv"
    };
}

std::vector<std::string> AggregatorConfig::getDefaultIgnoredFiles() {
    return {
        ".DS_Store"
    };
}

std::filesystem::path AggregatorConfig::getDefaultOutputFile(const std::filesystem::path& resolved_input) {
    std::string name = resolved_input.filename().string();
    if (name.empty()) {
        return {};
    }
    return resolved_input.parent_path() / (name + ".md");
}

} // namespace Folio
