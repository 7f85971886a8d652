// =================================================================
// include/Folio/AggregatorConfig.hpp
// =================================================================
// Configuration structure for one aggregation run.

#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <unordered_set>

namespace Folio {

class ConfigParser;
struct Commands;

/**
 * @brief Settings for one aggregation run
 *
 * Values are layered: built-in defaults, then the YAML file, then the
 * command line. Extension lists replace the defaults; ignored directory and
 * file names are added to them.
 */
struct AggregatorConfig {
    std::filesystem::path input_dir;
    std::filesystem::path output_file;   // Empty means the default beside input_dir
    std::string title;                   // Empty means "<dir name> Source Archive"

    std::vector<std::string> extensions;       // Empty means the defaults
    std::vector<std::string> ignore_dirs;      // In addition to the defaults
    std::vector<std::string> ignore_files;     // In addition to the defaults
    std::vector<std::string> ignore_patterns;  // Gitignore syntax, evaluated in order
    bool follow_symlinks = false;

    /**
     * @brief Load configuration from ConfigParser
     * @param config ConfigParser instance
     */
    void loadFromConfig(const ConfigParser& config);

    /**
     * @brief Apply command-line overrides
     * @param commands Command-line arguments
     */
    void applyCommandOverrides(const Commands& commands);

    /**
     * @brief Normalized extension set (configured or default)
     */
    std::unordered_set<std::string> getMergedExtensions() const;

    std::unordered_set<std::string> getMergedIgnoredDirs() const;
    std::unordered_set<std::string> getMergedIgnoredFiles() const;

    /**
     * @brief Title to print, falling back to the input directory name
     * @param resolved_input Resolved input directory
     */
    std::string getEffectiveTitle(const std::filesystem::path& resolved_input) const;

    /**
     * @brief Validate configuration settings
     * @return True if configuration is valid
     */
    bool validate() const;

    static std::vector<std::string> getDefaultExtensions();
    static std::vector<std::string> getDefaultIgnoredDirs();
    static std::vector<std::string> getDefaultIgnoredFiles();

    /**
     * @brief "<parent>/<name>.md" for a resolved input directory
     */
    static std::filesystem::path getDefaultOutputFile(const std::filesystem::path& resolved_input);
};

} // namespace Folio
