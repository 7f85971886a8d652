// =================================================================
// include/Folio/Commands.hpp
// =================================================================
// Parsed command-line values, kept free of the CLI library so that the
// core library can consume them.

#pragma once

#include <string>
#include <vector>

namespace Folio {

struct Commands {
    std::string input_dir;
    std::string output_file;        // Empty means "<input_dir>.md"
    std::string title;

    // Filtering
    std::vector<std::string> extensions;       // Replaces the defaults when non-empty
    std::vector<std::string> ignore_dirs;      // Added to the defaults
    std::vector<std::string> ignore_files;     // Added to the defaults
    std::vector<std::string> ignore_patterns;
    bool follow_symlinks = false;

    // Configuration and logging
    std::string config_path;
    std::string log_dir;
    bool verbose = false;
    bool quiet = false;
};

} // namespace Folio
