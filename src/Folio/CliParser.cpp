// =================================================================
// src/Folio/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Folio/CliParser.hpp"

namespace Folio {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>(
        "Folio: aggregate all source code and Markdown files under a directory into a single Markdown file.",
        "folio");
    m_app->set_version_flag("--version", "folio 1.0.0");

    setupPositionals(*m_app);
    setupFilterOptions(*m_app);
    setupOutputOptions(*m_app);
    setupLoggingOptions(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupPositionals(CLI::App& app) {
    app.add_option("input_dir", m_commands.input_dir, "Directory to scan for source and Markdown files.")->required();
    app.add_option("output_file", m_commands.output_file, "Destination Markdown file. Defaults to '<input_dir>.md'.");
}

void CliParser::setupFilterOptions(CLI::App& app) {
    app.add_option("--extensions", m_commands.extensions,
                   "Overrides the default list of source file extensions (space separated list).");
    app.add_flag("--follow-symlinks", m_commands.follow_symlinks,
                 "Follow directory symlinks while walking the tree.");
    app.add_option("--ignore-dir", m_commands.ignore_dirs,
                   "Additional directory name to ignore (can be provided multiple times).")
        ->allow_extra_args(false);
    app.add_option("--ignore-file", m_commands.ignore_files,
                   "Additional file name to ignore (can be provided multiple times).")
        ->allow_extra_args(false);
    app.add_option("--ignore", m_commands.ignore_patterns,
                   "Gitignore-style pattern(s) to exclude; provide one or more per flag.");
}

void CliParser::setupOutputOptions(CLI::App& app) {
    app.add_option("--title", m_commands.title,
                   "Optional title for the aggregated document. Defaults to '<input_dir name> Source Archive'.");
    app.add_option("--config", m_commands.config_path,
                   "YAML configuration file. Defaults to '<input_dir>/.folio.yml' when present.")
        ->check(CLI::ExistingFile);
}

void CliParser::setupLoggingOptions(CLI::App& app) {
    app.add_option("--log-dir", m_commands.log_dir, "Also write logs to files in this directory.");
    auto* verbose = app.add_flag("-v,--verbose", m_commands.verbose, "Print debug output.");
    app.add_flag("-q,--quiet", m_commands.quiet, "Only print errors.")->excludes(verbose);
}

} // namespace Folio
