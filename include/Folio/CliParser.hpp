// =================================================================
// include/Folio/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include "Folio/Commands.hpp"
#include <memory>

namespace Folio {

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI options, positionals, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupPositionals(CLI::App& app);
    void setupFilterOptions(CLI::App& app);
    void setupOutputOptions(CLI::App& app);
    void setupLoggingOptions(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Folio
