// =================================================================
// include/Folio/Core.hpp
// =================================================================
// Defines the application orchestrator behind the command line.

#pragma once

#include "Folio/AggregatorConfig.hpp"
#include "Folio/Commands.hpp"
#include <memory>
#include <string>

namespace Folio {

class ConfigParser;

/// Process exit codes
enum class ExitCode : int {
    Success = 0,
    ConfigurationError = 1,
    EmptyResult = 2,
    Failure = 3
};

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Destructor defined in the .cpp file because of the forward-declared ConfigParser.
     */
    ~Core();

    /**
     * @brief Loads configuration, runs the aggregation and reports the outcome.
     * @return An integer exit code (see ExitCode).
     */
    int run();

    /**
     * @brief Settings after defaults, YAML file and command line are layered.
     */
    AggregatorConfig buildConfig() const;

private:
    void configureLogging();
    std::string resolveConfigPath() const;

    const Commands& m_commands;
    std::unique_ptr<ConfigParser> m_config;
};

} // namespace Folio
