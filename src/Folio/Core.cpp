// =================================================================
// src/Folio/Core.cpp
// =================================================================
// Implementation for the application orchestrator.

#include "Folio/Core.hpp"
#include "Folio/Aggregator.hpp"
#include "Folio/ConfigParser.hpp"
#include "Folio/Logger.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>

namespace Folio {

Core::Core(const Commands& commands)
    : m_commands(commands)
{
    configureLogging();
    m_config = std::make_unique<ConfigParser>(resolveConfigPath());
}

Core::~Core() = default;

int Core::run() {
    auto start_time = std::chrono::steady_clock::now();
    Logger::getInstance().logSessionStart(m_commands.input_dir, m_commands.output_file);

    ExitCode exit_code = ExitCode::Success;
    try {
        AggregationResult result = aggregateDirectory(buildConfig());
        LOG_INFO("Core", "Aggregated " + std::to_string(result.file_count) + " files from " +
                 std::to_string(result.directory_count) + " directories into " +
                 result.output_file.string());
    } catch (const ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        LOG_DEBUG("Core", std::string("Configuration error: ") + e.what());
        exit_code = ExitCode::ConfigurationError;
    } catch (const EmptyResultError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        LOG_DEBUG("Core", std::string("Empty result: ") + e.what());
        exit_code = ExitCode::EmptyResult;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        LOG_DEBUG("Core", std::string("Aggregation failed: ") + e.what());
        exit_code = ExitCode::Failure;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    Logger::getInstance().logSessionEnd(static_cast<int>(exit_code), static_cast<long>(duration.count()));
    Logger::getInstance().flush();

    return static_cast<int>(exit_code);
}

AggregatorConfig Core::buildConfig() const {
    AggregatorConfig config;
    config.loadFromConfig(*m_config);
    config.applyCommandOverrides(m_commands);
    return config;
}

void Core::configureLogging() {
    Logger& logger = Logger::getInstance();

    if (m_commands.verbose) {
        logger.setConsoleLogLevel(LogLevel::DEBUG);
    } else if (m_commands.quiet) {
        logger.setConsoleLogLevel(LogLevel::ERROR);
    }

    if (!m_commands.log_dir.empty()) {
        logger.initialize(m_commands.log_dir);
    }
}

std::string Core::resolveConfigPath() const {
    if (!m_commands.config_path.empty()) {
        return m_commands.config_path;
    }
    if (m_commands.input_dir.empty()) {
        return "";
    }
    return (std::filesystem::path(m_commands.input_dir) / ConfigParser::DEFAULT_CONFIG_FILE).string();
}

} // namespace Folio
