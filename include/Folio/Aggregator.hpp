// =================================================================
// include/Folio/Aggregator.hpp
// =================================================================
// Header for the end-to-end aggregation pipeline.

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include "AggregatorConfig.hpp"
#include "PathFilter.hpp"
#include "SysInteraction.hpp"

namespace Folio {

/**
 * @brief The input is unusable (not a directory, invalid settings)
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief The walk ran but no file survived filtering
 */
class EmptyResultError : public std::runtime_error {
public:
    explicit EmptyResultError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Statistics of a finished aggregation
 */
struct AggregationResult {
    std::filesystem::path output_file;
    size_t directory_count = 0;
    size_t file_count = 0;
    size_t line_count = 0;
    size_t byte_count = 0;
};

/**
 * @brief Runs PathFilter -> TreeBuilder -> HeadingAssigner -> DocumentRenderer
 *
 * Paths are resolved once at construction. Every call to render() starts
 * from a fresh anchor registry, so repeated runs over an unchanged tree
 * produce identical documents.
 */
class Aggregator {
public:
    /**
     * @brief Construct an aggregator
     * @param config Run settings; the output file defaults to "<input>.md" beside the input
     * @throws ConfigurationError if the settings are invalid
     */
    explicit Aggregator(AggregatorConfig config);

    /**
     * @brief Build the document text without writing it
     * @throws ConfigurationError if the input is not a directory
     * @throws EmptyResultError if no file matched
     */
    std::string render();

    /**
     * @brief Build the document and write it to the output file
     * @throws ConfigurationError, EmptyResultError, std::runtime_error on write failure
     */
    AggregationResult run();

    const std::filesystem::path& getInputDir() const { return m_input_dir; }
    const std::filesystem::path& getOutputFile() const { return m_output_file; }
    const AggregationResult& getLastResult() const { return m_last_result; }

    /**
     * @brief Filter settings derived from the configuration and resolved paths
     */
    FilterConfig makeFilterConfig() const;

private:
    AggregatorConfig m_config;
    std::filesystem::path m_input_dir;
    std::filesystem::path m_output_file;
    AggregationResult m_last_result;
    SysInteraction m_sys;

    static std::filesystem::path resolvePath(const std::filesystem::path& path);
};

/**
 * @brief Aggregate a directory into one Markdown file
 * @param config Run settings
 * @return Statistics of the written document
 */
AggregationResult aggregateDirectory(const AggregatorConfig& config);

/**
 * @brief Render a directory's document without writing it
 */
std::string renderDirectory(const AggregatorConfig& config);

} // namespace Folio
