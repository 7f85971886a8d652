// =================================================================
// src/Folio/Aggregator.cpp
// =================================================================
// Implementation for the end-to-end aggregation pipeline.

#include "Folio/Aggregator.hpp"
#include "Folio/AnchorRegistry.hpp"
#include "Folio/DocumentRenderer.hpp"
#include "Folio/HeadingAssigner.hpp"
#include "Folio/Logger.hpp"
#include "Folio/TreeBuilder.hpp"
#include <chrono>

namespace fs = std::filesystem;

namespace Folio {

Aggregator::Aggregator(AggregatorConfig config)
    : m_config(std::move(config))
{
    if (!m_config.validate()) {
        throw ConfigurationError("Invalid configuration");
    }

    m_input_dir = resolvePath(m_config.input_dir);

    if (m_config.output_file.empty()) {
        m_output_file = AggregatorConfig::getDefaultOutputFile(m_input_dir);
        if (m_output_file.empty()) {
            throw ConfigurationError("Cannot derive an output file name from " + m_input_dir.string());
        }
    } else {
        m_output_file = resolvePath(m_config.output_file);
    }
}

FilterConfig Aggregator::makeFilterConfig() const {
    FilterConfig filter_config;
    filter_config.root = m_input_dir;
    filter_config.output_path = m_output_file;
    filter_config.extensions = m_config.getMergedExtensions();
    filter_config.ignored_dirs = m_config.getMergedIgnoredDirs();
    filter_config.ignored_files = m_config.getMergedIgnoredFiles();
    filter_config.follow_symlinks = m_config.follow_symlinks;

    for (const auto& pattern : m_config.ignore_patterns) {
        if (!filter_config.ignore_patterns.addPattern(pattern)) {
            LOG_DEBUG("Aggregator", "Ignoring blank or comment pattern '" + pattern + "'");
        }
    }

    return filter_config;
}

std::string Aggregator::render() {
    std::error_code ec;
    if (!fs::is_directory(m_input_dir, ec)) {
        throw ConfigurationError("Input path is not a directory: " + m_input_dir.string());
    }

    PathFilter filter(makeFilterConfig());
    TreeBuilder builder(filter);
    std::unique_ptr<TreeNode> root = builder.build(m_input_dir);

    if (!root || root->children.empty()) {
        throw EmptyResultError("No matching files found under " + m_input_dir.string());
    }

    Logger::getInstance().logTreeBuilt(builder.getDirectoryCount(), builder.getFileCount());

    AnchorRegistry registry;
    HeadingAssigner assigner(m_input_dir, registry);
    assigner.assign(*root);

    DocumentRenderer renderer(m_input_dir, m_config.getEffectiveTitle(m_input_dir));
    std::vector<std::string> lines = renderer.render(*root);
    std::string document = DocumentRenderer::joinLines(lines);

    m_last_result = AggregationResult();
    m_last_result.output_file = m_output_file;
    m_last_result.directory_count = builder.getDirectoryCount();
    m_last_result.file_count = builder.getFileCount();
    m_last_result.line_count = lines.size();
    m_last_result.byte_count = document.size();

    return document;
}

AggregationResult Aggregator::run() {
    auto start_time = std::chrono::steady_clock::now();

    std::string document = render();

    if (!m_sys.writeFile(m_output_file.string(), document)) {
        throw std::runtime_error("Failed to write output file: " + m_output_file.string());
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    Logger::getInstance().logDocumentWritten(m_output_file.string(), m_last_result.line_count,
                                             m_last_result.byte_count, static_cast<long>(duration.count()));

    return m_last_result;
}

fs::path Aggregator::resolvePath(const fs::path& path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    if (ec) {
        throw ConfigurationError("Cannot resolve path " + path.string() + ": " + ec.message());
    }

    fs::path resolved = fs::weakly_canonical(absolute, ec);
    if (ec) {
        return absolute.lexically_normal();
    }
    return resolved;
}

AggregationResult aggregateDirectory(const AggregatorConfig& config) {
    Aggregator aggregator(config);
    return aggregator.run();
}

std::string renderDirectory(const AggregatorConfig& config) {
    Aggregator aggregator(config);
    return aggregator.render();
}

} // namespace Folio
