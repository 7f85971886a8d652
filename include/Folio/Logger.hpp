// =================================================================
// include/Folio/Logger.hpp
// =================================================================
// Header for console and file logging.

#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <memory>

namespace Folio {

/**
 * @brief Log levels for message classification
 *
 * CRITICAL is never emitted; as a console threshold it silences everything.
 */
enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string context;

    LogEntry(LogLevel lvl, const std::string& comp, const std::string& msg, const std::string& ctx)
        : timestamp(std::chrono::system_clock::now()), level(lvl), component(comp), message(msg), context(ctx) {}
};

/**
 * @brief Process-wide logger with a console sink and an optional rotating file sink
 *
 * Console output is always available. File output is only enabled once
 * initialize() has been called with a log directory, so running the tool
 * never leaves log files behind unless asked to.
 *
 * Log files are named folio_<date>_<time>_<sequence>.log. The sequence
 * grows with every file this process opens, so names sort in the order
 * the files were started, even for several rotations within one second.
 */
class Logger {
public:
    static Logger& getInstance();

    /**
     * @brief Enable file logging
     * @param log_dir Directory for log files (created if missing)
     * @param max_log_size Size in bytes after which a new file is started
     * @param max_log_files Number of folio_*.log files kept in log_dir, current one included
     */
    void initialize(const std::string& log_dir,
                    size_t max_log_size = 10 * 1024 * 1024,
                    size_t max_log_files = 5);

    void setConsoleLogLevel(LogLevel level);

    LogLevel getConsoleLogLevel() const { return m_console_level; }
    bool isFileLoggingEnabled() const { return m_log_file != nullptr; }

    /**
     * @brief Path of the file currently written, empty when file logging is off
     */
    const std::string& getLogFilename() const { return m_log_filename; }

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log the outcome of a tree walk
     * @param directory_count Directories kept in the pruned tree (root excluded)
     * @param file_count Files kept in the pruned tree
     */
    void logTreeBuilt(size_t directory_count, size_t file_count);

    /**
     * @brief Log a finished document write
     * @param output_path Destination file
     * @param line_count Number of lines rendered
     * @param byte_count Number of bytes written
     * @param duration_ms Time spent on the whole run
     */
    void logDocumentWritten(const std::string& output_path, size_t line_count,
                            size_t byte_count, long duration_ms);

    void logSessionStart(const std::string& input_dir, const std::string& output_file);
    void logSessionEnd(int exit_code, long duration_ms);

    void flush();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string m_log_dir;
    size_t m_max_log_size = 10 * 1024 * 1024;
    size_t m_max_log_files = 5;
    LogLevel m_console_level = LogLevel::INFO;

    std::unique_ptr<std::ofstream> m_log_file;
    std::string m_log_filename;
    size_t m_log_size = 0;
    unsigned m_file_sequence = 0;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);
    std::string formatEntry(const LogEntry& entry, bool include_color);
    bool openNextLogFile();
    void rotateLogsIfNeeded();
    void removeOldLogFiles();
    std::string generateLogFilename();
};

#define LOG_DEBUG(component, message) \
    Folio::Logger::getInstance().debug(component, message)

#define LOG_INFO(component, message) \
    Folio::Logger::getInstance().info(component, message)

#define LOG_WARNING(component, message) \
    Folio::Logger::getInstance().warning(component, message)

#define LOG_ERROR(component, message) \
    Folio::Logger::getInstance().error(component, message)

} // namespace Folio
