// =================================================================
// src/Folio/Logger.cpp
// =================================================================
// Implementation for the logging system.

#include "Folio/Logger.hpp"
#include <iostream>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <vector>
#include <algorithm>
#include <ctime>

namespace Folio {

namespace {

const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "CRIT";
    }
}

const char* levelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[90m";     // Dark gray
        case LogLevel::INFO: return "\033[36m";      // Cyan
        case LogLevel::WARNING: return "\033[33m";   // Yellow
        default: return "\033[31m";                 // Red
    }
}

std::tm localTime(std::time_t time) {
    std::tm result{};
    localtime_r(&time, &result);
    return result;
}

std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point) {
    std::tm local = localTime(std::chrono::system_clock::to_time_t(time_point));
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

bool isFolioLogFile(const std::filesystem::path& path) {
    return path.extension() == ".log" && path.filename().string().rfind("folio_", 0) == 0;
}

} // namespace

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::initialize(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    m_log_file.reset();
    m_log_filename.clear();
    m_log_dir = log_dir;
    m_max_log_size = max_log_size;
    m_max_log_files = std::max<size_t>(max_log_files, 1);

    std::error_code ec;
    std::filesystem::create_directories(m_log_dir, ec);
    if (ec) {
        warning("Logger", "File logging disabled", "Cannot create " + log_dir + ": " + ec.message());
        return;
    }

    if (!openNextLogFile()) {
        warning("Logger", "File logging disabled", "Cannot open " + m_log_filename);
        m_log_filename.clear();
        return;
    }
    removeOldLogFiles();

    debug("Logger", "File logging enabled", m_log_filename);
}

void Logger::setConsoleLogLevel(LogLevel level) {
    m_console_level = level;
}

void Logger::debug(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::DEBUG, component, message, context));
}

void Logger::info(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::INFO, component, message, context));
}

void Logger::warning(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::WARNING, component, message, context));
}

void Logger::error(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::ERROR, component, message, context));
}

void Logger::logTreeBuilt(size_t directory_count, size_t file_count) {
    std::ostringstream context;
    context << "Directories: " << directory_count << ", ";
    context << "Files: " << file_count;

    info("TreeBuilder", "Source tree built", context.str());
}

void Logger::logDocumentWritten(const std::string& output_path, size_t line_count,
                                size_t byte_count, long duration_ms) {
    std::ostringstream context;
    context << "Lines: " << line_count << ", ";
    context << "Size: " << byte_count << " bytes, ";
    context << "Duration: " << duration_ms << "ms";

    info("Aggregator", "Wrote " + output_path, context.str());
}

void Logger::logSessionStart(const std::string& input_dir, const std::string& output_file) {
    std::ostringstream context;
    context << "Input: " << input_dir << ", ";
    context << "Output: " << (output_file.empty() ? "<default>" : output_file);

    debug("Session", "Session started", context.str());
}

void Logger::logSessionEnd(int exit_code, long duration_ms) {
    std::ostringstream context;
    context << "Exit code: " << exit_code << ", ";
    context << "Duration: " << duration_ms << "ms";

    debug("Session", exit_code == 0 ? "Session completed successfully" : "Session completed with errors",
          context.str());
}

void Logger::flush() {
    if (m_log_file) {
        m_log_file->flush();
    }
}

void Logger::logEntry(const LogEntry& entry) {
    writeToConsole(entry);
    writeToFile(entry);
}

void Logger::writeToConsole(const LogEntry& entry) {
    if (entry.level < m_console_level) {
        return;
    }

    std::string formatted = formatEntry(entry, true);
    if (entry.level >= LogLevel::ERROR) {
        std::cerr << formatted << std::endl;
    } else {
        std::cout << formatted << std::endl;
    }
}

void Logger::writeToFile(const LogEntry& entry) {
    if (!m_log_file) {
        return;
    }

    rotateLogsIfNeeded();
    if (!m_log_file) {
        return;
    }

    std::string formatted = formatEntry(entry, false);
    *m_log_file << formatted << '\n';
    m_log_size += formatted.length() + 1;

    if (entry.level >= LogLevel::ERROR) {
        m_log_file->flush();
    }
}

std::string Logger::formatEntry(const LogEntry& entry, bool include_color) {
    std::ostringstream formatted;

    formatted << formatTimestamp(entry.timestamp) << " ";
    if (include_color) {
        formatted << levelColor(entry.level) << "[" << levelName(entry.level) << "]\033[0m";
    } else {
        formatted << "[" << levelName(entry.level) << "]";
    }
    formatted << " " << entry.component << ": " << entry.message;

    if (!entry.context.empty()) {
        formatted << " (" << entry.context << ")";
    }

    return formatted.str();
}

bool Logger::openNextLogFile() {
    m_log_filename = generateLogFilename();
    m_log_file = std::make_unique<std::ofstream>(m_log_filename, std::ios::app);
    if (!m_log_file->is_open()) {
        m_log_file.reset();
        return false;
    }
    m_log_size = 0;
    return true;
}

void Logger::rotateLogsIfNeeded() {
    if (m_log_size < m_max_log_size) {
        return;
    }

    m_log_file.reset();
    if (!openNextLogFile()) {
        // The logger cannot log its own failure to a file it failed to open
        std::cerr << "[WARN] Logger: File logging disabled (Cannot open " << m_log_filename << ")" << std::endl;
        m_log_filename.clear();
        return;
    }
    removeOldLogFiles();
}

void Logger::removeOldLogFiles() {
    std::error_code ec;
    std::vector<std::filesystem::path> older;
    for (std::filesystem::directory_iterator it(m_log_dir, ec), end; !ec && it != end; it.increment(ec)) {
        const std::filesystem::path& path = it->path();
        if (isFolioLogFile(path) && path != std::filesystem::path(m_log_filename)) {
            older.push_back(path);
        }
    }
    if (ec) {
        std::cerr << "[WARN] Logger: Cannot list " << m_log_dir << " (" << ec.message() << ")" << std::endl;
        return;
    }

    // Newest first; the file being written always counts as one of the kept files
    std::sort(older.begin(), older.end(),
              [](const std::filesystem::path& a, const std::filesystem::path& b) {
                  return a.filename().string() > b.filename().string();
              });

    for (size_t i = m_max_log_files - 1; i < older.size(); i++) {
        std::filesystem::remove(older[i], ec);
        if (ec) {
            std::cerr << "[WARN] Logger: Cannot remove " << older[i].string() << " (" << ec.message() << ")" << std::endl;
        }
    }
}

std::string Logger::generateLogFilename() {
    std::tm local = localTime(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));

    std::ostringstream filename;
    filename << m_log_dir << "/folio_";
    filename << std::put_time(&local, "%Y%m%d_%H%M%S");
    filename << "_" << std::setfill('0') << std::setw(4) << ++m_file_sequence;
    filename << ".log";

    return filename.str();
}

} // namespace Folio
