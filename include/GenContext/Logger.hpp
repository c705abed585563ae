// =================================================================
// include/GenContext/Logger.hpp
// =================================================================
// Header for component-tagged diagnostic logging.

#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <memory>

namespace GenContext {

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed debug information
    INFO,       ///< General information
    WARNING,    ///< Warning conditions
    ERROR       ///< Error conditions
};

/**
 * @brief Log entry structure
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string context;

    LogEntry(LogLevel lvl, const std::string& comp, const std::string& msg, const std::string& ctx = "")
        : timestamp(std::chrono::system_clock::now()), level(lvl), component(comp), message(msg), context(ctx) {}
};

/**
 * @brief Process-wide logger
 *
 * Console output always goes to stderr so that stdout stays free for
 * the assembled document. File output is only enabled once
 * enableFileLogging() has been called.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Start writing log files into a directory
     * @param log_dir Directory for log files
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep
     */
    void enableFileLogging(const std::string& log_dir,
                           size_t max_log_size = 10 * 1024 * 1024,  // 10MB
                           size_t max_log_files = 5);

    /**
     * @brief Set minimum log level for console output
     * @param level Minimum level to display on console
     */
    void setConsoleLogLevel(LogLevel level);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log the outcome of a directory walk
     * @param root Root directory that was scanned
     * @param entries Number of entries that survived filtering
     * @param rule_sets Number of rule files discovered
     * @param related_roots Directories classified as related trees
     */
    void logScan(const std::string& root, size_t entries, size_t rule_sets,
                 const std::vector<std::string>& related_roots);

    /**
     * @brief Log assembly statistics
     * @param files_included Files written into the document
     * @param files_summarized Files replaced by a declaration digest
     * @param files_truncated Files cut at the line limit
     * @param read_errors Files replaced by an error placeholder
     * @param tokens Estimated token count
     */
    void logAssembly(size_t files_included, size_t files_summarized,
                     size_t files_truncated, size_t read_errors, size_t tokens);

    /**
     * @brief Log session start
     * @param root Root directory being assembled
     */
    void logSessionStart(const std::string& root);

    /**
     * @brief Log session end
     * @param exit_code Exit code
     * @param duration_ms Session duration in milliseconds
     */
    void logSessionEnd(int exit_code, long duration_ms);

    /**
     * @brief Flush all log buffers
     */
    void flush();

    static std::string getLevelName(LogLevel level);
    static std::string getLevelColor(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string m_log_dir;
    size_t m_max_log_size = 10 * 1024 * 1024;
    size_t m_max_log_files = 5;
    LogLevel m_console_level = LogLevel::INFO;
    LogLevel m_file_level = LogLevel::DEBUG;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);

    /**
     * @brief Format log entry for output
     * @param entry Log entry
     * @param include_color Whether to include color codes
     * @return Formatted string
     */
    std::string formatEntry(const LogEntry& entry, bool include_color = false);

    /**
     * @brief Rotate log files if needed
     */
    void rotateLogsIfNeeded();

    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
    bool ensureLogDirectory();
    std::string generateLogFilename();
};

// Convenience macros for logging
#define LOG_DEBUG(component, message) \
    GenContext::Logger::getInstance().debug(component, message)

#define LOG_INFO(component, message) \
    GenContext::Logger::getInstance().info(component, message)

#define LOG_WARNING(component, message) \
    GenContext::Logger::getInstance().warning(component, message)

#define LOG_ERROR(component, message) \
    GenContext::Logger::getInstance().error(component, message)

} // namespace GenContext
