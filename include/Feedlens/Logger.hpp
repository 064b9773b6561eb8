// =================================================================
// include/Feedlens/Logger.hpp
// =================================================================
// Header for structured logging of inference orchestration.

#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <mutex>
#include <optional>

namespace Feedlens {

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed debug information
    INFO,       ///< General information
    WARNING,    ///< Warning conditions
    ERROR,      ///< Error conditions
    CRITICAL    ///< Critical conditions
};

/**
 * @brief Logging section of the configuration file
 */
struct LoggingConfig {
    std::string log_dir = ".feedlens/logs";
    std::string console_level = "INFO";
    std::string file_level = "DEBUG";
    bool console_enabled = true;
    bool file_enabled = true;
    size_t max_file_size_mb = 10;
    size_t max_files = 5;
};

/**
 * @brief Process-wide logger shared by the orchestrator and its workers
 * 
 * Entries go to the console and to a rotating log file. All writes are
 * serialized, so batch workers may log concurrently.
 */
class Logger {
public:
    static Logger& getInstance();

    /**
     * @brief Apply a logging configuration section
     *
     * Unknown level names keep the current level. A new log file is
     * started in the configured directory when file output is enabled.
     */
    void configure(const LoggingConfig& config);

    void setConsoleLogLevel(LogLevel level);

    /**
     * @brief Enable or disable file output; disabling closes the current file
     */
    void setFileLogging(bool enabled);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log a remote inference call
     * @param batch_size Number of inputs sent in the call
     * @param response_size Response size in characters
     * @param duration_ms Call duration in milliseconds
     * @param success Whether the call and its parse succeeded
     */
    void logRemoteCall(size_t batch_size, size_t response_size,
                       long duration_ms, bool success);

    void logCircuitTransition(const std::string& from, const std::string& to,
                              const std::string& reason);

    void logBatchProgress(size_t batches_done, size_t batches_total,
                          size_t items_done, size_t items_total);

    void logSessionStart(const std::string& command, size_t input_count);
    void logSessionEnd(const std::string& command, int exit_code, long duration_ms);

    /**
     * @brief Path of the file currently written, empty when file output is off
     */
    std::string currentLogFile();

    static std::string levelName(LogLevel level);
    static std::optional<LogLevel> parseLevel(const std::string& name);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void write(LogLevel level, const std::string& component,
               const std::string& message, const std::string& context);
    std::string formatLine(LogLevel level, const std::string& component, const std::string& message,
                           const std::string& context, bool colored) const;
    void openLogFile();
    void closeLogFile();
    void pruneOldLogFiles();

    LoggingConfig m_config;
    LogLevel m_console_level = LogLevel::INFO;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_opened = false;              ///< Set once a file has been opened or file output was configured off

    std::ofstream m_file;
    std::string m_file_path;
    size_t m_file_bytes = 0;
    unsigned m_file_sequence = 0;

    std::mutex m_mutex;
};

// Convenience macros for logging
#define LOG_DEBUG(component, message) \
    Feedlens::Logger::getInstance().debug(component, message)

#define LOG_INFO(component, message) \
    Feedlens::Logger::getInstance().info(component, message)

#define LOG_WARNING(component, message) \
    Feedlens::Logger::getInstance().warning(component, message)

#define LOG_ERROR(component, message) \
    Feedlens::Logger::getInstance().error(component, message)

#define LOG_CRITICAL(component, message) \
    Feedlens::Logger::getInstance().critical(component, message)

} // namespace Feedlens
