// =================================================================
// src/Feedlens/Logger.cpp
// =================================================================
// Implementation for the orchestration logging system.

#include "Feedlens/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace Feedlens {

namespace {

struct LevelStyle {
    LogLevel level;
    const char* name;
    const char* color;
};

const LevelStyle kLevelStyles[] = {
    {LogLevel::DEBUG, "DEBUG", "\033[90m"},
    {LogLevel::INFO, "INFO", "\033[36m"},
    {LogLevel::WARNING, "WARN", "\033[33m"},
    {LogLevel::ERROR, "ERROR", "\033[31m"},
    {LogLevel::CRITICAL, "CRIT", "\033[91m"}
};

const char* kColorReset = "\033[0m";

const LevelStyle& styleOf(LogLevel level) {
    for (const auto& style : kLevelStyles) {
        if (style.level == level) {
            return style;
        }
    }
    return kLevelStyles[0];
}

std::string localTime(std::chrono::system_clock::time_point time_point, const char* format, bool with_ms) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(time_point);
    std::ostringstream out;
    out << std::put_time(std::localtime(&seconds), format);
    if (with_ms) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(time_point.time_since_epoch()) % 1000;
        out << "." << std::setfill('0') << std::setw(3) << ms.count();
    }
    return out.str();
}

} // anonymous namespace

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    closeLogFile();
}

void Logger::configure(const LoggingConfig& config) {
    std::lock_guard<std::mutex> lock(m_mutex);

    m_config = config;
    m_console_level = parseLevel(config.console_level).value_or(m_console_level);
    m_file_level = parseLevel(config.file_level).value_or(m_file_level);

    closeLogFile();
    m_opened = true;
    if (m_config.file_enabled) {
        openLogFile();
    }
}

void Logger::setConsoleLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_console_level = level;
}

void Logger::setFileLogging(bool enabled) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config.file_enabled = enabled;
    if (!enabled) {
        closeLogFile();
    }
}

void Logger::debug(const std::string& component, const std::string& message, const std::string& context) {
    write(LogLevel::DEBUG, component, message, context);
}

void Logger::info(const std::string& component, const std::string& message, const std::string& context) {
    write(LogLevel::INFO, component, message, context);
}

void Logger::warning(const std::string& component, const std::string& message, const std::string& context) {
    write(LogLevel::WARNING, component, message, context);
}

void Logger::error(const std::string& component, const std::string& message, const std::string& context) {
    write(LogLevel::ERROR, component, message, context);
}

void Logger::critical(const std::string& component, const std::string& message, const std::string& context) {
    write(LogLevel::CRITICAL, component, message, context);
}

void Logger::logRemoteCall(size_t batch_size, size_t response_size,
                           long duration_ms, bool success) {
    std::ostringstream context;
    context << "Batch size: " << batch_size << ", Response size: " << response_size
            << " chars, Duration: " << duration_ms << "ms";

    if (success) {
        info("Remote", "Inference call completed", context.str());
    } else {
        warning("Remote", "Inference call failed", context.str());
    }

    if (duration_ms > 10000) {
        warning("Remote", "Slow response detected", "Duration: " + std::to_string(duration_ms) + "ms");
    }
}

void Logger::logCircuitTransition(const std::string& from, const std::string& to,
                                  const std::string& reason) {
    write(to == "OPEN" ? LogLevel::WARNING : LogLevel::INFO, "CircuitBreaker",
          "Circuit " + from + " -> " + to, reason);
}

void Logger::logBatchProgress(size_t batches_done, size_t batches_total,
                              size_t items_done, size_t items_total) {
    debug("Orchestrator", "Batch completed",
          "Batches: " + std::to_string(batches_done) + "/" + std::to_string(batches_total) +
          ", Items: " + std::to_string(items_done) + "/" + std::to_string(items_total));
}

void Logger::logSessionStart(const std::string& command, size_t input_count) {
    info("Session", "Session started", "Command: " + command + ", Inputs: " + std::to_string(input_count));
}

void Logger::logSessionEnd(const std::string& command, int exit_code, long duration_ms) {
    std::string context = "Command: " + command + ", Exit code: " + std::to_string(exit_code) +
                          ", Duration: " + std::to_string(duration_ms) + "ms";
    if (exit_code == 0) {
        info("Session", "Session completed successfully", context);
    } else {
        error("Session", "Session completed with errors", context);
    }
}

std::string Logger::currentLogFile() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_file.is_open() ? m_file_path : std::string();
}

std::string Logger::levelName(LogLevel level) {
    return styleOf(level).name;
}

std::optional<LogLevel> Logger::parseLevel(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "WARNING") return LogLevel::WARNING;
    if (upper == "CRITICAL") return LogLevel::CRITICAL;
    for (const auto& style : kLevelStyles) {
        if (upper == style.name) {
            return style.level;
        }
    }
    return std::nullopt;
}

void Logger::write(LogLevel level, const std::string& component,
                   const std::string& message, const std::string& context) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_opened) {
        m_opened = true;
        if (m_config.file_enabled) {
            openLogFile();
        }
    }

    // Console output goes to stderr so JSON written to stdout stays clean
    if (m_config.console_enabled && level >= m_console_level) {
        std::cerr << formatLine(level, component, message, context, true) << std::endl;
    }

    if (!m_file.is_open() || level < m_file_level) {
        return;
    }

    if (m_file_bytes >= m_config.max_file_size_mb * 1024 * 1024) {
        closeLogFile();
        openLogFile();
        if (!m_file.is_open()) {
            return;
        }
    }

    std::string line = formatLine(level, component, message, context, false);
    m_file << line << '\n';
    m_file_bytes += line.size() + 1;
    if (level >= LogLevel::WARNING) {
        m_file.flush();
    }
}

std::string Logger::formatLine(LogLevel level, const std::string& component, const std::string& message,
                               const std::string& context, bool colored) const {
    const LevelStyle& style = styleOf(level);
    std::ostringstream line;

    line << localTime(std::chrono::system_clock::now(), "%Y-%m-%d %H:%M:%S", true) << " ";
    if (colored) {
        line << style.color << "[" << style.name << "]" << kColorReset;
    } else {
        line << "[" << style.name << "]";
    }
    line << " " << component << ": " << message;
    if (!context.empty()) {
        line << " (" << context << ")";
    }

    return line.str();
}

void Logger::openLogFile() {
    std::error_code ec;
    std::filesystem::create_directories(m_config.log_dir, ec);
    if (ec) {
        std::cerr << "[ERROR] Cannot create log directory " << m_config.log_dir << ": " << ec.message() << std::endl;
        return;
    }

    // Timestamp plus sequence keeps names unique and sortable by age
    std::ostringstream path;
    path << m_config.log_dir << "/feedlens_"
         << localTime(std::chrono::system_clock::now(), "%Y%m%d_%H%M%S", false)
         << "_" << std::setfill('0') << std::setw(4) << m_file_sequence++ << ".log";

    m_file_path = path.str();
    m_file.open(m_file_path, std::ios::app);
    m_file_bytes = 0;
    if (!m_file.is_open()) {
        std::cerr << "[ERROR] Cannot open log file " << m_file_path << std::endl;
        return;
    }

    m_file << formatLine(LogLevel::INFO, "Logger", "Log file opened", m_config.log_dir, false) << '\n';
    pruneOldLogFiles();
}

void Logger::closeLogFile() {
    if (m_file.is_open()) {
        m_file.flush();
        m_file.close();
    }
}

void Logger::pruneOldLogFiles() {
    std::error_code ec;
    std::vector<std::filesystem::path> log_files;
    for (std::filesystem::directory_iterator it(m_config.log_dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& path = it->path();
        if (path.extension() == ".log" && path.filename().string().rfind("feedlens_", 0) == 0) {
            log_files.push_back(path);
        }
    }
    if (ec) {
        std::cerr << "[WARN] Log rotation failed: " << ec.message() << std::endl;
        return;
    }

    std::sort(log_files.begin(), log_files.end());
    while (log_files.size() > m_config.max_files) {
        std::filesystem::remove(log_files.front(), ec);
        log_files.erase(log_files.begin());
    }
}

} // namespace Feedlens
