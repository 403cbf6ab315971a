#pragma once

#include <atomic>
#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace vmexec {

// ============================================================================
// Log levels
// ============================================================================

enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    FATAL = 5,
    OFF   = 6
};

[[nodiscard]] std::string to_string(LogLevel level);

/**
 * @brief Parses a level name (case-insensitive, "warning" accepted).
 * @return INFO when the name is not recognised
 */
[[nodiscard]] LogLevel log_level_from_string(const std::string& level_str);

// ============================================================================
// Log message
// ============================================================================

struct LogMessage {
    LogLevel level = LogLevel::INFO;
    std::string component;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id thread_id;

    // Structured key-value fields
    std::unordered_map<std::string, std::string> fields;

    LogMessage() = default;
    LogMessage(LogLevel lvl, std::string comp, std::string msg,
               std::chrono::system_clock::time_point ts = std::chrono::system_clock::now());
};

// ============================================================================
// Formatters
// ============================================================================

class ILogFormatter {
public:
    virtual ~ILogFormatter() = default;
    virtual std::string format(const LogMessage& message) = 0;
};

/**
 * @brief `[2026-01-01T00:00:00.000Z] [INFO ] [component] message {k=v}`
 */
class TextFormatter : public ILogFormatter {
public:
    explicit TextFormatter(bool include_thread_id = false);
    std::string format(const LogMessage& message) override;

private:
    bool include_thread_id_;
};

/**
 * @brief One JSON object per line, suitable for log shippers.
 */
class JsonFormatter : public ILogFormatter {
public:
    explicit JsonFormatter(bool pretty_print = false);
    std::string format(const LogMessage& message) override;

private:
    bool pretty_print_;
};

// ============================================================================
// Sinks
// ============================================================================

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void write(const std::string& formatted_message) = 0;
    virtual void flush() = 0;
};

class ConsoleSink : public ILogSink {
public:
    ConsoleSink() = default;
    void write(const std::string& formatted_message) override;
    void flush() override;

private:
    std::mutex mutex_;
};

class FileSink : public ILogSink {
public:
    /**
     * @brief Opens (and creates parent directories of) the log file.
     * @throws std::runtime_error if the file cannot be opened
     */
    explicit FileSink(const std::string& filename, bool append = true);
    ~FileSink() override;

    void write(const std::string& formatted_message) override;
    void flush() override;

private:
    std::string filename_;
    std::ofstream file_;
    std::mutex mutex_;
};

/**
 * @brief Keeps formatted lines in memory. Used by tests.
 */
class MemorySink : public ILogSink {
public:
    void write(const std::string& formatted_message) override;
    void flush() override {}

    [[nodiscard]] std::vector<std::string> lines() const;
    void clear();

private:
    std::vector<std::string> lines_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Logger
// ============================================================================

/**
 * @brief Component logger with pluggable sinks and formatter.
 *
 * Lock order: fields_mutex_ before config_mutex_. do_log() takes a snapshot of
 * both under short locks and writes to the sinks afterwards.
 */
class Logger {
public:
    explicit Logger(std::string component);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void trace(const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);
    void fatal(const std::string& message);
    void log(LogLevel level, const std::string& message);

    // ========================================================================
    // Structured logging
    // ========================================================================

    Logger& with_field(const std::string& key, const std::string& value);

    template<typename T>
    Logger& with_field(const std::string& key, T value);

    Logger& clear_fields();

    // ========================================================================
    // Configuration
    // ========================================================================

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel get_level() const;
    [[nodiscard]] bool is_enabled(LogLevel level) const;

    void add_sink(std::shared_ptr<ILogSink> sink);
    void clear_sinks();
    void set_formatter(std::shared_ptr<ILogFormatter> formatter);
    void flush();

    [[nodiscard]] const std::string& component() const;

private:
    const std::string component_;
    std::atomic<LogLevel> min_level_{LogLevel::INFO};

    std::unordered_map<std::string, std::string> fields_;
    mutable std::mutex fields_mutex_;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    std::shared_ptr<ILogFormatter> formatter_;
    mutable std::mutex config_mutex_;

    void do_log(LogLevel level, const std::string& message);
};

// ============================================================================
// Global logger registry
// ============================================================================

class LoggerFactory {
public:
    static Logger& get_default();
    static Logger& get_logger(const std::string& component);

    /**
     * @brief Applies to existing loggers and to loggers created later.
     */
    static void set_global_level(LogLevel level);
    static void set_default_sink(std::shared_ptr<ILogSink> sink);
    static void add_default_sink(std::shared_ptr<ILogSink> sink);
    static void set_default_formatter(std::shared_ptr<ILogFormatter> formatter);
    static void flush_all();

private:
    static std::unordered_map<std::string, std::unique_ptr<Logger>> loggers_;
    static std::vector<std::shared_ptr<ILogSink>> default_sinks_;
    static std::shared_ptr<ILogFormatter> default_formatter_;
    static LogLevel global_level_;
    static std::mutex registry_mutex_;
};

// ============================================================================
// Template implementation
// ============================================================================

template<typename T>
Logger& Logger::with_field(const std::string& key, T value) {
    std::lock_guard<std::mutex> lock(fields_mutex_);

    if constexpr (std::is_same_v<T, bool>) {
        fields_[key] = value ? "true" : "false";
    } else if constexpr (std::is_arithmetic_v<T>) {
        fields_[key] = std::to_string(value);
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        fields_[key] = std::string(value);
    } else {
        static_assert(std::is_convertible_v<T, std::string>, "Type not supported for logging field");
    }

    return *this;
}

} // namespace vmexec
