#include "vmexec/utils/logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace vmexec {

namespace {

std::string format_timestamp(std::chrono::system_clock::time_point timestamp) {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return oss.str();
}

} // anonymous namespace

// ============================================================================
// LogLevel helpers
// ============================================================================

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF";
        default: return "UNKNOWN";
    }
}

LogLevel log_level_from_string(const std::string& level_str) {
    std::string upper_str = level_str;
    std::transform(upper_str.begin(), upper_str.end(), upper_str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper_str == "TRACE") return LogLevel::TRACE;
    if (upper_str == "DEBUG") return LogLevel::DEBUG;
    if (upper_str == "INFO")  return LogLevel::INFO;
    if (upper_str == "WARN" || upper_str == "WARNING") return LogLevel::WARN;
    if (upper_str == "ERROR") return LogLevel::ERROR;
    if (upper_str == "FATAL") return LogLevel::FATAL;
    if (upper_str == "OFF")   return LogLevel::OFF;

    return LogLevel::INFO;
}

// ============================================================================
// LogMessage
// ============================================================================

LogMessage::LogMessage(LogLevel lvl, std::string comp, std::string msg,
                       std::chrono::system_clock::time_point ts)
    : level(lvl)
    , component(std::move(comp))
    , message(std::move(msg))
    , timestamp(ts)
    , thread_id(std::this_thread::get_id()) {
}

// ============================================================================
// TextFormatter
// ============================================================================

TextFormatter::TextFormatter(bool include_thread_id)
    : include_thread_id_(include_thread_id) {
}

std::string TextFormatter::format(const LogMessage& message) {
    std::ostringstream oss;

    oss << "[" << format_timestamp(message.timestamp) << "] ";
    oss << "[" << std::setw(5) << std::left << to_string(message.level) << "] ";

    if (!message.component.empty()) {
        oss << "[" << message.component << "] ";
    }

    if (include_thread_id_) {
        oss << "[thread=" << message.thread_id << "] ";
    }

    oss << message.message;

    if (!message.fields.empty()) {
        oss << " {";
        bool first = true;
        for (const auto& [key, value] : message.fields) {
            if (!first) oss << ", ";
            oss << key << "=" << value;
            first = false;
        }
        oss << "}";
    }

    return oss.str();
}

// ============================================================================
// JsonFormatter
// ============================================================================

JsonFormatter::JsonFormatter(bool pretty_print)
    : pretty_print_(pretty_print) {
}

std::string JsonFormatter::format(const LogMessage& message) {
    nlohmann::json j;
    j["timestamp"] = format_timestamp(message.timestamp);
    j["level"] = to_string(message.level);
    if (!message.component.empty()) {
        j["component"] = message.component;
    }

    std::ostringstream tid;
    tid << message.thread_id;
    j["thread_id"] = tid.str();
    j["message"] = message.message;

    if (!message.fields.empty()) {
        j["fields"] = message.fields;
    }

    // Replace invalid UTF-8 instead of throwing from a log call
    return j.dump(pretty_print_ ? 2 : -1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// ============================================================================
// ConsoleSink
// ============================================================================

void ConsoleSink::write(const std::string& formatted_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << formatted_message << '\n';
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout.flush();
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& filename, bool append)
    : filename_(filename) {
    auto parent_path = std::filesystem::path(filename).parent_path();
    if (!parent_path.empty()) {
        std::filesystem::create_directories(parent_path);
    }

    auto mode = append ? std::ios::out | std::ios::app : std::ios::out;
    file_.open(filename_, mode);

    if (!file_.is_open()) {
        throw std::runtime_error("Failed to open log file: " + filename_);
    }
}

FileSink::~FileSink() {
    if (file_.is_open()) {
        file_.close();
    }
}

void FileSink::write(const std::string& formatted_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) return;
    file_ << formatted_message << "\n";
}

void FileSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// MemorySink
// ============================================================================

void MemorySink::write(const std::string& formatted_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.push_back(formatted_message);
}

std::vector<std::string> MemorySink::lines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
}

void MemorySink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger(std::string component)
    : component_(std::move(component))
    , formatter_(std::make_shared<TextFormatter>()) {
    add_sink(std::make_shared<ConsoleSink>());
}

Logger::~Logger() {
    flush();
}

void Logger::trace(const std::string& message) {
    log(LogLevel::TRACE, message);
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::fatal(const std::string& message) {
    log(LogLevel::FATAL, message);
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!is_enabled(level)) {
        return;
    }
    do_log(level, message);
}

Logger& Logger::with_field(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(fields_mutex_);
    fields_[key] = value;
    return *this;
}

Logger& Logger::clear_fields() {
    std::lock_guard<std::mutex> lock(fields_mutex_);
    fields_.clear();
    return *this;
}

void Logger::set_level(LogLevel level) {
    min_level_ = level;
}

LogLevel Logger::get_level() const {
    return min_level_.load();
}

bool Logger::is_enabled(LogLevel level) const {
    auto min = min_level_.load();
    return min != LogLevel::OFF && level >= min;
}

void Logger::add_sink(std::shared_ptr<ILogSink> sink) {
    if (!sink) return;

    std::lock_guard<std::mutex> lock(config_mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(config_mutex_);
    sinks_.clear();
}

void Logger::set_formatter(std::shared_ptr<ILogFormatter> formatter) {
    if (!formatter) return;

    std::lock_guard<std::mutex> lock(config_mutex_);
    formatter_ = std::move(formatter);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(config_mutex_);
    for (auto& sink : sinks_) {
        if (sink) {
            sink->flush();
        }
    }
}

const std::string& Logger::component() const {
    return component_;
}

void Logger::do_log(LogLevel level, const std::string& message) {
    LogMessage log_msg(level, component_, message);

    {
        std::lock_guard<std::mutex> lock(fields_mutex_);
        log_msg.fields = fields_;
    }

    std::vector<std::shared_ptr<ILogSink>> sinks;
    std::shared_ptr<ILogFormatter> formatter;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        sinks = sinks_;
        formatter = formatter_;
    }

    std::string formatted_message = formatter ? formatter->format(log_msg) : message;

    for (auto& sink : sinks) {
        if (sink) {
            sink->write(formatted_message);
        }
    }
}

// ============================================================================
// LoggerFactory
// ============================================================================

std::unordered_map<std::string, std::unique_ptr<Logger>> LoggerFactory::loggers_;
std::vector<std::shared_ptr<ILogSink>> LoggerFactory::default_sinks_;
std::shared_ptr<ILogFormatter> LoggerFactory::default_formatter_;
LogLevel LoggerFactory::global_level_ = LogLevel::INFO;
std::mutex LoggerFactory::registry_mutex_;

Logger& LoggerFactory::get_default() {
    return get_logger("vmexec");
}

Logger& LoggerFactory::get_logger(const std::string& component) {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    auto it = loggers_.find(component);
    if (it != loggers_.end()) {
        return *it->second;
    }

    auto logger = std::make_unique<Logger>(component);
    logger->set_level(global_level_);

    if (!default_sinks_.empty()) {
        logger->clear_sinks();
        for (const auto& sink : default_sinks_) {
            logger->add_sink(sink);
        }
    }

    if (default_formatter_) {
        logger->set_formatter(default_formatter_);
    }

    Logger& logger_ref = *logger;
    loggers_[component] = std::move(logger);

    return logger_ref;
}

void LoggerFactory::set_global_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    global_level_ = level;

    for (auto& [name, logger] : loggers_) {
        logger->set_level(level);
    }
}

void LoggerFactory::set_default_sink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    default_sinks_.clear();
    if (sink) {
        default_sinks_.push_back(sink);
    }

    for (auto& [name, logger] : loggers_) {
        logger->clear_sinks();
        logger->add_sink(sink);
    }
}

void LoggerFactory::add_default_sink(std::shared_ptr<ILogSink> sink) {
    if (!sink) return;

    std::lock_guard<std::mutex> lock(registry_mutex_);
    if (default_sinks_.empty()) {
        // The implicit console sink of each logger becomes explicit
        default_sinks_.push_back(std::make_shared<ConsoleSink>());
        for (auto& [name, logger] : loggers_) {
            logger->clear_sinks();
            logger->add_sink(default_sinks_.front());
        }
    }
    default_sinks_.push_back(sink);

    for (auto& [name, logger] : loggers_) {
        logger->add_sink(sink);
    }
}

void LoggerFactory::set_default_formatter(std::shared_ptr<ILogFormatter> formatter) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    default_formatter_ = formatter;

    for (auto& [name, logger] : loggers_) {
        logger->set_formatter(formatter);
    }
}

void LoggerFactory::flush_all() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    for (auto& [name, logger] : loggers_) {
        logger->flush();
    }
}

} // namespace vmexec
