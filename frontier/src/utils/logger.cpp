#include "frontier/utils/logger.h"
#include "frontier/core/exceptions.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace frontier {

namespace {

std::string upper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

// ISO 8601 in UTC with milliseconds
std::string iso_timestamp(std::chrono::system_clock::time_point timestamp) {
    auto seconds = std::chrono::system_clock::to_time_t(timestamp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis.count() << 'Z';
    return oss.str();
}

const char* color_of(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "\033[37m";
        case LogLevel::DEBUG: return "\033[36m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::FATAL: return "\033[35m";
        default: return "\033[0m";
    }
}

} // namespace

// ============================================================================
// Levels and Formats
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
    static const std::unordered_map<std::string, LogLevel> levels = {
        {"TRACE", LogLevel::TRACE}, {"DEBUG", LogLevel::DEBUG}, {"INFO", LogLevel::INFO},
        {"WARN", LogLevel::WARN},   {"WARNING", LogLevel::WARN}, {"ERROR", LogLevel::ERROR},
        {"FATAL", LogLevel::FATAL}, {"OFF", LogLevel::OFF}};

    auto it = levels.find(upper(level_str));
    return it == levels.end() ? LogLevel::INFO : it->second;
}

std::string to_string(LogFormat format) {
    return format == LogFormat::JSON ? "json" : "text";
}

std::optional<LogFormat> log_format_from_string(const std::string& format_str) {
    auto name = upper(format_str);
    if (name == "TEXT") return LogFormat::TEXT;
    if (name == "JSON") return LogFormat::JSON;
    return std::nullopt;
}

// ============================================================================
// Formatters
// ============================================================================

std::string TextFormatter::format(const LogRecord& record) const {
    std::ostringstream oss;
    oss << '[' << iso_timestamp(record.timestamp) << "] "
        << '[' << std::setw(5) << std::left << to_string(record.level) << "] ";

    if (!record.component.empty()) {
        oss << '[' << record.component << "] ";
    }
    oss << record.message;

    if (!record.fields.empty()) {
        const char* separator = " {";
        for (const auto& [key, value] : record.fields) {
            oss << separator << key << '=' << value;
            separator = ", ";
        }
        oss << '}';
    }
    return oss.str();
}

std::string JsonFormatter::format(const LogRecord& record) const {
    nlohmann::ordered_json line = {
        {"timestamp", iso_timestamp(record.timestamp)},
        {"level", to_string(record.level)},
        {"component", record.component},
        {"message", record.message},
    };
    if (!record.fields.empty()) {
        line["fields"] = record.fields;
    }

    // URLs and bodies may carry invalid UTF-8; a log call must not throw
    return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::shared_ptr<ILogFormatter> make_formatter(LogFormat format) {
    if (format == LogFormat::JSON) {
        return std::make_shared<JsonFormatter>();
    }
    return std::make_shared<TextFormatter>();
}

// ============================================================================
// Sinks
// ============================================================================

void ConsoleSink::write(LogLevel level, const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostream& stream = level >= LogLevel::WARN ? std::cerr : std::clog;
    if (use_colors_) {
        stream << color_of(level) << line << "\033[0m\n";
    } else {
        stream << line << '\n';
    }
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::clog.flush();
    std::cerr.flush();
}

FileSink::FileSink(std::filesystem::path path)
    : path_(std::move(path)) {
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw StorageIOException(path_.parent_path().string(), "create log directory", ec.message());
        }
    }

    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_.is_open()) {
        throw StorageIOException(path_.string(), "open log file", "cannot open for appending");
    }
}

void FileSink::write(LogLevel, const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << '\n';
}

void FileSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    out_.flush();
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger(std::string component)
    : component_(std::move(component))
    , formatter_(std::make_shared<TextFormatter>()) {
    sinks_.push_back(std::make_shared<ConsoleSink>());
}

Logger::~Logger() {
    flush();
}

bool Logger::is_enabled(LogLevel level) const {
    LogLevel min_level = min_level_.load();
    return min_level != LogLevel::OFF && level >= min_level;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!is_enabled(level)) {
        return;
    }

    LogRecord record;
    record.level = level;
    record.component = component_;
    record.message = message;

    std::shared_ptr<ILogFormatter> formatter;
    std::vector<std::shared_ptr<ILogSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        record.fields = fields_;
        formatter = formatter_;
        sinks = sinks_;
    }

    std::string line = formatter->format(record);
    for (auto& sink : sinks) {
        sink->write(level, line);
    }
}

Logger& Logger::with_field(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    fields_[key] = value;
    return *this;
}

Logger& Logger::clear_fields() {
    std::lock_guard<std::mutex> lock(mutex_);
    fields_.clear();
    return *this;
}

void Logger::set_formatter(std::shared_ptr<ILogFormatter> formatter) {
    if (!formatter) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    formatter_ = std::move(formatter);
}

void Logger::add_sink(std::shared_ptr<ILogSink> sink) {
    if (!sink) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::flush() {
    std::vector<std::shared_ptr<ILogSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks = sinks_;
    }
    for (auto& sink : sinks) {
        sink->flush();
    }
}

// ============================================================================
// LoggerFactory
// ============================================================================

std::unordered_map<std::string, std::unique_ptr<Logger>> LoggerFactory::loggers_;
LogLevel LoggerFactory::global_level_ = LogLevel::INFO;
std::mutex LoggerFactory::registry_mutex_;

Logger& LoggerFactory::get_logger(const std::string& component) {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    auto& slot = loggers_[component];
    if (!slot) {
        slot = std::make_unique<Logger>(component);
        slot->set_level(global_level_);
    }
    return *slot;
}

void LoggerFactory::set_global_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    global_level_ = level;
    for (auto& [component, logger] : loggers_) {
        logger->set_level(level);
    }
}

} // namespace frontier
