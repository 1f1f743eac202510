#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace frontier {

// ============================================================================
// Levels and Formats
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

/**
 * @brief Line format written by a logger's sinks
 */
enum class LogFormat : int {
    TEXT = 0,   ///< `[timestamp] [LEVEL] [component] message {k=v}`
    JSON = 1    ///< One JSON object per line
};

[[nodiscard]] std::string to_string(LogLevel level);
[[nodiscard]] LogLevel log_level_from_string(const std::string& level_str);

[[nodiscard]] std::string to_string(LogFormat format);
[[nodiscard]] std::optional<LogFormat> log_format_from_string(const std::string& format_str);

/**
 * @brief One emitted log line before formatting
 */
struct LogRecord {
    LogLevel level = LogLevel::INFO;
    std::string component;
    std::string message;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    std::map<std::string, std::string> fields;     ///< Sorted, so output is stable
};

// ============================================================================
// Formatters
// ============================================================================

class ILogFormatter {
public:
    virtual ~ILogFormatter() = default;
    [[nodiscard]] virtual std::string format(const LogRecord& record) const = 0;
};

class TextFormatter : public ILogFormatter {
public:
    [[nodiscard]] std::string format(const LogRecord& record) const override;
};

/**
 * @brief Compact JSON lines for log shippers
 *
 * Keys: timestamp, level, component, message and, when present, fields.
 */
class JsonFormatter : public ILogFormatter {
public:
    [[nodiscard]] std::string format(const LogRecord& record) const override;
};

[[nodiscard]] std::shared_ptr<ILogFormatter> make_formatter(LogFormat format);

// ============================================================================
// Sinks
// ============================================================================

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void write(LogLevel level, const std::string& line) = 0;
    virtual void flush() = 0;
};

/**
 * @brief stderr for WARN and above, stdlog otherwise
 */
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(bool use_colors = true) : use_colors_(use_colors) {}

    void write(LogLevel level, const std::string& line) override;
    void flush() override;

private:
    bool use_colors_;
    std::mutex mutex_;
};

/**
 * @brief Appends lines to a file, creating its directory when missing
 */
class FileSink : public ILogSink {
public:
    /**
     * @throws StorageIOException if the file cannot be opened for appending
     */
    explicit FileSink(std::filesystem::path path);

    void write(LogLevel level, const std::string& line) override;
    void flush() override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::ofstream out_;
    std::mutex mutex_;
};

// ============================================================================
// Logger
// ============================================================================

/**
 * @brief Named component logger with structured fields
 *
 * Loggers are owned by LoggerFactory and handed out by reference. Fields
 * stay attached until clear_fields().
 */
class Logger {
public:
    explicit Logger(std::string component);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void trace(const std::string& message) { log(LogLevel::TRACE, message); }
    void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
    void info(const std::string& message) { log(LogLevel::INFO, message); }
    void warn(const std::string& message) { log(LogLevel::WARN, message); }
    void error(const std::string& message) { log(LogLevel::ERROR, message); }
    void fatal(const std::string& message) { log(LogLevel::FATAL, message); }
    void log(LogLevel level, const std::string& message);

    Logger& with_field(const std::string& key, const std::string& value);

    template<typename T>
    Logger& with_field(const std::string& key, T value);

    Logger& clear_fields();

    void set_level(LogLevel level) { min_level_ = level; }
    [[nodiscard]] LogLevel get_level() const { return min_level_.load(); }
    [[nodiscard]] bool is_enabled(LogLevel level) const;

    void set_formatter(std::shared_ptr<ILogFormatter> formatter);
    void add_sink(std::shared_ptr<ILogSink> sink);
    void clear_sinks();
    void flush();

    [[nodiscard]] const std::string& component() const noexcept { return component_; }

private:
    std::string component_;
    std::atomic<LogLevel> min_level_{LogLevel::INFO};

    std::map<std::string, std::string> fields_;
    std::shared_ptr<ILogFormatter> formatter_;
    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Registry
// ============================================================================

class LoggerFactory {
public:
    /**
     * @brief Logger for a component, created at the global level on first use
     */
    static Logger& get_logger(const std::string& component);

    /**
     * @brief Set the level of every existing and future logger
     */
    static void set_global_level(LogLevel level);

private:
    static std::unordered_map<std::string, std::unique_ptr<Logger>> loggers_;
    static LogLevel global_level_;
    static std::mutex registry_mutex_;
};

template<typename T>
Logger& Logger::with_field(const std::string& key, T value) {
    if constexpr (std::is_same_v<T, bool>) {
        return with_field(key, std::string(value ? "true" : "false"));
    } else if constexpr (std::is_arithmetic_v<T>) {
        return with_field(key, std::to_string(value));
    } else {
        static_assert(std::is_convertible_v<T, std::string>, "Type not supported for logging field");
        return with_field(key, std::string(value));
    }
}

} // namespace frontier
