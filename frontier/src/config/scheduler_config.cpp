#include "frontier/config/scheduler_config.h"
#include "frontier/core/exceptions.h"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace frontier {

// ============================================================================
// Internal Utilities
// ============================================================================

namespace {

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::optional<std::string> get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    return value ? std::optional<std::string>(value) : std::nullopt;
}

/**
 * @brief Parse boolean from string (true/false, yes/no, 1/0, on/off)
 */
std::optional<bool> parse_bool(const std::string& value) {
    std::string lower_value = to_lower(trim(value));

    if (lower_value == "true" || lower_value == "yes" || lower_value == "1" || lower_value == "on") {
        return true;
    } else if (lower_value == "false" || lower_value == "no" || lower_value == "0" || lower_value == "off") {
        return false;
    }

    return std::nullopt;
}

bool is_valid_log_level(const std::string& value) {
    static const std::vector<std::string> levels = {
        "trace", "debug", "info", "warn", "warning", "error", "fatal", "off"};
    return std::find(levels.begin(), levels.end(), to_lower(trim(value))) != levels.end();
}

template<typename T>
std::optional<T> find_value(const toml::table& table, const char* section, const char* key,
                            const char* expected_type) {
    auto node = table[section][key];
    if (!node) {
        return std::nullopt;
    }

    auto value = node.template value<T>();
    if (!value) {
        throw ConfigurationException(std::string(section) + "." + key + " must be " + expected_type);
    }
    return value;
}

void apply_fairness(SchedulerConfig& config, const std::string& value, const std::string& source) {
    auto fairness = fairness_from_string(value);
    if (!fairness) {
        throw ConfigurationException(source + ": unknown fairness strategy '" + value +
                                     "' (expected round_robin or downloader_aware)");
    }
    config.fairness = *fairness;
}

void apply_order(SchedulerConfig& config, const std::string& value, const std::string& source) {
    auto order = queue_order_from_string(value);
    if (!order) {
        throw ConfigurationException(source + ": unknown queue order '" + value + "' (expected fifo or lifo)");
    }
    config.order = *order;
}

void apply_backend(SchedulerConfig& config, const std::string& value, const std::string& source) {
    auto backend = queue_backend_from_string(value);
    if (!backend) {
        throw ConfigurationException(source + ": unknown queue backend '" + value +
                                     "' (expected disk, sqlite or memory)");
    }
    config.backend = *backend;
}

void apply_log_level(SchedulerConfig& config, const std::string& value, const std::string& source) {
    if (!is_valid_log_level(value)) {
        throw ConfigurationException(source + ": unknown log level '" + value + "'");
    }
    config.logging.level = log_level_from_string(trim(value));
}

void apply_log_format(SchedulerConfig& config, const std::string& value, const std::string& source) {
    auto format = log_format_from_string(trim(value));
    if (!format) {
        throw ConfigurationException(source + ": unknown log format '" + value + "' (expected text or json)");
    }
    config.logging.format = *format;
}

SchedulerConfig config_from_table(const toml::table& table) {
    SchedulerConfig config;

    if (auto fairness = find_value<std::string>(table, "scheduler", "fairness", "a string")) {
        apply_fairness(config, *fairness, "scheduler.fairness");
    }

    if (auto order = find_value<std::string>(table, "scheduler", "order", "a string")) {
        apply_order(config, *order, "scheduler.order");
    }

    if (auto backend = find_value<std::string>(table, "scheduler", "backend", "a string")) {
        apply_backend(config, *backend, "scheduler.backend");
    }

    if (auto job_dir = find_value<std::string>(table, "scheduler", "job_dir", "a string")) {
        if (!job_dir->empty()) {
            config.job_dir = std::filesystem::path(*job_dir);
        }
    }

    if (auto level = find_value<std::string>(table, "logging", "level", "a string")) {
        apply_log_level(config, *level, "logging.level");
    }

    if (auto component = find_value<std::string>(table, "logging", "component", "a string")) {
        config.logging.component = *component;
    }

    if (auto format = find_value<std::string>(table, "logging", "format", "a string")) {
        apply_log_format(config, *format, "logging.format");
    }

    if (auto console = find_value<bool>(table, "logging", "console", "a boolean")) {
        config.logging.console = *console;
    }

    if (auto file = find_value<std::string>(table, "logging", "file", "a string")) {
        if (!file->empty()) {
            config.logging.file = std::filesystem::path(*file);
        }
    }

    if (auto flag = find_value<bool>(table, "logging", "log_unserializable_requests", "a boolean")) {
        config.logging.log_unserializable_requests = *flag;
    }

    if (auto flag = find_value<bool>(table, "logging", "log_stats_on_close", "a boolean")) {
        config.logging.log_stats_on_close = *flag;
    }

    return config;
}

} // namespace

// ============================================================================
// Enum Conversions
// ============================================================================

std::string to_string(QueueOrder order) {
    switch (order) {
        case QueueOrder::FIFO: return "fifo";
        case QueueOrder::LIFO: return "lifo";
        default: return "unknown";
    }
}

std::optional<QueueOrder> queue_order_from_string(const std::string& order_str) {
    std::string lower = to_lower(trim(order_str));
    if (lower == "fifo") return QueueOrder::FIFO;
    if (lower == "lifo") return QueueOrder::LIFO;
    return std::nullopt;
}

std::string to_string(FairnessStrategy strategy) {
    switch (strategy) {
        case FairnessStrategy::ROUND_ROBIN: return "round_robin";
        case FairnessStrategy::DOWNLOADER_AWARE: return "downloader_aware";
        default: return "unknown";
    }
}

std::optional<FairnessStrategy> fairness_from_string(const std::string& strategy_str) {
    std::string lower = to_lower(trim(strategy_str));
    std::replace(lower.begin(), lower.end(), '-', '_');
    if (lower == "round_robin") return FairnessStrategy::ROUND_ROBIN;
    if (lower == "downloader_aware") return FairnessStrategy::DOWNLOADER_AWARE;
    return std::nullopt;
}

std::string to_string(QueueBackend backend) {
    switch (backend) {
        case QueueBackend::MEMORY: return "memory";
        case QueueBackend::DISK: return "disk";
        case QueueBackend::SQLITE: return "sqlite";
        default: return "unknown";
    }
}

std::optional<QueueBackend> queue_backend_from_string(const std::string& backend_str) {
    std::string lower = to_lower(trim(backend_str));
    if (lower == "memory") return QueueBackend::MEMORY;
    if (lower == "disk") return QueueBackend::DISK;
    if (lower == "sqlite") return QueueBackend::SQLITE;
    return std::nullopt;
}

// ============================================================================
// ValidationResult
// ============================================================================

std::string ValidationResult::report() const {
    std::ostringstream oss;
    oss << (is_valid ? "Configuration is valid" : "Configuration is invalid") << "\n";
    for (const auto& error : errors) {
        oss << "  error: " << error << "\n";
    }
    for (const auto& warning : warnings) {
        oss << "  warning: " << warning << "\n";
    }
    return oss.str();
}

// ============================================================================
// SchedulerConfig
// ============================================================================

void SchedulerConfig::Logging::apply(Logger& logger) const {
    std::shared_ptr<ILogSink> file_sink;
    if (file) {
        try {
            file_sink = std::make_shared<FileSink>(*file);
        } catch (const StorageIOException& e) {
            throw ConfigurationException(std::string("logging.file: ") + e.what());
        }
    }

    logger.set_level(level);
    logger.set_formatter(make_formatter(format));
    logger.clear_sinks();
    if (console) {
        logger.add_sink(std::make_shared<ConsoleSink>());
    }
    logger.add_sink(std::move(file_sink));
}

std::filesystem::path SchedulerConfig::queue_dir() const {
    if (!job_dir) {
        throw ConfigurationException("no job directory configured");
    }
    return *job_dir / "requests.queue";
}

std::filesystem::path SchedulerConfig::snapshot_path() const {
    return queue_dir() / "active.json";
}

SchedulerConfig SchedulerConfig::from_toml_file(const std::filesystem::path& config_path) {
    if (!std::filesystem::exists(config_path)) {
        throw ConfigurationException("configuration file '" + config_path.string() + "' does not exist");
    }

    try {
        return config_from_table(toml::parse_file(config_path.string()));
    } catch (const toml::parse_error& e) {
        std::ostringstream oss;
        oss << config_path.string() << ":" << e.source().begin.line << ": " << e.description();
        throw ConfigurationException(oss.str());
    }
}

SchedulerConfig SchedulerConfig::from_toml_string(const std::string& toml_content) {
    try {
        return config_from_table(toml::parse(toml_content));
    } catch (const toml::parse_error& e) {
        std::ostringstream oss;
        oss << "line " << e.source().begin.line << ": " << e.description();
        throw ConfigurationException(oss.str());
    }
}

SchedulerConfig SchedulerConfig::from_environment() {
    return SchedulerConfig{}.with_environment_overrides();
}

SchedulerConfig SchedulerConfig::with_environment_overrides() const {
    SchedulerConfig config = *this;

    if (auto fairness = get_env("FRONTIER_SCHEDULER_FAIRNESS")) {
        apply_fairness(config, *fairness, "FRONTIER_SCHEDULER_FAIRNESS");
    }

    if (auto order = get_env("FRONTIER_SCHEDULER_ORDER")) {
        apply_order(config, *order, "FRONTIER_SCHEDULER_ORDER");
    }

    if (auto backend = get_env("FRONTIER_SCHEDULER_BACKEND")) {
        apply_backend(config, *backend, "FRONTIER_SCHEDULER_BACKEND");
    }

    // An empty value switches back to memory-only scheduling
    if (auto job_dir = get_env("FRONTIER_JOB_DIR")) {
        if (trim(*job_dir).empty()) {
            config.job_dir.reset();
        } else {
            config.job_dir = std::filesystem::path(trim(*job_dir));
        }
    }

    if (auto level = get_env("FRONTIER_LOG_LEVEL")) {
        apply_log_level(config, *level, "FRONTIER_LOG_LEVEL");
    }

    if (auto format = get_env("FRONTIER_LOG_FORMAT")) {
        apply_log_format(config, *format, "FRONTIER_LOG_FORMAT");
    }

    if (auto file = get_env("FRONTIER_LOG_FILE")) {
        if (trim(*file).empty()) {
            config.logging.file.reset();
        } else {
            config.logging.file = std::filesystem::path(trim(*file));
        }
    }

    if (auto flag_str = get_env("FRONTIER_LOG_UNSERIALIZABLE")) {
        auto flag = parse_bool(*flag_str);
        if (!flag) {
            throw ConfigurationException("FRONTIER_LOG_UNSERIALIZABLE: expected a boolean, got '" +
                                         *flag_str + "'");
        }
        config.logging.log_unserializable_requests = *flag;
    }

    return config;
}

SchedulerConfig SchedulerConfig::merge(const SchedulerConfig& other) const {
    SchedulerConfig result = *this;

    result.fairness = other.fairness;
    result.order = other.order;
    result.backend = other.backend;
    if (other.job_dir) {
        result.job_dir = other.job_dir;
    }

    result.logging = other.logging;

    return result;
}

ValidationResult SchedulerConfig::validate() const {
    ValidationResult result;

    if (job_dir) {
        std::error_code ec;
        if (job_dir->empty()) {
            result.errors.push_back("job_dir is set but empty");
        } else if (std::filesystem::exists(*job_dir, ec) && !std::filesystem::is_directory(*job_dir, ec)) {
            result.errors.push_back("job_dir '" + job_dir->string() + "' exists and is not a directory");
        } else if (!std::filesystem::exists(*job_dir, ec)) {
            result.warnings.push_back("job_dir '" + job_dir->string() + "' does not exist and will be created");
        }

        if (backend == QueueBackend::MEMORY) {
            result.warnings.push_back("backend is memory; job_dir is ignored and the crawl cannot be resumed");
        }
    }

    if (logging.component.empty()) {
        result.errors.push_back("logging.component must not be empty");
    }

    if (logging.file) {
        std::error_code ec;
        if (logging.file->empty()) {
            result.errors.push_back("logging.file is set but empty");
        } else if (std::filesystem::is_directory(*logging.file, ec)) {
            result.errors.push_back("logging.file '" + logging.file->string() + "' is a directory");
        }
    } else if (!logging.console && logging.level != LogLevel::OFF) {
        result.warnings.push_back("logging.console is off and no logging.file is set; log output is discarded");
    }

    if (fairness == FairnessStrategy::DOWNLOADER_AWARE && logging.level == LogLevel::OFF) {
        result.warnings.push_back("downloader_aware fairness relies on dispatch hooks; with logging off, "
                                  "missing completion reports go unnoticed");
    }

    result.is_valid = result.errors.empty();
    return result;
}

std::string SchedulerConfig::to_toml() const {
    toml::table scheduler{
        {"fairness", to_string(fairness)},
        {"order", to_string(order)},
        {"backend", to_string(backend)},
    };
    if (job_dir) {
        scheduler.insert("job_dir", job_dir->string());
    }

    toml::table logging_table{
        {"component", logging.component},
        {"level", to_lower(to_string(logging.level))},
        {"format", to_string(logging.format)},
        {"console", logging.console},
        {"log_unserializable_requests", logging.log_unserializable_requests},
        {"log_stats_on_close", logging.log_stats_on_close},
    };

    if (logging.file) {
        logging_table.insert("file", logging.file->string());
    }

    toml::table root{
        {"scheduler", std::move(scheduler)},
        {"logging", std::move(logging_table)},
    };

    std::ostringstream oss;
    oss << root;
    return oss.str();
}

std::string SchedulerConfig::summary() const {
    std::ostringstream oss;
    oss << "fairness=" << to_string(fairness)
        << " order=" << to_string(order)
        << " backend=" << to_string(is_persistent() ? backend : QueueBackend::MEMORY);
    if (job_dir) {
        oss << " job_dir=" << job_dir->string();
    }
    return oss.str();
}

} // namespace frontier
