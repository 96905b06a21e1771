#include "masklint/log/log_config.hpp"

#include <algorithm>
#include <cctype>

#include "masklint/core/errors.hpp"

namespace masklint::log {

void LogConfig::from_ptree(const boost::property_tree::ptree& pt) {
    if (auto level_str = get_optional_value<std::string>(pt, "global_level")) {
        global_level = level_from_string(*level_str);
    }

    if (auto console_pt = pt.get_child_optional("console")) {
        console.enabled = get_value(*console_pt, "enabled", console.enabled);
        console.pattern = get_value(*console_pt, "pattern", console.pattern);
    }

    if (auto file_pt = pt.get_child_optional("file")) {
        file.enabled = get_value(*file_pt, "enabled", file.enabled);
        file.log_file = get_value(*file_pt, "log_file", file.log_file);
        file.max_file_size =
            get_value(*file_pt, "max_file_size", file.max_file_size);
        file.max_files = get_value(*file_pt, "max_files", file.max_files);
        file.pattern = get_value(*file_pt, "pattern", file.pattern);
    }
}

void LogConfig::validate() const {
    if (file.enabled && file.log_file.empty()) {
        throw ConfigError("log.file.log_file must be set when file logging is enabled");
    }
    if (file.max_file_size <= 0) {
        throw ConfigError("log.file.max_file_size must be positive");
    }
    if (file.max_files <= 0) {
        throw ConfigError("log.file.max_files must be positive");
    }
}

LogConfig::LogLevel LogConfig::level_from_string(const std::string& level_str) {
    std::string lower = level_str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "fatal") return LogLevel::FATAL;

    throw ConfigError("unknown log level '" + level_str + "'");
}

std::string LogConfig::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:
            return "trace";
        case LogLevel::DEBUG:
            return "debug";
        case LogLevel::INFO:
            return "info";
        case LogLevel::WARN:
            return "warning";
        case LogLevel::ERROR:
            return "error";
        case LogLevel::FATAL:
            return "fatal";
    }
    return "info";
}

}  // namespace masklint::log
