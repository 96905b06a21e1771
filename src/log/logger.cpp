#include "masklint/log/logger.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>
#include <filesystem>
#include <iostream>

namespace logging = boost::log;

namespace masklint::log {

namespace {

logging::trivial::severity_level to_boost_level(LogConfig::LogLevel level) {
    switch (level) {
        case LogConfig::LogLevel::TRACE:
            return logging::trivial::trace;
        case LogConfig::LogLevel::DEBUG:
            return logging::trivial::debug;
        case LogConfig::LogLevel::INFO:
            return logging::trivial::info;
        case LogConfig::LogLevel::WARN:
            return logging::trivial::warning;
        case LogConfig::LogLevel::ERROR:
            return logging::trivial::error;
        case LogConfig::LogLevel::FATAL:
            return logging::trivial::fatal;
    }
    return logging::trivial::info;
}

}  // namespace

void Logger::init(const LogConfig& config) {
    logging::core::get()->remove_all_sinks();

    if (config.file.enabled) {
        std::filesystem::path log_path(config.file.log_file);
        auto parent_path = log_path.parent_path();
        if (!parent_path.empty()) {
            std::filesystem::create_directories(parent_path);
        }

        logging::add_file_log(
            logging::keywords::file_name = config.file.log_file,
            logging::keywords::rotation_size = config.file.max_file_size,
            logging::keywords::max_files = config.file.max_files,
            logging::keywords::open_mode = std::ios_base::app,
            logging::keywords::auto_flush = true,
            logging::keywords::format =
                logging::parse_formatter(config.file.pattern));
    }

    // stdout carries the lint report, diagnostics go to stderr
    if (config.console.enabled) {
        logging::add_console_log(
            std::clog, logging::keywords::format =
                           logging::parse_formatter(config.console.pattern));
    }

    logging::add_common_attributes();
    set_level(config.global_level);

    MASKLINT_LOG_DEBUG << "Logger initialized at level "
                       << LogConfig::level_to_string(config.global_level);
}

void Logger::shutdown() {
    MASKLINT_LOG_DEBUG << "Logger shutting down";
    logging::core::get()->flush();
    logging::core::get()->remove_all_sinks();
}

void Logger::set_level(LogConfig::LogLevel level) {
    logging::core::get()->set_filter(
        logging::expressions::attr<logging::trivial::severity_level>(
            "Severity") >= to_boost_level(level));
}

}  // namespace masklint::log
