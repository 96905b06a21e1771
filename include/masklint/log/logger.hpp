#pragma once
#include <boost/log/trivial.hpp>
#include <string>

#include "masklint/log/log_config.hpp"

namespace masklint::log {

class Logger {
public:
    // Replaces any installed sinks with the ones described by config
    static void init(const LogConfig& config);
    static void shutdown();
    static void set_level(LogConfig::LogLevel level);
};

}  // namespace masklint::log

#define MASKLINT_LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define MASKLINT_LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define MASKLINT_LOG_INFO BOOST_LOG_TRIVIAL(info)
#define MASKLINT_LOG_WARN BOOST_LOG_TRIVIAL(warning)
#define MASKLINT_LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define MASKLINT_LOG_FATAL BOOST_LOG_TRIVIAL(fatal)
