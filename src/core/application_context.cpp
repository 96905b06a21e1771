#include "masklint/core/application_context.hpp"

#include <filesystem>

#include "masklint/config/config.hpp"
#include "masklint/core/errors.hpp"
#include "masklint/log/logger.hpp"

namespace masklint::core {

ApplicationContext& ApplicationContext::instance() {
    static ApplicationContext context;
    return context;
}

ApplicationContext::ApplicationContext()
    : log_config_(std::make_shared<log::LogConfig>()),
      linter_config_(std::make_shared<lint::LinterConfig>()),
      report_config_(std::make_shared<ReportConfig>()) {}

void ApplicationContext::configure(const std::string& config_file,
                                   bool config_required,
                                   const std::string& log_level) {
    auto& manager = config::ConfigManager::instance();
    manager.reset();

    log_config_ = std::make_shared<log::LogConfig>();
    linter_config_ = std::make_shared<lint::LinterConfig>();
    report_config_ = std::make_shared<ReportConfig>();
    manager.register_configuration_properties(log_config_);
    manager.register_configuration_properties(linter_config_);
    manager.register_configuration_properties(report_config_);

    // Logging is needed while the file loads; start with defaults
    log::Logger::init(*log_config_);

    if (!config_file.empty() && std::filesystem::exists(config_file)) {
        manager.load_config(config_file, config::format_from_path(config_file));
    } else if (config_required) {
        throw ConfigError("config file not found: " + config_file);
    }

    if (!log_level.empty()) {
        log_config_->global_level = log::LogConfig::level_from_string(log_level);
    }
    log::Logger::init(*log_config_);
}

}  // namespace masklint::core
