#pragma once

#include <memory>
#include <string>

#include "masklint/core/reporter.hpp"
#include "masklint/lint/linter_config.hpp"
#include "masklint/log/log_config.hpp"

namespace masklint::core {

// Owns the configuration sections shared by every subcommand
class ApplicationContext {
public:
    static ApplicationContext& instance();

    // Registers the configuration sections, loads config_file when present
    // and initializes logging. A missing file is an error only when
    // config_required is set. A non-empty log_level overrides log.global_level.
    void configure(const std::string& config_file, bool config_required,
                   const std::string& log_level = "");

    const log::LogConfig& log_config() const { return *log_config_; }
    const lint::LinterConfig& linter_config() const { return *linter_config_; }
    const ReportConfig& report_config() const { return *report_config_; }

private:
    ApplicationContext();

    std::shared_ptr<log::LogConfig> log_config_;
    std::shared_ptr<lint::LinterConfig> linter_config_;
    std::shared_ptr<ReportConfig> report_config_;
};

}  // namespace masklint::core
