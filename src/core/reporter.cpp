#include "masklint/core/reporter.hpp"

#include <unistd.h>

#include <ostream>

#include "masklint/core/errors.hpp"

namespace masklint::core {

std::string emphasize_header(const std::string& text, bool enabled) {
    if (!enabled) {
        return text;
    }
    return "\x1b[1;36;4m" + text + "\x1b[0m";
}

void ReportConfig::from_ptree(const boost::property_tree::ptree& pt) {
    if (auto value = get_optional_value<std::string>(pt, "emphasis")) {
        emphasis = emphasis_from_string(*value);
    }
}

ReportConfig::Emphasis ReportConfig::emphasis_from_string(
    const std::string& value) {
    if (value == "auto") return Emphasis::AUTO;
    if (value == "always") return Emphasis::ALWAYS;
    if (value == "never") return Emphasis::NEVER;
    throw ConfigError("report.emphasis must be auto, always or never, got '" +
                      value + "'");
}

bool ReportConfig::emphasize_stdout() const {
    switch (emphasis) {
        case Emphasis::ALWAYS:
            return true;
        case Emphasis::NEVER:
            return false;
        case Emphasis::AUTO:
            return ::isatty(STDOUT_FILENO) == 1;
    }
    return false;
}

void Reporter::report(const std::string& qualified_name,
                      const std::string& findings) {
    if (findings.empty()) {
        return;
    }
    out_ << emphasize_header(qualified_name, emphasize_) << '\n';
    out_ << findings << "\n\n";
    out_.flush();
}

}  // namespace masklint::core
