#pragma once
#include <iosfwd>
#include <string>

#include "masklint/config/config.hpp"

namespace masklint::core {

// Bold cyan underlined text when enabled, text unchanged otherwise
std::string emphasize_header(const std::string& text, bool enabled);

// Settings for the "report" section
class ReportConfig : public config::ConfigurationProperties {
public:
    enum class Emphasis { AUTO, ALWAYS, NEVER };

    Emphasis emphasis = Emphasis::AUTO;

    void from_ptree(const boost::property_tree::ptree& pt) override;
    std::string properties_name() const override { return "report"; }

    static Emphasis emphasis_from_string(const std::string& value);

    // Resolves AUTO by asking whether stdout is a terminal
    bool emphasize_stdout() const;
};

// Prints findings per command in the order they are produced
class Reporter {
public:
    Reporter(std::ostream& out, bool emphasize) : out_(out), emphasize_(emphasize) {}

    // Header, findings, blank line; nothing when findings is empty
    void report(const std::string& qualified_name, const std::string& findings);

private:
    std::ostream& out_;
    bool emphasize_;
};

}  // namespace masklint::core
