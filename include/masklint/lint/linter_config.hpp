#pragma once
#include <string>

#include "masklint/config/config.hpp"

namespace masklint::lint {

// Executable names for the external linters, read from the "linters" section
class LinterConfig : public config::ConfigurationProperties {
public:
    std::string shellcheck = "shellcheck";
    std::string ruff = "ruff";
    std::string rubocop = "rubocop";

    void from_ptree(const boost::property_tree::ptree& pt) override;
    void validate() const override;
    std::string properties_name() const override { return "linters"; }
};

}  // namespace masklint::lint
