#include "masklint/lint/linter_config.hpp"

#include "masklint/core/errors.hpp"

namespace masklint::lint {

void LinterConfig::from_ptree(const boost::property_tree::ptree& pt) {
    shellcheck = get_value(pt, "shellcheck.executable", shellcheck);
    ruff = get_value(pt, "ruff.executable", ruff);
    rubocop = get_value(pt, "rubocop.executable", rubocop);
}

void LinterConfig::validate() const {
    if (shellcheck.empty()) {
        throw ConfigError("linters.shellcheck.executable must not be empty");
    }
    if (ruff.empty()) {
        throw ConfigError("linters.ruff.executable must not be empty");
    }
    if (rubocop.empty()) {
        throw ConfigError("linters.rubocop.executable must not be empty");
    }
}

}  // namespace masklint::lint
