#pragma once
#include <filesystem>
#include <iosfwd>
#include <string>

#include "masklint/lint/linter_config.hpp"
#include "masklint/lint/process_runner.hpp"
#include "masklint/maskfile/maskfile.hpp"

namespace masklint::lint {

// Per-language strategy for materializing and linting a script
enum class LanguageHandler { Catchall, Shellcheck, Ruff, Rubocop };

// Findings reported for scripts no linter is registered for
inline constexpr const char* NO_LINTER_FINDING = "no linter found for target";

// sh/bash/zsh -> Shellcheck, py/python -> Ruff, rb/ruby -> Rubocop,
// anything else -> Catchall
LanguageHandler handler_for_executor(const std::string& executor);

const char* handler_name(LanguageHandler handler);

// ".sh", ".py", ".rb"; empty for Catchall
const char* file_extension(LanguageHandler handler);

// File content for a script; Shellcheck prepends an interpreter line
std::string transform_content(LanguageHandler handler,
                              const maskfile::Script& script);

// Runs the handler's linter against path and returns normalized findings.
// Throws LinterNotFoundError when the linter executable is missing.
std::string execute(LanguageHandler handler, const std::filesystem::path& path,
                    IProcessRunner& runner, const LinterConfig& linters);

std::string normalize_shellcheck_output(const std::string& raw,
                                        const std::string& path);
std::string normalize_ruff_output(const std::string& raw,
                                  const std::string& path);
std::string normalize_rubocop_output(const std::string& raw,
                                     const std::string& path);

std::ostream& operator<<(std::ostream& os, LanguageHandler handler);

}  // namespace masklint::lint
