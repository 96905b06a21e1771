#pragma once
#include <filesystem>
#include <optional>
#include <string>

#include "masklint/core/reporter.hpp"
#include "masklint/lint/linter_config.hpp"
#include "masklint/lint/process_runner.hpp"
#include "masklint/maskfile/maskfile.hpp"

namespace masklint::core {

// Where scripts go and whether they are linted after being written
struct OutputContext {
    std::filesystem::path directory;
    bool extract_only = false;
    lint::LinterConfig linters;
};

// Depth-first, preorder walk over the command tree. Each command carrying a
// script is materialized and, unless extract_only is set, linted and
// reported. The first error aborts the walk.
class CommandWalker {
public:
    CommandWalker(const OutputContext& context, lint::IProcessRunner& runner,
                  Reporter& reporter)
        : context_(context), runner_(&runner), reporter_(&reporter) {}

    // Extraction only; walking a context without extract_only throws once a
    // script needs linting
    explicit CommandWalker(const OutputContext& context) : context_(context) {}

    void walk_all(const maskfile::Maskfile& maskfile);

    void walk(const maskfile::CommandNode& node,
              const std::optional<std::string>& parent_qualified_name);

    // "parent name" when a parent is given, bare name otherwise
    static std::string qualified_name(
        const std::optional<std::string>& parent_qualified_name,
        const std::string& name);

    // Number of scripts materialized so far
    size_t scripts_processed() const { return scripts_processed_; }

private:
    void process_script(const maskfile::Script& script,
                        const std::string& qualified);

    const OutputContext& context_;
    lint::IProcessRunner* runner_ = nullptr;
    Reporter* reporter_ = nullptr;
    size_t scripts_processed_ = 0;
};

}  // namespace masklint::core
