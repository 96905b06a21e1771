#include "masklint/core/command_walker.hpp"

#include "masklint/core/errors.hpp"
#include "masklint/fs/script_materializer.hpp"
#include "masklint/lint/language_handler.hpp"
#include "masklint/log/logger.hpp"

namespace masklint::core {

std::string CommandWalker::qualified_name(
    const std::optional<std::string>& parent_qualified_name,
    const std::string& name) {
    if (parent_qualified_name) {
        return *parent_qualified_name + " " + name;
    }
    return name;
}

void CommandWalker::walk_all(const maskfile::Maskfile& maskfile) {
    for (const auto& command : maskfile.commands) {
        walk(command, std::nullopt);
    }
    MASKLINT_LOG_INFO << "Processed " << scripts_processed_ << " scripts";
}

void CommandWalker::walk(
    const maskfile::CommandNode& node,
    const std::optional<std::string>& parent_qualified_name) {
    const std::string qualified = qualified_name(parent_qualified_name, node.name);
    MASKLINT_LOG_TRACE << "Visiting command '" << qualified << "'"
                       << (node.description.empty() ? "" : ": ")
                       << node.description;

    if (node.script) {
        process_script(*node.script, qualified);
    }

    const std::optional<std::string> parent_for_children = qualified;
    for (const auto& subcommand : node.subcommands) {
        walk(subcommand, parent_for_children);
    }
}

void CommandWalker::process_script(const maskfile::Script& script,
                                   const std::string& qualified) {
    const auto handler = lint::handler_for_executor(script.executor);
    MASKLINT_LOG_DEBUG << "Command '" << qualified << "' uses executor '"
                       << script.executor << "', handled by " << handler;

    const auto path =
        fs::materialize(handler, qualified, script, context_.directory);
    ++scripts_processed_;

    if (context_.extract_only) {
        return;
    }
    if (runner_ == nullptr || reporter_ == nullptr) {
        throw Error("cannot lint '" + qualified +
                    "' without a process runner and reporter");
    }

    const std::string findings =
        lint::execute(handler, path, *runner_, context_.linters);
    reporter_->report(qualified, findings);
}

}  // namespace masklint::core
