#include "masklint/commands/run_command.hpp"

#include <iostream>

#include "masklint/core/application_context.hpp"
#include "masklint/core/command_walker.hpp"
#include "masklint/fs/output_directory.hpp"
#include "masklint/lint/process_runner.hpp"
#include "masklint/log/logger.hpp"

namespace masklint::commands {

RunCommand::RunCommand() : MaskfileCommand("run", "Runs the linters") {
    set_long_description(
        "Extracts every script into a temporary directory, runs shellcheck, "
        "ruff or rubocop on it depending on its language and prints the "
        "findings. The temporary directory is removed afterwards.")
        .set_usage("masklint [GLOBAL_OPTIONS] run");
}

int RunCommand::run(cli::CommandContext& ctx) {
    const auto maskfile = prepare(ctx);
    const auto& app = core::ApplicationContext::instance();

    // Removed on every exit path, including exceptions from the walk
    auto output_dir = fs::OutputDirectory::ephemeral();

    core::OutputContext context;
    context.directory = output_dir.path();
    context.extract_only = false;
    context.linters = app.linter_config();

    lint::PosixProcessRunner runner;
    core::Reporter reporter(std::cout, app.report_config().emphasize_stdout());
    core::CommandWalker walker(context, runner, reporter);
    walker.walk_all(maskfile);

    output_dir.cleanup();
    return 0;
}

}  // namespace masklint::commands
