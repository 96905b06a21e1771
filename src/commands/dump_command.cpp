#include "masklint/commands/dump_command.hpp"

#include <stdexcept>

#include "masklint/core/command_walker.hpp"
#include "masklint/fs/output_directory.hpp"
#include "masklint/log/logger.hpp"

namespace masklint::commands {

DumpCommand::DumpCommand()
    : MaskfileCommand("dump",
                      "Extracts all the commands from the maskfile and dumps "
                      "them as files into the defined directory") {
    setup_flags();
    set_usage("masklint [GLOBAL_OPTIONS] dump --output <DIR>")
        .set_example(
            "  masklint dump --output scripts\\n"
            "  masklint --maskfile ci/maskfile.md dump -o /tmp/ci-scripts");
}

void DumpCommand::setup_flags() {
    add_flag_with_short("output", "o",
                        "Directory to write the scripts to, created if missing");
}

int DumpCommand::run(cli::CommandContext& ctx) {
    const std::string output = ctx.get_flag("output");
    if (output.empty()) {
        throw std::runtime_error("the following required argument was not provided: --output <DIR>");
    }

    const auto maskfile = prepare(ctx);
    auto output_dir = fs::OutputDirectory::persistent(output);

    core::OutputContext context;
    context.directory = output_dir.path();
    context.extract_only = true;

    core::CommandWalker walker(context);
    walker.walk_all(maskfile);

    MASKLINT_LOG_INFO << "Dumped " << walker.scripts_processed()
                      << " scripts into " << output;
    return 0;
}

}  // namespace masklint::commands
