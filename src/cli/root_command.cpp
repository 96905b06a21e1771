#include "masklint/cli/root_command.hpp"

#include "masklint/commands/all_commands.hpp"
#include "masklint/config/config.hpp"
#include "masklint/version.hpp"

namespace masklint::cli {

RootCommand::RootCommand()
    : Command("masklint", "Lint the scripts embedded in a maskfile") {
    set_long_description(
        "masklint extracts the code blocks of every command in a maskfile "
        "and checks them with shellcheck, ruff or rubocop.")
        .set_usage("masklint [GLOBAL_OPTIONS] <COMMAND> [COMMAND_OPTIONS]")
        .set_example(
            "  masklint run\\n"
            "  masklint --maskfile tasks.md run\\n"
            "  masklint dump --output scripts");

    add_persistent_flag("maskfile",
                        "Path to a different maskfile you want to use",
                        config::ConfigPaths::DEFAULT_MASKFILE);
    add_persistent_flag("config", "Configuration file",
                        config::ConfigPaths::DEFAULT_CONFIG_FILE);
    add_persistent_flag("log-level",
                        "Override the configured log level (trace..fatal)");
    add_bool_flag_with_short("version", "V", "Show version information",
                             false);

    register_commands();
}

std::shared_ptr<RootCommand> RootCommand::create() {
    // Use make_shared with a helper struct to access the protected constructor
    struct MakeSharedEnabler : public RootCommand {};
    auto root = std::make_shared<MakeSharedEnabler>();
    return std::static_pointer_cast<RootCommand>(root);
}

void RootCommand::register_commands() {
    add_command(std::make_shared<masklint::commands::RunCommand>());
    add_command(std::make_shared<masklint::commands::DumpCommand>());
}

int RootCommand::run(CommandContext& ctx) {
    if (ctx.get_bool_flag("version")) {
        masklint::print_version();
        return 0;
    }

    print_help();
    return 2;
}

}  // namespace masklint::cli
