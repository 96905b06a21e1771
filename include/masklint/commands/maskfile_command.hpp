#pragma once
#include "masklint/cli/command.hpp"
#include "masklint/maskfile/maskfile.hpp"

namespace masklint::commands {

// Base for subcommands operating on a maskfile. Applies the global
// --config/--log-level flags, then loads the file named by --maskfile.
class MaskfileCommand : public cli::Command {
public:
    using cli::Command::Command;

protected:
    maskfile::Maskfile prepare(const cli::CommandContext& ctx);
};

}  // namespace masklint::commands
