#pragma once
#include "masklint/commands/maskfile_command.hpp"

namespace masklint::commands {

// Lints every script in a scratch directory that is removed afterwards
class RunCommand : public MaskfileCommand {
public:
    RunCommand();
    int run(cli::CommandContext& ctx) override;
};

}  // namespace masklint::commands
