#pragma once
#include "masklint/commands/maskfile_command.hpp"

namespace masklint::commands {

// Writes every script to --output without linting
class DumpCommand : public MaskfileCommand {
public:
    DumpCommand();
    int run(cli::CommandContext& ctx) override;

private:
    void setup_flags();
};

}  // namespace masklint::commands
