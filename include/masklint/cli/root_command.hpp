#pragma once
#include <memory>

#include "masklint/cli/command.hpp"

namespace masklint::cli {

// Root command that manages all subcommands
class RootCommand : public Command {
public:
    static std::shared_ptr<RootCommand> create();

    int run(CommandContext& ctx) override;

protected:
    RootCommand();

private:
    void register_commands();
};

}  // namespace masklint::cli
