#pragma once
#include <optional>
#include <string>
#include <vector>

namespace masklint::maskfile {

// Script body of a command, tagged with the language it is written in
struct Script {
    std::string executor;  // Info string of the code fence, e.g. "sh", "py"
    std::string source;
};

struct CommandNode {
    std::string name;  // Unique among siblings
    std::string description;
    std::optional<Script> script;
    std::vector<CommandNode> subcommands;  // Document order
};

struct Maskfile {
    std::string title;
    std::vector<CommandNode> commands;
};

}  // namespace masklint::maskfile
