#pragma once
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace masklint::cli {

class CommandContext;

// Base command class (similar to cobra.Command)
class Command {
public:
    Command(const std::string& name, const std::string& description);
    virtual ~Command() = default;

    std::string name() const { return name_; }
    std::string description() const { return description_; }

    // Command hierarchy
    void add_command(std::shared_ptr<Command> cmd);
    std::shared_ptr<Command> find_command(const std::string& name);

    // Flags local to this command
    void add_flag_with_short(const std::string& name,
                             const std::string& short_name,
                             const std::string& description,
                             const std::string& default_value = "");
    void add_bool_flag_with_short(const std::string& name,
                                  const std::string& short_name,
                                  const std::string& description,
                                  bool default_value = false);

    // Flags also accepted by, and passed down to, every subcommand
    void add_persistent_flag(const std::string& name,
                             const std::string& description,
                             const std::string& default_value = "");

    // Command execution. Returns the process exit status; errors thrown by
    // run() are printed as "Error: <what>" and map to 1. Commands take no
    // positional arguments besides the name of a subcommand.
    virtual int run(CommandContext& ctx) = 0;
    int execute(int argc, char* argv[]);

    // Help system
    void print_help() const;
    void print_usage() const;

    Command& set_long_description(const std::string& desc) {
        long_description_ = desc;
        return *this;
    }
    Command& set_usage(const std::string& usage) {
        usage_ = usage;
        return *this;
    }
    Command& set_example(const std::string& example) {
        example_ = example;
        return *this;
    }

protected:
    struct Flag {
        std::string name;
        std::string short_name;
        std::string description;
        std::string default_value;
        std::string type;  // "string", "bool"
        bool persistent = false;
    };

    std::string name_;
    std::string description_;
    std::string long_description_;
    std::string usage_;
    std::string example_;

    std::vector<std::shared_ptr<Command>> subcommands_;
    std::vector<Flag> flags_;
    Command* parent_ = nullptr;

private:
    int parse_and_execute(const std::vector<std::string>& args,
                          const CommandContext* inherited);

    // Local flags plus persistent flags of every ancestor
    std::vector<Flag> effective_flags() const;
};

// Command context for passing data between commands
class CommandContext {
public:
    void set_flag(const std::string& name, const std::string& value) {
        flags_[name] = value;
    }
    void set_user_flag(const std::string& name, const std::string& value) {
        flags_[name] = value;
        user_provided_flags_.insert(name);
    }
    std::string get_flag(const std::string& name) const;
    bool get_bool_flag(const std::string& name) const;
    bool is_user_provided(const std::string& name) const {
        return user_provided_flags_.count(name) > 0;
    }

private:
    std::unordered_map<std::string, std::string> flags_;
    std::unordered_set<std::string> user_provided_flags_;
};

}  // namespace masklint::cli
