#include "masklint/cli/command.hpp"

#include <algorithm>
#include <boost/program_options.hpp>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace po = boost::program_options;

namespace masklint::cli {

Command::Command(const std::string& name, const std::string& description)
    : name_(name), description_(description) {}

void Command::add_command(std::shared_ptr<Command> cmd) {
    cmd->parent_ = this;
    subcommands_.push_back(cmd);
}

std::shared_ptr<Command> Command::find_command(const std::string& name) {
    auto it = std::find_if(subcommands_.begin(), subcommands_.end(),
                           [&name](const std::shared_ptr<Command>& cmd) {
                               return cmd->name() == name;
                           });
    return it != subcommands_.end() ? *it : nullptr;
}

void Command::add_flag_with_short(const std::string& name,
                                  const std::string& short_name,
                                  const std::string& description,
                                  const std::string& default_value) {
    flags_.push_back({name, short_name, description, default_value, "string"});
}

void Command::add_bool_flag_with_short(const std::string& name,
                                       const std::string& short_name,
                                       const std::string& description,
                                       bool default_value) {
    flags_.push_back({name, short_name, description,
                      default_value ? "true" : "false", "bool"});
}

void Command::add_persistent_flag(const std::string& name,
                                  const std::string& description,
                                  const std::string& default_value) {
    flags_.push_back(
        {name, "", description, default_value, "string", true});
}

std::vector<Command::Flag> Command::effective_flags() const {
    std::vector<Flag> flags = flags_;
    for (const Command* ancestor = parent_; ancestor != nullptr;
         ancestor = ancestor->parent_) {
        for (const auto& flag : ancestor->flags_) {
            if (flag.persistent) {
                flags.push_back(flag);
            }
        }
    }
    return flags;
}

int Command::execute(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    try {
        return parse_and_execute(args, nullptr);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int Command::parse_and_execute(const std::vector<std::string>& args,
                               const CommandContext* inherited) {
    const auto flags = effective_flags();

    po::options_description desc("Options");
    desc.add_options()("help,h", "Show help message");

    for (const auto& flag : flags) {
        std::string option_spec = flag.name;
        if (!flag.short_name.empty()) {
            option_spec += "," + flag.short_name;
        }

        if (flag.type == "bool") {
            desc.add_options()(option_spec.c_str(), flag.description.c_str());
        } else {
            desc.add_options()(option_spec.c_str(), po::value<std::string>(),
                               flag.description.c_str());
        }
    }

    po::variables_map vm;
    po::command_line_parser parser(args);
    parser.options(desc);
    // Commands with children pass unknown tokens on to the chosen child
    if (!subcommands_.empty()) {
        parser.allow_unregistered();
    }
    po::parsed_options parsed = parser.run();

    po::store(parsed, vm);
    po::notify(vm);

    std::vector<std::string> unrecognized =
        po::collect_unrecognized(parsed.options, po::include_positional);

    CommandContext ctx;
    for (const auto& flag : flags) {
        if (vm.count(flag.name)) {
            if (flag.type == "bool") {
                ctx.set_user_flag(flag.name, "true");
            } else {
                ctx.set_user_flag(flag.name, vm[flag.name].as<std::string>());
            }
        } else if (inherited && inherited->is_user_provided(flag.name)) {
            ctx.set_user_flag(flag.name, inherited->get_flag(flag.name));
        } else {
            ctx.set_flag(flag.name, flag.default_value);
        }
    }

    if (!unrecognized.empty() && !subcommands_.empty()) {
        auto subcmd = find_command(unrecognized[0]);
        if (!subcmd) {
            throw std::runtime_error("unknown command '" + unrecognized[0] +
                                     "' for '" + name_ + "'");
        }

        std::vector<std::string> subcmd_args(unrecognized.begin() + 1,
                                             unrecognized.end());
        if (vm.count("help")) {
            subcmd_args.emplace_back("-h");
        }
        return subcmd->parse_and_execute(subcmd_args, &ctx);
    }

    if (vm.count("help")) {
        print_help();
        return 0;
    }

    if (!unrecognized.empty()) {
        throw std::runtime_error("unexpected argument '" + unrecognized[0] +
                                 "' for '" + name_ + "'");
    }

    return run(ctx);
}

void Command::print_help() const {
    std::cout << name_ << " - " << description_ << std::endl << std::endl;

    if (!long_description_.empty()) {
        std::cout << long_description_ << std::endl << std::endl;
    }

    print_usage();
    std::cout << std::endl;

    if (!subcommands_.empty()) {
        std::cout << "Available Commands:" << std::endl;
        for (const auto& cmd : subcommands_) {
            std::cout << "  " << std::left << std::setw(12) << cmd->name()
                      << cmd->description() << std::endl;
        }
        std::cout << std::endl;
    }

    const auto flags = effective_flags();
    if (!flags.empty()) {
        std::cout << "Flags:" << std::endl;
        for (const auto& flag : flags) {
            std::cout << "  --" << std::left << std::setw(12) << flag.name;
            if (!flag.short_name.empty()) {
                std::cout << "-" << flag.short_name << ", ";
            } else {
                std::cout << "    ";
            }
            std::cout << flag.description;
            if (!flag.default_value.empty() && flag.type != "bool") {
                std::cout << " (default: " << flag.default_value << ")";
            }
            std::cout << std::endl;
        }
        std::cout << std::endl;
    }

    if (!example_.empty()) {
        std::cout << "Examples:" << std::endl;
        std::string processed_example = example_;
        size_t pos = 0;
        while ((pos = processed_example.find("\\n", pos)) !=
               std::string::npos) {
            processed_example.replace(pos, 2, "\n");
            pos += 1;
        }
        std::cout << processed_example << std::endl << std::endl;
    }

    if (!subcommands_.empty()) {
        std::cout << "Use '" << name_
                  << " <command> --help' for more information about a command."
                  << std::endl;
    }
}

void Command::print_usage() const {
    if (!usage_.empty()) {
        std::cout << "Usage: " << usage_ << std::endl;
    } else {
        std::cout << "Usage: " << name_;
        if (!flags_.empty()) {
            std::cout << " [OPTIONS]";
        }
        if (!subcommands_.empty()) {
            std::cout << " <COMMAND>";
        }
        std::cout << std::endl;
    }
}

std::string CommandContext::get_flag(const std::string& name) const {
    auto it = flags_.find(name);
    return it != flags_.end() ? it->second : "";
}

bool CommandContext::get_bool_flag(const std::string& name) const {
    std::string value = get_flag(name);
    return value == "true" || value == "1";
}

}  // namespace masklint::cli
