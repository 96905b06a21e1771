#include <iostream>

#include "masklint/cli/root_command.hpp"
#include "masklint/log/logger.hpp"

int main(int argc, char* argv[]) {
    try {
        auto root_cmd = masklint::cli::RootCommand::create();
        const int status = root_cmd->execute(argc, argv);
        masklint::log::Logger::shutdown();
        return status;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
