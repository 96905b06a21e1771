#pragma once
#include <string>
#include <vector>

namespace masklint::lint {

// Captured result of a finished child process
struct ProcessOutput {
    std::string stdout_text;
    int exit_code = 0;
};

// Process launching interface
class IProcessRunner {
public:
    virtual ~IProcessRunner() = default;

    // Runs program with args, blocking until it exits. The program is looked
    // up on $PATH. Throws ExecutableNotFoundError when it cannot be found and
    // ProcessError on any other launch failure. A non-zero exit status is not
    // an error.
    virtual ProcessOutput run(const std::string& program,
                              const std::vector<std::string>& args) = 0;
};

// fork + execvp runner with pipe-based stdout capture; stderr is inherited
class PosixProcessRunner : public IProcessRunner {
public:
    ProcessOutput run(const std::string& program,
                      const std::vector<std::string>& args) override;
};

}  // namespace masklint::lint
