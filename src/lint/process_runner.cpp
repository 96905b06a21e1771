#include "masklint/lint/process_runner.hpp"

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "masklint/core/errors.hpp"
#include "masklint/log/logger.hpp"

namespace masklint::lint {

namespace {

std::string errno_message(const std::string& what, int err) {
    return what + ": " + std::strerror(err);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Reads until EOF, retrying on EINTR
bool read_all(int fd, std::string& out, int& err) {
    char buffer[4096];
    while (true) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<size_t>(n));
        } else if (n == 0) {
            return true;
        } else if (errno != EINTR) {
            err = errno;
            return false;
        }
    }
}

}  // namespace

ProcessOutput PosixProcessRunner::run(const std::string& program,
                                      const std::vector<std::string>& args) {
    MASKLINT_LOG_DEBUG << "Spawning " << program << " with "
                       << args.size() << " arguments";

    int stdout_pipe[2] = {-1, -1};
    if (::pipe(stdout_pipe) != 0) {
        throw ProcessError(errno_message("Failed to create stdout pipe", errno));
    }

    // Carries the child's exec errno; close-on-exec so a successful exec
    // leaves the parent reading EOF
    int error_pipe[2] = {-1, -1};
    if (::pipe2(error_pipe, O_CLOEXEC) != 0) {
        const int err = errno;
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        throw ProcessError(errno_message("Failed to create error pipe", err));
    }

    std::vector<char*> c_args;
    c_args.push_back(const_cast<char*>(program.c_str()));
    for (const auto& a : args) {
        c_args.push_back(const_cast<char*>(a.c_str()));
    }
    c_args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        close_fd(error_pipe[0]);
        close_fd(error_pipe[1]);
        throw ProcessError(errno_message("Failed to fork", err));
    }

    if (pid == 0) {
        // Child process
        ::close(stdout_pipe[0]);
        ::close(error_pipe[0]);
        ::dup2(stdout_pipe[1], STDOUT_FILENO);
        ::close(stdout_pipe[1]);

        ::execvp(program.c_str(), c_args.data());

        const int err = errno;
        ssize_t ignored = ::write(error_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    close_fd(stdout_pipe[1]);
    close_fd(error_pipe[1]);

    ProcessOutput output;
    int read_err = 0;
    const bool read_ok = read_all(stdout_pipe[0], output.stdout_text, read_err);
    close_fd(stdout_pipe[0]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(error_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(error_pipe[0]);

    int status = 0;
    pid_t waited;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        if (exec_errno == ENOENT) {
            throw ExecutableNotFoundError(program);
        }
        throw ProcessError(errno_message("Failed to execute " + program,
                                         exec_errno));
    }
    if (waited < 0) {
        throw ProcessError(errno_message("Failed to wait for " + program, errno));
    }
    if (!read_ok) {
        throw ProcessError(errno_message("Failed to read output of " + program,
                                         read_err));
    }

    if (WIFEXITED(status)) {
        output.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        output.exit_code = 128 + WTERMSIG(status);
    }

    MASKLINT_LOG_DEBUG << program << " exited with code " << output.exit_code
                       << ", " << output.stdout_text.size()
                       << " bytes of output";
    return output;
}

}  // namespace masklint::lint
