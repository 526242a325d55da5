#include "platform/linux/spawn.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace platform {

namespace {

std::string errno_message(const char* call) {
    return std::string(call) + " failed: " + std::strerror(errno);
}

} // namespace

std::expected<void, std::string> run_command(const std::vector<std::string>& argv,
                                             std::string_view input) {
    if (argv.empty()) {
        return std::unexpected(std::string("empty command"));
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    bool with_input = !input.empty();
    int pipefd[2] = {-1, -1};
    if (with_input && ::pipe2(pipefd, O_CLOEXEC) < 0) {
        return std::unexpected(errno_message("pipe2()"));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        auto err = errno_message("fork()");
        if (with_input) {
            ::close(pipefd[0]);
            ::close(pipefd[1]);
        }
        return std::unexpected(err);
    }

    if (pid == 0) {
        if (with_input) {
            ::dup2(pipefd[0], STDIN_FILENO);
        }
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    std::string write_error;
    if (with_input) {
        ::close(pipefd[0]);
        size_t total_written = 0;
        while (total_written < input.size()) {
            ssize_t n = ::write(pipefd[1], input.data() + total_written, input.size() - total_written);
            if (n < 0) {
                if (errno == EINTR) continue;
                write_error = errno_message("write()");
                break;
            }
            total_written += static_cast<size_t>(n);
        }
        ::close(pipefd[1]);
    }

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(errno_message("waitpid()"));
    }

    if (!write_error.empty()) {
        return std::unexpected(write_error);
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) == 127) {
        return std::unexpected(argv[0] + " not found");
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        return std::unexpected(argv[0] + " exited with code " + std::to_string(WEXITSTATUS(status)));
    }
    if (WIFSIGNALED(status)) {
        return std::unexpected(argv[0] + " killed by signal " + std::to_string(WTERMSIG(status)));
    }

    return {};
}

} // namespace platform
