#include "platform/linux/child_process.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace platform {

namespace {

std::string errno_message(const char* what) {
    return std::string(what) + " failed: " + std::strerror(errno);
}

} // namespace

std::expected<void, std::string> run_child(const std::vector<std::string>& argv,
                                           std::string_view stdin_text) {
    if (argv.empty()) return std::unexpected("empty command");

    int pipefd[2];
    if (::pipe2(pipefd, O_CLOEXEC) < 0) {
        return std::unexpected(errno_message("pipe()"));
    }

    std::vector<char*> args;
    for (auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        return std::unexpected(errno_message("fork()"));
    }

    if (pid == 0) {
        ::dup2(pipefd[0], STDIN_FILENO);
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    ::close(pipefd[0]);
    size_t total_written = 0;
    while (total_written < stdin_text.size()) {
        ssize_t n = ::write(pipefd[1], stdin_text.data() + total_written,
                            stdin_text.size() - total_written);
        if (n < 0) {
            if (errno == EINTR) continue;
            auto err = errno_message("write()");
            ::close(pipefd[1]);
            ::waitpid(pid, nullptr, 0);
            return std::unexpected(err);
        }
        total_written += static_cast<size_t>(n);
    }
    ::close(pipefd[1]);

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(errno_message("waitpid()"));
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
