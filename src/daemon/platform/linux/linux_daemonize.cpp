#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <print>
#include <unistd.h>

namespace platform {

namespace {

void fork_and_leave_parent() {
    pid_t pid = fork();
    if (pid < 0) {
        std::println(stderr, "daemon: fork failed: {}", std::strerror(errno));
        _exit(1);
    }
    if (pid > 0) _exit(0);
}

bool redirect(int target_fd, const char* path, int flags) {
    int fd = open(path, flags | O_CLOEXEC, 0644);
    if (fd < 0) return false;
    dup2(fd, target_fd);
    close(fd);
    return true;
}

} // namespace

void daemonize(const std::string& log_path) {
    fork_and_leave_parent();
    setsid();
    fork_and_leave_parent();

    redirect(STDIN_FILENO, "/dev/null", O_RDONLY);
    redirect(STDOUT_FILENO, "/dev/null", O_WRONLY);

    std::error_code ec;
    if (!log_path.empty()) {
        std::filesystem::create_directories(std::filesystem::path(log_path).parent_path(), ec);
    }
    if (log_path.empty() || ec ||
        !redirect(STDERR_FILENO, log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND)) {
        redirect(STDERR_FILENO, "/dev/null", O_WRONLY);
    }
}

} // namespace platform
