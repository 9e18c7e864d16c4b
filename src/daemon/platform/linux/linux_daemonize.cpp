#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <print>
#include <sys/stat.h>
#include <unistd.h>

namespace platform {

namespace {

void redirect(int target, const char* path, int flags) {
    int fd = ::open(path, flags | O_CLOEXEC, 0640);
    if (fd < 0) fd = ::open("/dev/null", O_RDWR | O_CLOEXEC);
    if (fd < 0) return;
    ::dup2(fd, target);
    ::close(fd);
}

} // namespace

void daemonize(const std::string& log_path) {
    // Create the log directory while errors can still reach the terminal.
    std::error_code ec;
    auto parent = std::filesystem::path(log_path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    if (ec) {
        std::println(stderr, "[whisperd] cannot create {}: {}", parent.string(), ec.message());
    }

    std::fflush(stdout);
    std::fflush(stderr);

    pid_t pid = fork();
    if (pid < 0) {
        std::println(stderr, "[whisperd] fork() failed: {}", std::strerror(errno));
        _exit(1);
    }
    if (pid > 0) _exit(0);

    if (setsid() < 0) {
        std::println(stderr, "[whisperd] setsid() failed: {}", std::strerror(errno));
        _exit(1);
    }

    pid = fork();
    if (pid < 0) _exit(1);
    if (pid > 0) {
        std::println(stderr, "[whisperd] started as pid {}, logging to {}", pid, log_path);
        _exit(0);
    }

    ::umask(027);

    redirect(STDIN_FILENO, "/dev/null", O_RDONLY);
    redirect(STDOUT_FILENO, "/dev/null", O_WRONLY);
    redirect(STDERR_FILENO, log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND);

    std::println(stderr, "[whisperd] daemon started, pid {}", ::getpid());
}

} // namespace platform
