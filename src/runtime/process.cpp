/**
 * @file process.cpp
 * @brief POSIX fork/exec command runner with poll()-driven pipe draining.
 */

#include "runtime/process.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace game_factory {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

/// Exit code reported when the child could not exec the binary.
constexpr int EXEC_FAILED = 127;

}  // anonymous namespace

Result<CommandOutput> run_command(const std::vector<std::string>& argv, uint32_t timeout_ms) {
    if (argv.empty()) {
        return Error{ErrorCode::InvalidInput, "Empty command line"};
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        return Error{ErrorCode::RuntimeUnavailable,
                     "pipe failed: " + std::string(strerror(errno))};
    }
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        return Error{ErrorCode::RuntimeUnavailable,
                     "pipe failed: " + std::string(strerror(errno))};
    }

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) ::close(fd);
        return Error{ErrorCode::RuntimeUnavailable,
                     "fork failed: " + std::string(strerror(errno))};
    }

    if (pid == 0) {
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvp(c_argv[0], c_argv.data());
        ::_exit(EXEC_FAILED);
    }

    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];

    CommandOutput output;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    bool timed_out = false;
    char buf[4096];

    while (out_fd >= 0 || err_fd >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            timed_out = true;
            break;
        }

        pollfd pfds[2];
        nfds_t count = 0;
        if (out_fd >= 0) pfds[count++] = pollfd{out_fd, POLLIN, 0};
        if (err_fd >= 0) pfds[count++] = pollfd{err_fd, POLLIN, 0};

        int ready = ::poll(pfds, count, static_cast<int>(remaining));
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) continue;

        for (nfds_t i = 0; i < count; ++i) {
            if ((pfds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
            auto n = ::read(pfds[i].fd, buf, sizeof(buf));
            bool is_out = pfds[i].fd == out_fd;
            if (n > 0) {
                (is_out ? output.stdout_text : output.stderr_text).append(buf, static_cast<size_t>(n));
            } else if (n == 0 || (n < 0 && errno != EINTR && errno != EAGAIN)) {
                close_fd(is_out ? out_fd : err_fd);
            }
        }
    }

    close_fd(out_fd);
    close_fd(err_fd);

    if (timed_out) {
        ::kill(pid, SIGKILL);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

    if (timed_out) {
        return Error{ErrorCode::RuntimeUnavailable,
                     "Command timed out after " + std::to_string(timeout_ms) + "ms: " + argv[0]};
    }

    if (WIFEXITED(status)) {
        output.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        output.exit_code = 128 + WTERMSIG(status);
    }

    if (output.exit_code == EXEC_FAILED && output.stdout_text.empty()
        && output.stderr_text.empty()) {
        return Error{ErrorCode::RuntimeUnavailable, "Could not execute " + argv[0]};
    }
    return output;
}

}  // namespace game_factory
