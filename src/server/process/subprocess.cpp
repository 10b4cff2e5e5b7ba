#include "subprocess.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace proc {

namespace {

std::string errno_message(const char* call) {
    return std::string(call) + " failed: " + std::strerror(errno);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

int exit_code_of(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

std::expected<int, std::string> wait_child(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(errno_message("waitpid()"));
    }
    return exit_code_of(status);
}

// Reaps the child if it exits before the deadline; nullopt while it is still running.
std::expected<std::optional<int>, std::string>
wait_child_until(pid_t pid, std::chrono::steady_clock::time_point deadline) {
    for (;;) {
        int status = 0;
        pid_t rc = ::waitpid(pid, &status, WNOHANG);
        if (rc < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(errno_message("waitpid()"));
        }
        if (rc == pid) return exit_code_of(status);
        if (std::chrono::steady_clock::now() >= deadline) return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

} // namespace

std::expected<ProcessResult, std::string>
run(const std::vector<std::string>& argv, std::optional<std::chrono::milliseconds> timeout) {
    if (argv.empty()) {
        return std::unexpected("empty command");
    }

    int out_pipe[2];
    int err_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) < 0) {
        return std::unexpected(errno_message("pipe()"));
    }
    if (::pipe2(err_pipe, O_CLOEXEC) < 0) {
        auto msg = errno_message("pipe()");
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        return std::unexpected(msg);
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        auto msg = errno_message("fork()");
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) ::close(fd);
        return std::unexpected(msg);
    }

    if (pid == 0) {
        // Child: default signal state, stdin from /dev/null, stdout/stderr into the pipes
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        ::signal(SIGPIPE, SIG_DFL);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);

    ProcessResult result;
    auto deadline = timeout ? std::optional(std::chrono::steady_clock::now() + *timeout)
                            : std::nullopt;
    std::array<char, 4096> buf;

    while (out_fd >= 0 || err_fd >= 0) {
        int wait_ms = -1;
        if (deadline) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                *deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) {
                result.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(left.count());
        }

        std::array<pollfd, 2> fds{{{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}}};
        int rc = ::poll(fds.data(), fds.size(), wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            auto msg = errno_message("poll()");
            ::kill(pid, SIGKILL);
            close_fd(out_fd);
            close_fd(err_fd);
            (void)wait_child(pid);
            return std::unexpected(msg);
        }
        if (rc == 0) continue;

        auto drain = [&buf](int& fd, short revents, std::string& sink) {
            if (fd < 0 || !(revents & (POLLIN | POLLHUP | POLLERR))) return;
            ssize_t n = ::read(fd, buf.data(), buf.size());
            if (n > 0) {
                sink.append(buf.data(), static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close_fd(fd);
            }
        };
        drain(out_fd, fds[0].revents, result.out);
        drain(err_fd, fds[1].revents, result.err);
    }

    close_fd(out_fd);
    close_fd(err_fd);

    // The child may close its streams and keep running
    if (deadline && !result.timed_out) {
        auto exited = wait_child_until(pid, *deadline);
        if (!exited) {
            ::kill(pid, SIGKILL);
            (void)wait_child(pid);
            return std::unexpected(exited.error());
        }
        if (*exited) {
            result.exit_code = **exited;
            return result;
        }
        result.timed_out = true;
    }

    if (result.timed_out) {
        ::kill(pid, SIGKILL);
    }

    auto code = wait_child(pid);
    if (!code) return std::unexpected(code.error());
    result.exit_code = *code;
    return result;
}

std::string join_command(const std::vector<std::string>& argv) {
    std::string out;
    for (auto& a : argv) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

} // namespace proc
