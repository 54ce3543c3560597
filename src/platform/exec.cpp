#include "capprobe/exec.hpp"

#include <cerrno>
#include <algorithm>
#include <climits>
#include <cstring>
#include <thread>

#ifndef _WIN32
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace capprobe {
namespace exec {

std::string describe_termination(const ExecResult& result) {
    if (!result.ok) {
        return result.error.empty() ? "failed to start" : result.error;
    }
    if (result.timed_out) {
        return "timed out";
    }
    if (result.term_signal != 0) {
        return "terminated by signal " + std::to_string(result.term_signal);
    }
    return "exit status " + std::to_string(result.exit_code);
}

#ifndef _WIN32

namespace {

// Longest bound honoured; poll() takes an int timeout
constexpr std::chrono::milliseconds kMaxTimeout{INT_MAX};

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Reads the child's stdout until EOF. Returns false when the deadline passed first.
bool drain_pipe(int fd, bool bounded, std::chrono::steady_clock::time_point deadline,
                std::string& output) {
    char buf[4096];
    while (true) {
        int wait_ms = -1;
        if (bounded) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                return false;
            }
            wait_ms = static_cast<int>(std::min<long long>(remaining.count(), INT_MAX));
        }

        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int rc = poll(&pfd, 1, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            return true;
        }
        if (rc == 0) {
            continue;
        }

        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            output.append(buf, static_cast<size_t>(n));
        } else if (n == 0) {
            return true;
        } else if (errno != EINTR) {
            return true;
        }
    }
}

bool open_cloexec_pipe(int fds[2]) {
#if defined(__linux__)
    return pipe2(fds, O_CLOEXEC) == 0;
#else
    if (pipe(fds) != 0) {
        return false;
    }
    if (fcntl(fds[0], F_SETFD, FD_CLOEXEC) == -1 || fcntl(fds[1], F_SETFD, FD_CLOEXEC) == -1) {
        int saved = errno;
        close_fd(fds[0]);
        close_fd(fds[1]);
        errno = saved;
        return false;
    }
    return true;
#endif
}

} // namespace

ExecResult SubprocessRunner::run(const ExecRequest& request) {
    ExecResult result;

    if (request.argv.empty() || request.argv[0].empty()) {
        result.error = "no program given";
        return result;
    }

    std::vector<char*> argv;
    for (const auto& s : request.argv) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    // Close-on-exec so children forked concurrently by other threads never
    // hold the write end open
    int out_pipe[2] = {-1, -1};
    if (request.capture_stdout && !open_cloexec_pipe(out_pipe)) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        return result;
    }

    pid_t pid = fork();

    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child process
        int devnull = open("/dev/null", O_RDWR | O_CLOEXEC);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDERR_FILENO);
            if (!request.capture_stdout) {
                dup2(devnull, STDOUT_FILENO);
            }
            if (devnull > STDERR_FILENO) {
                close(devnull);
            }
        }
        if (request.capture_stdout) {
            dup2(out_pipe[1], STDOUT_FILENO);
            close(out_pipe[0]);
            close(out_pipe[1]);
        }

        if (!request.cwd.empty()) {
            if (chdir(request.cwd.c_str()) != 0) {
                _exit(127);
            }
        }

        if (request.argv[0].find('/') != std::string::npos) {
            execv(argv[0], argv.data());
        } else {
            execvp(argv[0], argv.data());
        }

        // If exec returns, it failed
        _exit(127);
    }

    // Parent process
    const auto timeout = std::min(request.timeout, kMaxTimeout);
    const bool bounded = timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    if (request.capture_stdout) {
        close_fd(out_pipe[1]);
        if (!drain_pipe(out_pipe[0], bounded, deadline, result.output)) {
            result.timed_out = true;
        }
        close_fd(out_pipe[0]);
    }

    int status = 0;
    while (true) {
        if (result.timed_out) {
            kill(pid, SIGKILL);
            while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
            }
            break;
        }

        pid_t waited = waitpid(pid, &status, bounded ? WNOHANG : 0);
        if (waited == pid) {
            break;
        }
        if (waited == -1) {
            if (errno == EINTR) continue;
            result.error = "waitpid failed: " + std::string(strerror(errno));
            return result;
        }

        // Still running
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            continue;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    result.ok = true;
    if (result.timed_out) {
        result.term_signal = SIGKILL;
        return result;
    }

    if (WIFEXITED(status)) {
        result.exited = true;
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
        result.exit_code = 128 + result.term_signal;
    } else {
        result.ok = false;
        result.error = "process terminated abnormally";
    }

    return result;
}

#else // _WIN32

ExecResult SubprocessRunner::run(const ExecRequest& request) {
    ExecResult result;
    result.error = "process execution is not supported on this platform: " +
                   (request.argv.empty() ? std::string() : request.argv[0]);
    return result;
}

#endif // _WIN32

} // namespace exec
} // namespace capprobe
