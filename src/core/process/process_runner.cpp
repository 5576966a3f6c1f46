#include "core/process/process_runner.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#include "core/util/text.hpp"

namespace orch::core::process {

namespace {

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void drain_pipe(const int fd, bool& is_open, std::string& out) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            is_open = false;
            static_cast<void>(close(fd));
            return;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        is_open = false;
        static_cast<void>(close(fd));
        return;
    }
}

void close_pair(int fds[2]) {
    if (fds[0] >= 0) static_cast<void>(close(fds[0]));
    if (fds[1] >= 0) static_cast<void>(close(fds[1]));
}

}  // namespace

std::optional<std::filesystem::path> find_executable(const std::string& name) {
    if (name.empty()) {
        return std::nullopt;
    }
    if (name.find('/') != std::string::npos) {
        if (access(name.c_str(), X_OK) == 0) {
            return std::filesystem::path(name);
        }
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return std::nullopt;
    }
    for (const auto& dir : util::split(path_env, ':')) {
        if (dir.empty()) {
            continue;
        }
        const std::filesystem::path candidate = std::filesystem::path(dir) / name;
        struct stat info {};
        if (stat(candidate.c_str(), &info) == 0 && S_ISREG(info.st_mode) &&
            access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

core::errors::Result<ProcessCapture> run_process(const ProcessRequest& request) {
    if (request.argv.empty()) {
        return core::errors::OrchError{core::errors::ErrorCategory::Input,
                                       "Process argv cannot be empty.",
                                       "empty_command"};
    }
    if (request.cancel_token && request.cancel_token->load()) {
        ProcessCapture capture;
        capture.cancelled = true;
        capture.stderr_text = "Command cancelled before start.";
        return capture;
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0) {
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        return core::errors::OrchError{core::errors::ErrorCategory::Internal,
                                       "Failed to create process pipes.",
                                       "pipe_creation_failed"};
    }

    std::vector<char*> argv;
    argv.reserve(request.argv.size() + 1);
    for (const auto& arg : request.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        return core::errors::OrchError{core::errors::ErrorCategory::Internal,
                                       "Failed to fork process.", "fork_failed"};
    }

    if (pid == 0) {
        if (chdir(request.working_directory.c_str()) != 0) {
            _exit(126);
        }
        const int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            static_cast<void>(dup2(devnull, STDIN_FILENO));
            static_cast<void>(close(devnull));
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        execvp(argv[0], argv.data());
        _exit(127);
    }

    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ProcessCapture capture;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    int status = 0;

    while (stdout_open || stderr_open || !child_exited) {
        if (request.cancel_token && request.cancel_token->load() && !child_exited) {
            capture.cancelled = true;
            static_cast<void>(kill(pid, SIGKILL));
        }

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - started)
                                 .count();
        if (!capture.timed_out && request.timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(request.timeout_ms) && !child_exited) {
            capture.timed_out = true;
            static_cast<void>(kill(pid, SIGKILL));
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else {
            usleep(10000);
        }

        drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_text);
        drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_text);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }
    }

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    } else {
        capture.exit_code = -1;
    }

    capture.duration_ms = std::chrono::duration<double, std::milli>(
                              std::chrono::steady_clock::now() - started)
                              .count();
    return capture;
}

}  // namespace orch::core::process
