#include "process/posix_process_runner.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <string>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace usbide::process {

using core::errors::CodexError;
using core::errors::ErrorCategory;
using protocol::RawLine;
using protocol::StreamOrigin;

namespace {

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void set_cloexec(const int fd) {
    const int flags = fcntl(fd, F_GETFD, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFD, flags | FD_CLOEXEC));
}

void close_pair(int (&fds)[2]) {
    for (int& fd : fds) {
        if (fd >= 0) {
            static_cast<void>(close(fd));
            fd = -1;
        }
    }
}

// Turns a byte stream into lines, keeping the unterminated tail.
class LineSplitter {
public:
    explicit LineSplitter(const StreamOrigin origin) : origin_(origin) {}

    void append(const char* data, const std::size_t size) { pending_.append(data, size); }

    void emit_complete(EventChannel& channel, std::uint64_t& sequence) {
        std::size_t start = 0;
        while (true) {
            const auto nl = pending_.find('\n', start);
            if (nl == std::string::npos) {
                break;
            }
            emit(channel, sequence, pending_.substr(start, nl - start));
            start = nl + 1;
        }
        pending_.erase(0, start);
    }

    void emit_rest(EventChannel& channel, std::uint64_t& sequence) {
        if (!pending_.empty()) {
            emit(channel, sequence, pending_);
            pending_.clear();
        }
    }

private:
    void emit(EventChannel& channel, std::uint64_t& sequence, std::string text) {
        while (!text.empty() && (text.back() == '\r' || text.back() == '\n')) {
            text.pop_back();
        }
        ProcessEvent event;
        event.kind = ProcessEvent::Kind::Line;
        event.line = RawLine{origin_, sequence++, std::move(text)};
        channel.push(std::move(event));
    }

    StreamOrigin origin_;
    std::string pending_;
};

void drain_pipe(const int fd, bool& is_open, LineSplitter& splitter) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            splitter.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            is_open = false;
            static_cast<void>(close(fd));
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        is_open = false;
        static_cast<void>(close(fd));
        return;
    }
}

void stream_child(const pid_t pid, const int stdout_fd, const int stderr_fd,
                  std::shared_ptr<EventChannel> channel,
                  std::shared_ptr<std::atomic_bool> cancel_token) {
    LineSplitter out_lines(StreamOrigin::Stdout);
    LineSplitter err_lines(StreamOrigin::Stderr);
    std::uint64_t sequence = 0;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    bool killed = false;
    int status = 0;

    while (stdout_open || stderr_open || !child_exited) {
        // The group id stays valid after its leader is reaped
        if (cancel_token->load() && !killed) {
            killed = true;
            LOG_DEBUG("PosixProcessRunner: cancelling process group " + std::to_string(pid));
            if (kill(-pid, SIGKILL) != 0 && !child_exited) {
                static_cast<void>(kill(pid, SIGKILL));
            }
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = stdout_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = stderr_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else {
            static_cast<void>(poll(nullptr, 0, 20));
        }

        // stdout first within one wake-up; lines keep their read order
        drain_pipe(stdout_fd, stdout_open, out_lines);
        out_lines.emit_complete(*channel, sequence);
        drain_pipe(stderr_fd, stderr_open, err_lines);
        err_lines.emit_complete(*channel, sequence);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }

        // Descendants outside the group may still hold the pipes
        if (killed) {
            if (stdout_open) {
                static_cast<void>(close(stdout_fd));
                stdout_open = false;
            }
            if (stderr_open) {
                static_cast<void>(close(stderr_fd));
                stderr_open = false;
            }
        }
    }

    out_lines.emit_rest(*channel, sequence);
    err_lines.emit_rest(*channel, sequence);

    ProcessEvent exit_event;
    exit_event.kind = ProcessEvent::Kind::Exit;
    exit_event.cancelled = killed;
    if (WIFEXITED(status)) {
        exit_event.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_event.exit_code = 128 + WTERMSIG(status);
    } else {
        exit_event.exit_code = -1;
    }
    LOG_DEBUG("PosixProcessRunner: pid " + std::to_string(pid) + " exited with " +
              std::to_string(exit_event.exit_code));
    channel->push(std::move(exit_event));
    channel->close();
}

}  // namespace

core::errors::Result<std::unique_ptr<ProcessHandle>> PosixProcessRunner::spawn(
    const SpawnRequest& request) {
    const std::vector<std::string> argv_strings =
        spawn_argv(request.candidate, request.argv, protocol::HostPlatform::Posix);

    // Everything the child needs is prepared before fork
    std::vector<char*> argv;
    argv.reserve(argv_strings.size() + 1);
    for (const auto& arg : argv_strings) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_strings;
    env_strings.reserve(request.environment.size());
    for (const auto& [name, value] : request.environment) {
        env_strings.push_back(name + "=" + value);
    }
    std::vector<char*> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto& entry : env_strings) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    const std::string cwd = request.working_directory.string();

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int error_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0 || pipe(error_pipe) != 0) {
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(error_pipe);
        return CodexError{ErrorCategory::Spawn, "Failed to create process pipes.",
                          "pipe_creation_failed"};
    }
    set_cloexec(error_pipe[0]);
    set_cloexec(error_pipe[1]);

    const pid_t pid = fork();
    if (pid < 0) {
        const int fork_errno = errno;
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(error_pipe);
        return CodexError{ErrorCategory::Spawn,
                          std::string("Failed to fork process: ") + std::strerror(fork_errno),
                          "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        int child_errno = 0;
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            child_errno = errno;
            static_cast<void>(write(error_pipe[1], &child_errno, sizeof(child_errno)));
            _exit(126);
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        static_cast<void>(close(error_pipe[0]));
        execve(argv[0], argv.data(), envp.data());
        child_errno = errno;
        static_cast<void>(write(error_pipe[1], &child_errno, sizeof(child_errno)));
        _exit(127);
    }

    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    static_cast<void>(close(error_pipe[1]));

    // The error pipe closes on a successful exec; data means exec failed.
    int child_errno = 0;
    ssize_t got = 0;
    do {
        got = read(error_pipe[0], &child_errno, sizeof(child_errno));
    } while (got < 0 && errno == EINTR);
    static_cast<void>(close(error_pipe[0]));

    if (got == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        static_cast<void>(waitpid(pid, &status, 0));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stderr_pipe[0]));
        LOG_ERROR("PosixProcessRunner: cannot start " + argv_strings.front());
        return CodexError{ErrorCategory::Spawn,
                          "Cannot start " + argv_strings.front() + ": " +
                              std::strerror(child_errno),
                          "spawn_failed",
                          "Check that the file exists and is executable, or reinstall "
                          "with `usbide_codex install`."};
    }

    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);
    LOG_DEBUG("PosixProcessRunner: started pid " + std::to_string(pid));

    auto channel = std::make_shared<EventChannel>();
    auto cancel_token = request.cancel_token
                            ? request.cancel_token
                            : std::make_shared<std::atomic_bool>(false);
    std::thread worker(stream_child, pid, stdout_pipe[0], stderr_pipe[0], channel,
                       cancel_token);
    return std::make_unique<ProcessHandle>(channel, cancel_token, std::move(worker));
}

}  // namespace usbide::process
