// =============================================================================
// Flamingo - Command Runner Implementation
// =============================================================================

#include "flamingo/tuner/command_runner.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <optional>
#include <thread>

namespace flamingo {
namespace tuner {

std::string CommandResult::describe() const {
    if (timed_out) {
        return "timed out";
    }
    if (cancelled) {
        return "cancelled";
    }
    if (signaled) {
        return fmt::format("signal {}", term_signal);
    }
    return fmt::format("exit {}", exit_code);
}

namespace {

using Clock = std::chrono::steady_clock;

constexpr int kPollIntervalMs = 20;
constexpr int kChildFailureStatus = 127;

// Owns a file descriptor
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() { reset(); }

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    Fd(Fd&& other) noexcept : fd_(other.release()) {}
    Fd& operator=(Fd&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    [[nodiscard]] int get() const { return fd_; }
    [[nodiscard]] bool valid() const { return fd_ >= 0; }

    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

  private:
    int fd_ = -1;
};

bool makePipe(Fd& read_end, Fd& write_end) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
    return true;
}

// Reads whatever is available; returns false once the pipe reached EOF
bool drain(Fd& fd, std::string& sink) {
    char buffer[4096];
    while (true) {
        ssize_t n = ::read(fd.get(), buffer, sizeof(buffer));
        if (n > 0) {
            sink.append(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            fd.reset();
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        }
        fd.reset();
        return false;
    }
}

// Child side: never returns
[[noreturn]] void execChild(const std::string& command, const CommandOptions& options,
                            int stdout_fd, int stderr_fd, int error_fd) {
    auto fail = [error_fd]() {
        int err = errno;
        ssize_t ignored = ::write(error_fd, &err, sizeof(err));
        (void)ignored;
        ::_exit(kChildFailureStatus);
    };

    ::setpgid(0, 0);

    int null_fd = ::open("/dev/null", O_RDONLY);
    if (null_fd < 0 || ::dup2(null_fd, STDIN_FILENO) < 0) {
        fail();
    }
    if (::dup2(stdout_fd, STDOUT_FILENO) < 0 || ::dup2(stderr_fd, STDERR_FILENO) < 0) {
        fail();
    }
    if (!options.working_directory.empty() && ::chdir(options.working_directory.c_str()) != 0) {
        fail();
    }

    ::signal(SIGINT, SIG_DFL);
    ::signal(SIGTERM, SIG_DFL);
    ::signal(SIGPIPE, SIG_DFL);

    ::execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
    fail();
    ::_exit(kChildFailureStatus);
}

void killGroup(pid_t pid) {
    if (::kill(-pid, SIGKILL) != 0 && errno != ESRCH) {
        spdlog::debug("Failed to kill process group {}: {}", pid, std::strerror(errno));
    }
}

}  // namespace

Result<CommandResult> ShellCommandRunner::run(const std::string& command,
                                              const CommandOptions& options) {
    Fd out_read, out_write, err_read, err_write, status_read, status_write;
    if (!makePipe(out_read, out_write) || !makePipe(err_read, err_write) ||
        !makePipe(status_read, status_write)) {
        return Error(ErrorCode::kProcessLaunchFailed,
                     fmt::format("cannot create pipes: {}", std::strerror(errno)));
    }

    auto start = Clock::now();
    pid_t pid = ::fork();
    if (pid < 0) {
        return Error(ErrorCode::kProcessLaunchFailed,
                     fmt::format("fork failed: {}", std::strerror(errno)));
    }
    if (pid == 0) {
        execChild(command, options, out_write.get(), err_write.get(), status_write.get());
    }

    // Both sides set the group to avoid racing the child
    if (::setpgid(pid, pid) != 0 && errno != EACCES) {
        spdlog::debug("setpgid({}) failed: {}", pid, std::strerror(errno));
    }
    out_write.reset();
    err_write.reset();
    status_write.reset();

    // The status pipe closes on a successful exec and carries errno otherwise
    int child_errno = 0;
    ssize_t status_bytes;
    do {
        status_bytes = ::read(status_read.get(), &child_errno, sizeof(child_errno));
    } while (status_bytes < 0 && errno == EINTR);

    if (status_bytes == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        return Error(ErrorCode::kProcessLaunchFailed,
                     fmt::format("cannot run '{}': {}", command, std::strerror(child_errno)));
    }

    if (::fcntl(out_read.get(), F_SETFL, O_NONBLOCK) != 0 ||
        ::fcntl(err_read.get(), F_SETFL, O_NONBLOCK) != 0) {
        killGroup(pid);
        int ignored = 0;
        while (::waitpid(pid, &ignored, 0) < 0 && errno == EINTR) {
        }
        return Error(ErrorCode::kProcessLaunchFailed,
                     fmt::format("cannot configure pipes: {}", std::strerror(errno)));
    }

    CommandResult result;
    bool exited = false;
    bool killed = false;
    int status = 0;
    std::optional<Clock::time_point> cancel_deadline;

    auto elapsed = [&start]() {
        return std::chrono::duration<double>(Clock::now() - start).count();
    };

    while (true) {
        if (!exited && !killed) {
            if (options.timeout_seconds > 0.0 && elapsed() >= options.timeout_seconds) {
                spdlog::debug("Command exceeded {}s, killing process group {}",
                              options.timeout_seconds, pid);
                killGroup(pid);
                killed = true;
                result.timed_out = true;
            } else if (options.cancellation != nullptr && options.cancellation->cancelled()) {
                auto now = Clock::now();
                if (!cancel_deadline) {
                    cancel_deadline = now + std::chrono::duration_cast<Clock::duration>(
                                                std::chrono::duration<double>(
                                                    options.cancel_grace_seconds));
                }
                if (now >= *cancel_deadline) {
                    spdlog::debug("Cancellation grace period over, killing process group {}",
                                  pid);
                    killGroup(pid);
                    killed = true;
                    result.cancelled = true;
                }
            }
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (out_read.valid()) {
            fds[nfds++] = {out_read.get(), POLLIN, 0};
        }
        if (err_read.valid()) {
            fds[nfds++] = {err_read.get(), POLLIN, 0};
        }

        if (nfds > 0) {
            int ready = ::poll(fds, nfds, kPollIntervalMs);
            if (ready < 0 && errno != EINTR) {
                spdlog::debug("poll failed: {}", std::strerror(errno));
            }
            if (out_read.valid()) {
                drain(out_read, result.stdout_text);
            }
            if (err_read.valid()) {
                drain(err_read, result.stderr_text);
            }
        } else if (!exited) {
            std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs));
        }

        if (!exited) {
            pid_t waited = ::waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                exited = true;
                result.wall_seconds = elapsed();
            } else if (waited < 0 && errno != EINTR) {
                return Error(ErrorCode::kProcessFailed,
                             fmt::format("waitpid failed: {}", std::strerror(errno)));
            }
        }

        if (exited) {
            // Background children may keep the pipes open; take what is there
            if (out_read.valid()) {
                drain(out_read, result.stdout_text);
            }
            if (err_read.valid()) {
                drain(err_read, result.stderr_text);
            }
            break;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signaled = true;
        result.term_signal = WTERMSIG(status);
        result.exit_code = 128 + result.term_signal;
    }

    spdlog::trace("'{}' finished ({}) in {:.3f}s", command, result.describe(),
                  result.wall_seconds);
    return result;
}

}  // namespace tuner
}  // namespace flamingo
