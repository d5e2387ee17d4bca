#include "execution/process_executor.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <format>
#include <ostream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <pty.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

#include "core/path_resolver.hpp"

namespace dimsh {

namespace {

// Poll interval while waiting for output from a child that may have exited.
constexpr int kExitCheckMillis = 50;

class UniqueFd {
  public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(UniqueFd &&other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    UniqueFd &operator=(UniqueFd &&other) noexcept {
        if (this != &other) {
            reset();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    UniqueFd(const UniqueFd &) = delete;
    UniqueFd &operator=(const UniqueFd &) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }

    void reset() noexcept {
        if (fd_ != -1) {
            close(fd_);
            fd_ = -1;
        }
    }

  private:
    int fd_{-1};
};

struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;
};

[[nodiscard]] Pipe make_pipe() {
    std::array<int, 2> fds{};
    if (pipe2(fds.data(), O_CLOEXEC) == -1) {
        throw std::runtime_error(std::format("pipe failed: {}", std::strerror(errno)));
    }

    return Pipe{.read_end = UniqueFd(fds[0]), .write_end = UniqueFd(fds[1])};
}

// Parent reads parent_end; the child writes to child_end.
struct OutputChannel {
    UniqueFd parent_end;
    UniqueFd child_end;
};

// A pseudo-terminal mirroring terminal_fd. Output post-processing is off so
// the bytes forwarded to the real terminal are the ones the child wrote.
[[nodiscard]] OutputChannel make_terminal_channel(int terminal_fd) {
    termios attributes{};
    winsize size{};
    const bool have_attributes = tcgetattr(terminal_fd, &attributes) == 0;
    const bool have_size = ioctl(terminal_fd, TIOCGWINSZ, &size) == 0;

    int master = -1;
    int slave = -1;
    if (openpty(&master, &slave, nullptr, have_attributes ? &attributes : nullptr, have_size ? &size : nullptr) == -1) {
        throw std::runtime_error(std::format("openpty failed: {}", std::strerror(errno)));
    }

    OutputChannel channel{.parent_end = UniqueFd(master), .child_end = UniqueFd(slave)};

    if (fcntl(master, F_SETFD, FD_CLOEXEC) == -1 || fcntl(slave, F_SETFD, FD_CLOEXEC) == -1 ||
        tcgetattr(slave, &attributes) == -1) {
        throw std::runtime_error(std::format("pseudo-terminal setup failed: {}", std::strerror(errno)));
    }

    attributes.c_oflag &= ~static_cast<tcflag_t>(OPOST);
    if (tcsetattr(slave, TCSANOW, &attributes) == -1) {
        throw std::runtime_error(std::format("pseudo-terminal setup failed: {}", std::strerror(errno)));
    }

    return channel;
}

[[nodiscard]] OutputChannel make_output_channel(int terminal_fd) {
    if (terminal_fd != -1) {
        return make_terminal_channel(terminal_fd);
    }

    Pipe output_pipe = make_pipe();
    return OutputChannel{.parent_end = std::move(output_pipe.read_end), .child_end = std::move(output_pipe.write_end)};
}

[[nodiscard]] std::vector<char *> build_argv(std::span<const std::string> argv) {
    std::vector<char *> result;
    result.reserve(argv.size() + 1);

    for (const auto &arg : argv) {
        result.push_back(const_cast<char *>(arg.c_str()));
    }
    result.push_back(nullptr);

    return result;
}

// Runs in the forked child: only async-signal-safe calls from here on.
[[noreturn]] void exec_in_child(
    const std::string &path, char *const *argv, int input_fd, int stdout_fd, int stderr_fd, int error_fd) noexcept {
    if ((input_fd != STDIN_FILENO && dup2(input_fd, STDIN_FILENO) == -1) || dup2(stdout_fd, STDOUT_FILENO) == -1 ||
        dup2(stderr_fd, STDERR_FILENO) == -1) {
        const int error = errno;
        (void)!write(error_fd, &error, sizeof(error));
        _exit(126);
    }

    signal(SIGPIPE, SIG_DFL);
    execv(path.c_str(), argv);

    const int error = errno;
    (void)!write(error_fd, &error, sizeof(error));
    _exit(126);
}

// Reads the errno a failed exec reports; EOF means the exec succeeded.
[[nodiscard]] int read_exec_error(int fd) {
    int error = 0;
    while (true) {
        const ssize_t n = read(fd, &error, sizeof(error));
        if (n == -1 && errno == EINTR) {
            continue;
        }
        return n == static_cast<ssize_t>(sizeof(error)) ? error : 0;
    }
}

} // namespace

ProcessExecutor::ProcessExecutor(const PathResolver &path_resolver, std::size_t output_limit)
    : path_resolver_(path_resolver), output_limit_(output_limit) {}

ExitSignal ProcessExecutor::execute(std::span<const std::string> argv,
                                    std::ostream &out,
                                    std::ostream &err,
                                    int input_fd,
                                    OutputTerminals terminals) const {
    if (argv.empty()) {
        throw std::invalid_argument("process executor called without a command");
    }

    const std::string &name = argv.front();
    const auto path = path_resolver_.resolve(name);
    if (!path.has_value()) {
        return ExitSignal::failure(ErrorKind::CommandNotFound, 127, std::format("{}: command not found", name));
    }

    OutputChannel stdout_channel = make_output_channel(terminals.out);
    OutputChannel stderr_channel = make_output_channel(terminals.err);
    Pipe error_pipe = make_pipe();
    auto child_argv = build_argv(argv);

    out.flush();
    err.flush();

    const pid_t pid = fork();
    if (pid == -1) {
        throw std::runtime_error(std::format("fork failed: {}", std::strerror(errno)));
    }

    if (pid == 0) {
        exec_in_child(*path,
                      child_argv.data(),
                      input_fd,
                      stdout_channel.child_end.get(),
                      stderr_channel.child_end.get(),
                      error_pipe.write_end.get());
    }

    stdout_channel.child_end.reset();
    stderr_channel.child_end.reset();
    error_pipe.write_end.reset();

    if (const int exec_error = read_exec_error(error_pipe.read_end.get()); exec_error != 0) {
        (void)wait_for_process(pid);
        return ExitSignal::failure(ErrorKind::SpawnFailed, 126, std::format("{}: {}", name, std::strerror(exec_error)));
    }

    const auto [within_limit, status] =
        forward_output(pid, stdout_channel.parent_end.get(), stderr_channel.parent_end.get(), out, err);

    if (!within_limit) {
        return ExitSignal::failure(ErrorKind::OutputLimitExceeded,
                                   1,
                                   std::format("{}: output exceeded the limit of {} bytes", name, output_limit_));
    }

    if (status != 0) {
        return ExitSignal::failure(ErrorKind::NonZeroExit, status, {});
    }

    return ExitSignal::success();
}

ProcessExecutor::Forwarded ProcessExecutor::forward_output(
    pid_t pid, int stdout_fd, int stderr_fd, std::ostream &out, std::ostream &err) const {
    std::array<pollfd, 2> fds{pollfd{.fd = stdout_fd, .events = POLLIN, .revents = 0},
                              pollfd{.fd = stderr_fd, .events = POLLIN, .revents = 0}};
    std::array<std::ostream *, 2> sinks{&out, &err};
    std::array<char, 8192> buffer{};
    std::size_t forwarded = 0;
    std::optional<int> status;

    // A background grandchild may hold the output open after the child exits,
    // so end-of-file alone does not decide when the command is over.
    while (fds[0].fd != -1 || fds[1].fd != -1) {
        const int ready = poll(fds.data(), fds.size(), status.has_value() ? 0 : kExitCheckMillis);
        if (ready == -1) {
            if (errno == EINTR) {
                continue;
            }

            const int poll_error = errno;
            if (!status.has_value()) {
                kill(pid, SIGKILL);
                (void)wait_for_process(pid);
            }
            throw std::runtime_error(std::format("poll failed: {}", std::strerror(poll_error)));
        }

        if (ready == 0) {
            if (status.has_value()) {
                break;
            }
            status = poll_process(pid);
            continue;
        }

        for (std::size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd == -1 || fds[i].revents == 0) {
                continue;
            }

            const ssize_t n = read(fds[i].fd, buffer.data(), buffer.size());
            if (n == -1 && errno == EINTR) {
                continue;
            }

            // A pseudo-terminal reports EIO once every writer has closed it.
            if (n <= 0) {
                fds[i].fd = -1;
                continue;
            }

            const auto chunk = static_cast<std::size_t>(n);
            if (forwarded + chunk > output_limit_) {
                sinks[i]->write(buffer.data(), static_cast<std::streamsize>(output_limit_ - forwarded));
                sinks[i]->flush();
                if (status.has_value()) {
                    return Forwarded{.within_limit = false, .status = *status};
                }
                kill(pid, SIGKILL);
                return Forwarded{.within_limit = false, .status = wait_for_process(pid)};
            }

            forwarded += chunk;
            sinks[i]->write(buffer.data(), n);
            sinks[i]->flush();
        }

        if (!status.has_value()) {
            status = poll_process(pid);
        }
    }

    if (status.has_value()) {
        return Forwarded{.within_limit = true, .status = *status};
    }
    return Forwarded{.within_limit = true, .status = wait_for_process(pid)};
}

int ProcessExecutor::wait_for_process(pid_t pid) {
    int status = 0;

    while (waitpid(pid, &status, 0) == -1) {
        if (errno == EINTR) {
            continue;
        }

        throw std::runtime_error("waitpid failed");
    }

    return wait_status_to_exit_code(status);
}

std::optional<int> ProcessExecutor::poll_process(pid_t pid) {
    int status = 0;

    while (true) {
        const pid_t result = waitpid(pid, &status, WNOHANG);
        if (result == -1) {
            if (errno == EINTR) {
                continue;
            }
            throw std::runtime_error("waitpid failed");
        }

        if (result == 0) {
            return std::nullopt;
        }

        return wait_status_to_exit_code(status);
    }
}

int ProcessExecutor::wait_status_to_exit_code(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }

    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }

    return 1;
}

} // namespace dimsh
