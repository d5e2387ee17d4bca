#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <span>
#include <string>

#include <sys/types.h>

#include "core/exit_signal.hpp"

namespace dimsh {

class PathResolver;

inline constexpr std::size_t kDefaultOutputLimit = 2 * 1024 * 1024;

// Terminal descriptors behind the session's output streams, -1 when the
// stream is not a terminal.
struct OutputTerminals {
    int out{-1};
    int err{-1};
};

// Runs commands that are not builtins as child processes.
class ProcessExecutor {
  public:
    explicit ProcessExecutor(const PathResolver &path_resolver, std::size_t output_limit = kDefaultOutputLimit);

    // argv must not be empty. The child reads input_fd and its output is
    // forwarded to out/err until output_limit bytes have been seen. A stream
    // listed in terminals reaches the child as a pseudo-terminal with the
    // same attributes and window size.
    [[nodiscard]] ExitSignal execute(std::span<const std::string> argv,
                                     std::ostream &out,
                                     std::ostream &err,
                                     int input_fd = 0,
                                     OutputTerminals terminals = {}) const;

    [[nodiscard]] std::size_t output_limit() const noexcept { return output_limit_; }

  private:
    const PathResolver &path_resolver_;
    std::size_t output_limit_;

    struct Forwarded {
        bool within_limit;
        int status;
    };

    // Forwards until the child has exited and its buffered output is drained.
    [[nodiscard]] Forwarded forward_output(pid_t pid, int stdout_fd, int stderr_fd, std::ostream &out, std::ostream &err) const;

    [[nodiscard]] static int wait_for_process(pid_t pid);
    [[nodiscard]] static std::optional<int> poll_process(pid_t pid);
    [[nodiscard]] static int wait_status_to_exit_code(int status);
};

} // namespace dimsh
