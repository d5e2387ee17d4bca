#pragma once

#include <fstream>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "core/command.hpp"
#include "core/shell_state.hpp"

namespace dimsh {

// Opens the redirection targets of one command and exposes the
// execution context that writes to them. Files close on destruction.
class RedirectionScope {
  public:
    RedirectionScope(std::span<const Redirection> redirections, const ExecContext &base);
    ~RedirectionScope();

    RedirectionScope(const RedirectionScope &) = delete;
    RedirectionScope &operator=(const RedirectionScope &) = delete;

    [[nodiscard]] bool is_valid() const noexcept { return valid_; }
    [[nodiscard]] const std::string &error() const noexcept { return error_; }

    // Only meaningful when is_valid().
    [[nodiscard]] ExecContext &context() { return *context_; }

  private:
    std::vector<std::unique_ptr<std::ofstream>> files_;
    std::ostream *out_;
    std::ostream *err_;
    int input_fd_;
    int owned_input_fd_{-1};
    int out_terminal_;
    int err_terminal_;
    bool valid_{true};
    std::string error_;
    std::optional<ExecContext> context_;

    [[nodiscard]] bool apply_redirection(const Redirection &redirection);
};

} // namespace dimsh
