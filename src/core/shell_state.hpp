#pragma once

#include <functional>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dimsh {

// Variables and parameters of one session.
class ShellState {
  public:
    ShellState();
    ShellState(std::string script_name, std::vector<std::string> positional);

    [[nodiscard]] std::optional<std::string> variable(std::string_view name) const;
    void set_variable(const std::string &name, const std::string &value);
    void export_variable(const std::string &name);

    [[nodiscard]] const std::string &script_name() const noexcept { return script_name_; }
    [[nodiscard]] const std::vector<std::string> &positional() const noexcept { return positional_; }

    [[nodiscard]] int last_status() const noexcept { return last_status_; }
    void set_last_status(int status) noexcept { last_status_ = status; }

  private:
    std::string script_name_;
    std::vector<std::string> positional_;
    std::map<std::string, std::string, std::less<>> variables_;
    int last_status_{0};
};

[[nodiscard]] bool is_valid_variable_name(std::string_view name) noexcept;

// Streams and state handed to every command of a session.
struct ExecContext {
    std::ostream &out;
    std::ostream &err;
    ShellState &state;
    // Standard input handed to external commands.
    int input_fd{0};
    // Terminals behind out and err, -1 when the stream is not a terminal.
    int out_terminal{-1};
    int err_terminal{-1};
};

} // namespace dimsh
