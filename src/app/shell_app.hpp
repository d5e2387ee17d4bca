#pragma once

#include <iosfwd>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "app/config.hpp"
#include "builtins/builtin_registry.hpp"
#include "core/exit_signal.hpp"
#include "core/path_resolver.hpp"
#include "core/shell_state.hpp"
#include "execution/exec_dispatcher.hpp"
#include "execution/process_executor.hpp"
#include "history/history_manager.hpp"
#include "interpreter/interpreter.hpp"
#include "line_editing/completion.hpp"

namespace dimsh {

enum class SessionMode {
    Interactive,
    PipedScript,
    CommandString,
    FileScript,
};

[[nodiscard]] std::string_view to_string(SessionMode mode) noexcept;

// Chosen once from the arguments (without the program name) and whether
// standard input is a terminal.
[[nodiscard]] SessionMode select_mode(std::span<const std::string> args, bool input_is_terminal) noexcept;

struct SessionIo {
    std::istream &in;
    std::ostream &out;
    std::ostream &err;
    bool input_is_terminal{false};
    // Terminal descriptors behind out and err, or -1.
    int out_terminal{-1};
    int err_terminal{-1};
    // Read interactive lines through GNU Readline instead of `in`.
    bool line_editing{false};
};

// Session frontend: wires the shell together, runs the selected mode and
// turns its outcome into a process exit code.
class ShellApp {
  public:
    ShellApp(std::vector<std::string> args, SessionIo io, Config config,
             std::vector<BuiltinRegistry::Entry> extra_builtins = {});

    ShellApp(const ShellApp &) = delete;
    ShellApp &operator=(const ShellApp &) = delete;

    [[nodiscard]] int run();

    [[nodiscard]] SessionMode mode() const noexcept { return mode_; }

    [[nodiscard]] static int exit_code_for(const ExitSignal &signal) noexcept;

  private:
    std::vector<std::string> args_;
    SessionIo io_;
    SessionMode mode_;
    PathResolver path_resolver_;
    HistoryManager history_manager_;
    BuiltinRegistry builtin_registry_;
    ProcessExecutor process_executor_;
    ExecDispatcher dispatcher_;
    ShellState state_;
    ExecContext ctx_;
    CompletionEngine completion_engine_;
    Interpreter interpreter_;

    [[nodiscard]] ExitSignal run_mode();
    [[nodiscard]] ExitSignal run_interactive();
};

} // namespace dimsh
