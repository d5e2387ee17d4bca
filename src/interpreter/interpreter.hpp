#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>

#include "core/ast.hpp"
#include "core/exit_signal.hpp"
#include "core/parser.hpp"
#include "core/shell_state.hpp"
#include "interpreter/runner.hpp"

namespace dimsh {

class ExecDispatcher;
class LineReader;

inline constexpr std::size_t kDefaultMaxPendingSource = 1024 * 1024;

inline constexpr std::string_view kPrimaryPrompt = "dim > ";
inline constexpr std::string_view kContinuationPrompt = "> ";

// Acquires source text in one of the session modes, parses it and runs it.
//
// Interactive mode keeps going after failures and only stops on end of input
// or explicit termination. The other modes return the first failure, with a
// message ready to be printed by the caller.
class Interpreter {
  public:
    Interpreter(const ExecDispatcher &dispatcher, ExecContext &ctx,
                std::size_t max_pending_source = kDefaultMaxPendingSource);

    [[nodiscard]] ExitSignal run(const Program &program);

    [[nodiscard]] ExitSignal run_interactive(LineReader &reader);
    [[nodiscard]] ExitSignal run_piped(std::istream &in);
    [[nodiscard]] ExitSignal run_command_string(std::string_view command);
    [[nodiscard]] ExitSignal run_file(const std::string &path);

  private:
    Parser parser_;
    Runner runner_;
    ExecContext &ctx_;
    std::size_t max_pending_source_;

    [[nodiscard]] ExitSignal run_source(std::string_view source);
    [[nodiscard]] ExitSignal pending_overflow() const;
};

} // namespace dimsh
