#pragma once

#include "core/ast.hpp"
#include "core/exit_signal.hpp"
#include "core/shell_state.hpp"

namespace dimsh {

class ExecDispatcher;

// Executes a parsed program in its own control-flow order. Every simple
// command with a command word goes through the dispatcher.
class Runner {
  public:
    explicit Runner(const ExecDispatcher &dispatcher);

    [[nodiscard]] ExitSignal run(ExecContext &ctx, const Program &program) const;

  private:
    const ExecDispatcher &dispatcher_;

    [[nodiscard]] ExitSignal run_list(ExecContext &ctx, const CommandList &list) const;
    [[nodiscard]] ExitSignal run_and_or(ExecContext &ctx, const AndOrList &list) const;
    [[nodiscard]] ExitSignal run_command(ExecContext &ctx, const Command &command) const;
    [[nodiscard]] ExitSignal run_simple(ExecContext &ctx, const SimpleCommand &command) const;
    [[nodiscard]] ExitSignal run_if(ExecContext &ctx, const IfClause &clause) const;
    [[nodiscard]] ExitSignal run_loop(ExecContext &ctx, const LoopClause &clause) const;
    [[nodiscard]] ExitSignal run_for(ExecContext &ctx, const ForClause &clause) const;
};

} // namespace dimsh
