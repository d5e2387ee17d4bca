#pragma once

#include <span>
#include <string>

#include "builtins/builtin_registry.hpp"
#include "core/exit_signal.hpp"
#include "core/shell_state.hpp"
#include "execution/process_executor.hpp"

namespace dimsh {

// Decides, for every command word, between a builtin and an external process.
// Builtins always win over an executable of the same name.
class ExecDispatcher {
  public:
    ExecDispatcher(const BuiltinRegistry &builtins, const ProcessExecutor &process_executor);

    [[nodiscard]] ExitSignal dispatch(ExecContext &ctx, std::span<const std::string> argv) const;

  private:
    const BuiltinRegistry &builtins_;
    const ProcessExecutor &process_executor_;
};

} // namespace dimsh
