#include "execution/exec_dispatcher.hpp"

#include <exception>
#include <format>

namespace dimsh {

ExecDispatcher::ExecDispatcher(const BuiltinRegistry &builtins, const ProcessExecutor &process_executor)
    : builtins_(builtins), process_executor_(process_executor) {}

ExitSignal ExecDispatcher::dispatch(ExecContext &ctx, std::span<const std::string> argv) const {
    if (argv.empty()) {
        return ExitSignal::success();
    }

    const std::string &name = argv.front();

    if (const BuiltinHandler *handler = builtins_.lookup(name); handler != nullptr) {
        try {
            auto result = (*handler)(ctx, argv.subspan(1));
            if (result.failed()) {
                return ExitSignal::failure(ErrorKind::Builtin, result.status(), result.message());
            }
            return result;
        } catch (const std::exception &error) {
            return ExitSignal::failure(ErrorKind::Builtin, 1, std::format("{}: {}", name, error.what()));
        }
    }

    return process_executor_.execute(
        argv, ctx.out, ctx.err, ctx.input_fd, OutputTerminals{.out = ctx.out_terminal, .err = ctx.err_terminal});
}

} // namespace dimsh
