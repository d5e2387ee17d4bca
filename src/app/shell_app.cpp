#include "app/shell_app.hpp"

#include <exception>
#include <ostream>
#include <utility>

#include "builtins/default_builtins.hpp"
#include "line_editing/line_reader.hpp"

namespace dimsh {

namespace {

constexpr std::string_view kCommandStringFlag = "-c";

[[nodiscard]] ShellState make_state(SessionMode mode, const std::vector<std::string> &args) {
    if (mode != SessionMode::FileScript) {
        return ShellState();
    }

    return ShellState(args.front(), std::vector<std::string>(args.begin() + 1, args.end()));
}

} // namespace

std::string_view to_string(SessionMode mode) noexcept {
    switch (mode) {
    case SessionMode::Interactive:
        return "interactive";
    case SessionMode::PipedScript:
        return "piped script";
    case SessionMode::CommandString:
        return "command string";
    case SessionMode::FileScript:
        return "file script";
    }

    return "unknown";
}

SessionMode select_mode(std::span<const std::string> args, bool input_is_terminal) noexcept {
    if (args.empty()) {
        return input_is_terminal ? SessionMode::Interactive : SessionMode::PipedScript;
    }

    if (args.size() == 2 && args.front() == kCommandStringFlag) {
        return SessionMode::CommandString;
    }

    return SessionMode::FileScript;
}

ShellApp::ShellApp(std::vector<std::string> args, SessionIo io, Config config,
                   std::vector<BuiltinRegistry::Entry> extra_builtins)
    : args_(std::move(args)),
      io_(io),
      mode_(select_mode(args_, io.input_is_terminal)),
      path_resolver_(),
      history_manager_(std::move(config.history_file)),
      builtin_registry_(make_default_registry(path_resolver_, history_manager_, std::move(extra_builtins))),
      process_executor_(path_resolver_, config.output_limit),
      dispatcher_(builtin_registry_, process_executor_),
      state_(make_state(mode_, args_)),
      ctx_{.out = io_.out,
           .err = io_.err,
           .state = state_,
           .input_fd = 0,
           .out_terminal = io.out_terminal,
           .err_terminal = io.err_terminal},
      completion_engine_(builtin_registry_, path_resolver_),
      interpreter_(dispatcher_, ctx_, config.max_pending_source) {}

int ShellApp::exit_code_for(const ExitSignal &signal) noexcept {
    switch (signal.kind()) {
    case ExitSignal::Kind::Success:
        return 0;
    case ExitSignal::Kind::Terminate:
        return signal.status();
    case ExitSignal::Kind::Failure:
        return 1;
    }

    return 1;
}

int ShellApp::run() {
    int exit_code = 1;

    try {
        const auto result = run_mode();
        if (result.failed() && !result.message().empty()) {
            io_.err << result.message() << std::endl;
        }
        exit_code = exit_code_for(result);
    } catch (const std::exception &e) {
        io_.err << "dimsh: " << e.what() << std::endl;
    }

    history_manager_.save();
    return exit_code;
}

ExitSignal ShellApp::run_mode() {
    switch (mode_) {
    case SessionMode::Interactive:
        return run_interactive();
    case SessionMode::PipedScript:
        return interpreter_.run_piped(io_.in);
    case SessionMode::CommandString:
        return interpreter_.run_command_string(args_.back());
    case SessionMode::FileScript:
        return interpreter_.run_file(args_.front());
    }

    return ExitSignal::failure(ErrorKind::Runtime, 1, "unknown session mode");
}

ExitSignal ShellApp::run_interactive() {
    if (!io_.line_editing) {
        StreamLineReader reader(io_.in, io_.out);
        return interpreter_.run_interactive(reader);
    }

    history_manager_.load();
    completion_engine_.install();

    ReadlineLineReader reader(history_manager_, io_.out);
    return interpreter_.run_interactive(reader);
}

} // namespace dimsh
