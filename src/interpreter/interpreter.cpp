#include "interpreter/interpreter.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <istream>
#include <iterator>
#include <ostream>
#include <string>
#include <system_error>

#include "line_editing/line_reader.hpp"

namespace dimsh {

namespace {

[[nodiscard]] ExitSignal parse_failure(const ParseError &error) {
    const ErrorKind cause = error.incomplete() ? ErrorKind::ParseIncomplete : ErrorKind::ParseInvalid;
    return ExitSignal::failure(cause, 1, "parse error: " + error.message);
}

[[nodiscard]] std::string runtime_message(const ExitSignal &signal) {
    return "runtime error: " + signal.message();
}

} // namespace

Interpreter::Interpreter(const ExecDispatcher &dispatcher, ExecContext &ctx, std::size_t max_pending_source)
    : runner_(dispatcher), ctx_(ctx), max_pending_source_(max_pending_source) {}

ExitSignal Interpreter::run(const Program &program) {
    return runner_.run(ctx_, program);
}

ExitSignal Interpreter::run_interactive(LineReader &reader) {
    std::string pending;

    while (true) {
        const auto prompt = pending.empty() ? kPrimaryPrompt : kContinuationPrompt;
        const auto line = reader.read_line(prompt);
        if (!line.has_value()) {
            return ExitSignal::success();
        }

        pending += *line;
        pending += '\n';

        if (pending.size() > max_pending_source_) {
            pending.clear();
            ctx_.err << pending_overflow().message() << std::endl;
            continue;
        }

        auto program = parser_.parse(pending);
        if (!program.has_value()) {
            if (program.error().incomplete()) {
                continue;
            }

            pending.clear();
            ctx_.err << "parse error: " << program.error().message << std::endl;
            continue;
        }

        pending.clear();
        if (program->empty()) {
            continue;
        }

        const auto result = run(*program);
        if (result.is_termination()) {
            return result;
        }

        if (result.failed()) {
            ctx_.err << runtime_message(result) << std::endl;
        }
    }
}

ExitSignal Interpreter::run_piped(std::istream &in) {
    std::string source{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
        return ExitSignal::failure(ErrorKind::Runtime, 1, "reading piped input failed");
    }

    if (source.empty()) {
        return ExitSignal::success();
    }

    return run_source(source);
}

ExitSignal Interpreter::run_command_string(std::string_view command) {
    return run_source(command);
}

ExitSignal Interpreter::run_file(const std::string &path) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return ExitSignal::failure(ErrorKind::ScriptUnreadable, 1,
                                   std::format("opening script file: {}: {}", path, std::strerror(EISDIR)));
    }

    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        const int error = errno;
        return ExitSignal::failure(
            ErrorKind::ScriptUnreadable,
            1,
            std::format("opening script file: {}: {}", path, error != 0 ? std::strerror(error) : "cannot open file"));
    }

    std::string source{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad()) {
        return ExitSignal::failure(ErrorKind::ScriptUnreadable, 1, std::format("reading script file: {}", path));
    }

    return run_source(source);
}

ExitSignal Interpreter::pending_overflow() const {
    return ExitSignal::failure(ErrorKind::InputTooLong,
                               1,
                               std::format("input too long: pending source exceeds {} bytes", max_pending_source_));
}

ExitSignal Interpreter::run_source(std::string_view source) {
    auto program = parser_.parse(source);
    if (!program.has_value()) {
        return parse_failure(program.error());
    }

    const auto result = run(*program);
    if (result.failed()) {
        return ExitSignal::failure(result.cause(), result.status(), runtime_message(result));
    }

    return result;
}

} // namespace dimsh
