#include "interpreter/runner.hpp"

#include <cstdlib>
#include <format>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "execution/exec_dispatcher.hpp"
#include "execution/redirection.hpp"
#include "interpreter/expansion.hpp"

namespace dimsh {

namespace {

// Exports prefix assignments (`NAME=value cmd`) for the duration of one command.
class EnvironmentOverride {
  public:
    void set(const std::string &name, const std::string &value) {
        const char *previous = std::getenv(name.c_str());
        saved_.push_back(
            SavedVariable{.name = name, .value = previous != nullptr ? std::optional<std::string>(previous) : std::nullopt});
        setenv(name.c_str(), value.c_str(), 1);
    }

    ~EnvironmentOverride() {
        for (auto it = saved_.rbegin(); it != saved_.rend(); ++it) {
            if (it->value.has_value()) {
                setenv(it->name.c_str(), it->value->c_str(), 1);
            } else {
                unsetenv(it->name.c_str());
            }
        }
    }

  private:
    struct SavedVariable {
        std::string name;
        std::optional<std::string> value;
    };

    std::vector<SavedVariable> saved_;
};

[[nodiscard]] ExitSignal with_status(int status) {
    return status == 0 ? ExitSignal::success() : ExitSignal::failure(ErrorKind::NonZeroExit, status, {});
}

template <class... Ts> struct Overloaded : Ts... {
    using Ts::operator()...;
};

} // namespace

Runner::Runner(const ExecDispatcher &dispatcher) : dispatcher_(dispatcher) {}

ExitSignal Runner::run(ExecContext &ctx, const Program &program) const {
    auto result = run_list(ctx, program.commands);
    if (result.is_termination()) {
        return result;
    }

    const int status = ctx.state.last_status();
    if (status == 0) {
        return ExitSignal::success();
    }

    const ErrorKind cause = result.failed() ? result.cause() : ErrorKind::NonZeroExit;
    return ExitSignal::failure(cause, status, std::format("exit status {}", status));
}

ExitSignal Runner::run_list(ExecContext &ctx, const CommandList &list) const {
    auto result = ExitSignal::success();

    for (const auto &item : list) {
        result = run_and_or(ctx, item);
        if (result.is_termination()) {
            break;
        }
    }

    return result;
}

ExitSignal Runner::run_and_or(ExecContext &ctx, const AndOrList &list) const {
    auto result = ExitSignal::success();

    for (const auto &link : list.links) {
        const int previous = ctx.state.last_status();
        if ((link.op == ListOp::And && previous != 0) || (link.op == ListOp::Or && previous == 0)) {
            continue;
        }

        result = run_command(ctx, *link.command);
        if (result.is_termination()) {
            return result;
        }

        if (link.negated) {
            result = result.ok() ? with_status(1) : ExitSignal::success();
        }
        ctx.state.set_last_status(result.status());
    }

    return result;
}

ExitSignal Runner::run_command(ExecContext &ctx, const Command &command) const {
    auto result = std::visit(
        Overloaded{
            [&](const SimpleCommand &node) { return run_simple(ctx, node); },
            [&](const IfClause &node) { return run_if(ctx, node); },
            [&](const LoopClause &node) { return run_loop(ctx, node); },
            [&](const ForClause &node) { return run_for(ctx, node); },
            [&](const BraceGroup &node) { return run_list(ctx, node.body); },
        },
        command.node);

    if (!result.is_termination()) {
        ctx.state.set_last_status(result.status());
    }
    return result;
}

ExitSignal Runner::run_simple(ExecContext &ctx, const SimpleCommand &command) const {
    const Expander expander(ctx.state);
    const auto argv = expander.expand_words(command.words);

    std::vector<Redirection> redirections;
    redirections.reserve(command.redirections.size());
    for (const auto &redirection : command.redirections) {
        redirections.push_back(Redirection{.op = redirection.op, .target = expander.expand_single(redirection.target)});
    }

    EnvironmentOverride environment;
    for (const auto &assignment : command.assignments) {
        const auto value = expander.expand_single(assignment.value);
        if (argv.empty()) {
            ctx.state.set_variable(assignment.name, value);
        } else {
            environment.set(assignment.name, value);
        }
    }

    RedirectionScope scope(redirections, ctx);
    if (!scope.is_valid()) {
        ctx.err << scope.error() << '\n';
        ctx.err.flush();
        return ExitSignal::failure(ErrorKind::Redirection, 1, scope.error());
    }

    ExecContext &command_ctx = scope.context();
    auto result = [&] {
        try {
            return dispatcher_.dispatch(command_ctx, argv);
        } catch (const std::runtime_error &error) {
            return ExitSignal::failure(ErrorKind::SpawnFailed, 1, std::format("{}: {}", argv.front(), error.what()));
        }
    }();

    if (result.failed() && !result.message().empty()) {
        command_ctx.err << result.message() << '\n';
        command_ctx.err.flush();
    }

    return result;
}

ExitSignal Runner::run_if(ExecContext &ctx, const IfClause &clause) const {
    for (const auto &branch : clause.branches) {
        auto condition = run_list(ctx, branch.condition);
        if (condition.is_termination()) {
            return condition;
        }

        if (ctx.state.last_status() == 0) {
            return run_list(ctx, branch.body);
        }
    }

    if (clause.else_body.has_value()) {
        return run_list(ctx, *clause.else_body);
    }

    return ExitSignal::success();
}

ExitSignal Runner::run_loop(ExecContext &ctx, const LoopClause &clause) const {
    auto result = ExitSignal::success();

    while (true) {
        auto condition = run_list(ctx, clause.condition);
        if (condition.is_termination()) {
            return condition;
        }

        const bool condition_true = ctx.state.last_status() == 0;
        if (condition_true == clause.until) {
            break;
        }

        result = run_list(ctx, clause.body);
        if (result.is_termination()) {
            return result;
        }
    }

    return result;
}

ExitSignal Runner::run_for(ExecContext &ctx, const ForClause &clause) const {
    const auto items =
        clause.items.has_value() ? Expander(ctx.state).expand_words(*clause.items) : ctx.state.positional();
    auto result = ExitSignal::success();

    for (const auto &item : items) {
        ctx.state.set_variable(clause.variable, item);

        result = run_list(ctx, clause.body);
        if (result.is_termination()) {
            return result;
        }
    }

    return result;
}

} // namespace dimsh
