#include "builtins/default_builtins.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <iterator>
#include <map>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <system_error>
#include <utility>

#include "core/path_resolver.hpp"
#include "history/history_manager.hpp"

extern char **environ;

namespace dimsh {

namespace fs = std::filesystem;

namespace {

[[nodiscard]] ExitSignal builtin_error(std::string message) {
    return ExitSignal::failure(ErrorKind::Builtin, 1, std::move(message));
}

[[nodiscard]] std::optional<int> parse_int(std::string_view token) {
    int value = 0;
    const char *first = token.data();
    const char *last = token.data() + token.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);

    if (token.empty() || ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }

    return value;
}

ExitSignal builtin_true(ExecContext & /*ctx*/, std::span<const std::string> /*args*/) { return ExitSignal::success(); }

ExitSignal builtin_false(ExecContext & /*ctx*/, std::span<const std::string> /*args*/) {
    return ExitSignal::failure(ErrorKind::Builtin, 1, {});
}

ExitSignal builtin_echo(ExecContext &ctx, std::span<const std::string> args) {
    bool newline = true;
    if (!args.empty() && args.front() == "-n") {
        newline = false;
        args = args.subspan(1);
    }

    for (std::size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            ctx.out << ' ';
        }

        ctx.out << args[i];
    }

    if (newline) {
        ctx.out << '\n';
    }
    ctx.out.flush();
    return ExitSignal::success();
}

ExitSignal builtin_cd(ExecContext &ctx, std::span<const std::string> args) {
    if (args.size() > 1) {
        return builtin_error("cd: too many arguments");
    }

    std::string target = args.empty() ? "~" : args.front();
    if (target == "~" || target.starts_with("~/")) {
        const auto home = ctx.state.variable("HOME");
        if (!home.has_value()) {
            return builtin_error("cd: HOME not set");
        }
        target = *home + target.substr(1);
    }

    std::error_code ec;
    const fs::path previous = fs::current_path(ec);

    fs::current_path(target, ec);
    if (ec) {
        return builtin_error(std::format("cd: {}: {}", target, ec.message()));
    }

    if (!previous.empty()) {
        setenv("OLDPWD", previous.c_str(), 1);
    }
    setenv("PWD", fs::current_path(ec).c_str(), 1);
    return ExitSignal::success();
}

ExitSignal builtin_pwd(ExecContext &ctx, std::span<const std::string> /*args*/) {
    std::error_code ec;
    const auto cwd = fs::current_path(ec);
    if (ec) {
        return builtin_error(std::format("pwd: {}", ec.message()));
    }

    ctx.out << cwd.string() << '\n';
    ctx.out.flush();
    return ExitSignal::success();
}

ExitSignal builtin_export(ExecContext &ctx, std::span<const std::string> args) {
    if (args.empty()) {
        std::map<std::string, std::string> exported;
        for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
            const std::string_view text(*entry);
            const auto equals = text.find('=');
            if (equals != std::string_view::npos) {
                exported.emplace(text.substr(0, equals), text.substr(equals + 1));
            }
        }

        for (const auto &[name, value] : exported) {
            ctx.out << std::format("export {}=\"{}\"\n", name, value);
        }
        ctx.out.flush();
        return ExitSignal::success();
    }

    std::optional<std::string> bad_name;
    for (const auto &arg : args) {
        const auto equals = arg.find('=');
        const std::string name = arg.substr(0, equals);

        if (!is_valid_variable_name(name)) {
            bad_name = arg;
            continue;
        }

        if (equals != std::string::npos) {
            ctx.state.set_variable(name, arg.substr(equals + 1));
        }
        ctx.state.export_variable(name);
    }

    if (bad_name.has_value()) {
        return builtin_error(std::format("export: `{}': not a valid identifier", *bad_name));
    }

    return ExitSignal::success();
}

ExitSignal builtin_exit(ExecContext &ctx, std::span<const std::string> args) {
    if (args.empty()) {
        return ExitSignal::terminate(ctx.state.last_status());
    }

    const auto code = parse_int(args.front());
    if (!code.has_value()) {
        ctx.err << std::format("exit: {}: numeric argument required\n", args.front());
        ctx.err.flush();
        return ExitSignal::terminate(2);
    }

    if (args.size() > 1) {
        return builtin_error("exit: too many arguments");
    }

    return ExitSignal::terminate(*code);
}

} // namespace

BuiltinRegistry make_default_registry(
    const PathResolver &path_resolver, const HistoryManager &history_manager, std::vector<BuiltinRegistry::Entry> extra) {
    std::vector<BuiltinRegistry::Entry> entries{
        {":", &builtin_true},
        {"true", &builtin_true},
        {"false", &builtin_false},
        {"echo", &builtin_echo},
        {"cd", &builtin_cd},
        {"pwd", &builtin_pwd},
        {"export", &builtin_export},
        {"exit", &builtin_exit},
    };

    entries.push_back({"history", [&history_manager](ExecContext &ctx, std::span<const std::string> args) {
                           if (args.size() > 1) {
                               return builtin_error("history: too many arguments");
                           }

                           std::optional<int> limit;
                           if (!args.empty()) {
                               limit = parse_int(args.front());
                               if (!limit.has_value() || *limit < 0) {
                                   return builtin_error(
                                       std::format("history: {}: numeric argument required", args.front()));
                               }
                           }

                           history_manager.print(ctx.out, limit);
                           ctx.out.flush();
                           return ExitSignal::success();
                       }});

    std::set<std::string> builtin_names{"type"};
    for (const auto &entry : entries) {
        builtin_names.insert(entry.name);
    }
    for (const auto &entry : extra) {
        builtin_names.insert(entry.name);
    }

    entries.push_back({"type", [&path_resolver, builtin_names](ExecContext &ctx, std::span<const std::string> args) {
                           if (args.empty()) {
                               return builtin_error("type: missing argument");
                           }

                           std::string missing;
                           for (const auto &name : args) {
                               if (builtin_names.contains(name)) {
                                   ctx.out << name << " is a shell builtin\n";
                               } else if (const auto path = path_resolver.resolve(name); path.has_value()) {
                                   ctx.out << name << " is " << *path << '\n';
                               } else {
                                   missing += missing.empty() ? "" : "\n";
                                   missing += std::format("type: {}: not found", name);
                               }
                           }
                           ctx.out.flush();

                           return missing.empty() ? ExitSignal::success() : builtin_error(std::move(missing));
                       }});

    std::move(extra.begin(), extra.end(), std::back_inserter(entries));
    return BuiltinRegistry(std::move(entries));
}

} // namespace dimsh
