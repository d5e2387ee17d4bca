#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <unistd.h>

#include "builtins/builtin_registry.hpp"
#include "core/path_resolver.hpp"
#include "core/shell_state.hpp"
#include "execution/exec_dispatcher.hpp"
#include "execution/process_executor.hpp"

using dimsh::BuiltinRegistry;
using dimsh::ErrorKind;
using dimsh::ExecContext;
using dimsh::ExecDispatcher;
using dimsh::ExitSignal;
using dimsh::PathResolver;
using dimsh::ProcessExecutor;
using dimsh::ShellState;

namespace {

namespace fs = std::filesystem;

class EnvVarGuard {
  public:
    explicit EnvVarGuard(const char *name) : name_(name) {
        const char *value = std::getenv(name_.c_str());
        if (value != nullptr) {
            had_value_ = true;
            value_ = value;
        }
    }

    ~EnvVarGuard() {
        if (had_value_) {
            setenv(name_.c_str(), value_.c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

  private:
    std::string name_;
    bool had_value_{false};
    std::string value_;
};

std::string make_temp_dir() {
    std::string pattern = "/tmp/dimsh_exec_dispatcher_XXXXXX";
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    char *created = mkdtemp(buffer.data());
    assert(created != nullptr);
    return created;
}

void make_executable_script(const fs::path &path, std::string_view body) {
    std::ofstream file(path);
    assert(file.is_open());
    file << body;
    file.close();

    std::error_code ec;
    fs::permissions(path,
                    fs::perms::owner_read | fs::perms::owner_write | fs::perms::owner_exec |
                        fs::perms::group_read | fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace,
                    ec);
    assert(!ec);
}

struct Harness {
    explicit Harness(BuiltinRegistry registry_in)
        : registry(std::move(registry_in)), executor(resolver), dispatcher(registry, executor) {}

    PathResolver resolver;
    BuiltinRegistry registry;
    ProcessExecutor executor;
    ExecDispatcher dispatcher;
    ShellState state;
    std::ostringstream out;
    std::ostringstream err;
    ExecContext ctx{.out = out, .err = err, .state = state};

    ExitSignal dispatch(std::vector<std::string> argv) { return dispatcher.dispatch(ctx, argv); }
};

void test_empty_argv_is_a_noop() {
    EnvVarGuard path_guard("PATH");
    unsetenv("PATH");

    int calls = 0;
    Harness harness(BuiltinRegistry({{"counted", [&calls](ExecContext &, std::span<const std::string>) {
                                           ++calls;
                                           return ExitSignal::success();
                                       }}}));

    const auto result = harness.dispatch({});
    assert(result.ok());
    assert(calls == 0);
    assert(harness.out.str().empty());
    assert(harness.err.str().empty());
}

void test_builtin_shadows_external_executable() {
    EnvVarGuard path_guard("PATH");

    const std::string dir = make_temp_dir();
    const fs::path marker = fs::path(dir) / "external-ran";
    make_executable_script(fs::path(dir) / "echo-builtin", "#!/bin/sh\ntouch '" + marker.string() + "'\n");
    const std::string path = dir + ":/bin:/usr/bin";
    setenv("PATH", path.c_str(), 1);

    std::vector<std::string> seen;
    Harness harness(BuiltinRegistry({{"echo-builtin", [&seen](ExecContext &ctx, std::span<const std::string> args) {
                                           seen.assign(args.begin(), args.end());
                                           ctx.out << "builtin says " << args.front() << '\n';
                                           return ExitSignal::success();
                                       }}}));

    assert(harness.resolver.resolve("echo-builtin").has_value());

    const auto result = harness.dispatch({"echo-builtin", "hi"});
    assert(result.ok());
    assert(seen == std::vector<std::string>{"hi"});
    assert(harness.out.str() == "builtin says hi\n");
    assert(!fs::exists(marker));

    // The same script does run when nothing shadows it.
    Harness unshadowed{BuiltinRegistry()};
    assert(unshadowed.dispatch({"echo-builtin"}).ok());
    assert(fs::exists(marker));

    std::error_code ec;
    fs::remove_all(dir, ec);
}

void test_missing_builtin_goes_to_process_executor() {
    EnvVarGuard path_guard("PATH");
    setenv("PATH", "/bin:/usr/bin", 1);

    const std::string dir = make_temp_dir();
    {
        std::ofstream file(fs::path(dir) / "listed-file");
        file << "x";
    }

    Harness harness{BuiltinRegistry()};
    assert(!harness.registry.is_builtin("ls"));

    auto result = harness.dispatch({"ls", "-la", dir});
    assert(result.ok());
    assert(harness.out.str().find("listed-file") != std::string::npos);

    result = harness.dispatch({"ls", "-la", dir + "/definitely-missing"});
    assert(result.failed());
    assert(result.cause() == ErrorKind::NonZeroExit);
    assert(result.status() != 0);
    assert(!harness.err.str().empty());

    result = harness.dispatch({"definitely_missing_command_xyz"});
    assert(result.cause() == ErrorKind::CommandNotFound);
    assert(result.status() == 127);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

void test_builtin_outcomes_are_translated() {
    EnvVarGuard path_guard("PATH");
    unsetenv("PATH");

    Harness harness(BuiltinRegistry({
        {"fails", [](ExecContext &, std::span<const std::string>) {
             return ExitSignal::failure(ErrorKind::Runtime, 3, "fails: boom");
         }},
        {"throws", [](ExecContext &, std::span<const std::string>) -> ExitSignal {
             throw std::runtime_error("unexpected state");
         }},
        {"quits", [](ExecContext &, std::span<const std::string>) { return ExitSignal::terminate(7); }},
    }));

    auto result = harness.dispatch({"fails"});
    assert(result.failed());
    assert(result.cause() == ErrorKind::Builtin);
    assert(result.status() == 3);
    assert(result.message() == "fails: boom");

    result = harness.dispatch({"throws", "arg"});
    assert(result.failed());
    assert(result.cause() == ErrorKind::Builtin);
    assert(result.message() == "throws: unexpected state");

    result = harness.dispatch({"quits"});
    assert(result.is_termination());
    assert(result.status() == 7);
}

} // namespace

int main() {
    test_empty_argv_is_a_noop();
    test_builtin_shadows_external_executable();
    test_missing_builtin_goes_to_process_executor();
    test_builtin_outcomes_are_translated();
    return 0;
}
