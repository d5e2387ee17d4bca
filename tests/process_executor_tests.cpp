#include <cassert>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <pty.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <unistd.h>

#define private public
#include "execution/process_executor.hpp"
#undef private

#include "core/path_resolver.hpp"

using dimsh::ErrorKind;
using dimsh::OutputTerminals;
using dimsh::PathResolver;
using dimsh::ProcessExecutor;

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
    std::string pattern = "/tmp/dimsh_process_executor_XXXXXX";
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

// A PATH holding only a fresh temp directory plus the system binaries the scripts need.
class ScriptDir {
  public:
    ScriptDir() : path_guard_("PATH"), dir_(make_temp_dir()) {
        const std::string path = dir_ + ":/bin:/usr/bin";
        setenv("PATH", path.c_str(), 1);
    }

    ~ScriptDir() {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path add(const std::string &name, std::string_view body) const {
        const fs::path script = fs::path(dir_) / name;
        make_executable_script(script, body);
        return script;
    }

    [[nodiscard]] const std::string &dir() const noexcept { return dir_; }

  private:
    EnvVarGuard path_guard_;
    std::string dir_;
};

void test_forwards_both_streams() {
    ScriptDir scripts;
    scripts.add("greet", "#!/bin/sh\necho \"out $1\"\necho \"err $2\" >&2\n");

    PathResolver resolver;
    ProcessExecutor executor(resolver);

    std::ostringstream out;
    std::ostringstream err;
    const std::vector<std::string> argv{"greet", "one", "two"};
    const auto result = executor.execute(argv, out, err);

    assert(result.ok());
    assert(out.str() == "out one\n");
    assert(err.str() == "err two\n");
}

void test_reports_exit_status() {
    ScriptDir scripts;
    scripts.add("fail_with_3", "#!/bin/sh\nexit 3\n");

    PathResolver resolver;
    ProcessExecutor executor(resolver);

    std::ostringstream out;
    std::ostringstream err;
    const std::vector<std::string> argv{"fail_with_3"};
    const auto result = executor.execute(argv, out, err);

    assert(result.failed());
    assert(!result.is_termination());
    assert(result.cause() == ErrorKind::NonZeroExit);
    assert(result.status() == 3);
    assert(result.message().empty());
}

void test_command_not_found_is_distinct() {
    ScriptDir scripts;

    PathResolver resolver;
    ProcessExecutor executor(resolver);

    std::ostringstream out;
    std::ostringstream err;
    const std::vector<std::string> argv{"definitely_missing_command_xyz"};
    const auto result = executor.execute(argv, out, err);

    assert(result.failed());
    assert(result.cause() == ErrorKind::CommandNotFound);
    assert(result.status() == 127);
    assert(result.message() == "definitely_missing_command_xyz: command not found");
    assert(out.str().empty());
}

void test_exec_failure_is_spawn_failure() {
    ScriptDir scripts;
    scripts.add("bad_interpreter", "#!/definitely/missing/interpreter\n");

    PathResolver resolver;
    ProcessExecutor executor(resolver);

    std::ostringstream out;
    std::ostringstream err;
    const std::vector<std::string> argv{"bad_interpreter"};
    const auto result = executor.execute(argv, out, err);

    assert(result.failed());
    assert(result.cause() == ErrorKind::SpawnFailed);
    assert(result.status() == 126);
    assert(result.message().starts_with("bad_interpreter: "));
}

void test_output_ceiling_kills_verbose_child() {
    ScriptDir scripts;
    scripts.add("chatty", "#!/bin/sh\nwhile :; do echo 0123456789abcdef0123456789abcdef; done\n");

    PathResolver resolver;
    ProcessExecutor executor(resolver, 1024);
    assert(executor.output_limit() == 1024);

    std::ostringstream out;
    std::ostringstream err;
    const std::vector<std::string> argv{"chatty"};
    const auto result = executor.execute(argv, out, err);

    assert(result.failed());
    assert(result.cause() == ErrorKind::OutputLimitExceeded);
    assert(result.message() == "chatty: output exceeded the limit of 1024 bytes");
    assert(out.str().size() == 1024);
}

void test_output_at_ceiling_succeeds() {
    ScriptDir scripts;
    scripts.add("exact", "#!/bin/sh\nprintf 0123456789\n");

    PathResolver resolver;
    ProcessExecutor executor(resolver, 10);

    std::ostringstream out;
    std::ostringstream err;
    const std::vector<std::string> argv{"exact"};
    const auto result = executor.execute(argv, out, err);

    assert(result.ok());
    assert(out.str() == "0123456789");
}

void test_reads_input_fd_and_runs_paths() {
    ScriptDir scripts;
    const auto script = scripts.add("echo_input", "#!/bin/sh\ncat\n");

    const fs::path input = fs::path(scripts.dir()) / "input.txt";
    {
        std::ofstream file(input);
        file << "line from file\n";
    }

    const int fd = open(input.c_str(), O_RDONLY | O_CLOEXEC);
    assert(fd != -1);

    PathResolver resolver;
    ProcessExecutor executor(resolver);

    std::ostringstream out;
    std::ostringstream err;
    const std::vector<std::string> argv{script.string()};
    const auto result = executor.execute(argv, out, err, fd);
    close(fd);

    assert(result.ok());
    assert(out.str() == "line from file\n");
}

void test_signals_map_to_128_plus_signal() {
    ScriptDir scripts;
    scripts.add("self_kill", "#!/bin/sh\nkill -TERM $$\n");

    PathResolver resolver;
    ProcessExecutor executor(resolver);

    std::ostringstream out;
    std::ostringstream err;
    const std::vector<std::string> argv{"self_kill"};
    const auto result = executor.execute(argv, out, err);

    assert(result.failed());
    assert(result.status() == 128 + SIGTERM);

    assert(ProcessExecutor::wait_status_to_exit_code(0) == 0);
}

void test_unrunnable_paths_are_spawn_failures() {
    ScriptDir scripts;
    const fs::path plain = fs::path(scripts.dir()) / "plain.sh";
    {
        std::ofstream file(plain);
        file << "#!/bin/sh\necho plain\n";
    }

    PathResolver resolver;
    ProcessExecutor executor(resolver);

    std::ostringstream out;
    std::ostringstream err;
    const std::vector<std::string> file_argv{plain.string()};
    const auto file_result = executor.execute(file_argv, out, err);

    assert(file_result.failed());
    assert(file_result.cause() == ErrorKind::SpawnFailed);
    assert(file_result.status() == 126);
    assert(file_result.message() == plain.string() + ": Permission denied");

    const std::vector<std::string> dir_argv{scripts.dir()};
    const auto dir_result = executor.execute(dir_argv, out, err);
    assert(dir_result.cause() == ErrorKind::SpawnFailed);
    assert(dir_result.status() == 126);
    assert(out.str().empty());
}

// A pseudo-terminal standing in for the session's terminal.
class SessionTerminal {
  public:
    SessionTerminal(unsigned short rows, unsigned short cols) {
        winsize size{};
        size.ws_row = rows;
        size.ws_col = cols;
        assert(openpty(&master_, &slave_, nullptr, nullptr, &size) == 0);
    }

    ~SessionTerminal() {
        close(slave_);
        close(master_);
    }

    SessionTerminal(const SessionTerminal &) = delete;
    SessionTerminal &operator=(const SessionTerminal &) = delete;

    [[nodiscard]] int fd() const noexcept { return slave_; }

  private:
    int master_{-1};
    int slave_{-1};
};

void test_terminal_streams_reach_the_child_as_terminals() {
    ScriptDir scripts;
    scripts.add("tty_check",
                "#!/bin/sh\n"
                "if [ -t 1 ]; then echo out-tty; else echo out-pipe; fi\n"
                "if [ -t 2 ]; then echo err-tty >&2; else echo err-pipe >&2; fi\n");
    scripts.add("term_size", "#!/bin/sh\nstty size <&1\n");

    SessionTerminal terminal(40, 100);
    PathResolver resolver;
    ProcessExecutor executor(resolver);

    {
        std::ostringstream out;
        std::ostringstream err;
        const std::vector<std::string> argv{"tty_check"};
        const auto result = executor.execute(argv, out, err, 0, OutputTerminals{.out = terminal.fd(), .err = -1});

        assert(result.ok());
        assert(out.str() == "out-tty\n");
        assert(err.str() == "err-pipe\n");
    }

    {
        std::ostringstream out;
        std::ostringstream err;
        const std::vector<std::string> argv{"tty_check"};
        assert(executor.execute(argv, out, err).ok());
        assert(out.str() == "out-pipe\n");
        assert(err.str() == "err-pipe\n");
    }

    {
        std::ostringstream out;
        std::ostringstream err;
        const std::vector<std::string> argv{"term_size"};
        const auto result = executor.execute(argv, out, err, 0, OutputTerminals{.out = terminal.fd(), .err = terminal.fd()});

        assert(result.ok());
        assert(out.str() == "40 100\n");
    }
}

void test_terminal_output_counts_toward_ceiling() {
    ScriptDir scripts;
    scripts.add("chatty", "#!/bin/sh\nwhile :; do echo 0123456789abcdef0123456789abcdef; done\n");

    SessionTerminal terminal(24, 80);
    PathResolver resolver;
    ProcessExecutor executor(resolver, 1024);

    std::ostringstream out;
    std::ostringstream err;
    const std::vector<std::string> argv{"chatty"};
    const auto result = executor.execute(argv, out, err, 0, OutputTerminals{.out = terminal.fd(), .err = -1});

    assert(result.cause() == ErrorKind::OutputLimitExceeded);
    assert(out.str().size() == 1024);
}

void test_background_grandchild_does_not_hold_the_command() {
    ScriptDir scripts;
    scripts.add("leave_sleeper", "#!/bin/sh\nsleep 5 &\necho started\n");

    PathResolver resolver;
    ProcessExecutor executor(resolver);

    std::ostringstream out;
    std::ostringstream err;
    const std::vector<std::string> argv{"leave_sleeper"};
    const auto started = std::chrono::steady_clock::now();
    const auto result = executor.execute(argv, out, err);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    assert(result.ok());
    assert(out.str() == "started\n");
    assert(elapsed < std::chrono::seconds(3));
}

void test_empty_argv_is_rejected() {
    PathResolver resolver;
    ProcessExecutor executor(resolver);

    std::ostringstream out;
    std::ostringstream err;
    bool threw = false;
    try {
        (void)executor.execute({}, out, err);
    } catch (const std::invalid_argument &) {
        threw = true;
    }

    assert(threw);
}

} // namespace

int main() {
    test_forwards_both_streams();
    test_reports_exit_status();
    test_command_not_found_is_distinct();
    test_exec_failure_is_spawn_failure();
    test_output_ceiling_kills_verbose_child();
    test_output_at_ceiling_succeeds();
    test_reads_input_fd_and_runs_paths();
    test_signals_map_to_128_plus_signal();
    test_unrunnable_paths_are_spawn_failures();
    test_terminal_streams_reach_the_child_as_terminals();
    test_terminal_output_counts_toward_ceiling();
    test_background_grandchild_does_not_hold_the_command();
    test_empty_argv_is_rejected();

    return 0;
}
