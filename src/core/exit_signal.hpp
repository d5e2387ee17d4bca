#pragma once

#include <string>

namespace dimsh {

enum class ErrorKind {
    None,
    Builtin,
    CommandNotFound,
    NonZeroExit,
    OutputLimitExceeded,
    SpawnFailed,
    Redirection,
    ParseIncomplete,
    ParseInvalid,
    ScriptUnreadable,
    InputTooLong,
    Runtime,
};

// Outcome of running a command or a whole program. Only Terminate ends the session.
class ExitSignal {
  public:
    enum class Kind {
        Success,
        Failure,
        Terminate,
    };

    [[nodiscard]] static ExitSignal success() noexcept;
    [[nodiscard]] static ExitSignal failure(ErrorKind cause, int status, std::string message);
    [[nodiscard]] static ExitSignal terminate(int status) noexcept;

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] int status() const noexcept { return status_; }
    [[nodiscard]] ErrorKind cause() const noexcept { return cause_; }
    [[nodiscard]] const std::string &message() const noexcept { return message_; }

    [[nodiscard]] bool ok() const noexcept { return kind_ == Kind::Success; }
    [[nodiscard]] bool failed() const noexcept { return kind_ == Kind::Failure; }
    [[nodiscard]] bool is_termination() const noexcept { return kind_ == Kind::Terminate; }

  private:
    ExitSignal(Kind kind, ErrorKind cause, int status, std::string message);

    Kind kind_;
    ErrorKind cause_;
    int status_;
    std::string message_;
};

} // namespace dimsh
