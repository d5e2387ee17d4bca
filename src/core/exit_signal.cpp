#include "core/exit_signal.hpp"

#include <utility>

namespace dimsh {

ExitSignal::ExitSignal(Kind kind, ErrorKind cause, int status, std::string message)
    : kind_(kind), cause_(cause), status_(status), message_(std::move(message)) {}

ExitSignal ExitSignal::success() noexcept { return ExitSignal(Kind::Success, ErrorKind::None, 0, {}); }

ExitSignal ExitSignal::failure(ErrorKind cause, int status, std::string message) {
    return ExitSignal(Kind::Failure, cause, status > 0 ? status : 1, std::move(message));
}

ExitSignal ExitSignal::terminate(int status) noexcept {
    return ExitSignal(Kind::Terminate, ErrorKind::None, status & 0xff, {});
}

} // namespace dimsh
