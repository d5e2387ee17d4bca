#include "execution/redirection.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <ios>

#include <fcntl.h>
#include <unistd.h>

namespace dimsh {

namespace {

[[nodiscard]] std::ios::openmode open_mode_for(RedirectionOp op) {
    switch (op) {
    case RedirectionOp::StdoutAppend:
    case RedirectionOp::StderrAppend:
        return std::ios::out | std::ios::app;
    case RedirectionOp::StdinRead:
    case RedirectionOp::StdoutTruncate:
    case RedirectionOp::StderrTruncate:
        break;
    }

    return std::ios::out | std::ios::trunc;
}

} // namespace

RedirectionScope::RedirectionScope(std::span<const Redirection> redirections, const ExecContext &base)
    : out_(&base.out),
      err_(&base.err),
      input_fd_(base.input_fd),
      out_terminal_(base.out_terminal),
      err_terminal_(base.err_terminal) {
    for (const auto &redirection : redirections) {
        if (!apply_redirection(redirection)) {
            valid_ = false;
            break;
        }
    }

    if (valid_) {
        context_.emplace(ExecContext{.out = *out_,
                                     .err = *err_,
                                     .state = base.state,
                                     .input_fd = input_fd_,
                                     .out_terminal = out_terminal_,
                                     .err_terminal = err_terminal_});
    }
}

RedirectionScope::~RedirectionScope() {
    if (context_.has_value()) {
        context_->out.flush();
        context_->err.flush();
    }

    if (owned_input_fd_ != -1) {
        close(owned_input_fd_);
    }
}

bool RedirectionScope::apply_redirection(const Redirection &redirection) {
    if (redirection.op == RedirectionOp::StdinRead) {
        const int fd = open(redirection.target.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd == -1) {
            error_ = std::format("failed to open '{}': {}", redirection.target, std::strerror(errno));
            return false;
        }

        if (owned_input_fd_ != -1) {
            close(owned_input_fd_);
        }
        owned_input_fd_ = fd;
        input_fd_ = fd;
        return true;
    }

    errno = 0;
    auto file = std::make_unique<std::ofstream>(redirection.target, open_mode_for(redirection.op));
    if (!file->is_open()) {
        const int saved_errno = errno;
        error_ = std::format(
            "failed to open '{}': {}", redirection.target, saved_errno != 0 ? std::strerror(saved_errno) : "cannot open file");
        return false;
    }

    const bool to_stderr =
        redirection.op == RedirectionOp::StderrTruncate || redirection.op == RedirectionOp::StderrAppend;
    (to_stderr ? err_ : out_) = file.get();
    (to_stderr ? err_terminal_ : out_terminal_) = -1;
    files_.push_back(std::move(file));
    return true;
}

} // namespace dimsh
