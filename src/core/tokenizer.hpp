#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "core/command.hpp"

namespace dimsh {

struct ParseError {
    enum class Kind {
        // The text is a valid prefix of a longer construct.
        Incomplete,
        Invalid,
    };

    Kind kind;
    std::string message;

    [[nodiscard]] bool incomplete() const noexcept { return kind == Kind::Incomplete; }
};

enum class TokenKind {
    Word,
    Newline,
    Semicolon,
    AndIf,
    OrIf,
    Redirect,
    End,
};

struct Token {
    TokenKind kind;
    Word word{};
    RedirectionOp redirect{RedirectionOp::StdoutTruncate};
};

class Tokenizer {
  public:
    [[nodiscard]] std::expected<std::vector<Token>, ParseError> tokenize(std::string_view input) const;
};

} // namespace dimsh
