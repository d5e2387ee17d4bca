#pragma once

#include <expected>
#include <span>
#include <string_view>

#include "core/ast.hpp"
#include "core/tokenizer.hpp"

namespace dimsh {

class Parser {
  public:
    [[nodiscard]] std::expected<Program, ParseError> parse(std::span<const Token> tokens) const;
    [[nodiscard]] std::expected<Program, ParseError> parse(std::string_view source) const;

  private:
    Tokenizer tokenizer_;
};

// Words with grammatical meaning in command position.
[[nodiscard]] std::span<const std::string_view> reserved_words() noexcept;

} // namespace dimsh
