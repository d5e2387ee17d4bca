#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "core/command.hpp"
#include "core/shell_state.hpp"

namespace dimsh {

// Parameter and tilde expansion. Unquoted expansions are split on blanks.
class Expander {
  public:
    explicit Expander(const ShellState &state);

    [[nodiscard]] std::vector<std::string> expand_words(std::span<const Word> words) const;
    // No field splitting: assignment values and redirection targets.
    [[nodiscard]] std::string expand_single(const Word &word) const;

  private:
    const ShellState &state_;

    void expand_into(const Word &word, std::vector<std::string> &fields) const;
    [[nodiscard]] std::string parameter_value(std::string_view name) const;
    [[nodiscard]] std::string literal_text(const Word &word, std::size_t index) const;
};

} // namespace dimsh
