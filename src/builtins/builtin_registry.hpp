#pragma once

#include <cstddef>
#include <functional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/exit_signal.hpp"
#include "core/shell_state.hpp"

namespace dimsh {

// args excludes the command name.
using BuiltinHandler = std::function<ExitSignal(ExecContext &ctx, std::span<const std::string> args)>;

// Immutable name -> handler table, built once per session.
class BuiltinRegistry {
  public:
    struct Entry {
        std::string name;
        BuiltinHandler handler;
    };

    BuiltinRegistry() = default;

    // Throws std::logic_error on an empty or duplicate name.
    explicit BuiltinRegistry(std::vector<Entry> entries);

    [[nodiscard]] const BuiltinHandler *lookup(std::string_view name) const;
    [[nodiscard]] bool is_builtin(std::string_view name) const;

    [[nodiscard]] std::set<std::string> names() const;
    [[nodiscard]] std::size_t size() const noexcept { return registry_.size(); }

  private:
    std::unordered_map<std::string, BuiltinHandler> registry_;
};

} // namespace dimsh
