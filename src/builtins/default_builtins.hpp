#pragma once

#include <vector>

#include "builtins/builtin_registry.hpp"

namespace dimsh {

class HistoryManager;
class PathResolver;

// The shell builtins every session starts with, plus any extra handlers.
[[nodiscard]] BuiltinRegistry make_default_registry(
    const PathResolver &path_resolver,
    const HistoryManager &history_manager,
    std::vector<BuiltinRegistry::Entry> extra = {});

} // namespace dimsh
