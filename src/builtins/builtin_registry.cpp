#include "builtins/builtin_registry.hpp"

#include <stdexcept>
#include <utility>

namespace dimsh {

BuiltinRegistry::BuiltinRegistry(std::vector<Entry> entries) {
    registry_.reserve(entries.size());

    for (auto &entry : entries) {
        if (entry.name.empty()) {
            throw std::logic_error("builtin registered without a name");
        }

        if (!entry.handler) {
            throw std::logic_error("builtin '" + entry.name + "' registered without a handler");
        }

        const auto [it, inserted] = registry_.emplace(std::move(entry.name), std::move(entry.handler));
        if (!inserted) {
            throw std::logic_error("builtin '" + it->first + "' registered twice");
        }
    }
}

const BuiltinHandler *BuiltinRegistry::lookup(std::string_view name) const {
    const auto it = registry_.find(std::string(name));
    if (it == registry_.end()) {
        return nullptr;
    }

    return &it->second;
}

bool BuiltinRegistry::is_builtin(std::string_view name) const { return lookup(name) != nullptr; }

std::set<std::string> BuiltinRegistry::names() const {
    std::set<std::string> result;

    for (const auto &[name, _] : registry_) {
        result.insert(name);
    }

    return result;
}

} // namespace dimsh
