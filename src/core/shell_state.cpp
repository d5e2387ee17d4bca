#include "core/shell_state.hpp"

#include <cctype>
#include <cstdlib>
#include <utility>

namespace dimsh {

ShellState::ShellState() : script_name_("dimsh") {}

ShellState::ShellState(std::string script_name, std::vector<std::string> positional)
    : script_name_(std::move(script_name)), positional_(std::move(positional)) {}

std::optional<std::string> ShellState::variable(std::string_view name) const {
    if (const auto it = variables_.find(name); it != variables_.end()) {
        return it->second;
    }

    const char *value = std::getenv(std::string(name).c_str());
    if (value != nullptr) {
        return std::string(value);
    }

    return std::nullopt;
}

void ShellState::set_variable(const std::string &name, const std::string &value) {
    variables_[name] = value;

    // Variables inherited from the environment stay exported.
    if (std::getenv(name.c_str()) != nullptr) {
        setenv(name.c_str(), value.c_str(), 1);
    }
}

void ShellState::export_variable(const std::string &name) {
    const auto value = variable(name);
    setenv(name.c_str(), value.value_or("").c_str(), 1);
}

bool is_valid_variable_name(std::string_view name) noexcept {
    if (name.empty()) {
        return false;
    }

    const auto first = static_cast<unsigned char>(name.front());
    if (std::isalpha(first) == 0 && name.front() != '_') {
        return false;
    }

    for (const char c : name) {
        if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '_') {
            return false;
        }
    }

    return true;
}

} // namespace dimsh
