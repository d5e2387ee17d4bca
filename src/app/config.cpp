#include "app/config.hpp"

#include <charconv>
#include <cstdlib>
#include <format>
#include <optional>
#include <ostream>
#include <string_view>
#include <system_error>

#include "execution/process_executor.hpp"
#include "interpreter/interpreter.hpp"

namespace dimsh {

namespace {

constexpr std::string_view kHistoryFileName = ".dimsh_history";

[[nodiscard]] std::optional<std::string_view> environment_value(const char *name) {
    const char *value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string_view(value);
}

[[nodiscard]] std::size_t size_setting(const char *name, std::size_t fallback, std::ostream &warnings) {
    const auto text = environment_value(name);
    if (!text.has_value()) {
        return fallback;
    }

    std::size_t value = 0;
    const auto [end, ec] = std::from_chars(text->data(), text->data() + text->size(), value);
    if (ec != std::errc() || end != text->data() + text->size() || value == 0) {
        warnings << std::format("dimsh: ignoring {}='{}': expected a positive byte count", name, *text) << std::endl;
        return fallback;
    }

    return value;
}

[[nodiscard]] std::string history_file_setting() {
    if (const auto histfile = environment_value("HISTFILE"); histfile.has_value()) {
        return std::string(*histfile);
    }

    if (const auto home = environment_value("HOME"); home.has_value()) {
        return std::format("{}/{}", *home, kHistoryFileName);
    }

    return {};
}

} // namespace

Config default_config() {
    return Config{
        .output_limit = kDefaultOutputLimit,
        .max_pending_source = kDefaultMaxPendingSource,
        .history_file = {},
    };
}

Config load_config(std::ostream &warnings) {
    return Config{
        .output_limit = size_setting("DIMSH_OUTPUT_LIMIT", kDefaultOutputLimit, warnings),
        .max_pending_source = size_setting("DIMSH_MAX_PENDING", kDefaultMaxPendingSource, warnings),
        .history_file = history_file_setting(),
    };
}

} // namespace dimsh
