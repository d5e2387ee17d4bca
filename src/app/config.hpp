#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>

namespace dimsh {

// Settings read from the environment once at start-up.
struct Config {
    std::size_t output_limit;
    std::size_t max_pending_source;
    // Empty disables persistent history.
    std::string history_file;
};

[[nodiscard]] Config default_config();

// Malformed values are reported to warnings and replaced by their defaults.
[[nodiscard]] Config load_config(std::ostream &warnings);

} // namespace dimsh
