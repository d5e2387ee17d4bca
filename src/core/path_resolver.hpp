#pragma once

#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace dimsh {

// Locates executables for the process layer, `type` and completion.
class PathResolver {
  public:
    // A name containing `/` is returned when it exists; anything else must be
    // an executable file found in PATH.
    [[nodiscard]] std::optional<std::string> resolve(std::string_view command) const;
    [[nodiscard]] std::set<std::string> executable_candidates(std::string_view prefix) const;

    [[nodiscard]] static bool is_executable_file(const std::string &path);

  private:
    void scan_path_executables(
        std::string_view prefix,
        const std::function<bool(std::string_view filename, std::string_view full_path)> &callback) const;
};

} // namespace dimsh
