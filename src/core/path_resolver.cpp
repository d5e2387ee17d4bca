#include "core/path_resolver.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace dimsh {

namespace fs = std::filesystem;

namespace {

// Empty PATH entries name the current directory.
[[nodiscard]] std::vector<std::string> path_directories() {
    std::vector<std::string> directories;

    const char *path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return directories;
    }

    const std::string_view path_list(path_env);
    std::size_t start = 0;
    while (true) {
        const auto colon = path_list.find(':', start);
        const auto end = colon == std::string_view::npos ? path_list.size() : colon;
        const auto dir = path_list.substr(start, end - start);
        directories.emplace_back(dir.empty() ? std::string_view(".") : dir);

        if (colon == std::string_view::npos) {
            break;
        }
        start = colon + 1;
    }

    return directories;
}

} // namespace

bool PathResolver::is_executable_file(const std::string &path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || ec) {
        return false;
    }

    return access(path.c_str(), X_OK) == 0;
}

void PathResolver::scan_path_executables(
    std::string_view prefix,
    const std::function<bool(std::string_view filename, std::string_view full_path)> &callback) const {
    for (const auto &dir : path_directories()) {
        std::error_code ec;
        for (const auto &entry : fs::directory_iterator(dir, ec)) {
            if (ec) {
                break;
            }

            const std::string filename = entry.path().filename().string();
            if (!filename.starts_with(prefix)) {
                continue;
            }

            const std::string full_path = entry.path().string();
            if (!is_executable_file(full_path)) {
                continue;
            }

            if (callback(filename, full_path)) {
                return;
            }
        }
    }
}

std::optional<std::string> PathResolver::resolve(std::string_view command) const {
    if (command.empty()) {
        return std::nullopt;
    }

    // Existing paths are returned even when they cannot run; exec reports why.
    if (command.find('/') != std::string_view::npos) {
        std::string path(command);
        std::error_code ec;
        if (fs::exists(path, ec)) {
            return path;
        }
        return std::nullopt;
    }

    for (const auto &dir : path_directories()) {
        const std::string candidate = (fs::path(dir) / command).string();
        if (is_executable_file(candidate)) {
            return candidate;
        }
    }

    return std::nullopt;
}

std::set<std::string> PathResolver::executable_candidates(std::string_view prefix) const {
    std::set<std::string> candidates;

    scan_path_executables(prefix, [&](std::string_view filename, std::string_view /*full_path*/) {
        candidates.emplace(filename);
        return false;
    });

    return candidates;
}

} // namespace dimsh
