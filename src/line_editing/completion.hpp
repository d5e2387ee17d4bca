#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace dimsh {

class BuiltinRegistry;
class PathResolver;

// Tab completion of the command word: builtins, PATH executables and the
// keywords that open a compound command. Only one engine is installed in
// readline at a time.
class CompletionEngine {
  public:
    CompletionEngine(const BuiltinRegistry &builtin_registry, const PathResolver &path_resolver);
    ~CompletionEngine();

    CompletionEngine(const CompletionEngine &) = delete;
    CompletionEngine &operator=(const CompletionEngine &) = delete;

    void install();

    [[nodiscard]] std::set<std::string> collect_matches(const std::string &prefix) const;

  private:
    const BuiltinRegistry &builtin_registry_;
    const PathResolver &path_resolver_;
    std::vector<std::string> candidates_;
    std::size_t next_candidate_{0};

    static CompletionEngine *instance_;

    static char **completion_callback(const char *text, int start, int end);
    static char *generator_callback(const char *text, int state);
};

} // namespace dimsh
