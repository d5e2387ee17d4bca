#include "line_editing/completion.hpp"

#include <cstring>
#include <set>
#include <string>
#include <string_view>

#include <readline/readline.h>

#include "builtins/builtin_registry.hpp"
#include "core/parser.hpp"
#include "core/path_resolver.hpp"

namespace dimsh {

namespace {

[[nodiscard]] bool opens_compound_command(std::string_view keyword) {
    return keyword == "if" || keyword == "while" || keyword == "until" || keyword == "for";
}

} // namespace

CompletionEngine *CompletionEngine::instance_ = nullptr;

CompletionEngine::CompletionEngine(const BuiltinRegistry &builtin_registry, const PathResolver &path_resolver)
    : builtin_registry_(builtin_registry), path_resolver_(path_resolver) {}

CompletionEngine::~CompletionEngine() {
    if (instance_ != this) {
        return;
    }

    instance_ = nullptr;
    rl_attempted_completion_function = nullptr;
}

void CompletionEngine::install() {
    instance_ = this;
    rl_attempted_completion_function = &CompletionEngine::completion_callback;
}

std::set<std::string> CompletionEngine::collect_matches(const std::string &prefix) const {
    std::set<std::string> matches = path_resolver_.executable_candidates(prefix);

    for (const auto &name : builtin_registry_.names()) {
        if (name.starts_with(prefix)) {
            matches.insert(name);
        }
    }

    for (const auto keyword : reserved_words()) {
        if (opens_compound_command(keyword) && keyword.starts_with(prefix)) {
            matches.emplace(keyword);
        }
    }

    return matches;
}

char **CompletionEngine::completion_callback(const char *text, int start, int /*end*/) {
    // Arguments fall back to readline's filename completion.
    if (instance_ == nullptr || start != 0) {
        return nullptr;
    }

    rl_attempted_completion_over = 1;
    return rl_completion_matches(text, &CompletionEngine::generator_callback);
}

// readline calls this with state 0 first, then keeps asking until it gets nullptr.
char *CompletionEngine::generator_callback(const char *text, int state) {
    CompletionEngine *engine = instance_;
    if (engine == nullptr) {
        return nullptr;
    }

    if (state == 0) {
        const auto matches = engine->collect_matches(text);
        engine->candidates_.assign(matches.begin(), matches.end());
        engine->next_candidate_ = 0;
    }

    if (engine->next_candidate_ >= engine->candidates_.size()) {
        return nullptr;
    }

    return ::strdup(engine->candidates_[engine->next_candidate_++].c_str());
}

} // namespace dimsh
