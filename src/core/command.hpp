#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace dimsh {

enum class RedirectionOp {
    StdinRead,
    StdoutTruncate,
    StdoutAppend,
    StderrTruncate,
    StderrAppend,
};

struct WordPart {
    enum class Kind {
        Literal,
        Parameter,
    };

    Kind kind;
    std::string text;
    bool quoted{false};
};

// One shell word before expansion.
struct Word {
    std::vector<WordPart> parts;

    [[nodiscard]] bool is_plain(std::string_view literal) const {
        return parts.size() == 1 && parts.front().kind == WordPart::Kind::Literal && !parts.front().quoted &&
               parts.front().text == literal;
    }
};

struct Redirection {
    RedirectionOp op;
    std::string target;
};

struct RedirectionSpec {
    RedirectionOp op;
    Word target;
};

struct Assignment {
    std::string name;
    Word value;
};

struct SimpleCommand {
    std::vector<Assignment> assignments;
    std::vector<Word> words;
    std::vector<RedirectionSpec> redirections;
};

} // namespace dimsh
