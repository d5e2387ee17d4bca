#pragma once

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "core/command.hpp"

namespace dimsh {

struct Command;

enum class ListOp {
    Always,
    And,
    Or,
};

struct AndOrLink {
    ListOp op{ListOp::Always};
    bool negated{false};
    std::unique_ptr<Command> command;
};

// `a && b || c`: a chain of links evaluated left to right.
struct AndOrList {
    std::vector<AndOrLink> links;
};

using CommandList = std::vector<AndOrList>;

struct IfBranch {
    CommandList condition;
    CommandList body;
};

struct IfClause {
    std::vector<IfBranch> branches;
    std::optional<CommandList> else_body;
};

struct LoopClause {
    bool until{false};
    CommandList condition;
    CommandList body;
};

struct ForClause {
    std::string variable;
    std::optional<std::vector<Word>> items;
    CommandList body;
};

struct BraceGroup {
    CommandList body;
};

struct Command {
    std::variant<SimpleCommand, IfClause, LoopClause, ForClause, BraceGroup> node;
};

// Executable form of one unit of source text.
struct Program {
    CommandList commands;

    [[nodiscard]] bool empty() const noexcept { return commands.empty(); }
};

} // namespace dimsh
