#include "core/parser.hpp"

#include <algorithm>
#include <format>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "core/shell_state.hpp"

namespace dimsh {

namespace {

// Commands nested deeper than this are rejected before the stack runs out.
constexpr std::size_t kMaxNestingDepth = 1000;

constexpr std::string_view kReservedWords[] = {"if", "then", "elif", "else", "fi", "while", "until", "do", "done", "for", "in", "{", "}", "!"};

struct SyntaxError {
    ParseError error;
};

[[noreturn]] void fail_incomplete(std::string message) {
    throw SyntaxError{ParseError{.kind = ParseError::Kind::Incomplete, .message = std::move(message)}};
}

[[noreturn]] void fail_invalid(std::string message) {
    throw SyntaxError{ParseError{.kind = ParseError::Kind::Invalid, .message = std::move(message)}};
}

[[nodiscard]] std::optional<std::string_view> reserved_word(const Token &token) {
    if (token.kind != TokenKind::Word) {
        return std::nullopt;
    }

    for (const auto word : kReservedWords) {
        if (token.word.is_plain(word)) {
            return word;
        }
    }

    return std::nullopt;
}

[[nodiscard]] std::string describe(const Token &token) {
    switch (token.kind) {
    case TokenKind::Word: {
        std::string text;
        for (const auto &part : token.word.parts) {
            text += part.kind == WordPart::Kind::Parameter ? "$" + part.text : part.text;
        }
        return "`" + text + "'";
    }
    case TokenKind::Newline:
        return "newline";
    case TokenKind::Semicolon:
        return "`;'";
    case TokenKind::AndIf:
        return "`&&'";
    case TokenKind::OrIf:
        return "`||'";
    case TokenKind::Redirect:
        return "redirection";
    case TokenKind::End:
        return "end of input";
    }

    return "token";
}

// NAME=value as the leading part of a word.
[[nodiscard]] std::optional<Assignment> as_assignment(const Word &word) {
    if (word.parts.empty()) {
        return std::nullopt;
    }

    const auto &first = word.parts.front();
    if (first.kind != WordPart::Kind::Literal || first.quoted) {
        return std::nullopt;
    }

    const auto equals = first.text.find('=');
    if (equals == std::string::npos || !is_valid_variable_name(std::string_view(first.text).substr(0, equals))) {
        return std::nullopt;
    }

    Assignment assignment{.name = first.text.substr(0, equals), .value = {}};
    if (equals + 1 < first.text.size()) {
        assignment.value.parts.push_back(
            WordPart{.kind = WordPart::Kind::Literal, .text = first.text.substr(equals + 1), .quoted = false});
    }
    assignment.value.parts.insert(assignment.value.parts.end(), word.parts.begin() + 1, word.parts.end());
    return assignment;
}

class ParserState {
  public:
    explicit ParserState(std::span<const Token> tokens) : tokens_(tokens) {}

    Program parse_program() {
        Program program;
        program.commands = parse_list({});

        if (peek().kind != TokenKind::End) {
            fail_invalid("syntax error near unexpected token " + describe(peek()));
        }

        return program;
    }

  private:
    std::span<const Token> tokens_;
    std::size_t pos_{0};
    std::size_t depth_{0};

    [[nodiscard]] const Token &peek() const {
        static const Token end{.kind = TokenKind::End};
        return pos_ < tokens_.size() ? tokens_[pos_] : end;
    }

    const Token &advance() {
        const Token &token = peek();
        if (pos_ < tokens_.size()) {
            ++pos_;
        }
        return token;
    }

    [[nodiscard]] bool at_reserved(std::string_view word) const {
        const auto reserved = reserved_word(peek());
        return reserved.has_value() && *reserved == word;
    }

    void skip_newlines() {
        while (peek().kind == TokenKind::Newline) {
            advance();
        }
    }

    void expect_reserved(std::string_view word) {
        if (peek().kind == TokenKind::End) {
            fail_incomplete(std::format("unexpected end of input (expected `{}')", word));
        }

        if (!at_reserved(word)) {
            fail_invalid(std::format("syntax error near unexpected token {} (expected `{}')", describe(peek()), word));
        }

        advance();
    }

    CommandList parse_list(std::initializer_list<std::string_view> terminators) {
        CommandList list;

        while (true) {
            skip_newlines();

            if (peek().kind == TokenKind::End) {
                if (terminators.size() != 0) {
                    fail_incomplete(std::format("unexpected end of input (expected `{}')", *terminators.begin()));
                }
                break;
            }

            const auto reserved = reserved_word(peek());
            if (reserved.has_value() && std::ranges::find(terminators, *reserved) != terminators.end()) {
                break;
            }

            list.push_back(parse_and_or());

            const auto kind = peek().kind;
            if (kind == TokenKind::Semicolon || kind == TokenKind::Newline) {
                advance();
                continue;
            }

            if (kind == TokenKind::End) {
                continue;
            }

            const auto next = reserved_word(peek());
            if (!next.has_value() || std::ranges::find(terminators, *next) == terminators.end()) {
                fail_invalid("syntax error near unexpected token " + describe(peek()));
            }
        }

        return list;
    }

    AndOrList parse_and_or() {
        AndOrList list;
        ListOp op = ListOp::Always;

        while (true) {
            AndOrLink link{.op = op, .negated = false, .command = nullptr};
            while (at_reserved("!")) {
                advance();
                link.negated = !link.negated;
            }

            link.command = std::make_unique<Command>(parse_command());
            list.links.push_back(std::move(link));

            const auto kind = peek().kind;
            if (kind != TokenKind::AndIf && kind != TokenKind::OrIf) {
                break;
            }

            op = kind == TokenKind::AndIf ? ListOp::And : ListOp::Or;
            advance();
            skip_newlines();

            if (peek().kind == TokenKind::End) {
                fail_incomplete(std::format("unexpected end of input after {}", op == ListOp::And ? "`&&'" : "`||'"));
            }
        }

        return list;
    }

    Command parse_command() {
        if (depth_ == kMaxNestingDepth) {
            fail_invalid(std::format("syntax error: commands nested more than {} deep", kMaxNestingDepth));
        }
        ++depth_;

        const auto reserved = reserved_word(peek());
        Command command;

        if (!reserved.has_value()) {
            command.node = parse_simple();
        } else if (*reserved == "if") {
            command.node = parse_if();
        } else if (*reserved == "while" || *reserved == "until") {
            command.node = parse_loop();
        } else if (*reserved == "for") {
            command.node = parse_for();
        } else if (*reserved == "{") {
            command.node = parse_brace_group();
        } else {
            fail_invalid("syntax error near unexpected token " + describe(peek()));
        }

        if (reserved.has_value() && peek().kind == TokenKind::Redirect) {
            fail_invalid("redirections on compound commands are not supported");
        }

        --depth_;
        return command;
    }

    SimpleCommand parse_simple() {
        SimpleCommand command;

        while (true) {
            const Token &token = peek();

            if (token.kind == TokenKind::Word) {
                if (command.words.empty()) {
                    if (auto assignment = as_assignment(token.word); assignment.has_value()) {
                        command.assignments.push_back(std::move(*assignment));
                        advance();
                        continue;
                    }
                }

                command.words.push_back(token.word);
                advance();
                continue;
            }

            if (token.kind == TokenKind::Redirect) {
                const RedirectionOp op = token.redirect;
                advance();

                if (peek().kind != TokenKind::Word) {
                    fail_invalid("syntax error near unexpected token " + describe(peek()) + ": redirection missing target file");
                }

                command.redirections.push_back(RedirectionSpec{.op = op, .target = advance().word});
                continue;
            }

            break;
        }

        if (command.words.empty() && command.assignments.empty() && command.redirections.empty()) {
            fail_invalid("syntax error near unexpected token " + describe(peek()));
        }

        return command;
    }

    CommandList parse_required_list(std::initializer_list<std::string_view> terminators) {
        auto list = parse_list(terminators);
        if (list.empty()) {
            fail_invalid("syntax error near unexpected token " + describe(peek()));
        }
        return list;
    }

    IfClause parse_if() {
        IfClause clause;
        advance();

        IfBranch first;
        first.condition = parse_required_list({"then"});
        expect_reserved("then");
        first.body = parse_required_list({"elif", "else", "fi"});
        clause.branches.push_back(std::move(first));

        while (at_reserved("elif")) {
            advance();
            IfBranch branch;
            branch.condition = parse_required_list({"then"});
            expect_reserved("then");
            branch.body = parse_required_list({"elif", "else", "fi"});
            clause.branches.push_back(std::move(branch));
        }

        if (at_reserved("else")) {
            advance();
            clause.else_body = parse_required_list({"fi"});
        }

        expect_reserved("fi");
        return clause;
    }

    LoopClause parse_loop() {
        LoopClause clause;
        clause.until = at_reserved("until");
        advance();

        clause.condition = parse_required_list({"do"});
        expect_reserved("do");
        clause.body = parse_required_list({"done"});
        expect_reserved("done");
        return clause;
    }

    ForClause parse_for() {
        ForClause clause;
        advance();

        const Token &name = peek();
        if (name.kind == TokenKind::End) {
            fail_incomplete("unexpected end of input (expected loop variable)");
        }

        if (name.kind != TokenKind::Word || name.word.parts.size() != 1 || name.word.parts.front().quoted ||
            name.word.parts.front().kind != WordPart::Kind::Literal ||
            !is_valid_variable_name(name.word.parts.front().text)) {
            fail_invalid("syntax error: invalid loop variable " + describe(name));
        }
        clause.variable = name.word.parts.front().text;
        advance();

        skip_newlines();
        if (peek().kind == TokenKind::Word && peek().word.is_plain("in")) {
            advance();

            std::vector<Word> items;
            while (peek().kind == TokenKind::Word) {
                items.push_back(advance().word);
            }

            if (peek().kind == TokenKind::End) {
                fail_incomplete("unexpected end of input (expected `do')");
            }

            if (peek().kind != TokenKind::Semicolon && peek().kind != TokenKind::Newline) {
                fail_invalid("syntax error near unexpected token " + describe(peek()));
            }
            advance();
            clause.items = std::move(items);
        } else if (peek().kind == TokenKind::Semicolon) {
            advance();
        }

        skip_newlines();
        expect_reserved("do");
        clause.body = parse_required_list({"done"});
        expect_reserved("done");
        return clause;
    }

    BraceGroup parse_brace_group() {
        BraceGroup group;
        advance();
        group.body = parse_required_list({"}"});
        expect_reserved("}");
        return group;
    }
};

} // namespace

std::expected<Program, ParseError> Parser::parse(std::span<const Token> tokens) const {
    try {
        ParserState state(tokens);
        return state.parse_program();
    } catch (SyntaxError &error) {
        return std::unexpected(std::move(error.error));
    }
}

std::expected<Program, ParseError> Parser::parse(std::string_view source) const {
    auto tokens = tokenizer_.tokenize(source);
    if (!tokens.has_value()) {
        return std::unexpected(std::move(tokens.error()));
    }

    return parse(std::span<const Token>(*tokens));
}

std::span<const std::string_view> reserved_words() noexcept {
    return kReservedWords;
}

} // namespace dimsh
