#include "core/tokenizer.hpp"

#include <cctype>
#include <string>
#include <utility>

namespace dimsh {

namespace {

[[nodiscard]] bool is_blank(char c) { return c == ' ' || c == '\t' || c == '\r'; }

[[nodiscard]] bool is_name_start(char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_'; }

[[nodiscard]] bool is_name_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_'; }

[[nodiscard]] bool is_special_parameter(char c) {
    return c == '?' || c == '#' || c == '@' || c == '*' || c == '$' || std::isdigit(static_cast<unsigned char>(c)) != 0;
}

class WordBuilder {
  public:
    void append(char c, bool quoted) {
        touched_ = true;
        if (!parts_.empty() && parts_.back().kind == WordPart::Kind::Literal && parts_.back().quoted == quoted) {
            parts_.back().text.push_back(c);
            return;
        }

        parts_.push_back(WordPart{.kind = WordPart::Kind::Literal, .text = std::string(1, c), .quoted = quoted});
    }

    void append_parameter(std::string name, bool quoted) {
        touched_ = true;
        parts_.push_back(WordPart{.kind = WordPart::Kind::Parameter, .text = std::move(name), .quoted = quoted});
    }

    // "" and '' still produce a (quoted, empty) word.
    void mark_quoted_empty() {
        touched_ = true;
        parts_.push_back(WordPart{.kind = WordPart::Kind::Literal, .text = {}, .quoted = true});
    }

    [[nodiscard]] bool empty() const noexcept { return !touched_; }

    Word take() {
        Word word{.parts = std::move(parts_)};
        parts_.clear();
        touched_ = false;
        return word;
    }

  private:
    std::vector<WordPart> parts_;
    bool touched_{false};
};

class Scanner {
  public:
    explicit Scanner(std::string_view input) : input_(input) {}

    std::expected<std::vector<Token>, ParseError> run() {
        while (pos_ < input_.size()) {
            const char current = input_[pos_];

            if (is_blank(current)) {
                flush_word();
                ++pos_;
                continue;
            }

            if (current == '\n') {
                flush_word();
                tokens_.push_back(Token{.kind = TokenKind::Newline});
                ++pos_;
                continue;
            }

            if (current == '#' && word_.empty()) {
                while (pos_ < input_.size() && input_[pos_] != '\n') {
                    ++pos_;
                }
                continue;
            }

            if (auto result = scan_operator(); !result.has_value()) {
                return std::unexpected(result.error());
            } else if (*result) {
                continue;
            }

            if (auto result = scan_word_char(); !result.has_value()) {
                return std::unexpected(result.error());
            }
        }

        flush_word();
        tokens_.push_back(Token{.kind = TokenKind::End});
        return std::move(tokens_);
    }

  private:
    std::string_view input_;
    std::size_t pos_{0};
    std::vector<Token> tokens_;
    WordBuilder word_;

    [[nodiscard]] static ParseError incomplete(std::string message) {
        return ParseError{.kind = ParseError::Kind::Incomplete, .message = std::move(message)};
    }

    [[nodiscard]] static ParseError invalid(std::string message) {
        return ParseError{.kind = ParseError::Kind::Invalid, .message = std::move(message)};
    }

    [[nodiscard]] bool peek_is(std::size_t offset, char c) const {
        return pos_ + offset < input_.size() && input_[pos_ + offset] == c;
    }

    void flush_word() {
        if (!word_.empty()) {
            tokens_.push_back(Token{.kind = TokenKind::Word, .word = word_.take()});
        }
    }

    void push_redirect(RedirectionOp op, std::size_t length) {
        flush_word();
        tokens_.push_back(Token{.kind = TokenKind::Redirect, .redirect = op});
        pos_ += length;
    }

    // Returns true when an operator was consumed.
    std::expected<bool, ParseError> scan_operator() {
        const char current = input_[pos_];

        if (word_.empty() && (current == '1' || current == '2') && peek_is(1, '>')) {
            const bool append = peek_is(2, '>');
            if (current == '1') {
                push_redirect(append ? RedirectionOp::StdoutAppend : RedirectionOp::StdoutTruncate, append ? 3 : 2);
            } else {
                push_redirect(append ? RedirectionOp::StderrAppend : RedirectionOp::StderrTruncate, append ? 3 : 2);
            }
            return true;
        }

        switch (current) {
        case ';':
            flush_word();
            tokens_.push_back(Token{.kind = TokenKind::Semicolon});
            ++pos_;
            return true;
        case '&':
            if (!tokens_.empty() && tokens_.back().kind == TokenKind::Redirect && word_.empty()) {
                return std::unexpected(invalid("syntax error near `&': descriptor duplication is not supported"));
            }
            if (!peek_is(1, '&')) {
                return std::unexpected(invalid("syntax error near `&': background jobs are not supported"));
            }
            flush_word();
            tokens_.push_back(Token{.kind = TokenKind::AndIf});
            pos_ += 2;
            return true;
        case '|':
            if (!peek_is(1, '|')) {
                return std::unexpected(invalid("syntax error near `|': pipelines are not supported"));
            }
            flush_word();
            tokens_.push_back(Token{.kind = TokenKind::OrIf});
            pos_ += 2;
            return true;
        case '(':
        case ')':
            return std::unexpected(invalid(std::string("syntax error near `") + current + "': subshells are not supported"));
        case '<':
            push_redirect(RedirectionOp::StdinRead, 1);
            return true;
        case '>':
            if (peek_is(1, '>')) {
                push_redirect(RedirectionOp::StdoutAppend, 2);
            } else {
                push_redirect(RedirectionOp::StdoutTruncate, 1);
            }
            return true;
        default:
            return false;
        }
    }

    std::expected<void, ParseError> scan_word_char() {
        const char current = input_[pos_];

        if (current == '\\') {
            // A continuation with nothing after it still needs the next line.
            if (pos_ + 1 >= input_.size() || (input_[pos_ + 1] == '\n' && pos_ + 2 >= input_.size())) {
                return std::unexpected(incomplete("unexpected end of input after `\\'"));
            }

            if (input_[pos_ + 1] != '\n') {
                word_.append(input_[pos_ + 1], true);
            }
            pos_ += 2;
            return {};
        }

        if (current == '\'') {
            const auto close = input_.find('\'', pos_ + 1);
            if (close == std::string_view::npos) {
                return std::unexpected(incomplete("unterminated single quote"));
            }

            if (close == pos_ + 1) {
                word_.mark_quoted_empty();
            }
            for (std::size_t i = pos_ + 1; i < close; ++i) {
                word_.append(input_[i], true);
            }
            pos_ = close + 1;
            return {};
        }

        if (current == '"') {
            return scan_double_quoted();
        }

        if (current == '`') {
            return std::unexpected(invalid("command substitution is not supported"));
        }

        if (current == '$') {
            return scan_parameter(false);
        }

        word_.append(current, false);
        ++pos_;
        return {};
    }

    std::expected<void, ParseError> scan_double_quoted() {
        ++pos_;
        bool produced = false;

        while (pos_ < input_.size()) {
            const char current = input_[pos_];

            if (current == '"') {
                if (!produced) {
                    word_.mark_quoted_empty();
                }
                ++pos_;
                return {};
            }

            if (current == '\\' && pos_ + 1 < input_.size()) {
                const char next = input_[pos_ + 1];
                if (next == '\n') {
                    pos_ += 2;
                    continue;
                }

                if (next != '$' && next != '`' && next != '"' && next != '\\') {
                    word_.append('\\', true);
                }
                word_.append(next, true);
                produced = true;
                pos_ += 2;
                continue;
            }

            if (current == '`') {
                return std::unexpected(invalid("command substitution is not supported"));
            }

            if (current == '$') {
                if (auto result = scan_parameter(true); !result.has_value()) {
                    return result;
                }
                produced = true;
                continue;
            }

            word_.append(current, true);
            produced = true;
            ++pos_;
        }

        return std::unexpected(incomplete("unterminated double quote"));
    }

    // pos_ is on the `$`.
    std::expected<void, ParseError> scan_parameter(bool quoted) {
        if (pos_ + 1 >= input_.size()) {
            word_.append('$', quoted);
            ++pos_;
            return {};
        }

        const char next = input_[pos_ + 1];

        if (next == '{') {
            const auto close = input_.find('}', pos_ + 2);
            if (close == std::string_view::npos) {
                return std::unexpected(incomplete("unterminated parameter expansion"));
            }

            std::string name(input_.substr(pos_ + 2, close - pos_ - 2));
            const bool special = name.size() == 1 && is_special_parameter(name.front());
            bool valid = !name.empty() && (special || is_name_start(name.front()));
            for (const char c : name) {
                valid = valid && (special || is_name_char(c));
            }
            if (!valid) {
                return std::unexpected(invalid("${" + name + "}: bad substitution"));
            }

            word_.append_parameter(std::move(name), quoted);
            pos_ = close + 1;
            return {};
        }

        if (next == '(') {
            return std::unexpected(invalid("command substitution is not supported"));
        }

        if (is_special_parameter(next)) {
            word_.append_parameter(std::string(1, next), quoted);
            pos_ += 2;
            return {};
        }

        if (is_name_start(next)) {
            std::size_t end = pos_ + 1;
            while (end < input_.size() && is_name_char(input_[end])) {
                ++end;
            }
            word_.append_parameter(std::string(input_.substr(pos_ + 1, end - pos_ - 1)), quoted);
            pos_ = end;
            return {};
        }

        word_.append('$', quoted);
        ++pos_;
        return {};
    }
};

} // namespace

std::expected<std::vector<Token>, ParseError> Tokenizer::tokenize(std::string_view input) const {
    Scanner scanner(input);
    return scanner.run();
}

} // namespace dimsh
