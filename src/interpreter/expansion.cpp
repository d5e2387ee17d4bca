#include "interpreter/expansion.hpp"

#include <cctype>
#include <charconv>
#include <string>
#include <system_error>
#include <utility>

#include <unistd.h>

namespace dimsh {

namespace {

[[nodiscard]] bool is_field_separator(char c) { return c == ' ' || c == '\t' || c == '\n'; }

std::string join(const std::vector<std::string> &values) {
    std::string joined;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            joined.push_back(' ');
        }
        joined += values[i];
    }
    return joined;
}

// Accumulates the fields of one word.
class FieldBuilder {
  public:
    explicit FieldBuilder(std::vector<std::string> &fields) : fields_(fields) {}

    void append(std::string_view text, bool quoted) {
        current_ += text;
        started_ = started_ || quoted || !text.empty();
    }

    void append_split(std::string_view value) {
        std::size_t i = 0;
        while (i < value.size()) {
            if (is_field_separator(value[i])) {
                finish();
                while (i < value.size() && is_field_separator(value[i])) {
                    ++i;
                }
                continue;
            }

            const std::size_t start = i;
            while (i < value.size() && !is_field_separator(value[i])) {
                ++i;
            }
            append(value.substr(start, i - start), false);
        }
    }

    void finish() {
        if (started_) {
            fields_.push_back(std::move(current_));
        }
        current_.clear();
        started_ = false;
    }

  private:
    std::vector<std::string> &fields_;
    std::string current_;
    bool started_{false};
};

} // namespace

Expander::Expander(const ShellState &state) : state_(state) {}

std::vector<std::string> Expander::expand_words(std::span<const Word> words) const {
    std::vector<std::string> fields;
    for (const auto &word : words) {
        expand_into(word, fields);
    }
    return fields;
}

std::string Expander::expand_single(const Word &word) const {
    std::string result;

    for (std::size_t i = 0; i < word.parts.size(); ++i) {
        const auto &part = word.parts[i];
        if (part.kind == WordPart::Kind::Literal) {
            result += literal_text(word, i);
        } else if (part.text == "@") {
            result += join(state_.positional());
        } else {
            result += parameter_value(part.text);
        }
    }

    return result;
}

void Expander::expand_into(const Word &word, std::vector<std::string> &fields) const {
    FieldBuilder builder(fields);

    for (std::size_t i = 0; i < word.parts.size(); ++i) {
        const auto &part = word.parts[i];

        if (part.kind == WordPart::Kind::Literal) {
            builder.append(literal_text(word, i), part.quoted);
            continue;
        }

        if (part.text == "@" && part.quoted) {
            // "$@" keeps every positional parameter as its own field.
            const auto &positional = state_.positional();
            for (std::size_t j = 0; j < positional.size(); ++j) {
                if (j > 0) {
                    builder.finish();
                }
                builder.append(positional[j], true);
            }
            continue;
        }

        if (part.quoted) {
            builder.append(parameter_value(part.text), true);
        } else if (part.text == "@" || part.text == "*") {
            for (const auto &value : state_.positional()) {
                builder.append_split(value);
                builder.finish();
            }
        } else {
            builder.append_split(parameter_value(part.text));
        }
    }

    builder.finish();
}

std::string Expander::literal_text(const Word &word, std::size_t index) const {
    const auto &part = word.parts[index];

    if (index == 0 && !part.quoted && part.text.starts_with('~') && (part.text.size() == 1 || part.text[1] == '/')) {
        if (const auto home = state_.variable("HOME"); home.has_value()) {
            return *home + part.text.substr(1);
        }
    }

    return part.text;
}

std::string Expander::parameter_value(std::string_view name) const {
    if (name == "?") {
        return std::to_string(state_.last_status());
    }

    if (name == "#") {
        return std::to_string(state_.positional().size());
    }

    if (name == "$") {
        return std::to_string(getpid());
    }

    if (name == "@" || name == "*") {
        return join(state_.positional());
    }

    if (name == "0") {
        return state_.script_name();
    }

    if (std::isdigit(static_cast<unsigned char>(name.front())) != 0) {
        std::size_t index = 0;
        const auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), index);
        if (ec != std::errc{}) {
            return {};
        }

        const auto &positional = state_.positional();
        return index >= 1 && index <= positional.size() ? positional[index - 1] : std::string();
    }

    return state_.variable(name).value_or("");
}

} // namespace dimsh
