#include "line_editing/line_reader.hpp"

#include <cstdlib>
#include <istream>
#include <ostream>
#include <string>

#include <readline/readline.h>

#include "history/history_manager.hpp"

namespace dimsh {

StreamLineReader::StreamLineReader(std::istream &in, std::ostream &out) : in_(in), out_(out) {}

std::optional<std::string> StreamLineReader::read_line(std::string_view prompt) {
    out_ << prompt;
    out_.flush();

    std::string line;
    if (!std::getline(in_, line)) {
        return std::nullopt;
    }

    return line;
}

ReadlineLineReader::ReadlineLineReader(const HistoryManager &history_manager, std::ostream &out)
    : history_manager_(history_manager), out_(out) {}

std::optional<std::string> ReadlineLineReader::read_line(std::string_view prompt) {
    const std::string prompt_text(prompt);
    char *line = readline(prompt_text.c_str());
    if (line == nullptr) {
        out_ << std::endl;
        return std::nullopt;
    }

    std::string input(line);
    std::free(line);

    history_manager_.record_input(input);
    return input;
}

} // namespace dimsh
