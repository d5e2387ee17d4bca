#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace dimsh {

class HistoryManager;

// Source of interactive input lines. nullopt means end of input.
class LineReader {
  public:
    virtual ~LineReader() = default;

    [[nodiscard]] virtual std::optional<std::string> read_line(std::string_view prompt) = 0;
};

// Prompts on a stream and reads with std::getline; used without a terminal.
class StreamLineReader : public LineReader {
  public:
    StreamLineReader(std::istream &in, std::ostream &out);

    [[nodiscard]] std::optional<std::string> read_line(std::string_view prompt) override;

  private:
    std::istream &in_;
    std::ostream &out_;
};

// GNU Readline with history recording.
class ReadlineLineReader : public LineReader {
  public:
    ReadlineLineReader(const HistoryManager &history_manager, std::ostream &out);

    [[nodiscard]] std::optional<std::string> read_line(std::string_view prompt) override;

  private:
    const HistoryManager &history_manager_;
    std::ostream &out_;
};

} // namespace dimsh
