#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace dimsh {

// Readline history of interactive sessions, persisted to a file.
class HistoryManager {
  public:
    explicit HistoryManager(std::string history_file = {});

    void load();
    void save() const;
    void record_input(std::string_view input) const;

    void print(std::ostream &out, std::optional<int> limit) const;

    [[nodiscard]] const std::string &history_file() const noexcept { return history_file_; }
    [[nodiscard]] bool loaded() const noexcept { return loaded_; }

  private:
    std::string history_file_;
    bool loaded_{false};
};

} // namespace dimsh
