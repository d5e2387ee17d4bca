#include "history/history_manager.hpp"

#include <algorithm>
#include <cstring>
#include <format>
#include <ostream>
#include <utility>

#include <readline/history.h>

namespace dimsh {

HistoryManager::HistoryManager(std::string history_file) : history_file_(std::move(history_file)) {}

void HistoryManager::load() {
    using_history();

    if (!history_file_.empty()) {
        // A missing file just means an empty history.
        (void)read_history(history_file_.c_str());
    }

    loaded_ = true;
}

void HistoryManager::save() const {
    if (!loaded_ || history_file_.empty()) {
        return;
    }

    (void)write_history(history_file_.c_str());
}

void HistoryManager::record_input(std::string_view input) const {
    if (input.empty()) {
        return;
    }

    const std::string line(input);
    if (history_length > 0) {
        const HIST_ENTRY *last_entry = history_get(history_base + history_length - 1);
        if (last_entry != nullptr && std::strcmp(line.c_str(), last_entry->line) == 0) {
            return;
        }
    }

    add_history(line.c_str());
}

void HistoryManager::print(std::ostream &out, std::optional<int> limit) const {
    const int count = std::clamp(limit.value_or(history_length), 0, history_length);

    for (int offset = history_length - count; offset < history_length; ++offset) {
        const HIST_ENTRY *entry = history_get(history_base + offset);
        if (entry != nullptr) {
            out << std::format("{:5}  {}\n", history_base + offset, entry->line);
        }
    }
}

} // namespace dimsh
