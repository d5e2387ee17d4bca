#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <readline/history.h>
#include <unistd.h>

#include "history/history_manager.hpp"

using dimsh::HistoryManager;

namespace {

namespace fs = std::filesystem;

std::string make_temp_file(std::string_view initial = "") {
    std::string pattern = "/tmp/dimsh_history_manager_XXXXXX";
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    const int fd = mkstemp(buffer.data());
    assert(fd != -1);
    close(fd);

    if (!initial.empty()) {
        std::ofstream file(buffer.data());
        assert(file.is_open());
        file << initial;
    }

    return buffer.data();
}

std::string slurp(const std::string &path) {
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void reset_history() {
    using_history();
    clear_history();
}

void test_load_and_save_with_history_file() {
    const std::string histfile = make_temp_file("echo old\n");

    reset_history();

    HistoryManager manager(histfile);
    assert(!manager.loaded());
    manager.load();
    assert(manager.loaded());
    assert(manager.history_file() == histfile);

    assert(history_length == 1);
    assert(std::string(history_get(history_base)->line) == "echo old");

    manager.record_input("echo new");
    manager.save();

    const auto content = slurp(histfile);
    assert(content.find("echo old") != std::string::npos);
    assert(content.find("echo new") != std::string::npos);

    fs::remove(histfile);
}

void test_save_requires_load_and_file() {
    const std::string histfile = make_temp_file("untouched\n");

    reset_history();
    add_history("echo unsaved");

    HistoryManager not_loaded(histfile);
    not_loaded.save();
    assert(slurp(histfile) == "untouched\n");

    HistoryManager without_file;
    without_file.load();
    without_file.save();

    HistoryManager missing_file("/no/such/directory/dimsh-history");
    missing_file.load();
    missing_file.save();

    fs::remove(histfile);
}

void test_record_input_deduplicates_consecutive_commands() {
    reset_history();
    HistoryManager manager;

    manager.record_input("");
    assert(history_length == 0);

    manager.record_input("echo first");
    assert(history_length == 1);

    manager.record_input("echo first");
    assert(history_length == 1);

    manager.record_input("echo second");
    assert(history_length == 2);

    manager.record_input("echo first");
    assert(history_length == 3);
}

void test_print_variants() {
    const std::string read_file = make_temp_file("echo a\necho b\n");

    reset_history();
    HistoryManager manager(read_file);
    manager.load();
    assert(history_length == 2);

    std::stringstream out;
    manager.print(out, 1);
    assert(out.str() == "    2  echo b\n");

    std::stringstream out_zero;
    manager.print(out_zero, 0);
    assert(out_zero.str().empty());

    std::stringstream out_all;
    manager.print(out_all, std::nullopt);
    assert(out_all.str() == "    1  echo a\n    2  echo b\n");

    std::stringstream out_large;
    manager.print(out_large, 100);
    assert(out_large.str() == out_all.str());

    fs::remove(read_file);
}

} // namespace

int main() {
    test_load_and_save_with_history_file();
    test_save_requires_load_and_file();
    test_record_input_deduplicates_consecutive_commands();
    test_print_variants();

    return 0;
}
