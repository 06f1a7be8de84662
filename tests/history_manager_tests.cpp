#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <readline/history.h>
#include <unistd.h>

#include "history/history_manager.hpp"

using guardsh::HistoryManager;

namespace {

namespace fs = std::filesystem;

std::string make_temp_file(std::string_view initial = "") {
    std::string pattern = "/tmp/guardsh_history_manager_XXXXXX";
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
    unstifle_history();
    clear_history();
}

std::string last_entry() {
    const HIST_ENTRY *entry = history_get(history_base + history_length - 1);
    assert(entry != nullptr);
    return entry->line;
}

void test_initialize_and_save_with_history_file() {
    reset_history();

    const std::string histfile = make_temp_file("echo old\n");

    HistoryManager manager;
    manager.initialize(histfile, 100);

    assert(manager.file_path() == histfile);
    assert(manager.length() == 1);
    assert(last_entry() == "echo old");

    manager.record_input("ls -la");
    assert(manager.save());

    const auto content = slurp(histfile);
    assert(content.find("echo old") != std::string::npos);
    assert(content.find("ls -la") != std::string::npos);

    fs::remove(histfile);
}

void test_missing_history_file_is_not_an_error() {
    reset_history();

    const std::string dir = make_temp_file();
    fs::remove(dir);
    fs::create_directory(dir);
    const std::string histfile = (fs::path(dir) / "history").string();

    HistoryManager manager;
    manager.initialize(histfile, 100);
    assert(manager.length() == 0);

    manager.record_input("pwd");
    assert(manager.save());
    assert(fs::exists(histfile));

    HistoryManager unsaved;
    unsaved.initialize("", 100);
    assert(!unsaved.save());

    HistoryManager unwritable;
    unwritable.initialize("/definitely/no/such/dir/history", 100);
    assert(!unwritable.save());

    fs::remove_all(dir);
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

void test_history_is_bounded() {
    reset_history();

    HistoryManager manager;
    manager.initialize("", 3);

    for (int i = 0; i < 10; ++i) {
        manager.record_input("cmd " + std::to_string(i));
    }

    assert(manager.length() == 3);
    assert(last_entry() == "cmd 9");

    std::stringstream out;
    manager.print(out, 10);
    assert(out.str().find("cmd 6") == std::string::npos);
    assert(out.str().find("cmd 7") != std::string::npos);

    reset_history();
}

void test_print_and_clear() {
    reset_history();
    HistoryManager manager;

    manager.record_input("echo a");
    manager.record_input("echo b");

    std::stringstream last_one;
    manager.print(last_one, 1);
    assert(last_one.str().find("echo b") != std::string::npos);
    assert(last_one.str().find("echo a") == std::string::npos);

    std::stringstream none;
    manager.print(none, 0);
    assert(none.str().empty());

    std::stringstream all;
    manager.print(all, 100);
    assert(all.str().find("    1  echo a\n") != std::string::npos);
    assert(all.str().find("    2  echo b\n") != std::string::npos);

    manager.clear();
    assert(manager.length() == 0);

    std::stringstream cleared;
    manager.print(cleared, 100);
    assert(cleared.str().empty());
}

} // namespace

int main() {
    test_initialize_and_save_with_history_file();
    test_missing_history_file_is_not_an_error();
    test_record_input_deduplicates_consecutive_commands();
    test_history_is_bounded();
    test_print_and_clear();
    return 0;
}
