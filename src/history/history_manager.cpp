#include "history/history_manager.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <ostream>

#include <fmt/core.h>
#include <readline/history.h>

#include "logging/logger.hpp"

namespace guardsh {

void HistoryManager::initialize(const std::string &history_file, int max_entries) {
    using_history();

    history_file_path_ = history_file;
    max_entries_ = max_entries;
    if (max_entries_ > 0) {
        stifle_history(max_entries_);
    }

    if (history_file_path_.empty()) {
        return;
    }

    // A missing file on first start is expected.
    const int rc = read_history(history_file_path_.c_str());
    if (rc != 0 && rc != ENOENT) {
        GUARDSH_WARN("could not read history from {}: {}", history_file_path_, std::strerror(rc));
    }
}

bool HistoryManager::save() const {
    if (history_file_path_.empty()) {
        return false;
    }

    const int rc = write_history(history_file_path_.c_str());
    if (rc != 0) {
        GUARDSH_WARN("could not write history to {}: {}", history_file_path_, std::strerror(rc));
        return false;
    }

    return true;
}

void HistoryManager::record_input(const std::string &input) const {
    if (input.empty()) {
        return;
    }

    if (history_length > 0) {
        const HIST_ENTRY *last_entry = history_get(history_base + history_length - 1);
        if (last_entry != nullptr && std::strcmp(input.c_str(), last_entry->line) == 0) {
            return;
        }
    }

    add_history(input.c_str());
}

void HistoryManager::clear() const { clear_history(); }

int HistoryManager::length() const noexcept { return history_length; }

void HistoryManager::print(std::ostream &out, int limit) const {
    const int normalized_limit = std::clamp(limit, 0, history_length);
    const int first = history_length - normalized_limit;

    for (int offset = first; offset < history_length; ++offset) {
        const HIST_ENTRY *entry = history_get(history_base + offset);
        if (entry != nullptr) {
            out << fmt::format("{:5}  {}\n", history_base + offset, entry->line);
        }
    }
}

} // namespace guardsh
