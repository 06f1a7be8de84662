#pragma once

#include <iosfwd>
#include <string>

namespace guardsh {

// Thin layer over readline's global history list, bounded and persisted to one file.
class HistoryManager {
  public:
    void initialize(const std::string &history_file, int max_entries);
    bool save() const;
    void record_input(const std::string &input) const;
    void clear() const;

    void print(std::ostream &out, int limit) const;
    [[nodiscard]] int length() const noexcept;

    [[nodiscard]] const std::string &file_path() const noexcept { return history_file_path_; }

  private:
    std::string history_file_path_;
    int max_entries_{0};
};

} // namespace guardsh
