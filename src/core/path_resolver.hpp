#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace guardsh {

class PathResolver {
  public:
    // Names containing '/' are checked as given; bare names are searched on PATH.
    [[nodiscard]] std::optional<std::filesystem::path> resolve(std::string_view program) const;
    [[nodiscard]] std::set<std::string> executable_candidates(std::string_view prefix) const;

    [[nodiscard]] static bool is_executable_file(const std::filesystem::path &path);

  private:
    void for_each_path_executable(
        std::string_view prefix,
        const std::function<bool(std::string_view filename, const std::filesystem::path &full_path)> &callback) const;
};

} // namespace guardsh
