#include "core/path_resolver.hpp"

#include <cstdlib>
#include <sstream>
#include <string>
#include <system_error>

namespace guardsh {

namespace fs = std::filesystem;

bool PathResolver::is_executable_file(const fs::path &path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || ec) {
        return false;
    }

    const auto perms = fs::status(path, ec).permissions();
    if (ec) {
        return false;
    }

    constexpr auto executable_bits = fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;
    return (perms & executable_bits) != fs::perms::none;
}

void PathResolver::for_each_path_executable(
    std::string_view prefix,
    const std::function<bool(std::string_view filename, const fs::path &full_path)> &callback) const {
    const char *path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return;
    }

    std::stringstream path_stream(path_env);
    std::string dir;

    while (std::getline(path_stream, dir, ':')) {
        if (dir.empty()) {
            continue;
        }

        std::error_code ec;
        for (const auto &entry : fs::directory_iterator(dir, ec)) {
            if (ec) {
                break;
            }

            const std::string filename = entry.path().filename().string();
            if (!filename.starts_with(prefix) || !is_executable_file(entry.path())) {
                continue;
            }

            if (callback(filename, entry.path())) {
                return;
            }
        }
    }
}

std::optional<fs::path> PathResolver::resolve(std::string_view program) const {
    if (program.empty()) {
        return std::nullopt;
    }

    if (program.find('/') != std::string_view::npos) {
        fs::path candidate(program);
        if (is_executable_file(candidate)) {
            return candidate;
        }
        return std::nullopt;
    }

    std::optional<fs::path> resolved;
    for_each_path_executable(program, [&](std::string_view filename, const fs::path &full_path) {
        if (filename == program) {
            resolved = full_path;
            return true;
        }

        return false;
    });

    return resolved;
}

std::set<std::string> PathResolver::executable_candidates(std::string_view prefix) const {
    std::set<std::string> candidates;

    for_each_path_executable(prefix, [&](std::string_view filename, const fs::path & /*full_path*/) {
        candidates.emplace(filename);
        return false;
    });

    return candidates;
}

} // namespace guardsh
