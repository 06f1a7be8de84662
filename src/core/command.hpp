#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace guardsh {

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitGeneralFailure = 1;
inline constexpr int kExitTimeout = 124;
inline constexpr int kExitPermissionDenied = 126;
inline constexpr int kExitNotFound = 127;

struct CommandRequest {
    std::vector<std::string> argv;
    std::optional<std::filesystem::path> working_directory;
    std::optional<std::chrono::seconds> timeout;

    [[nodiscard]] bool empty() const noexcept { return argv.empty(); }
    [[nodiscard]] const std::string &program() const { return argv.front(); }
};

enum class Outcome {
    Completed,
    PolicyDenied,
    BuiltinDeferred,
    NotFound,
    PermissionDenied,
    Timeout,
    Terminated,
    SpawnFailure,
};

[[nodiscard]] std::string_view to_string(Outcome outcome) noexcept;

struct ExecutionResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code{kExitSuccess};
    bool timed_out{false};
    bool truncated{false};
    Outcome outcome{Outcome::Completed};
    std::chrono::milliseconds duration{0};

    [[nodiscard]] bool succeeded() const noexcept { return outcome == Outcome::Completed && exit_code == 0; }
};

} // namespace guardsh
