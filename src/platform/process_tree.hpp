#pragma once

#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace guardsh::platform {

class UniqueFd {
  public:
    UniqueFd() noexcept = default;
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(UniqueFd &&other) noexcept : fd_(other.release()) {}
    UniqueFd &operator=(UniqueFd &&other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    UniqueFd(const UniqueFd &) = delete;
    UniqueFd &operator=(const UniqueFd &) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    int release() noexcept {
        const int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1) noexcept;

  private:
    int fd_{-1};
};

struct SpawnSpec {
    std::vector<std::string> argv;
    std::filesystem::path working_directory;
};

enum class SpawnErrorKind {
    NotFound,
    PermissionDenied,
    Other,
};

struct SpawnError {
    SpawnErrorKind kind;
    int error_number;
    std::string message;
};

// A running child that leads its own process group. The caller owns the
// pipe read ends and must eventually reap `pid`.
struct ChildProcess {
    pid_t pid{-1};
    pid_t process_group{-1};
    UniqueFd stdout_fd;
    UniqueFd stderr_fd;
};

enum class TerminationSignal {
    Graceful,
    Forceful,
};

struct TerminationReport {
    bool escalated{false};
    std::optional<int> leader_exit_code;
};

[[nodiscard]] std::expected<ChildProcess, SpawnError> spawn_in_new_group(const SpawnSpec &spec);

// Exit code once `pid` has exited, std::nullopt while it is still running.
// Throws std::system_error if `pid` is not a child of this process.
[[nodiscard]] std::optional<int> try_reap(pid_t pid);
int reap(pid_t pid);

bool signal_group(pid_t process_group, TerminationSignal signal) noexcept;
[[nodiscard]] bool group_alive(pid_t process_group) noexcept;

// Graceful signal to the whole group, up to `grace` for it to disappear, then a
// forceful signal if any member survives. When `leader` is given it is reaped
// along the way and its exit code reported.
TerminationReport terminate_tree(pid_t process_group, std::chrono::milliseconds grace, pid_t leader = -1);

[[nodiscard]] int wait_status_to_exit_code(int status) noexcept;

} // namespace guardsh::platform
