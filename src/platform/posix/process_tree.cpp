#include "platform/process_tree.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <system_error>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

namespace guardsh::platform {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(10);

enum class ChildStage : int {
    EnterDirectory = 1,
    Exec = 2,
};

struct ChildFailure {
    ChildStage stage;
    int error_number;
};

[[nodiscard]] SpawnError make_spawn_error(SpawnErrorKind kind, int error_number, std::string message) {
    return SpawnError{.kind = kind, .error_number = error_number, .message = std::move(message)};
}

[[nodiscard]] SpawnErrorKind classify_exec_errno(int error_number) noexcept {
    switch (error_number) {
    case ENOENT:
    case ENOTDIR:
        return SpawnErrorKind::NotFound;
    case EACCES:
    case EPERM:
        return SpawnErrorKind::PermissionDenied;
    default:
        return SpawnErrorKind::Other;
    }
}

[[noreturn]] void report_child_failure(int error_fd, ChildStage stage) noexcept {
    const ChildFailure failure{.stage = stage, .error_number = errno};
    [[maybe_unused]] const ssize_t written = ::write(error_fd, &failure, sizeof(failure));
    _exit(127);
}

// Runs between fork and exec: async-signal-safe calls only.
[[noreturn]] void run_child(
    char *const *argv, const char *working_directory, int null_fd, int stdout_fd, int stderr_fd, int error_fd) noexcept {
    ::setpgid(0, 0);

    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    ::sigprocmask(SIG_SETMASK, &empty_mask, nullptr);

    struct sigaction default_action {};
    default_action.sa_handler = SIG_DFL;
    sigemptyset(&default_action.sa_mask);
    for (int signal_number = 1; signal_number < NSIG; ++signal_number) {
        ::sigaction(signal_number, &default_action, nullptr);
    }

    if (::chdir(working_directory) == -1) {
        report_child_failure(error_fd, ChildStage::EnterDirectory);
    }

    ::dup2(null_fd, STDIN_FILENO);
    ::dup2(stdout_fd, STDOUT_FILENO);
    ::dup2(stderr_fd, STDERR_FILENO);

    ::execvp(argv[0], argv);
    report_child_failure(error_fd, ChildStage::Exec);
}

struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;
};

[[nodiscard]] bool make_pipe(Pipe &out) noexcept {
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC) == -1) {
        return false;
    }

    out.read_end.reset(fds[0]);
    out.write_end.reset(fds[1]);
    return true;
}

[[nodiscard]] std::optional<int> try_reap_quietly(pid_t pid) noexcept {
    try {
        return try_reap(pid);
    } catch (const std::system_error &) {
        // Already reaped elsewhere; nothing left to wait for.
        return -1;
    }
}

} // namespace

void UniqueFd::reset(int fd) noexcept {
    if (fd_ >= 0 && fd_ != fd) {
        ::close(fd_);
    }
    fd_ = fd;
}

std::expected<ChildProcess, SpawnError> spawn_in_new_group(const SpawnSpec &spec) {
    if (spec.argv.empty()) {
        return std::unexpected(make_spawn_error(SpawnErrorKind::Other, EINVAL, "empty argument vector"));
    }

    std::vector<char *> argv;
    argv.reserve(spec.argv.size() + 1);
    for (const auto &arg : spec.argv) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const std::string working_directory = spec.working_directory.string();

    Pipe stdout_pipe;
    Pipe stderr_pipe;
    Pipe error_pipe;
    if (!make_pipe(stdout_pipe) || !make_pipe(stderr_pipe) || !make_pipe(error_pipe)) {
        const int error_number = errno;
        return std::unexpected(make_spawn_error(
            SpawnErrorKind::Other, error_number, fmt::format("pipe failed: {}", std::strerror(error_number))));
    }

    UniqueFd null_fd(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (!null_fd.valid()) {
        const int error_number = errno;
        return std::unexpected(make_spawn_error(
            SpawnErrorKind::Other, error_number, fmt::format("cannot open /dev/null: {}", std::strerror(error_number))));
    }

    const pid_t pid = ::fork();
    if (pid == -1) {
        const int error_number = errno;
        return std::unexpected(make_spawn_error(
            SpawnErrorKind::Other, error_number, fmt::format("fork failed: {}", std::strerror(error_number))));
    }

    if (pid == 0) {
        run_child(argv.data(),
                  working_directory.c_str(),
                  null_fd.get(),
                  stdout_pipe.write_end.get(),
                  stderr_pipe.write_end.get(),
                  error_pipe.write_end.get());
    }

    // Both sides set the group so it exists before either proceeds.
    if (::setpgid(pid, pid) == -1 && errno != EACCES && errno != ESRCH) {
        const int error_number = errno;
        ::kill(pid, SIGKILL);
        (void)reap(pid);
        return std::unexpected(make_spawn_error(
            SpawnErrorKind::Other, error_number, fmt::format("setpgid failed: {}", std::strerror(error_number))));
    }

    stdout_pipe.write_end.reset();
    stderr_pipe.write_end.reset();
    error_pipe.write_end.reset();
    null_fd.reset();

    ChildFailure failure{};
    ssize_t received = 0;
    do {
        received = ::read(error_pipe.read_end.get(), &failure, sizeof(failure));
    } while (received == -1 && errno == EINTR);

    if (received == static_cast<ssize_t>(sizeof(failure))) {
        (void)reap(pid);

        if (failure.stage == ChildStage::EnterDirectory) {
            return std::unexpected(make_spawn_error(
                SpawnErrorKind::Other,
                failure.error_number,
                fmt::format("cannot enter {}: {}", working_directory, std::strerror(failure.error_number))));
        }

        return std::unexpected(make_spawn_error(
            classify_exec_errno(failure.error_number),
            failure.error_number,
            fmt::format("{}: {}", spec.argv.front(), std::strerror(failure.error_number))));
    }

    return ChildProcess{
        .pid = pid,
        .process_group = pid,
        .stdout_fd = std::move(stdout_pipe.read_end),
        .stderr_fd = std::move(stderr_pipe.read_end),
    };
}

std::optional<int> try_reap(pid_t pid) {
    int status = 0;
    pid_t result = 0;
    do {
        result = ::waitpid(pid, &status, WNOHANG);
    } while (result == -1 && errno == EINTR);

    if (result == -1) {
        throw std::system_error(errno, std::generic_category(), "waitpid failed");
    }

    if (result == 0) {
        return std::nullopt;
    }

    return wait_status_to_exit_code(status);
}

int reap(pid_t pid) {
    int status = 0;

    while (::waitpid(pid, &status, 0) == -1) {
        if (errno == EINTR) {
            continue;
        }

        throw std::system_error(errno, std::generic_category(), "waitpid failed");
    }

    return wait_status_to_exit_code(status);
}

bool signal_group(pid_t process_group, TerminationSignal signal) noexcept {
    if (process_group <= 0) {
        return false;
    }

    const int signal_number = signal == TerminationSignal::Graceful ? SIGTERM : SIGKILL;
    return ::killpg(process_group, signal_number) == 0;
}

bool group_alive(pid_t process_group) noexcept {
    if (process_group <= 0) {
        return false;
    }

    return ::killpg(process_group, 0) == 0 || errno == EPERM;
}

TerminationReport terminate_tree(pid_t process_group, std::chrono::milliseconds grace, pid_t leader) {
    TerminationReport report;

    if (!signal_group(process_group, TerminationSignal::Graceful)) {
        if (leader > 0) {
            report.leader_exit_code = try_reap_quietly(leader);
        }
        if (!group_alive(process_group)) {
            return report;
        }
    }

    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (leader > 0 && !report.leader_exit_code) {
            report.leader_exit_code = try_reap_quietly(leader);
        }

        if (!group_alive(process_group)) {
            return report;
        }

        std::this_thread::sleep_for(kPollInterval);
    }

    if (group_alive(process_group)) {
        report.escalated = signal_group(process_group, TerminationSignal::Forceful);
    }

    if (leader > 0 && !report.leader_exit_code) {
        try {
            report.leader_exit_code = reap(leader);
        } catch (const std::system_error &) {
            report.leader_exit_code = -1;
        }
    }

    return report;
}

int wait_status_to_exit_code(int status) noexcept {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }

    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }

    return 1;
}

} // namespace guardsh::platform
