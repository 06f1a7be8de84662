#include "execution/process_supervisor.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <limits>
#include <string>
#include <system_error>
#include <utility>

#include <poll.h>
#include <unistd.h>

#include <fmt/core.h>

#include "logging/logger.hpp"
#include "platform/process_tree.hpp"

namespace guardsh {

namespace fs = std::filesystem;
using std::chrono::steady_clock;

namespace {

constexpr auto kPollSlice = std::chrono::milliseconds(20);
constexpr auto kFinalDrainBudget = std::chrono::milliseconds(50);
// Raw capture keeps this many times the sanitizer cap so trimming still sees real content.
constexpr std::size_t kCaptureFactor = 4;

[[nodiscard]] std::size_t capture_limit(std::size_t max_bytes) noexcept {
    constexpr std::size_t kMax = std::numeric_limits<std::size_t>::max();
    return max_bytes > kMax / kCaptureFactor ? kMax : max_bytes * kCaptureFactor;
}

// Only a leader that died from the group signal counts as terminated; one that
// exited on its own, or handled SIGTERM and chose a status, keeps that status.
[[nodiscard]] bool killed_by_group_signal(int exit_code) noexcept {
    return exit_code == 128 + SIGTERM || exit_code == 128 + SIGKILL;
}

[[nodiscard]] ExecutionResult failure_result(Outcome outcome, int exit_code, std::string message) {
    ExecutionResult result;
    result.outcome = outcome;
    result.exit_code = exit_code;
    result.stderr_text = std::move(message);
    return result;
}

[[nodiscard]] ExecutionResult spawn_failure_result(const platform::SpawnError &error) {
    switch (error.kind) {
    case platform::SpawnErrorKind::NotFound:
        return failure_result(Outcome::NotFound, kExitNotFound, fmt::format("command not found: {}", error.message));
    case platform::SpawnErrorKind::PermissionDenied:
        return failure_result(
            Outcome::PermissionDenied, kExitPermissionDenied, fmt::format("permission denied: {}", error.message));
    case platform::SpawnErrorKind::Other:
        break;
    }

    return failure_result(Outcome::SpawnFailure, kExitGeneralFailure, fmt::format("execution failed: {}", error.message));
}

// Removes the handle from the registry on every exit path out of execute().
class RegistrationGuard {
  public:
    RegistrationGuard(ProcessRegistry &registry, const ProcessHandle &handle) : registry_(registry), handle_(handle) {}

    ~RegistrationGuard() {
        if (!registry_.unregister(handle_.id) && !handle_.externally_terminated()) {
            GUARDSH_ERROR("registry inconsistency: process {} (pid {}) was missing at unregister", handle_.id, handle_.pid);
        }
    }

    RegistrationGuard(const RegistrationGuard &) = delete;
    RegistrationGuard &operator=(const RegistrationGuard &) = delete;

  private:
    ProcessRegistry &registry_;
    const ProcessHandle &handle_;
};

} // namespace

struct ProcessSupervisor::Capture {
    std::string stdout_text;
    std::string stderr_text;
    std::size_t limit{0};
    bool overflowed{false};

    void append(std::string &target, const char *data, std::size_t size) {
        const std::size_t room = limit > target.size() ? limit - target.size() : 0;
        if (size > room) {
            overflowed = true;
            size = room;
        }
        target.append(data, size);
    }

    // Reads whatever is ready within `timeout`. Closes a pipe at EOF.
    void pump(platform::ChildProcess &child, std::chrono::milliseconds timeout) {
        std::array<pollfd, 2> fds{};
        std::array<platform::UniqueFd *, 2> owners{};
        std::array<std::string *, 2> targets{};
        nfds_t count = 0;

        if (child.stdout_fd.valid()) {
            fds[count] = pollfd{.fd = child.stdout_fd.get(), .events = POLLIN, .revents = 0};
            owners[count] = &child.stdout_fd;
            targets[count] = &stdout_text;
            ++count;
        }
        if (child.stderr_fd.valid()) {
            fds[count] = pollfd{.fd = child.stderr_fd.get(), .events = POLLIN, .revents = 0};
            owners[count] = &child.stderr_fd;
            targets[count] = &stderr_text;
            ++count;
        }

        const int ready = ::poll(fds.data(), count, static_cast<int>(timeout.count()));
        if (ready <= 0) {
            return;
        }

        std::array<char, 4096> buffer{};
        for (nfds_t i = 0; i < count; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }

            const ssize_t received = ::read(fds[i].fd, buffer.data(), buffer.size());
            if (received > 0) {
                append(*targets[i], buffer.data(), static_cast<std::size_t>(received));
            } else if (received == 0 || errno != EINTR) {
                owners[i]->reset();
            }
        }
    }

    [[nodiscard]] bool pipes_open(const platform::ChildProcess &child) const noexcept {
        return child.stdout_fd.valid() || child.stderr_fd.valid();
    }

    // Reads until both pipes reach EOF or `budget` runs out; a member that
    // escaped the group may keep a pipe open indefinitely.
    void drain(platform::ChildProcess &child, std::chrono::milliseconds budget) {
        const auto deadline = steady_clock::now() + budget;
        while (pipes_open(child) && steady_clock::now() < deadline) {
            pump(child, std::chrono::milliseconds(5));
        }
    }
};

ProcessSupervisor::ProcessSupervisor(ExecutionPolicy policy, SupervisorOptions options)
    : guard_(std::move(policy)), sanitizer_(options.max_output_bytes), registry_(options.grace_period) {}

ProcessSupervisor::~ProcessSupervisor() {
    try {
        terminate_all();
    } catch (const std::exception &ex) {
        GUARDSH_ERROR("shutdown of supervised processes failed: {}", ex.what());
    }
}

ExecutionResult ProcessSupervisor::run(const CommandRequest &request) {
    const auto started = steady_clock::now();
    ExecutionResult result = execute(request);
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(steady_clock::now() - started);
    return result;
}

bool ProcessSupervisor::terminate(ProcessId id) { return registry_.terminate_one(id); }

std::size_t ProcessSupervisor::terminate_all() { return registry_.terminate_all(); }

std::vector<ProcessHandle> ProcessSupervisor::running() const { return registry_.snapshot(); }

std::chrono::seconds ProcessSupervisor::resolve_timeout(const CommandRequest &request) const {
    if (request.timeout && request.timeout->count() > 0) {
        return *request.timeout;
    }

    return guard_.policy().timeout_for(request.program());
}

fs::path ProcessSupervisor::resolve_working_directory(const CommandRequest &request) {
    std::error_code ec;
    if (request.working_directory && fs::is_directory(*request.working_directory, ec) && !ec) {
        return *request.working_directory;
    }

    return fs::current_path();
}

ExecutionResult ProcessSupervisor::execute(const CommandRequest &request) {
    if (request.empty()) {
        return failure_result(Outcome::SpawnFailure, kExitGeneralFailure, "empty command");
    }

    const std::string &program = request.program();
    switch (guard_.evaluate(program)) {
    case Verdict::Deny:
        return failure_result(
            Outcome::PolicyDenied, kExitGeneralFailure, fmt::format("command not allowed: {}", program));
    case Verdict::BuiltinDefer:
        return failure_result(
            Outcome::BuiltinDeferred, kExitGeneralFailure, fmt::format("{}: handled by the shell", program));
    case Verdict::Allow:
        break;
    }

    const auto timeout = resolve_timeout(request);

    std::expected<platform::ChildProcess, platform::SpawnError> spawned;
    try {
        spawned = platform::spawn_in_new_group(
            platform::SpawnSpec{.argv = request.argv, .working_directory = resolve_working_directory(request)});
    } catch (const std::system_error &ex) {
        spawned = std::unexpected(platform::SpawnError{
            .kind = platform::SpawnErrorKind::Other, .error_number = ex.code().value(), .message = ex.what()});
    }

    if (!spawned) {
        GUARDSH_WARN("spawn of '{}' failed: {}", program, spawned.error().message);
        return spawn_failure_result(spawned.error());
    }

    platform::ChildProcess &child = *spawned;
    ProcessHandle handle{
        .id = next_id_.fetch_add(1),
        .pid = child.pid,
        .process_group = child.process_group,
        .started_at = steady_clock::now(),
        .timeout = timeout,
    };

    if (!registry_.register_process(handle)) {
        GUARDSH_WARN("refusing '{}' (pid {}): supervisor is shutting down", program, child.pid);
        (void)platform::terminate_tree(child.process_group, registry_.grace_period(), child.pid);
        ExecutionResult result =
            failure_result(Outcome::Terminated, kExitTimeout, fmt::format("{}: terminated during shutdown", program));
        result.timed_out = true;
        return result;
    }

    RegistrationGuard registration(registry_, handle);
    GUARDSH_DEBUG("process {} started: '{}' pid {} timeout {}s", handle.id, program, child.pid, timeout.count());

    Capture capture;
    capture.limit = capture_limit(sanitizer_.max_bytes());

    const auto deadline = handle.started_at + timeout;
    std::optional<int> exit_code;

    try {
        while (!exit_code) {
            const auto now = steady_clock::now();
            if (now >= deadline) {
                break;
            }

            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            capture.pump(child, std::min(remaining, std::chrono::milliseconds(kPollSlice)));
            exit_code = platform::try_reap(child.pid);
        }
    } catch (const std::system_error &ex) {
        GUARDSH_ERROR("lost track of '{}' (pid {}): {}", program, child.pid, ex.what());
        (void)platform::terminate_tree(child.process_group, registry_.grace_period());
        return failure_result(Outcome::SpawnFailure, kExitGeneralFailure, fmt::format("execution failed: {}", ex.what()));
    }

    ExecutionResult result;

    if (!exit_code) {
        GUARDSH_WARN("'{}' (pid {}) timed out after {}s", program, child.pid, timeout.count());
        (void)platform::terminate_tree(child.process_group, registry_.grace_period(), child.pid);

        capture.drain(child, kFinalDrainBudget);
        package_output(capture, result, fmt::format("command timed out after {} seconds", timeout.count()));

        result.outcome = Outcome::Timeout;
        result.exit_code = kExitTimeout;
        result.timed_out = true;
        return result;
    }

    capture.drain(child, kFinalDrainBudget);

    // Anything left in the group outlived its leader; it does not get to outlive the command.
    if (platform::group_alive(child.process_group)) {
        GUARDSH_DEBUG("reaping leftover members of process group {}", child.process_group);
        (void)platform::terminate_tree(child.process_group, registry_.grace_period());
    }

    package_output(capture, result);

    if (handle.externally_terminated() && killed_by_group_signal(*exit_code)) {
        GUARDSH_INFO("'{}' (pid {}) was terminated on request", program, child.pid);
        result.outcome = Outcome::Terminated;
        result.exit_code = kExitTimeout;
        result.timed_out = true;
        return result;
    }

    result.outcome = Outcome::Completed;
    result.exit_code = *exit_code;
    return result;
}

void ProcessSupervisor::package_output(const Capture &capture, ExecutionResult &result,
                                       std::string_view stderr_trailer) const {
    auto out = sanitizer_.sanitize(capture.stdout_text);

    // The trailer goes through the sanitizer with the captured text so the cap still holds.
    auto err = stderr_trailer.empty()
                   ? sanitizer_.sanitize(capture.stderr_text)
                   : sanitizer_.sanitize(capture.stderr_text + "\n" + std::string(stderr_trailer));

    if (capture.overflowed && !out.truncated && !err.truncated) {
        // Discarded bytes were mostly whitespace; still flag the cut visibly.
        out.text.append(OutputSanitizer::kTruncationMarker);
        out.truncated = true;
    }

    result.stdout_text = std::move(out.text);
    result.stderr_text = std::move(err.text);
    result.truncated = out.truncated || err.truncated;
}

} // namespace guardsh
