#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string_view>
#include <vector>

#include "core/command.hpp"
#include "execution/output_sanitizer.hpp"
#include "execution/process_registry.hpp"
#include "policy/policy_guard.hpp"

namespace guardsh {

struct SupervisorOptions {
    std::size_t max_output_bytes{OutputSanitizer::kDefaultMaxBytes};
    std::chrono::milliseconds grace_period{ProcessRegistry::kGracePeriod};
};

// Runs policy-approved commands in their own process groups with a deadline.
// run() may be called from any number of threads at once; the destructor
// terminates whatever is still running.
class ProcessSupervisor {
  public:
    explicit ProcessSupervisor(ExecutionPolicy policy, SupervisorOptions options = {});
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor &) = delete;
    ProcessSupervisor &operator=(const ProcessSupervisor &) = delete;

    [[nodiscard]] ExecutionResult run(const CommandRequest &request);

    bool terminate(ProcessId id);
    std::size_t terminate_all();
    [[nodiscard]] std::vector<ProcessHandle> running() const;

    [[nodiscard]] const PolicyGuard &policy() const noexcept { return guard_; }
    [[nodiscard]] ProcessRegistry &registry() noexcept { return registry_; }
    [[nodiscard]] const OutputSanitizer &sanitizer() const noexcept { return sanitizer_; }

  private:
    struct Capture;

    PolicyGuard guard_;
    OutputSanitizer sanitizer_;
    ProcessRegistry registry_;
    std::atomic<ProcessId> next_id_{1};

    [[nodiscard]] ExecutionResult execute(const CommandRequest &request);
    [[nodiscard]] std::chrono::seconds resolve_timeout(const CommandRequest &request) const;
    [[nodiscard]] static std::filesystem::path resolve_working_directory(const CommandRequest &request);

    void package_output(const Capture &capture, ExecutionResult &result, std::string_view stderr_trailer = {}) const;
};

} // namespace guardsh
