#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include <sys/types.h>

namespace guardsh {

using ProcessId = std::uint64_t;

struct ProcessHandle {
    ProcessId id{0};
    pid_t pid{-1};
    pid_t process_group{-1};
    std::chrono::steady_clock::time_point started_at{};
    std::chrono::seconds timeout{0};
    // Set by terminate_one/terminate_all; shared with the supervisor waiting on the process.
    std::shared_ptr<std::atomic<bool>> terminated{std::make_shared<std::atomic<bool>>(false)};

    [[nodiscard]] bool externally_terminated() const noexcept { return terminated && terminated->load(); }
};

class ProcessRegistry {
  public:
    static constexpr std::chrono::milliseconds kGracePeriod{500};

    explicit ProcessRegistry(std::chrono::milliseconds grace_period = kGracePeriod) noexcept;

    ProcessRegistry(const ProcessRegistry &) = delete;
    ProcessRegistry &operator=(const ProcessRegistry &) = delete;

    // False when the id is already present or the registry has been closed by terminate_all().
    [[nodiscard]] bool register_process(const ProcessHandle &handle);
    bool unregister(ProcessId id);

    [[nodiscard]] std::vector<ProcessId> list_all() const;
    [[nodiscard]] std::vector<ProcessHandle> snapshot() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool closed() const;

    bool terminate_one(ProcessId id);
    std::size_t terminate_all();

    [[nodiscard]] std::chrono::milliseconds grace_period() const noexcept { return grace_period_; }

  private:
    const std::chrono::milliseconds grace_period_;
    mutable std::mutex mutex_;
    std::unordered_map<ProcessId, ProcessHandle> entries_;
    bool closed_{false};
};

} // namespace guardsh
