#include "execution/process_registry.hpp"

#include <algorithm>
#include <thread>

#include "logging/logger.hpp"
#include "platform/process_tree.hpp"

namespace guardsh {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(10);

} // namespace

ProcessRegistry::ProcessRegistry(std::chrono::milliseconds grace_period) noexcept : grace_period_(grace_period) {}

bool ProcessRegistry::register_process(const ProcessHandle &handle) {
    std::lock_guard lock(mutex_);
    if (closed_) {
        return false;
    }

    const auto [it, inserted] = entries_.try_emplace(handle.id, handle);
    if (!inserted) {
        GUARDSH_WARN("process {} is already registered (pid {})", handle.id, it->second.pid);
    }

    return inserted;
}

bool ProcessRegistry::unregister(ProcessId id) {
    std::lock_guard lock(mutex_);
    return entries_.erase(id) > 0;
}

std::vector<ProcessId> ProcessRegistry::list_all() const {
    std::lock_guard lock(mutex_);

    std::vector<ProcessId> ids;
    ids.reserve(entries_.size());
    for (const auto &[id, _] : entries_) {
        ids.push_back(id);
    }

    std::ranges::sort(ids);
    return ids;
}

std::vector<ProcessHandle> ProcessRegistry::snapshot() const {
    std::lock_guard lock(mutex_);

    std::vector<ProcessHandle> handles;
    handles.reserve(entries_.size());
    for (const auto &[_, handle] : entries_) {
        handles.push_back(handle);
    }

    std::ranges::sort(handles, {}, &ProcessHandle::id);
    return handles;
}

std::size_t ProcessRegistry::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

bool ProcessRegistry::closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

bool ProcessRegistry::terminate_one(ProcessId id) {
    ProcessHandle handle;
    {
        std::lock_guard lock(mutex_);
        const auto it = entries_.find(id);
        if (it == entries_.end()) {
            return false;
        }

        handle = it->second;
        handle.terminated->store(true);
    }

    GUARDSH_INFO("terminating process {} (pid {})", id, handle.pid);
    const auto report = platform::terminate_tree(handle.process_group, grace_period_);
    if (report.escalated) {
        GUARDSH_WARN("process {} (pid {}) ignored SIGTERM and was killed", id, handle.pid);
    }

    unregister(id);
    return true;
}

std::size_t ProcessRegistry::terminate_all() {
    std::vector<ProcessHandle> handles;
    {
        std::lock_guard lock(mutex_);
        closed_ = true;

        handles.reserve(entries_.size());
        for (const auto &[_, handle] : entries_) {
            handle.terminated->store(true);
            handles.push_back(handle);
        }
    }

    if (handles.empty()) {
        return 0;
    }

    GUARDSH_INFO("terminating {} supervised process(es)", handles.size());

    for (const auto &handle : handles) {
        if (!platform::signal_group(handle.process_group, platform::TerminationSignal::Graceful)) {
            GUARDSH_DEBUG("process group {} already gone", handle.process_group);
        }
    }

    const auto deadline = std::chrono::steady_clock::now() + grace_period_;
    auto any_alive = [&handles]() {
        return std::ranges::any_of(
            handles, [](const ProcessHandle &handle) { return platform::group_alive(handle.process_group); });
    };

    while (any_alive() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(kPollInterval);
    }

    for (const auto &handle : handles) {
        if (platform::group_alive(handle.process_group) &&
            platform::signal_group(handle.process_group, platform::TerminationSignal::Forceful)) {
            GUARDSH_WARN("process {} (pid {}) ignored SIGTERM and was killed", handle.id, handle.pid);
        }
    }

    {
        std::lock_guard lock(mutex_);
        entries_.clear();
    }

    return handles.size();
}

} // namespace guardsh
