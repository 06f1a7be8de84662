#pragma once

#include <atomic>
#include <iosfwd>
#include <optional>
#include <string>
#include <thread>

#include <signal.h>

#include "builtins/builtin_registry.hpp"
#include "config/settings.hpp"
#include "core/path_resolver.hpp"
#include "core/tokenizer.hpp"
#include "execution/process_supervisor.hpp"
#include "history/history_manager.hpp"
#include "line_editing/completion.hpp"
#include "platform/process_tree.hpp"

namespace guardsh {

class ShellApp {
  public:
    explicit ShellApp(const Settings &settings);
    ~ShellApp();

    ShellApp(const ShellApp &) = delete;
    ShellApp &operator=(const ShellApp &) = delete;

    // Returns the exit builtin's code, or 128 + signal when SIGTERM or SIGHUP ended the session.
    int run();

    // Runs one input line: a builtin in-process, anything else through the supervisor.
    int execute_line(const std::string &input, std::ostream &out, std::ostream &err);

    [[nodiscard]] ProcessSupervisor &supervisor() noexcept { return supervisor_; }
    [[nodiscard]] const BuiltinRegistry &builtins() const noexcept { return builtin_registry_; }

  private:
    Settings settings_;
    ProcessSupervisor supervisor_;
    PathResolver path_resolver_;
    HistoryManager history_manager_;
    BuiltinRegistry builtin_registry_;
    CompletionEngine completion_engine_;
    Tokenizer tokenizer_;

    sigset_t watched_signals_{};
    std::thread signal_watcher_;

    // The watcher thread never touches readline or history; it leaves a note
    // here and wakes the main thread through the pipe.
    platform::UniqueFd wake_read_;
    platform::UniqueFd wake_write_;
    std::atomic<int> shutdown_signal_{0};
    std::atomic<bool> interrupt_pending_{false};

    std::optional<std::string> pending_line_;
    bool line_ready_{false};

    static ShellApp *active_;
    static void handle_line(char *line);

    [[nodiscard]] std::optional<std::string> read_line();
    void open_wake_pipe();
    void wake_main_thread() noexcept;
    void drain_wake_pipe() noexcept;
    void discard_current_line();

    void start_signal_watcher();
    void stop_signal_watcher();
    void watch_signals();

    [[nodiscard]] static std::string prompt();
};

} // namespace guardsh
