#include "app/shell_app.hpp"

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <unistd.h>

#include <readline/readline.h>

#include "logging/logger.hpp"

namespace guardsh {

namespace {

// Sent by stop_signal_watcher() to release the watcher from sigwait().
constexpr int kWatcherStopSignal = SIGUSR2;

} // namespace

ShellApp *ShellApp::active_ = nullptr;

ShellApp::ShellApp(const Settings &settings)
    : settings_(settings),
      supervisor_(settings_.policy, settings_.supervisor),
      path_resolver_(),
      history_manager_(),
      builtin_registry_(path_resolver_, history_manager_, supervisor_),
      completion_engine_(builtin_registry_, path_resolver_, supervisor_.policy()),
      tokenizer_() {}

ShellApp::~ShellApp() { stop_signal_watcher(); }

int ShellApp::run() {
    std::cout << std::unitbuf;
    std::cerr << std::unitbuf;

    open_wake_pipe();
    start_signal_watcher();

    rl_catch_signals = 0;
    completion_engine_.install();
    history_manager_.initialize(settings_.history_file, settings_.history_size);

    GUARDSH_INFO("session started (config: {})",
                 settings_.config_file ? settings_.config_file->string() : std::string("<defaults>"));

    while (shutdown_signal_.load() == 0) {
        const auto input = read_line();
        if (!input) {
            if (shutdown_signal_.load() == 0) {
                std::cout << std::endl;
            }
            break;
        }

        history_manager_.record_input(*input);
        execute_line(*input, std::cout, std::cerr);

        if (builtin_registry_.exit_requested()) {
            break;
        }
    }

    const auto terminated = supervisor_.terminate_all();
    history_manager_.save();
    stop_signal_watcher();

    if (const int signal_number = shutdown_signal_.load(); signal_number != 0) {
        std::cout << std::endl;
        GUARDSH_INFO("session ended by signal {}", signal_number);
        Logger::instance().flush();
        return 128 + signal_number;
    }

    GUARDSH_INFO("session ended, {} process(es) terminated on exit", terminated);
    return builtin_registry_.exit_code();
}

// Reads one line with readline's callback interface so a signal noted by the
// watcher can end the wait without leaving the terminal in raw mode.
std::optional<std::string> ShellApp::read_line() {
    drain_wake_pipe();
    interrupt_pending_.store(false);

    pending_line_.reset();
    line_ready_ = false;
    active_ = this;
    rl_callback_handler_install(prompt().c_str(), &ShellApp::handle_line);

    while (!line_ready_ && shutdown_signal_.load() == 0) {
        std::array<pollfd, 2> fds{
            pollfd{.fd = STDIN_FILENO, .events = POLLIN, .revents = 0},
            pollfd{.fd = wake_read_.get(), .events = POLLIN, .revents = 0},
        };

        if (::poll(fds.data(), fds.size(), -1) == -1) {
            if (errno == EINTR) {
                continue;
            }
            const int error = errno;
            rl_callback_handler_remove();
            active_ = nullptr;
            throw std::system_error(error, std::generic_category(), "poll on stdin failed");
        }

        if ((fds[1].revents & POLLIN) != 0) {
            drain_wake_pipe();
            if (interrupt_pending_.exchange(false)) {
                discard_current_line();
            }
            continue;
        }

        if ((fds[0].revents & POLLNVAL) != 0) {
            // stdin was closed under us; treat it as end of input.
            rl_callback_handler_remove();
            line_ready_ = true;
            break;
        }

        if ((fds[0].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
            rl_callback_read_char();
        }
    }

    // handle_line() already removed the handler once a line arrived.
    if (!line_ready_) {
        rl_callback_handler_remove();
    }
    active_ = nullptr;
    return std::move(pending_line_);
}

void ShellApp::handle_line(char *line) {
    rl_callback_handler_remove();

    if (active_ == nullptr) {
        std::free(line);
        return;
    }

    active_->line_ready_ = true;
    if (line != nullptr) {
        active_->pending_line_ = std::string(line);
        std::free(line);
    }
}

void ShellApp::discard_current_line() {
    rl_crlf();
    rl_replace_line("", 0);
    rl_on_new_line();
    rl_redisplay();
}

void ShellApp::open_wake_pipe() {
    if (wake_read_.valid()) {
        return;
    }

    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC | O_NONBLOCK) == -1) {
        throw std::system_error(errno, std::generic_category(), "pipe2 failed");
    }

    wake_read_.reset(fds[0]);
    wake_write_.reset(fds[1]);
}

void ShellApp::wake_main_thread() noexcept {
    const char byte = 1;
    // A full pipe already guarantees a wake-up.
    [[maybe_unused]] const ssize_t written = ::write(wake_write_.get(), &byte, 1);
}

void ShellApp::drain_wake_pipe() noexcept {
    std::array<char, 64> buffer{};
    while (::read(wake_read_.get(), buffer.data(), buffer.size()) > 0) {
    }
}

int ShellApp::execute_line(const std::string &input, std::ostream &out, std::ostream &err) {
    const auto tokens = tokenizer_.tokenize(input);
    if (tokens.empty()) {
        return 0;
    }

    const std::string &command = tokens.front();
    if (builtin_registry_.is_builtin(command)) {
        const std::vector<std::string> args(tokens.begin() + 1, tokens.end());
        return builtin_registry_.execute(command, args, out, err);
    }

    CommandRequest request;
    request.argv = tokens;

    const ExecutionResult result = supervisor_.run(request);
    GUARDSH_DEBUG("{} -> {} (exit {}, {} ms)", command, to_string(result.outcome), result.exit_code,
                  result.duration.count());

    if (!result.stdout_text.empty()) {
        out << result.stdout_text << '\n';
    }
    if (!result.stderr_text.empty()) {
        err << result.stderr_text << '\n';
    }

    if (result.outcome == Outcome::Timeout) {
        err << "[timed out]" << '\n';
    } else if (result.outcome == Outcome::Terminated) {
        err << "[terminated]" << '\n';
    }
    if (result.truncated) {
        err << "[output truncated]" << '\n';
    }

    return result.exit_code;
}

void ShellApp::start_signal_watcher() {
    if (signal_watcher_.joinable()) {
        return;
    }

    sigemptyset(&watched_signals_);
    sigaddset(&watched_signals_, SIGINT);
    sigaddset(&watched_signals_, SIGTERM);
    sigaddset(&watched_signals_, SIGHUP);
    sigaddset(&watched_signals_, kWatcherStopSignal);

    // Blocked here so every later thread inherits the mask and only the watcher sees them.
    const int rc = ::pthread_sigmask(SIG_BLOCK, &watched_signals_, nullptr);
    if (rc != 0) {
        throw std::system_error(rc, std::generic_category(), "pthread_sigmask failed");
    }

    signal_watcher_ = std::thread([this] { watch_signals(); });
}

void ShellApp::stop_signal_watcher() {
    if (!signal_watcher_.joinable()) {
        return;
    }

    ::pthread_kill(signal_watcher_.native_handle(), kWatcherStopSignal);
    signal_watcher_.join();
}

void ShellApp::watch_signals() {
    while (true) {
        int signal_number = 0;
        if (::sigwait(&watched_signals_, &signal_number) != 0) {
            continue;
        }

        switch (signal_number) {
        case kWatcherStopSignal:
            return;

        case SIGINT: {
            std::size_t count = 0;
            for (const auto &handle : supervisor_.running()) {
                if (supervisor_.terminate(handle.id)) {
                    ++count;
                }
            }
            if (count > 0) {
                GUARDSH_INFO("interrupt: terminated {} running command(s)", count);
            } else {
                interrupt_pending_.store(true);
                wake_main_thread();
            }
            break;
        }

        case SIGTERM:
        case SIGHUP: {
            const auto count = supervisor_.terminate_all();
            GUARDSH_INFO("received signal {}, terminated {} process(es), shutting down", signal_number, count);
            int expected = 0;
            shutdown_signal_.compare_exchange_strong(expected, signal_number);
            wake_main_thread();
            break;
        }

        default:
            break;
        }
    }
}

std::string ShellApp::prompt() {
    std::error_code ec;
    const auto cwd = std::filesystem::current_path(ec);
    return "guardsh:" + (ec ? std::string("?") : cwd.string()) + "$ ";
}

} // namespace guardsh
