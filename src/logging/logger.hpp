#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace guardsh {

struct LogOptions {
    std::string file_path;
    spdlog::level::level_enum level{spdlog::level::info};
    std::size_t max_file_size{10 * 1024 * 1024};
    std::size_t max_files{5};
    bool console{true};
};

// Process-wide log sink. Until initialize() runs, messages go through
// spdlog's default logger; initialize() must happen before worker threads start.
class Logger {
  public:
    static Logger &instance();

    void initialize(const LogOptions &options);
    void set_level(spdlog::level::level_enum level);
    void flush();

    [[nodiscard]] bool initialized() const noexcept { return logger_ != nullptr; }

    template <typename... Args>
    void debug(fmt::format_string<Args...> format, Args &&...args) {
        sink().debug(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(fmt::format_string<Args...> format, Args &&...args) {
        sink().info(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(fmt::format_string<Args...> format, Args &&...args) {
        sink().warn(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(fmt::format_string<Args...> format, Args &&...args) {
        sink().error(format, std::forward<Args>(args)...);
    }

  private:
    Logger() = default;

    [[nodiscard]] spdlog::logger &sink() const;

    std::shared_ptr<spdlog::logger> logger_;
};

[[nodiscard]] spdlog::level::level_enum parse_log_level(const std::string &name);

} // namespace guardsh

#define GUARDSH_DEBUG(...) ::guardsh::Logger::instance().debug(__VA_ARGS__)
#define GUARDSH_INFO(...) ::guardsh::Logger::instance().info(__VA_ARGS__)
#define GUARDSH_WARN(...) ::guardsh::Logger::instance().warn(__VA_ARGS__)
#define GUARDSH_ERROR(...) ::guardsh::Logger::instance().error(__VA_ARGS__)
