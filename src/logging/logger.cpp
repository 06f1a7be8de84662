#include "logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace guardsh {

namespace fs = std::filesystem;

Logger &Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const LogOptions &options) {
    std::vector<spdlog::sink_ptr> sinks;

    if (options.console) {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(spdlog::level::warn);
        console_sink->set_pattern("[%^%l%$] %v");
        sinks.push_back(std::move(console_sink));
    }

    std::string file_error;
    if (!options.file_path.empty()) {
        try {
            const fs::path parent = fs::path(options.file_path).parent_path();
            if (!parent.empty()) {
                std::error_code ec;
                fs::create_directories(parent, ec);
            }

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                options.file_path, options.max_file_size, options.max_files);
            file_sink->set_pattern("%Y-%m-%d %H:%M:%S - %n - %l - [%t] %v");
            sinks.push_back(std::move(file_sink));
        } catch (const spdlog::spdlog_ex &ex) {
            file_error = ex.what();
        }
    }

    logger_ = std::make_shared<spdlog::logger>("guardsh", sinks.begin(), sinks.end());
    logger_->set_level(options.level);
    logger_->flush_on(spdlog::level::warn);

    if (!file_error.empty()) {
        logger_->warn("log file {} unavailable, continuing without it: {}", options.file_path, file_error);
    }

    logger_->debug("logger initialized (file: {})", options.file_path.empty() ? "<none>" : options.file_path);
}

void Logger::set_level(spdlog::level::level_enum level) { sink().set_level(level); }

void Logger::flush() { sink().flush(); }

spdlog::logger &Logger::sink() const {
    if (logger_) {
        return *logger_;
    }

    return *spdlog::default_logger_raw();
}

spdlog::level::level_enum parse_log_level(const std::string &name) {
    std::string lowered(name);
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) { return std::tolower(c); });

    if (lowered == "warning") {
        lowered = "warn";
    }

    const auto level = spdlog::level::from_str(lowered);
    // from_str maps unknown names to off; only accept that for an explicit "off".
    if (level == spdlog::level::off && lowered != "off") {
        throw std::runtime_error("unknown log level: " + name);
    }

    return level;
}

} // namespace guardsh
