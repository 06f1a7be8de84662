#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include "execution/process_supervisor.hpp"
#include "logging/logger.hpp"
#include "policy/execution_policy.hpp"

namespace guardsh {

struct Settings {
    ExecutionPolicy policy{ExecutionPolicy::defaults()};
    SupervisorOptions supervisor;
    LogOptions logging;
    std::string history_file;
    int history_size{1000};
    std::optional<std::filesystem::path> config_file;

    // Built-in defaults, then the YAML file named by GUARDSH_CONFIG, then the
    // remaining GUARDSH_* / HISTFILE variables. Throws std::runtime_error on bad input.
    [[nodiscard]] static Settings load();
};

void apply_config_file(Settings &settings, const std::filesystem::path &path);
void apply_environment(Settings &settings);

} // namespace guardsh
