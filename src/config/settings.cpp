#include "config/settings.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <initializer_list>
#include <stdexcept>
#include <string_view>
#include <vector>

#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

namespace guardsh {

namespace fs = std::filesystem;

namespace {

[[nodiscard]] std::string home_directory() {
    const char *home = std::getenv("HOME");
    return home != nullptr ? std::string(home) : std::string();
}

[[nodiscard]] std::optional<std::string> env_value(const char *name) {
    const char *value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }

    return std::string(value);
}

template <typename T>
[[nodiscard]] T parse_positive(std::string_view name, std::string_view text) {
    T value{};
    const char *first = text.data();
    const char *last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);

    if (ec != std::errc{} || ptr != last || value <= 0) {
        throw std::runtime_error(fmt::format("{}: expected a positive integer, got '{}'", name, text));
    }

    return value;
}

void validate_keys(const YAML::Node &node, std::initializer_list<std::string_view> allowed, std::string_view context,
                   const fs::path &path) {
    if (!node.IsMap()) {
        throw std::runtime_error(fmt::format("{}: {} must be a mapping", path.string(), context));
    }

    for (const auto &pair : node) {
        const auto key = pair.first.as<std::string>();
        if (std::ranges::find(allowed, key) == allowed.end()) {
            const auto mark = pair.first.Mark();
            throw std::runtime_error(
                fmt::format("{}:{}: unknown field '{}' in {}", path.string(), mark.line + 1, key, context));
        }
    }
}

[[nodiscard]] std::vector<std::string> string_list(const YAML::Node &node, std::string_view context,
                                                   const fs::path &path) {
    if (!node.IsSequence()) {
        throw std::runtime_error(fmt::format("{}: {} must be a list", path.string(), context));
    }

    std::vector<std::string> names;
    for (const auto &item : node) {
        names.push_back(item.as<std::string>());
    }
    return names;
}

// Read as a signed value so that a negative entry is rejected instead of wrapping.
template <typename T>
[[nodiscard]] T positive_value(const YAML::Node &node, std::string_view context, const fs::path &path) {
    const auto value = node.as<long long>();
    if (value <= 0) {
        throw std::runtime_error(fmt::format("{}: {} must be positive", path.string(), context));
    }
    return static_cast<T>(value);
}

[[nodiscard]] std::chrono::seconds seconds_value(const YAML::Node &node, std::string_view context,
                                               const fs::path &path) {
    return std::chrono::seconds(positive_value<long long>(node, context, path));
}

void apply_policy_section(ExecutionPolicy &policy, const YAML::Node &node, const fs::path &path) {
    validate_keys(node, {"replace_defaults", "allow", "deny", "builtins", "timeouts"}, "policy", path);

    if (node["replace_defaults"] && node["replace_defaults"].as<bool>()) {
        const auto default_timeout = policy.default_timeout;
        policy = ExecutionPolicy{};
        policy.default_timeout = default_timeout;
    }

    if (node["allow"]) {
        for (const auto &name : string_list(node["allow"], "policy.allow", path)) {
            policy.allow(name);
        }
    }

    if (node["deny"]) {
        for (const auto &name : string_list(node["deny"], "policy.deny", path)) {
            policy.deny(name);
        }
    }

    if (node["builtins"]) {
        for (const auto &name : string_list(node["builtins"], "policy.builtins", path)) {
            policy.add_builtin(name);
        }
    }

    if (const auto timeouts = node["timeouts"]) {
        if (!timeouts.IsMap()) {
            throw std::runtime_error(fmt::format("{}: policy.timeouts must be a mapping", path.string()));
        }

        for (const auto &pair : timeouts) {
            const auto name = pair.first.as<std::string>();
            policy.set_timeout(name, seconds_value(pair.second, fmt::format("policy.timeouts.{}", name), path));
        }
    }
}

void apply_logging_section(LogOptions &logging, const YAML::Node &node, const fs::path &path) {
    validate_keys(node, {"file", "level", "max_size", "max_files"}, "logging", path);

    if (node["file"]) {
        logging.file_path = node["file"].as<std::string>();
    }
    if (node["level"]) {
        logging.level = parse_log_level(node["level"].as<std::string>());
    }
    if (node["max_size"]) {
        logging.max_file_size = positive_value<std::size_t>(node["max_size"], "logging.max_size", path);
    }
    if (node["max_files"]) {
        logging.max_files = positive_value<std::size_t>(node["max_files"], "logging.max_files", path);
    }
}

} // namespace

Settings Settings::load() {
    Settings settings;

    const std::string home = home_directory();
    if (!home.empty()) {
        settings.logging.file_path = (fs::path(home) / ".guardsh" / "guardsh.log").string();
        settings.history_file = (fs::path(home) / ".guardsh_history").string();
    }

    if (const auto config = env_value("GUARDSH_CONFIG")) {
        apply_config_file(settings, *config);
    }

    apply_environment(settings);
    return settings;
}

void apply_config_file(Settings &settings, const fs::path &path) {
    try {
        const YAML::Node root = YAML::LoadFile(path.string());
        if (root.IsNull()) {
            settings.config_file = path;
            return;
        }

        validate_keys(root, {"default_timeout", "max_output_bytes", "history_size", "policy", "logging"}, "root", path);

        if (root["default_timeout"]) {
            settings.policy.default_timeout = seconds_value(root["default_timeout"], "default_timeout", path);
        }
        if (root["max_output_bytes"]) {
            settings.supervisor.max_output_bytes =
                positive_value<std::size_t>(root["max_output_bytes"], "max_output_bytes", path);
        }
        if (root["history_size"]) {
            settings.history_size = positive_value<int>(root["history_size"], "history_size", path);
        }
        if (root["policy"]) {
            apply_policy_section(settings.policy, root["policy"], path);
        }
        if (root["logging"]) {
            apply_logging_section(settings.logging, root["logging"], path);
        }
    } catch (const YAML::Exception &ex) {
        throw std::runtime_error(fmt::format("failed to load {}: {}", path.string(), ex.what()));
    }

    settings.config_file = path;
}

void apply_environment(Settings &settings) {
    if (const auto value = env_value("GUARDSH_DEFAULT_TIMEOUT")) {
        settings.policy.default_timeout = std::chrono::seconds(parse_positive<long long>("GUARDSH_DEFAULT_TIMEOUT", *value));
    }

    if (const auto value = env_value("GUARDSH_MAX_OUTPUT")) {
        settings.supervisor.max_output_bytes = parse_positive<std::size_t>("GUARDSH_MAX_OUTPUT", *value);
    }

    if (const auto value = env_value("GUARDSH_LOG_FILE")) {
        settings.logging.file_path = *value;
    }

    if (const auto value = env_value("GUARDSH_LOG_LEVEL")) {
        settings.logging.level = parse_log_level(*value);
    }

    if (const auto value = env_value("HISTFILE")) {
        settings.history_file = *value;
    }
}

} // namespace guardsh
