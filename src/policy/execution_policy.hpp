#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace guardsh {

// Basename of `program` with any directory prefix removed, lowercased.
[[nodiscard]] std::string normalize_program_name(std::string_view program);

struct ExecutionPolicy {
    std::unordered_set<std::string> allowed;
    std::unordered_set<std::string> denied;
    std::unordered_set<std::string> builtins;
    std::unordered_map<std::string, std::chrono::seconds> timeouts;
    std::chrono::seconds default_timeout{30};

    [[nodiscard]] static ExecutionPolicy defaults();

    [[nodiscard]] std::chrono::seconds timeout_for(std::string_view program) const;

    // Names are normalized on insertion so lookups only need normalize_program_name().
    void allow(std::string_view program);
    void deny(std::string_view program);
    void add_builtin(std::string_view program);
    void set_timeout(std::string_view program, std::chrono::seconds timeout);
};

} // namespace guardsh
