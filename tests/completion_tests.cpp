#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include <vector>

#include <readline/readline.h>

#define private public
#include "line_editing/completion.hpp"
#undef private

#include "builtins/builtin_registry.hpp"
#include "core/path_resolver.hpp"
#include "execution/process_supervisor.hpp"
#include "history/history_manager.hpp"

using guardsh::BuiltinRegistry;
using guardsh::CompletionEngine;
using guardsh::ExecutionPolicy;
using guardsh::HistoryManager;
using guardsh::PathResolver;
using guardsh::ProcessSupervisor;

namespace {

namespace fs = std::filesystem;

class EnvVarGuard {
  public:
    explicit EnvVarGuard(const char *name) : name_(name) {
        const char *value = std::getenv(name_.c_str());
        if (value != nullptr) {
            had_value_ = true;
            value_ = value;
        }
    }

    ~EnvVarGuard() {
        if (had_value_) {
            setenv(name_.c_str(), value_.c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

  private:
    std::string name_;
    bool had_value_{false};
    std::string value_;
};

std::string make_temp_dir() {
    std::string pattern = "/tmp/guardsh_completion_tests_XXXXXX";
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    char *created = mkdtemp(buffer.data());
    assert(created != nullptr);
    return created;
}

void make_executable(const fs::path &path) {
    std::ofstream file(path);
    assert(file.is_open());
    file << "#!/bin/sh\nexit 0\n";
    file.close();

    std::error_code ec;
    fs::permissions(path,
                    fs::perms::owner_read | fs::perms::owner_write | fs::perms::owner_exec |
                        fs::perms::group_read | fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace,
                    ec);
    assert(!ec);
}

void free_completion_matches(char **matches) {
    if (matches == nullptr) {
        return;
    }

    for (std::size_t i = 0; matches[i] != nullptr; ++i) {
        std::free(matches[i]);
    }
    std::free(matches);
}

ExecutionPolicy completion_policy() {
    ExecutionPolicy policy;
    policy.allow("ec_allowed_exe");
    policy.allow("ca_custom_exe");
    policy.deny("ec_denied_exe");
    return policy;
}

void test_collect_matches_filters_by_policy() {
    EnvVarGuard path_guard("PATH");

    const std::string dir = make_temp_dir();
    make_executable(fs::path(dir) / "ec_allowed_exe");
    make_executable(fs::path(dir) / "ec_denied_exe");
    make_executable(fs::path(dir) / "ec_unlisted_exe");

    setenv("PATH", dir.c_str(), 1);

    PathResolver resolver;
    HistoryManager history_manager;
    ProcessSupervisor supervisor(completion_policy());
    BuiltinRegistry registry(resolver, history_manager, supervisor);
    CompletionEngine engine(registry, resolver, supervisor.policy());

    const auto matches = engine.collect_matches("ec");
    assert(matches.contains("echo"));
    assert(matches.contains("ec_allowed_exe"));
    assert(!matches.contains("ec_denied_exe"));
    assert(!matches.contains("ec_unlisted_exe"));

    const auto builtins_only = engine.collect_matches("hi");
    assert(builtins_only.size() == 1);
    assert(builtins_only.contains("history"));

    assert(engine.collect_matches("zz").empty());

    CompletionEngine::instance_ = nullptr;
    assert(CompletionEngine::generator_callback("ec", 0) == nullptr);

    engine.install();
    char *first = CompletionEngine::generator_callback("ec", 0);
    assert(first != nullptr);
    assert(std::string(first) == "ec_allowed_exe");
    std::free(first);

    char *second = CompletionEngine::generator_callback("ec", 1);
    assert(second != nullptr);
    assert(std::string(second) == "echo");
    std::free(second);

    assert(CompletionEngine::generator_callback("ec", 2) == nullptr);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

void test_completion_callback_paths() {
    EnvVarGuard path_guard("PATH");

    const std::string dir = make_temp_dir();
    const fs::path exe = fs::path(dir) / "ca_custom_exe";
    make_executable(exe);

    setenv("PATH", dir.c_str(), 1);

    PathResolver resolver;
    HistoryManager history_manager;
    ProcessSupervisor supervisor(completion_policy());
    BuiltinRegistry registry(resolver, history_manager, supervisor);
    CompletionEngine engine(registry, resolver, supervisor.policy());

    engine.install();

    // Arguments are left to readline's filename completion.
    rl_attempted_completion_over = 0;
    char **non_command_position = CompletionEngine::completion_callback("ca", 1, 1);
    assert(rl_attempted_completion_over == 0);
    assert(non_command_position == nullptr);

    rl_attempted_completion_over = 0;
    char **command_position = CompletionEngine::completion_callback("ca", 0, 2);
    assert(rl_attempted_completion_over == 1);
    assert(command_position != nullptr);

    free_completion_matches(command_position);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

} // namespace

int main() {
    test_collect_matches_filters_by_policy();
    test_completion_callback_paths();
    return 0;
}
