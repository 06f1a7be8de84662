#include "line_editing/completion.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <set>
#include <string>

#include <readline/readline.h>

#include "builtins/builtin_registry.hpp"
#include "core/path_resolver.hpp"
#include "policy/policy_guard.hpp"

namespace guardsh {

CompletionEngine *CompletionEngine::instance_ = nullptr;

CompletionEngine::CompletionEngine(const BuiltinRegistry &builtin_registry, const PathResolver &path_resolver,
                                   const PolicyGuard &policy_guard)
    : builtin_registry_(builtin_registry), path_resolver_(path_resolver), policy_guard_(policy_guard) {}

void CompletionEngine::install() {
    instance_ = this;
    rl_attempted_completion_function = &CompletionEngine::completion_callback;
}

char **CompletionEngine::completion_callback(const char *text, int start, int /*end*/) {
    // Arguments fall back to readline's filename completion.
    if (instance_ == nullptr || start != 0) {
        return nullptr;
    }

    rl_attempted_completion_over = 1;
    return rl_completion_matches(text, &CompletionEngine::generator_callback);
}

char *CompletionEngine::generator_callback(const char *text, int state) {
    static std::set<std::string> matches;
    static std::set<std::string>::iterator iterator;

    if (instance_ == nullptr) {
        return nullptr;
    }

    if (state == 0) {
        matches = instance_->collect_matches(text);
        iterator = matches.begin();
    }

    if (iterator == matches.end()) {
        return nullptr;
    }

    return ::strdup((iterator++)->c_str());
}

std::set<std::string> CompletionEngine::collect_matches(const std::string &prefix) const {
    std::set<std::string> matches;

    for (const auto &candidate : path_resolver_.executable_candidates(prefix)) {
        if (policy_guard_.classify(candidate) == Verdict::Allow) {
            matches.insert(candidate);
        }
    }

    for (const auto &builtin : builtin_registry_.names()) {
        if (builtin.starts_with(prefix)) {
            matches.insert(builtin);
        }
    }

    return matches;
}

} // namespace guardsh
