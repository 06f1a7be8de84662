#pragma once

#include <set>
#include <string>

namespace guardsh {

class BuiltinRegistry;
class PathResolver;
class PolicyGuard;

// Command-name completion: shell builtins plus PATH executables the policy would run.
class CompletionEngine {
  public:
    CompletionEngine(const BuiltinRegistry &builtin_registry, const PathResolver &path_resolver,
                     const PolicyGuard &policy_guard);

    void install();

    [[nodiscard]] std::set<std::string> collect_matches(const std::string &prefix) const;

  private:
    const BuiltinRegistry &builtin_registry_;
    const PathResolver &path_resolver_;
    const PolicyGuard &policy_guard_;

    static CompletionEngine *instance_;

    static char **completion_callback(const char *text, int start, int end);
    static char *generator_callback(const char *text, int state);
};

} // namespace guardsh
