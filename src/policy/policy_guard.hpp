#pragma once

#include <string_view>

#include "policy/execution_policy.hpp"

namespace guardsh {

enum class Verdict {
    Allow,
    Deny,
    BuiltinDefer,
};

[[nodiscard]] std::string_view to_string(Verdict verdict) noexcept;

class PolicyGuard {
  public:
    explicit PolicyGuard(ExecutionPolicy policy);

    // Deny-set first, then allow-set, then the shell built-ins; anything else is denied.
    [[nodiscard]] Verdict evaluate(std::string_view program) const;
    // Same decision as evaluate() without recording a violation.
    [[nodiscard]] Verdict classify(std::string_view program) const;

    [[nodiscard]] const ExecutionPolicy &policy() const noexcept { return policy_; }

  private:
    const ExecutionPolicy policy_;
};

} // namespace guardsh
