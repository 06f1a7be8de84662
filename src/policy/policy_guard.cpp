#include "policy/policy_guard.hpp"

#include <string>
#include <utility>

#include "logging/logger.hpp"

namespace guardsh {

std::string_view to_string(Verdict verdict) noexcept {
    switch (verdict) {
    case Verdict::Allow:
        return "allowed";
    case Verdict::Deny:
        return "denied";
    case Verdict::BuiltinDefer:
        return "shell builtin";
    }

    return "unknown";
}

PolicyGuard::PolicyGuard(ExecutionPolicy policy) : policy_(std::move(policy)) {}

Verdict PolicyGuard::classify(std::string_view program) const {
    const std::string name = normalize_program_name(program);
    if (name.empty() || policy_.denied.contains(name)) {
        return Verdict::Deny;
    }

    if (policy_.allowed.contains(name)) {
        return Verdict::Allow;
    }

    if (policy_.builtins.contains(name)) {
        return Verdict::BuiltinDefer;
    }

    return Verdict::Deny;
}

Verdict PolicyGuard::evaluate(std::string_view program) const {
    const Verdict verdict = classify(program);
    if (verdict != Verdict::Deny) {
        return verdict;
    }

    const std::string name = normalize_program_name(program);
    if (name.empty()) {
        GUARDSH_WARN("policy violation: empty program name");
    } else if (policy_.denied.contains(name)) {
        GUARDSH_WARN("policy violation: '{}' is on the deny list", program);
    } else {
        GUARDSH_WARN("policy violation: unknown command '{}' blocked", program);
    }

    return Verdict::Deny;
}

} // namespace guardsh
