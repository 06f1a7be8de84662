#include "core/command.hpp"

namespace guardsh {

std::string_view to_string(Outcome outcome) noexcept {
    switch (outcome) {
    case Outcome::Completed:
        return "completed";
    case Outcome::PolicyDenied:
        return "policy-denied";
    case Outcome::BuiltinDeferred:
        return "builtin-deferred";
    case Outcome::NotFound:
        return "not-found";
    case Outcome::PermissionDenied:
        return "permission-denied";
    case Outcome::Timeout:
        return "timeout";
    case Outcome::Terminated:
        return "terminated";
    case Outcome::SpawnFailure:
        return "spawn-failure";
    }

    return "unknown";
}

} // namespace guardsh
