#include <cassert>
#include <chrono>
#include <initializer_list>
#include <string>
#include <utility>

#include "policy/execution_policy.hpp"
#include "policy/policy_guard.hpp"

using guardsh::ExecutionPolicy;
using guardsh::PolicyGuard;
using guardsh::Verdict;

namespace {

using namespace std::chrono_literals;

void test_default_lists() {
    PolicyGuard guard(ExecutionPolicy::defaults());

    assert(guard.evaluate("ls") == Verdict::Allow);
    assert(guard.evaluate("grep") == Verdict::Allow);
    assert(guard.evaluate("rm") == Verdict::Deny);
    assert(guard.evaluate("sudo") == Verdict::Deny);
    assert(guard.evaluate("shutdown") == Verdict::Deny);
    assert(guard.evaluate("cd") == Verdict::BuiltinDefer);
    assert(guard.evaluate("echo") == Verdict::BuiltinDefer);
}

void test_unknown_and_empty_names_are_denied() {
    PolicyGuard guard(ExecutionPolicy::defaults());

    assert(guard.evaluate("definitely_not_listed") == Verdict::Deny);
    assert(guard.evaluate("") == Verdict::Deny);
    assert(guard.evaluate("/") == Verdict::Deny);
}

void test_names_are_normalized() {
    PolicyGuard guard(ExecutionPolicy::defaults());

    assert(guard.evaluate("LS") == Verdict::Allow);
    assert(guard.evaluate("/bin/ls") == Verdict::Allow);
    assert(guard.evaluate("/usr/bin/RM") == Verdict::Deny);
    assert(guard.evaluate("./sudo") == Verdict::Deny);
    assert(guard.evaluate("/usr/local/bin/Cd") == Verdict::BuiltinDefer);
}

void test_deny_wins_over_allow() {
    ExecutionPolicy policy;
    policy.allow("tool");
    policy.deny("Tool");
    policy.add_builtin("tool");

    PolicyGuard guard(std::move(policy));
    assert(guard.evaluate("tool") == Verdict::Deny);
    assert(guard.classify("tool") == Verdict::Deny);
}

void test_allow_wins_over_builtin() {
    PolicyGuard guard(ExecutionPolicy::defaults());

    // history is both an allowed program and a shell builtin by default.
    assert(guard.evaluate("history") == Verdict::Allow);
}

void test_classify_matches_evaluate() {
    PolicyGuard guard(ExecutionPolicy::defaults());

    for (const char *name : {"ls", "rm", "cd", "unknown_thing", "", "/usr/bin/GIT"}) {
        assert(guard.classify(name) == guard.evaluate(name));
    }
}

void test_timeouts() {
    const auto policy = ExecutionPolicy::defaults();

    assert(policy.default_timeout == 30s);
    assert(policy.timeout_for("ping") == 10s);
    assert(policy.timeout_for("/usr/bin/TAR") == 120s);
    assert(policy.timeout_for("curl") == 60s);
    assert(policy.timeout_for("ls") == 30s);

    ExecutionPolicy custom;
    custom.default_timeout = 5s;
    custom.set_timeout("Sleep", 2s);
    assert(custom.timeout_for("sleep") == 2s);
    assert(custom.timeout_for("cat") == 5s);
}

void test_to_string() {
    assert(guardsh::to_string(Verdict::Allow) == "allowed");
    assert(guardsh::to_string(Verdict::Deny) == "denied");
    assert(guardsh::to_string(Verdict::BuiltinDefer) == "shell builtin");
    assert(guardsh::normalize_program_name("/opt/X/Bin/MyTool") == "mytool");
}

} // namespace

int main() {
    test_default_lists();
    test_unknown_and_empty_names_are_denied();
    test_names_are_normalized();
    test_deny_wins_over_allow();
    test_allow_wins_over_builtin();
    test_classify_matches_evaluate();
    test_timeouts();
    test_to_string();
    return 0;
}
