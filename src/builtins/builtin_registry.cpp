#include "builtins/builtin_registry.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <system_error>
#include <vector>

#include <fmt/core.h>

#include "core/path_resolver.hpp"
#include "execution/process_supervisor.hpp"
#include "history/history_manager.hpp"

namespace guardsh {

namespace fs = std::filesystem;

namespace {

[[nodiscard]] bool parse_int(const std::string &token, int &value) {
    const char *first = token.data();
    const char *last = token.data() + token.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    return ec == std::errc{} && ptr == last;
}

} // namespace

BuiltinRegistry::BuiltinRegistry(
    const PathResolver &path_resolver, HistoryManager &history_manager, ProcessSupervisor &supervisor)
    : path_resolver_(path_resolver), history_manager_(history_manager), supervisor_(supervisor) {
    register_builtins();
}

bool BuiltinRegistry::is_builtin(std::string_view command) const { return registry_.contains(std::string(command)); }

int BuiltinRegistry::execute(
    std::string_view command, const std::vector<std::string> &args, std::ostream &out, std::ostream &err) {
    auto it = registry_.find(std::string(command));
    if (it == registry_.end()) {
        return 1;
    }

    return it->second(args, out, err);
}

std::unordered_set<std::string> BuiltinRegistry::names() const {
    std::unordered_set<std::string> result;
    result.reserve(registry_.size());

    for (const auto &[name, _] : registry_) {
        result.insert(name);
    }

    return result;
}

void BuiltinRegistry::register_builtins() {
    registry_["cd"] = [this](const auto &args, auto &out, auto &err) { return builtin_cd(args, out, err); };
    registry_["pwd"] = [this](const auto &args, auto &out, auto &err) { return builtin_pwd(args, out, err); };
    registry_["echo"] = [this](const auto &args, auto &out, auto &err) { return builtin_echo(args, out, err); };
    registry_["help"] = [this](const auto &args, auto &out, auto &err) { return builtin_help(args, out, err); };
    registry_["clear"] = [this](const auto &args, auto &out, auto &err) { return builtin_clear(args, out, err); };
    registry_["history"] = [this](const auto &args, auto &out, auto &err) { return builtin_history(args, out, err); };
    registry_["type"] = [this](const auto &args, auto &out, auto &err) { return builtin_type(args, out, err); };
    registry_["jobs"] = [this](const auto &args, auto &out, auto &err) { return builtin_jobs(args, out, err); };
    registry_["exit"] = [this](const auto &args, auto &out, auto &err) { return builtin_exit(args, out, err); };
}

int BuiltinRegistry::builtin_cd(const std::vector<std::string> &args, std::ostream &out, std::ostream &err) {
    fs::path target_path(args.empty() ? "~" : args.front());
    const bool back = target_path == "-";

    if (target_path == "~") {
        const char *home = std::getenv("HOME");
        if (home == nullptr) {
            err << "cd: HOME not set" << std::endl;
            return 1;
        }
        target_path = home;
    } else if (back) {
        if (previous_directory_.empty()) {
            err << "cd: OLDPWD not set" << std::endl;
            return 1;
        }
        target_path = previous_directory_;
    }

    std::error_code ec;
    const fs::path current = fs::current_path(ec);
    fs::current_path(target_path, ec);
    if (ec) {
        err << "cd: " << target_path.string() << ": " << ec.message() << std::endl;
        return 1;
    }

    previous_directory_ = current;
    if (back) {
        out << fs::current_path().string() << std::endl;
    }

    return 0;
}

int BuiltinRegistry::builtin_pwd(const std::vector<std::string> & /*args*/, std::ostream &out, std::ostream &err) {
    std::error_code ec;
    const fs::path current = fs::current_path(ec);
    if (ec) {
        err << "pwd: " << ec.message() << std::endl;
        return 1;
    }

    out << current.string() << std::endl;
    return 0;
}

int BuiltinRegistry::builtin_echo(const std::vector<std::string> &args, std::ostream &out, std::ostream & /*err*/) {
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            out << ' ';
        }

        out << args[i];
    }

    out << std::endl;
    return 0;
}

int BuiltinRegistry::builtin_help(const std::vector<std::string> & /*args*/, std::ostream &out, std::ostream & /*err*/) {
    out << "Shell builtins:\n"
           "  cd [dir|-]     change directory\n"
           "  pwd            print working directory\n"
           "  echo <text>    print text\n"
           "  clear          clear the screen\n"
           "  history [-c|N] show or clear command history\n"
           "  type <name>    show how a name would be run\n"
           "  jobs           list supervised processes\n"
           "  help           show this help\n"
           "  exit [code]    leave the shell\n"
           "\n"
           "Other commands run as supervised processes when the execution policy allows them.\n"
        << fmt::format("Default timeout: {}s. Output is capped at {} bytes per stream.\n",
                       supervisor_.policy().policy().default_timeout.count(),
                       supervisor_.sanitizer().max_bytes());
    return 0;
}

int BuiltinRegistry::builtin_clear(const std::vector<std::string> & /*args*/, std::ostream &out, std::ostream & /*err*/) {
    out << "\033[H\033[2J" << std::flush;
    return 0;
}

int BuiltinRegistry::builtin_history(const std::vector<std::string> &args, std::ostream &out, std::ostream &err) {
    if (!args.empty() && args[0] == "-c") {
        history_manager_.clear();
        return 0;
    }

    int limit = history_manager_.length();
    if (!args.empty() && (!parse_int(args[0], limit) || limit < 0)) {
        err << "history: " << args[0] << ": numeric argument required" << std::endl;
        return 1;
    }

    history_manager_.print(out, limit);
    return 0;
}

int BuiltinRegistry::builtin_type(const std::vector<std::string> &args, std::ostream &out, std::ostream &err) {
    if (args.empty()) {
        err << "type: missing argument" << std::endl;
        return 1;
    }

    int status = 0;
    for (const auto &name : args) {
        if (is_builtin(name)) {
            out << name << " is a shell builtin" << std::endl;
            continue;
        }

        switch (supervisor_.policy().classify(name)) {
        case Verdict::Deny:
            out << name << " is blocked by the execution policy" << std::endl;
            status = 1;
            break;
        case Verdict::BuiltinDefer:
            out << name << " is reserved for the shell" << std::endl;
            status = 1;
            break;
        case Verdict::Allow:
            if (const auto path = path_resolver_.resolve(name)) {
                out << name << " is " << path->string() << std::endl;
            } else {
                out << name << ": not found" << std::endl;
                status = 1;
            }
            break;
        }
    }

    return status;
}

int BuiltinRegistry::builtin_jobs(const std::vector<std::string> & /*args*/, std::ostream &out, std::ostream & /*err*/) {
    const auto now = std::chrono::steady_clock::now();

    for (const auto &handle : supervisor_.running()) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - handle.started_at);
        out << fmt::format("[{}] pid {}  running {}s of {}s\n", handle.id, handle.pid, elapsed.count(),
                           handle.timeout.count());
    }

    return 0;
}

int BuiltinRegistry::builtin_exit(const std::vector<std::string> &args, std::ostream & /*out*/, std::ostream &err) {
    int code = 0;
    if (!args.empty() && !parse_int(args[0], code)) {
        err << "exit: " << args[0] << ": numeric argument required" << std::endl;
        code = 2;
    }

    exit_code_ = code & 0xff;
    exit_requested_ = true;
    return exit_code_;
}

} // namespace guardsh
