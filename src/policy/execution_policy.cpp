#include "policy/execution_policy.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace guardsh {

namespace {

using namespace std::chrono_literals;

constexpr std::array kDefaultAllowed{
    // file viewing and lookup
    "ls", "dir", "cat", "head", "tail", "less", "more", "file", "find", "locate", "which", "whereis", "type",
    // text processing
    "grep", "egrep", "fgrep", "awk", "sed", "sort", "uniq", "cut", "tr", "wc", "diff", "cmp",
    // archives
    "tar", "gzip", "gunzip", "zip", "unzip", "7z",
    // system information
    "ps", "top", "htop", "free", "df", "du", "lsof", "netstat", "uname", "whoami", "id", "groups", "uptime", "date",
    "cal", "env", "printenv", "history",
    // network diagnostics
    "ping", "wget", "curl", "nslookup", "dig", "host",
    // development tools
    "git", "python", "python3", "node", "npm", "pip", "pip3", "java", "javac", "gcc", "g++", "make", "cmake",
    // editors
    "vim", "vi", "nano", "emacs",
    // package managers
    "apt", "yum", "dnf", "pacman", "brew",
};

constexpr std::array kDefaultDenied{
    // filesystem destruction
    "rm", "rmdir", "del", "erase", "format", "mkfs", "fdisk", "parted", "gparted",
    // privilege and power control
    "sudo", "su", "login", "logout", "exit", "shutdown", "reboot", "halt", "poweroff", "init", "systemctl", "service",
    // remote access
    "ssh", "scp", "rsync", "ftp", "sftp", "telnet",
    // process control
    "kill", "killall", "pkill", "nohup", "screen", "tmux",
    // permissions
    "chmod", "chown", "chgrp", "umask",
    // mounts
    "mount", "umount", "swapon", "swapoff",
    // wipers
    "dd", "shred", "wipe",
};

constexpr std::array kDefaultBuiltins{"cd", "pwd", "echo", "help", "clear", "history"};

} // namespace

std::string normalize_program_name(std::string_view program) {
    const auto slash = program.find_last_of('/');
    if (slash != std::string_view::npos) {
        program.remove_prefix(slash + 1);
    }

    std::string name(program);
    std::ranges::transform(name, name.begin(), [](unsigned char c) { return std::tolower(c); });
    return name;
}

ExecutionPolicy ExecutionPolicy::defaults() {
    ExecutionPolicy policy;

    for (const auto *name : kDefaultAllowed) {
        policy.allow(name);
    }
    for (const auto *name : kDefaultDenied) {
        policy.deny(name);
    }
    for (const auto *name : kDefaultBuiltins) {
        policy.add_builtin(name);
    }

    policy.set_timeout("ping", 10s);
    policy.set_timeout("wget", 60s);
    policy.set_timeout("curl", 60s);
    policy.set_timeout("find", 60s);
    policy.set_timeout("grep", 30s);
    policy.set_timeout("tar", 120s);
    policy.set_timeout("zip", 120s);
    policy.set_timeout("unzip", 120s);

    return policy;
}

std::chrono::seconds ExecutionPolicy::timeout_for(std::string_view program) const {
    const auto it = timeouts.find(normalize_program_name(program));
    if (it != timeouts.end()) {
        return it->second;
    }

    return default_timeout;
}

void ExecutionPolicy::allow(std::string_view program) { allowed.insert(normalize_program_name(program)); }

void ExecutionPolicy::deny(std::string_view program) { denied.insert(normalize_program_name(program)); }

void ExecutionPolicy::add_builtin(std::string_view program) { builtins.insert(normalize_program_name(program)); }

void ExecutionPolicy::set_timeout(std::string_view program, std::chrono::seconds timeout) {
    timeouts[normalize_program_name(program)] = timeout;
}

} // namespace guardsh
