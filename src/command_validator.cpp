// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "archchan/command_validator.h"

#include <algorithm>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>

namespace archchan {

namespace {

// Fragments shared by several rules.
// kCmdStart: start of a simple command (input start, newline or other separator, subshell,
// or sudo-like prefix), then any variable assignments and wrapper words ("env", "nice -n 5"),
// then an optional backslash or directory in front of the command name ("\rm", "/usr/bin/rm").
const std::string kCmdStart =
    R"((?:^|[;&|(`{\n\r]\s*|\$\(\s*|\b(?:sudo|doas|pkexec|run0)\s+(?:-\S+\s+)*))"
    R"((?:\w+=\S*\s+)*)"
    R"((?:(?:command|env|exec|nohup|nice|time|builtin|setsid|stdbuf|timeout|xargs)\s+(?:-\S+\s+|\w+=\S*\s+|\d+\w*\s+)*)*)"
    R"(\\?(?:\S*/)?)";
const std::string kSystemDirs = R"((?:bin|boot|dev|etc|home|lib|lib64|opt|root|sbin|srv|sys|usr|var))";
const std::string kPrivilegedDirs = R"((?:etc|usr|boot|opt|var|srv|root|bin|sbin|lib|lib64|sys))";

const std::set<std::string> kElevationPrefixes = {"sudo", "doas", "pkexec", "run0", "kdesu"};

const std::map<std::string, std::string> kCommandDescriptions = {
    {"pacman",     "Arch Linux package manager"},
    {"yay",        "AUR helper"},
    {"paru",       "AUR helper"},
    {"systemctl",  "systemd service manager"},
    {"journalctl", "systemd journal viewer"},
    {"ls",         "List files and directories"},
    {"cd",         "Change directory"},
    {"pwd",        "Print working directory"},
    {"cat",        "Print file contents"},
    {"grep",       "Search text for patterns"},
    {"find",       "Search for files and directories"},
    {"chmod",      "Change file permissions"},
    {"chown",      "Change file owner"},
    {"ps",         "List processes"},
    {"top",        "Interactive process monitor"},
    {"df",         "Show disk space usage"},
    {"du",         "Show file space usage"},
    {"free",       "Show memory usage"},
    {"uname",      "Show system information"},
    {"uptime",     "Show system uptime"},
    {"neofetch",   "Show system information with style"},
    {"fastfetch",  "Show system information with style"},
    {"lsblk",      "List block devices"},
    {"ip",         "Show and manipulate network configuration"},
    {"ping",       "Check network reachability"},
    {"rm",         "Remove files"},
    {"mv",         "Move or rename files"},
    {"cp",         "Copy files"},
};

const std::set<std::string> kLowRisk = {"ls", "pwd", "cat", "echo", "date", "whoami", "uname",
                                        "uptime", "df", "du", "free", "ps", "lsblk"};
const std::set<std::string> kMediumRisk = {"rm", "mv", "cp", "chmod", "chown", "kill", "pkill",
                                           "killall", "ln", "tee"};

std::vector<std::string> splitWords(const std::string& command) {
    std::istringstream iss(command);
    std::vector<std::string> words;
    std::string w;
    while (iss >> w) {
        words.push_back(w);
    }
    return words;
}

} // namespace

CommandPolicy CommandPolicy::defaults() {
    CommandPolicy policy;

    policy.blocked = {
        // Recursive deletion of the filesystem root, home or top-level system directories
        {kCmdStart + R"(rm\s+(?:-{1,2}[\w-]+\s+)*(?:-[a-z]*r[a-z]*|--recursive)\s+(?:-{1,2}[\w-]+\s+)*["']?(?:/|/\*|~|~/|~/\*|\$home|\$\{home\}|\$home/\*|/)" +
             kSystemDirs + R"(/?\*?)["']?(?:\s|;|&|\||$))",
         "recursive deletion of the root, home or a system directory"},
        {R"(--no-preserve-root)", "recursive deletion of the root, home or a system directory"},

        // Raw disk writes and partitioning
        {R"(\bdd\b[^;&|]*\bof=/dev/)", "raw write to a block device"},
        {R"(>\s*/dev/(?:sd|hd|vd|xvd|nvme|mmcblk|loop|disk))", "raw write to a block device"},
        {R"(\bshred\b[^;&|]*/dev/)", "raw write to a block device"},
        {R"(\bmkfs(?:\.\w+)?\b)", "filesystem creation wipes the target device"},
        {R"(\b(?:wipefs|fdisk|sfdisk|gdisk|sgdisk|parted|partprobe|cryptsetup|pvcreate|vgcreate|lvcreate)\b)",
         "disk partitioning or volume management"},

        // Fork bombs
        {R"(:\s*\(\s*\)\s*\{\s*:\s*\|\s*:\s*&\s*\}\s*;\s*:)", "fork bomb"},
        {R"(\b(\w+)\s*\(\s*\)\s*\{[^}]*\b\1\s*\|\s*\1\s*&)", "fork bomb"},

        // Core system services and power state
        {R"(\bsystemctl\s+(?:--\S+\s+)*(?:disable|mask|stop|kill)\s+(?:--\S+\s+)*(?:systemd-[\w@.-]+|dbus|polkit|udev|sddm|gdm|lightdm|networkmanager|getty@[\w.-]*)(?:\.service|\.socket)?\b)",
         "disabling a core system service"},
        {R"(\bsystemctl\s+(?:--\S+\s+)*(?:poweroff|reboot|halt|kexec|emergency|rescue)\b)", "changing the system power state"},
        {kCmdStart + R"((?:shutdown|poweroff|halt|reboot)\b)", "changing the system power state"},
        {kCmdStart + R"(init\s+[06]\b)", "changing the system power state"},

        // Critical account files and whole-system permission changes
        {R"(>{1,2}\s*/etc/(?:passwd|shadow|gshadow|group|sudoers)\b)", "overwriting a critical account file"},
        {kCmdStart + R"((?:chmod|chown|chgrp)\s+(?:-\S+\s+)*-[a-z]*r[a-z]*\s+(?:-\S+\s+)*\S+\s+/(?:\s|;|&|$))",
         "recursive permission change on the filesystem root"},

        // Remote code piped straight into a shell
        {R"(\b(?:curl|wget)\b[^|;&]*\|\s*(?:sudo\s+)?(?:ba|z|da|k|fi)?sh\b)", "piping a download into a shell"},
        {R"(\b(?:ba|z)?sh\s+<\(\s*(?:curl|wget)\b)", "piping a download into a shell"},
    };

    policy.privileged = {
        {kCmdStart + R"((?:sudo|doas|pkexec|run0|kdesu|su)\b)", "command requests elevated privileges"},

        // Package installation and removal
        // -S, -R, -U operations; -Ss/-Si/-Sl/-Sg only query the sync database
        {R"(\bpacman\s+(?:--\S+\s+)*-(?:[ru]|s(?![a-z]*[sigl])))", "installs or removes system packages"},
        {R"(\bpacman\s+(?:--sync|--remove|--upgrade)\b)", "installs or removes system packages"},
        {kCmdStart + R"((?:yay|paru)\b)", "installs or removes system packages"},
        {R"(\b(?:apt|apt-get|dnf|yum|zypper)\s+(?:-\S+\s+)*(?:install|remove|purge|upgrade|dist-upgrade|full-upgrade|autoremove|erase)\b)",
         "installs or removes system packages"},
        {R"(\b(?:flatpak|snap)\s+(?:install|remove|uninstall)\b)", "installs or removes system packages"},

        // Service management
        {R"(\bsystemctl\s+(?:--\S+\s+)*(?:start|stop|restart|reload|try-restart|enable|disable|mask|unmask|daemon-reload|isolate|set-default|kill)\b)",
         "changes the state of a system service"},
        {R"(\bservice\s+\S+\s+(?:start|stop|restart|reload)\b)", "changes the state of a system service"},

        // Writes under privileged paths
        {R"(>{1,2}\s*/)" + kPrivilegedDirs + R"(/)", "writes under a privileged path"},
        {R"(\btee\s+(?:-\S+\s+)*/)" + kPrivilegedDirs + R"(/)", "writes under a privileged path"},
        {R"(\b(?:mv|rm|chmod|chown|chgrp|ln|install|truncate|cp)\b[^;&|]*\s/)" + kPrivilegedDirs + R"(/)",
         "modifies files under a privileged path"},
        {R"(\bsed\s+(?:-\S+\s+)*-i\S*\s+[^;&|]*\s/)" + kPrivilegedDirs + R"(/)", "modifies files under a privileged path"},

        // Accounts, mounts, kernel
        {R"(\b(?:useradd|userdel|usermod|groupadd|groupdel|passwd|chsh|chfn|visudo)\b)", "changes user accounts"},
        {kCmdStart + R"((?:mount|umount|modprobe|rmmod|insmod)\b)", "changes mounts or kernel modules"},
        {R"(\bsysctl\s+(?:-\S+\s+)*-w\b)", "changes kernel parameters"},
    };

    policy.whitelist = {"ls", "pwd", "cat", "echo", "date", "whoami", "uname", "uptime",
                        "df", "du", "free", "ps", "top", "lsblk", "ip", "ping", "grep",
                        "find", "journalctl", "neofetch", "fastfetch", "hostname", "which"};

    return policy;
}

CommandValidator::CommandValidator(const CommandPolicy& policy)
    : blocked_(compile(policy.blocked)),
      privileged_(compile(policy.privileged)),
      whitelist_(policy.whitelist) {}

std::vector<CommandValidator::CompiledRule> CommandValidator::compile(const std::vector<PolicyRule>& rules) {
    std::vector<CompiledRule> compiled;
    compiled.reserve(rules.size());
    for (const auto& rule : rules) {
        try {
            compiled.push_back({std::regex(rule.pattern, std::regex::ECMAScript | std::regex::icase),
                                rule.reason});
        } catch (const std::regex_error& e) {
            throw std::invalid_argument("Invalid policy pattern '" + rule.pattern + "': " + e.what());
        }
    }
    return compiled;
}

ValidationVerdict CommandValidator::validate(const std::string& command) const {
    if (command.find_first_not_of(" \t\r\n") == std::string::npos) {
        return ValidationVerdict::blocked("empty command");
    }

    for (const auto& rule : blocked_) {
        if (std::regex_search(command, rule.re)) {
            return ValidationVerdict::blocked(rule.reason);
        }
    }

    for (const auto& rule : privileged_) {
        if (std::regex_search(command, rule.re)) {
            return ValidationVerdict::requiresConfirmation(rule.reason);
        }
    }

    return ValidationVerdict::safe();
}

std::string CommandValidator::baseCommand(const std::string& command) {
    auto words = splitWords(command);
    size_t i = 0;
    while (i < words.size() && kElevationPrefixes.count(words[i])) {
        ++i;
        // Skip the prefix's own options ("sudo -u bob", "kdesu -c")
        while (i < words.size() && words[i].size() > 1 && words[i][0] == '-') {
            bool takesValue = (words[i] == "-u" || words[i] == "-g" || words[i] == "--user");
            ++i;
            if (takesValue && i < words.size()) ++i;
        }
    }
    if (i >= words.size()) {
        return words.empty() ? "" : words.back();
    }
    std::string base = words[i];
    // Strip quoting left by "kdesu -c 'cmd ...'"
    base.erase(std::remove(base.begin(), base.end(), '\''), base.end());
    base.erase(std::remove(base.begin(), base.end(), '"'), base.end());
    return base;
}

bool CommandValidator::isWhitelisted(const std::string& command) const {
    std::string base = baseCommand(command);
    return std::find(whitelist_.begin(), whitelist_.end(), base) != whitelist_.end();
}

CommandInfo CommandValidator::describe(const std::string& command) const {
    CommandInfo info;
    info.verdict = validate(command);
    info.baseCommand = baseCommand(command);
    info.whitelisted = isWhitelisted(command);

    auto it = kCommandDescriptions.find(info.baseCommand);
    info.description = (it != kCommandDescriptions.end()) ? it->second : "System command";

    if (info.verdict.isBlocked()) {
        info.riskLevel = "high";
    } else if (info.verdict.needsConfirmation() || kMediumRisk.count(info.baseCommand)) {
        info.riskLevel = "medium";
    } else if (kLowRisk.count(info.baseCommand)) {
        info.riskLevel = "low";
    } else {
        info.riskLevel = "unknown";
    }
    return info;
}

} // namespace archchan
