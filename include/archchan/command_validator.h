// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Static policy check for shell commands requested by the model.
//
// Rules are regular expressions matched against the raw command string,
// case-insensitively. Blocked rules are checked first, then privileged rules;
// a command matching neither is SAFE. This is a pattern net, not a sandbox:
// a sufficiently obfuscated command will slip through.

#pragma once

#include <regex>
#include <string>
#include <vector>

#include "types.h"
#include "archchan/export.h"

namespace archchan {

struct PolicyRule {
    std::string pattern; // ECMAScript regex, matched case-insensitively
    std::string reason;  // Shown to the user when the rule matches
};

struct CommandPolicy {
    std::vector<PolicyRule> blocked;      // Irreversible or destructive
    std::vector<PolicyRule> privileged;   // Needs explicit confirmation
    std::vector<std::string> whitelist;   // Advisory only; never overrides a rule

    /// Built-in policy for an Arch Linux desktop.
    static CommandPolicy defaults();
};

class ARCHCHAN_API CommandValidator {
public:
    /// @throws std::invalid_argument if a rule pattern does not compile.
    explicit CommandValidator(const CommandPolicy& policy = CommandPolicy::defaults());

    /// Classify a command as SAFE, REQUIRES_CONFIRMATION or BLOCKED.
    /// Pure function of the command and the policy.
    ValidationVerdict validate(const std::string& command) const;

    /// Verdict plus an advisory description and risk level.
    CommandInfo describe(const std::string& command) const;

    /// True if the base command is on the advisory whitelist.
    bool isWhitelisted(const std::string& command) const;

    /// First word of the command, skipping a privilege-elevation prefix
    /// and its options ("sudo -u bob pacman -Syu" -> "pacman").
    static std::string baseCommand(const std::string& command);

private:
    struct CompiledRule {
        std::regex re;
        std::string reason;
    };

    static std::vector<CompiledRule> compile(const std::vector<PolicyRule>& rules);

    std::vector<CompiledRule> blocked_;
    std::vector<CompiledRule> privileged_;
    std::vector<std::string> whitelist_;
};

} // namespace archchan
