// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Child process execution with timeout, output caps and group termination.
//
// Each invocation runs in its own process group so that a timeout or a
// cancellation can terminate the command together with everything it spawned.
// A non-zero exit status is a normal result; only a failure to start the
// program is an error (LaunchError).

#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "types.h"
#include "cancellation.h"
#include "archchan/export.h"

namespace archchan {

/// The program could not be started (missing binary, permission denied, fork failure).
class ARCHCHAN_API LaunchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct RunOptions {
    std::chrono::milliseconds timeout{30000};
    size_t maxOutputBytes = 64 * 1024; // Per stream
};

/// Abstract execution backend used by the Tool Dispatcher.
class ARCHCHAN_API ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    /// Run a command line through the shell.
    /// @throws LaunchError if the shell could not be started
    virtual ExecutionResult runShell(const std::string& command, const CancellationToken& token) = 0;

    /// Run the search collaborator with a single query string.
    /// @throws LaunchError if the search program could not be started
    virtual ExecutionResult runSearch(const std::string& query, const CancellationToken& token) = 0;
};

/// POSIX implementation: fork + execvp, non-blocking pipes, poll().
/// Holds only immutable settings, so concurrent calls are independent.
class ARCHCHAN_API SubprocessRunner : public ProcessRunner {
public:
    explicit SubprocessRunner(const AssistantConfig& config = AssistantConfig{});

    ExecutionResult runShell(const std::string& command, const CancellationToken& token) override;
    ExecutionResult runSearch(const std::string& query, const CancellationToken& token) override;

    /// Run an argument vector (no shell involved).
    ///
    /// On timeout or cancellation the process group receives SIGTERM, then
    /// SIGKILL after a short grace period; output collected so far is returned.
    ///
    /// @param argv Program and arguments; argv[0] is looked up on PATH
    /// @param options Timeout and per-stream output cap
    /// @param token Polled while the child runs
    /// @return ExecutionResult with exit code (128 + signal if killed by a signal)
    /// @throws LaunchError if argv is empty or the program could not be started
    ExecutionResult runArgv(const std::vector<std::string>& argv,
                            const RunOptions& options,
                            const CancellationToken& token) const;

    /// Argument vector for the search collaborator:
    /// {searchCommand, "--json", "-n", N, "--unsafe", "--", query}.
    static std::vector<std::string> searchArgv(const AssistantConfig& config, const std::string& query);

    const RunOptions& shellOptions() const { return shellOptions_; }
    const RunOptions& searchOptions() const { return searchOptions_; }

private:
    AssistantConfig config_;
    RunOptions shellOptions_;
    RunOptions searchOptions_;
};

} // namespace archchan
