// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "archchan/process_runner.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace archchan {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(50);
constexpr auto kTerminateGrace = std::chrono::milliseconds(1000);

/// Read end of a child's output stream with a byte cap.
struct OutputPipe {
    int fd = -1;
    bool open = false;
    std::string* text = nullptr;
    bool* truncated = nullptr;
    size_t limit = 0;

    /// Read everything currently available. Bytes past the limit are discarded.
    void drain() {
        if (!open) return;

        char buffer[4096];
        while (true) {
            ssize_t n = read(fd, buffer, sizeof(buffer));
            if (n > 0) {
                size_t room = limit > text->size() ? limit - text->size() : 0;
                size_t keep = std::min(room, static_cast<size_t>(n));
                text->append(buffer, keep);
                if (keep < static_cast<size_t>(n)) {
                    *truncated = true;
                }
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
            // EOF or hard error
            closeFd();
            return;
        }
    }

    void closeFd() {
        if (fd >= 0) close(fd);
        fd = -1;
        open = false;
    }
};

void closePair(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
    fds[0] = fds[1] = -1;
}

/// True once the child has exited. Does not reap it, so the pid (and the
/// process group id) cannot be reused while we still signal the group.
bool leaderExited(pid_t pid) {
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    if (waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
        return errno == ECHILD;
    }
    return info.si_pid == pid;
}

int reap(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

std::string joinArgv(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

} // namespace

SubprocessRunner::SubprocessRunner(const AssistantConfig& config)
    : config_(config) {
    shellOptions_.timeout = std::chrono::seconds(config.processTimeoutSeconds);
    shellOptions_.maxOutputBytes = config.maxOutputBytes;
    searchOptions_.timeout = std::chrono::seconds(config.searchTimeoutSeconds);
    searchOptions_.maxOutputBytes = config.maxOutputBytes;
}

ExecutionResult SubprocessRunner::runShell(const std::string& command, const CancellationToken& token) {
    return runArgv({"/bin/sh", "-c", command}, shellOptions_, token);
}

ExecutionResult SubprocessRunner::runSearch(const std::string& query, const CancellationToken& token) {
    return runArgv(searchArgv(config_, query), searchOptions_, token);
}

std::vector<std::string> SubprocessRunner::searchArgv(const AssistantConfig& config, const std::string& query) {
    return {config.searchCommand, "--json", "-n", std::to_string(config.searchResultCount),
            "--unsafe", "--", query};
}

ExecutionResult SubprocessRunner::runArgv(const std::vector<std::string>& argv,
                                          const RunOptions& options,
                                          const CancellationToken& token) const {
    if (argv.empty() || argv[0].empty()) {
        throw LaunchError("No program to run");
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) {
        cargv.push_back(const_cast<char*>(a.c_str()));
    }
    cargv.push_back(nullptr);

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1}; // Reports execvp() failure; closed by a successful exec

    if (pipe2(outPipe, O_CLOEXEC) != 0 || pipe2(errPipe, O_CLOEXEC) != 0 ||
        pipe2(execPipe, O_CLOEXEC) != 0) {
        int err = errno;
        closePair(outPipe); closePair(errPipe); closePair(execPipe);
        throw LaunchError(std::string("Failed to create pipes: ") + std::strerror(err));
    }

    auto start = std::chrono::steady_clock::now();

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        closePair(outPipe); closePair(errPipe); closePair(execPipe);
        throw LaunchError(std::string("Failed to fork: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Child: own process group, stdin from /dev/null
        setpgid(0, 0);
        int devNull = open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            close(devNull);
        }
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);

        execvp(cargv[0], cargv.data());

        int err = errno;
        ssize_t ignored = write(execPipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent. Also set the group here so killpg() works even if we signal
    // before the child reached its own setpgid().
    setpgid(pid, pid);
    close(outPipe[1]);
    close(errPipe[1]);
    close(execPipe[1]);

    int execErr = 0;
    ssize_t n;
    do {
        n = read(execPipe[0], &execErr, sizeof(execErr));
    } while (n < 0 && errno == EINTR);
    close(execPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(execErr))) {
        close(outPipe[0]);
        close(errPipe[0]);
        reap(pid);
        throw LaunchError("Failed to launch '" + argv[0] + "': " + std::strerror(execErr));
    }

    if (config_.debug) {
        std::cerr << "[RUN] pid " << pid << ": " << joinArgv(argv) << std::endl;
    }

    ExecutionResult result;

    OutputPipe out{outPipe[0], true, &result.stdoutText, &result.stdoutTruncated, options.maxOutputBytes};
    OutputPipe err{errPipe[0], true, &result.stderrText, &result.stderrTruncated, options.maxOutputBytes};
    fcntl(out.fd, F_SETFL, fcntl(out.fd, F_GETFL) | O_NONBLOCK);
    fcntl(err.fd, F_SETFL, fcntl(err.fd, F_GETFL) | O_NONBLOCK);

    auto deadline = start + options.timeout;
    bool terminate = false;

    while (out.open || err.open || !leaderExited(pid)) {
        if (token.isCancelled()) {
            result.cancelled = true;
            terminate = true;
            break;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            result.timedOut = true;
            terminate = true;
            break;
        }

        auto wait = std::min<std::chrono::steady_clock::duration>(kPollInterval, deadline - now);
        int waitMs = static_cast<int>(
            std::chrono::duration_cast<std::chrono::milliseconds>(wait).count()) + 1;

        pollfd fds[2];
        nfds_t nfds = 0;
        if (out.open) fds[nfds++] = {out.fd, POLLIN, 0};
        if (err.open) fds[nfds++] = {err.fd, POLLIN, 0};

        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, waitMs));
        } else {
            // Pipes closed, leader still running
            std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
                wait, std::chrono::milliseconds(10)));
        }

        out.drain();
        err.drain();
    }

    if (terminate) {
        if (config_.debug) {
            std::cerr << "[RUN] pid " << pid << ": "
                      << (result.timedOut ? "timed out" : "cancelled")
                      << ", terminating process group" << std::endl;
        }

        killpg(pid, SIGTERM);
        auto graceEnd = std::chrono::steady_clock::now() + kTerminateGrace;
        while (!leaderExited(pid) && std::chrono::steady_clock::now() < graceEnd) {
            out.drain();
            err.drain();
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        // Descendants may have ignored SIGTERM or outlived the leader
        killpg(pid, SIGKILL);
    }

    result.exitCode = reap(pid);

    // Whatever is still buffered in the pipes
    out.drain();
    err.drain();
    out.closeFd();
    err.closeFd();

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (config_.debug) {
        std::cerr << "[RUN] pid " << pid << " exited with " << result.exitCode
                  << " after " << result.duration.count() << "ms"
                  << " (stdout " << result.stdoutText.size() << "B"
                  << (result.stdoutTruncated ? ", truncated" : "")
                  << ", stderr " << result.stderrText.size() << "B"
                  << (result.stderrTruncated ? ", truncated" : "") << ")" << std::endl;
    }

    return result;
}

} // namespace archchan
