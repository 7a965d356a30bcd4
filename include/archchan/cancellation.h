// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Cooperative cancellation for one dispatch cycle.
//
// The dispatcher polls isCancelled() at every state transition. Blocking
// operations (an HTTP request, a pending confirmation) register a hook that
// cancel() invokes to unblock them.

#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>

#include "archchan/export.h"

namespace archchan {

class ARCHCHAN_API CancellationToken {
public:
    using Hook = std::function<void()>;

    CancellationToken() = default;

    // Non-copyable
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /// Request cancellation. Idempotent; only the first call runs the hook.
    /// The hook runs outside the token's lock.
    void cancel();

    bool isCancelled() const;

    /// Install the hook for the blocking operation in progress.
    /// Runs it immediately if cancellation was already requested.
    void setHook(Hook hook);

    /// Remove the hook. Blocks until a concurrently running hook has returned,
    /// so whatever the hook captured may be destroyed afterwards.
    void clearHook();

private:
    mutable std::mutex mutex_;
    std::condition_variable hookDone_;
    bool cancelled_ = false;
    bool hookRunning_ = false;
    Hook hook_;
};

/// Installs a hook for the lifetime of a scope.
class CancelHookGuard {
public:
    CancelHookGuard(CancellationToken& token, CancellationToken::Hook hook)
        : token_(token) {
        token_.setHook(std::move(hook));
    }
    ~CancelHookGuard() { token_.clearHook(); }

    CancelHookGuard(const CancelHookGuard&) = delete;
    CancelHookGuard& operator=(const CancelHookGuard&) = delete;

private:
    CancellationToken& token_;
};

} // namespace archchan
