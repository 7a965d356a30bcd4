// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "archchan/cancellation.h"

namespace archchan {

void CancellationToken::cancel() {
    Hook hook;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_) return;
        cancelled_ = true;
        if (!hook_) return;
        hook = hook_;
        hookRunning_ = true;
    }

    hook();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        hookRunning_ = false;
    }
    hookDone_.notify_all();
}

bool CancellationToken::isCancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

void CancellationToken::setHook(Hook hook) {
    bool runNow = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        hook_ = hook;
        runNow = cancelled_;
    }
    if (runNow && hook) {
        hook();
    }
}

void CancellationToken::clearHook() {
    std::unique_lock<std::mutex> lock(mutex_);
    hookDone_.wait(lock, [this] { return !hookRunning_; });
    hook_ = nullptr;
}

} // namespace archchan
