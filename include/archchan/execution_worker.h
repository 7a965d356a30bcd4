// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Background execution of dispatch cycles.
//
// The worker owns one thread and a FIFO of submitted messages. Each message
// becomes one ToolDispatcher cycle; its progress is reported as events on a
// queue the caller drains from its own (interactive) thread:
//   PROGRESS  once per state-machine transition
//   RESULT    exactly once when the cycle completes
//   CANCELLED exactly once when cancellation was honored instead
// Messages submitted while a cycle runs wait their turn; cycles never overlap.

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "types.h"
#include "cancellation.h"
#include "tool_dispatcher.h"
#include "archchan/export.h"

namespace archchan {

enum class WorkerEventType {
    PROGRESS,
    RESULT,
    CANCELLED
};

inline std::string workerEventTypeToString(WorkerEventType t) {
    switch (t) {
        case WorkerEventType::PROGRESS:  return "progress";
        case WorkerEventType::RESULT:    return "result";
        case WorkerEventType::CANCELLED: return "cancelled";
    }
    return "unknown";
}

struct WorkerEvent {
    WorkerEventType type = WorkerEventType::PROGRESS;
    uint64_t jobId = 0;
    DispatchStage stage = DispatchStage::IDLE; // PROGRESS only
    std::optional<DispatchOutcome> outcome;    // RESULT only
};

/// Thread-safe FIFO of worker events.
class ARCHCHAN_API WorkerEventQueue {
public:
    void push(WorkerEvent event);

    /// Wait up to timeout for the next event.
    std::optional<WorkerEvent> pop(std::chrono::milliseconds timeout);

    /// Next event if one is already queued.
    std::optional<WorkerEvent> tryPop();

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<WorkerEvent> events_;
};

class ARCHCHAN_API ExecutionWorker {
public:
    /// Starts the worker thread. The dispatcher must outlive the worker.
    explicit ExecutionWorker(ToolDispatcher& dispatcher);
    ~ExecutionWorker();

    // Non-copyable
    ExecutionWorker(const ExecutionWorker&) = delete;
    ExecutionWorker& operator=(const ExecutionWorker&) = delete;

    /// Queue a user message.
    /// @return Job id carried by every event of this message's cycle
    /// @throws std::runtime_error after stop()
    uint64_t submit(const std::string& userInput);

    /// Cancel a queued or running job.
    /// A queued job is dropped with a CANCELLED event; a running job has its
    /// token cancelled (terminating any child process) and reports CANCELLED
    /// if the cycle had not completed yet.
    /// @return false if the job is unknown or already finished
    bool cancel(uint64_t jobId);

    /// Cancel the running job and every queued job.
    void cancelAll();

    /// Cancel everything and join the thread. Idempotent.
    void stop();

    /// True while a cycle is running.
    bool busy() const;

    /// Jobs waiting behind the running one.
    size_t pendingCount() const;

    WorkerEventQueue& events() { return events_; }

private:
    struct Job {
        uint64_t id = 0;
        std::string input;
        std::shared_ptr<CancellationToken> token;
    };

    void run();
    void execute(const Job& job);

    ToolDispatcher& dispatcher_;
    WorkerEventQueue events_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Job> queue_;
    std::optional<Job> current_;
    uint64_t nextId_ = 1;
    bool stopping_ = false;

    std::thread thread_;
};

} // namespace archchan
