// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "archchan/execution_worker.h"

#include <stdexcept>

namespace archchan {

// ---- WorkerEventQueue ----

void WorkerEventQueue::push(WorkerEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(std::move(event));
    }
    cv_.notify_all();
}

std::optional<WorkerEvent> WorkerEventQueue::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this]() { return !events_.empty(); })) {
        return std::nullopt;
    }
    WorkerEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<WorkerEvent> WorkerEventQueue::tryPop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) {
        return std::nullopt;
    }
    WorkerEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

size_t WorkerEventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

// ---- ExecutionWorker ----

ExecutionWorker::ExecutionWorker(ToolDispatcher& dispatcher)
    : dispatcher_(dispatcher) {
    thread_ = std::thread(&ExecutionWorker::run, this);
}

ExecutionWorker::~ExecutionWorker() {
    stop();
}

uint64_t ExecutionWorker::submit(const std::string& userInput) {
    uint64_t id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("Execution worker is stopped");
        }
        id = nextId_++;
        queue_.push_back(Job{id, userInput, std::make_shared<CancellationToken>()});
    }
    cv_.notify_all();
    return id;
}

bool ExecutionWorker::cancel(uint64_t jobId) {
    std::shared_ptr<CancellationToken> running;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = queue_.begin(); it != queue_.end(); ++it) {
            if (it->id == jobId) {
                queue_.erase(it);
                events_.push({WorkerEventType::CANCELLED, jobId, DispatchStage::CANCELLED, std::nullopt});
                return true;
            }
        }
        if (!current_.has_value() || current_->id != jobId) {
            return false;
        }
        running = current_->token;
    }
    // Outside the lock: cancel() runs hooks that may block briefly
    running->cancel();
    return true;
}

void ExecutionWorker::cancelAll() {
    std::shared_ptr<CancellationToken> running;
    std::deque<Job> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped.swap(queue_);
        if (current_.has_value()) {
            running = current_->token;
        }
    }
    for (const auto& job : dropped) {
        events_.push({WorkerEventType::CANCELLED, job.id, DispatchStage::CANCELLED, std::nullopt});
    }
    if (running) {
        running->cancel();
    }
}

void ExecutionWorker::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && !thread_.joinable()) {
            return;
        }
        stopping_ = true;
    }
    cancelAll();
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool ExecutionWorker::busy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_.has_value();
}

size_t ExecutionWorker::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void ExecutionWorker::run() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return; // stopping
            }
            job = std::move(queue_.front());
            queue_.pop_front();
            current_ = job;
        }

        execute(job);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            current_.reset();
        }
    }
}

void ExecutionWorker::execute(const Job& job) {
    uint64_t id = job.id;
    auto onProgress = [this, id](DispatchStage stage) {
        events_.push({WorkerEventType::PROGRESS, id, stage, std::nullopt});
    };

    DispatchOutcome outcome = dispatcher_.dispatch(job.input, *job.token, onProgress);

    if (std::holds_alternative<Cancelled>(outcome)) {
        events_.push({WorkerEventType::CANCELLED, id, DispatchStage::CANCELLED, std::nullopt});
    } else {
        events_.push({WorkerEventType::RESULT, id, DispatchStage::DONE, std::move(outcome)});
    }
}

} // namespace archchan
