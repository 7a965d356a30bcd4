// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include <gtest/gtest.h>
#include <archchan/execution_worker.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <vector>

#include "test_fakes.h"

using namespace archchan;
using archchan::testing::RecordingRunner;
using archchan::testing::ScriptedModel;

class ExecutionWorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.silentMode = true;
        config_.modelRetries = 0;
        dispatcher_ = std::make_unique<ToolDispatcher>(config_, state_, model_, runner_, confirmation_);
        dispatcher_->setOutputHandler(std::make_unique<SilentConsole>(true));
        worker_ = std::make_unique<ExecutionWorker>(*dispatcher_);
    }

    void TearDown() override {
        worker_.reset();
    }

    /// Drain events until one terminal event per job has been seen.
    std::vector<WorkerEvent> collect(size_t terminalCount,
                                     std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::vector<WorkerEvent> events;
        size_t terminals = 0;
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (terminals < terminalCount && std::chrono::steady_clock::now() < deadline) {
            auto event = worker_->events().pop(std::chrono::milliseconds(50));
            if (!event) continue;
            if (event->type != WorkerEventType::PROGRESS) ++terminals;
            events.push_back(std::move(*event));
        }
        return events;
    }

    static size_t countFor(const std::vector<WorkerEvent>& events, uint64_t id, WorkerEventType type) {
        size_t n = 0;
        for (const auto& e : events) {
            if (e.jobId == id && e.type == type) ++n;
        }
        return n;
    }

    AssistantConfig config_;
    ConversationState state_{20, "arch-chan"};
    ScriptedModel model_;
    RecordingRunner runner_;
    CallbackConfirmation confirmation_{[](const ConfirmationRequest&) { return true; }};
    std::unique_ptr<ToolDispatcher> dispatcher_;
    std::unique_ptr<ExecutionWorker> worker_;
};

TEST_F(ExecutionWorkerTest, ProgressThenExactlyOneResult) {
    model_.reply("hola");
    uint64_t id = worker_->submit("hi");

    auto events = collect(1);
    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(events[0].type, WorkerEventType::PROGRESS);
    EXPECT_EQ(events[0].stage, DispatchStage::AWAITING_MODEL_REPLY);
    EXPECT_EQ(events[1].stage, DispatchStage::PARSING);
    EXPECT_EQ(events[2].stage, DispatchStage::DONE);
    EXPECT_EQ(events[3].type, WorkerEventType::RESULT);
    for (const auto& e : events) {
        EXPECT_EQ(e.jobId, id);
    }

    ASSERT_TRUE(events[3].outcome.has_value());
    EXPECT_EQ(outcomeText(*events[3].outcome), "hola");

    // Nothing further for this job
    EXPECT_FALSE(worker_->events().pop(std::chrono::milliseconds(100)).has_value());
}

TEST_F(ExecutionWorkerTest, ShellResultEvent) {
    model_.reply(R"({"tool":"shell","command":"df -h","explanation":"disk"})");
    uint64_t id = worker_->submit("disk usage?");

    auto events = collect(1);
    ASSERT_FALSE(events.empty());
    const auto& last = events.back();
    EXPECT_EQ(last.type, WorkerEventType::RESULT);
    EXPECT_EQ(last.jobId, id);
    ASSERT_TRUE(last.outcome.has_value());
    EXPECT_TRUE(std::holds_alternative<Executed>(*last.outcome));
    EXPECT_EQ(countFor(events, id, WorkerEventType::PROGRESS), 5u);
}

TEST_F(ExecutionWorkerTest, MessagesRunInSubmissionOrder) {
    model_.reply("one");
    model_.reply("two");
    model_.reply("three");

    uint64_t a = worker_->submit("1");
    uint64_t b = worker_->submit("2");
    uint64_t c = worker_->submit("3");
    EXPECT_LT(a, b);
    EXPECT_LT(b, c);

    auto events = collect(3);
    std::vector<uint64_t> resultOrder;
    for (const auto& e : events) {
        if (e.type == WorkerEventType::RESULT) resultOrder.push_back(e.jobId);
    }
    std::vector<uint64_t> expected = {a, b, c};
    EXPECT_EQ(resultOrder, expected);

    // Each cycle saw the complete history of the previous ones
    auto requests = model_.requests();
    ASSERT_EQ(requests.size(), 3u);
    EXPECT_EQ(requests[0].context.size(), 1u);
    EXPECT_EQ(requests[1].context.size(), 3u);
    EXPECT_EQ(requests[2].context.size(), 5u);
}

TEST_F(ExecutionWorkerTest, CancelRunningJob) {
    model_.block();
    uint64_t id = worker_->submit("slow");
    ASSERT_TRUE(model_.waitForCalls(1));
    EXPECT_TRUE(worker_->busy());

    EXPECT_TRUE(worker_->cancel(id));

    auto events = collect(1);
    EXPECT_EQ(countFor(events, id, WorkerEventType::CANCELLED), 1u);
    EXPECT_EQ(countFor(events, id, WorkerEventType::RESULT), 0u);
    EXPECT_FALSE(worker_->events().pop(std::chrono::milliseconds(100)).has_value());
}

TEST_F(ExecutionWorkerTest, CancelRunningCommand) {
    model_.reply(R"({"tool":"shell","command":"sleep 100","explanation":"wait"})");
    runner_.blockUntilCancelled = true;
    uint64_t id = worker_->submit("wait a while");

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (runner_.callCount() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_EQ(runner_.callCount(), 1u);
    EXPECT_TRUE(worker_->cancel(id));

    auto events = collect(1);
    EXPECT_EQ(countFor(events, id, WorkerEventType::CANCELLED), 1u);
    EXPECT_EQ(countFor(events, id, WorkerEventType::RESULT), 0u);
}

TEST_F(ExecutionWorkerTest, CancelQueuedJob) {
    model_.block();
    uint64_t first = worker_->submit("slow");
    ASSERT_TRUE(model_.waitForCalls(1));
    uint64_t second = worker_->submit("queued");
    EXPECT_EQ(worker_->pendingCount(), 1u);

    EXPECT_TRUE(worker_->cancel(second));
    EXPECT_EQ(worker_->pendingCount(), 0u);
    EXPECT_TRUE(worker_->cancel(first));

    auto events = collect(2);
    EXPECT_EQ(countFor(events, second, WorkerEventType::CANCELLED), 1u);
    EXPECT_EQ(countFor(events, second, WorkerEventType::PROGRESS), 0u);
    EXPECT_EQ(countFor(events, first, WorkerEventType::CANCELLED), 1u);
    EXPECT_EQ(model_.callCount(), 1u);
}

TEST_F(ExecutionWorkerTest, CancelUnknownOrFinishedJob) {
    EXPECT_FALSE(worker_->cancel(42));

    model_.reply("done");
    uint64_t id = worker_->submit("x");
    collect(1);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (worker_->busy() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_FALSE(worker_->cancel(id));
}

TEST_F(ExecutionWorkerTest, CancelAll) {
    model_.block();
    uint64_t a = worker_->submit("a");
    ASSERT_TRUE(model_.waitForCalls(1));
    uint64_t b = worker_->submit("b");
    uint64_t c = worker_->submit("c");

    worker_->cancelAll();

    auto events = collect(3);
    EXPECT_EQ(countFor(events, a, WorkerEventType::CANCELLED), 1u);
    EXPECT_EQ(countFor(events, b, WorkerEventType::CANCELLED), 1u);
    EXPECT_EQ(countFor(events, c, WorkerEventType::CANCELLED), 1u);
}

TEST_F(ExecutionWorkerTest, StopCancelsAndRejectsNewWork) {
    model_.block();
    uint64_t id = worker_->submit("slow");
    ASSERT_TRUE(model_.waitForCalls(1));

    worker_->stop();
    worker_->stop(); // idempotent
    EXPECT_FALSE(worker_->busy());
    EXPECT_THROW(worker_->submit("late"), std::runtime_error);

    auto events = collect(1, std::chrono::milliseconds(500));
    EXPECT_EQ(countFor(events, id, WorkerEventType::CANCELLED), 1u);
}

TEST(WorkerEventQueueTest, PopTimesOut) {
    WorkerEventQueue queue;
    EXPECT_FALSE(queue.tryPop().has_value());
    EXPECT_FALSE(queue.pop(std::chrono::milliseconds(10)).has_value());

    queue.push({WorkerEventType::PROGRESS, 7, DispatchStage::PARSING, std::nullopt});
    EXPECT_EQ(queue.size(), 1u);
    auto event = queue.pop(std::chrono::milliseconds(10));
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->jobId, 7u);
    EXPECT_EQ(workerEventTypeToString(event->type), "progress");
}
