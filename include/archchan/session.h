// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// AssistantSession: one conversation with everything it needs.
//
// Owns the conversation state, the model client, the process runner, the
// confirmation gate, the dispatcher and the background worker. Front ends
// submit messages, drain events() and answer confirmation requests with
// approve()/deny(). Nothing here is process-wide; two sessions are independent.

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "types.h"
#include "conversation_state.h"
#include "execution_worker.h"
#include "model_client.h"
#include "process_runner.h"
#include "tool_dispatcher.h"
#include "archchan/export.h"

namespace archchan {

using json = nlohmann::json;

class ARCHCHAN_API AssistantSession {
public:
    /// Session talking to the configured Ollama endpoint and running real processes.
    explicit AssistantSession(const AssistantConfig& config = AssistantConfig{});

    /// Session with injected backends (tests, alternative endpoints).
    AssistantSession(const AssistantConfig& config,
                     std::unique_ptr<ModelClient> model,
                     std::unique_ptr<ProcessRunner> runner);

    ~AssistantSession();

    // Non-copyable
    AssistantSession(const AssistantSession&) = delete;
    AssistantSession& operator=(const AssistantSession&) = delete;

    /// Queue a user message for the background worker.
    /// @return Job id used in the resulting events
    uint64_t submit(const std::string& userInput);

    /// Cancel a queued or running message.
    bool cancel(uint64_t jobId);

    /// Answer the pending confirmation request.
    /// @return false if nothing is waiting for confirmation
    bool approve();
    bool deny();

    /// Confirmation request currently waiting for an answer.
    std::optional<ConfirmationRequest> pendingConfirmation() const;

    /// Notified on the worker thread when a confirmation request is raised.
    void onConfirmationRequest(ConfirmationGate::RequestCallback callback);

    /// Drop the conversation history ("clear chat").
    void clearChat();

    /// Switch the model used by subsequent messages.
    /// @throws std::invalid_argument if modelId is empty
    void selectModel(const std::string& modelId);
    std::string currentModel() const;

    /// Known model identifiers from the configuration.
    std::vector<std::string> knownModels() const;

    /// Retained turns as JSON (see ConversationState::toJson()).
    json exportTranscript() const;

    WorkerEventQueue& events() { return worker_->events(); }
    bool busy() const { return worker_->busy(); }

    ConversationState& state() { return state_; }
    ToolDispatcher& dispatcher() { return *dispatcher_; }
    const AssistantConfig& config() const { return config_; }

private:
    // Declaration order is construction order; the worker must go first on destruction
    AssistantConfig config_;
    ConversationState state_;
    std::unique_ptr<ModelClient> model_;
    std::unique_ptr<ProcessRunner> runner_;
    ConfirmationGate gate_;
    std::unique_ptr<ToolDispatcher> dispatcher_;
    std::unique_ptr<ExecutionWorker> worker_;
};

} // namespace archchan
