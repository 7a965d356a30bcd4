// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Tool Dispatcher: the per-message state machine.
//
//   IDLE -> AWAITING_MODEL_REPLY -> PARSING -> DONE                      (plain text)
//                                          -> VALIDATING -> [AWAITING_CONFIRMATION]
//                                             -> EXECUTING -> [SUMMARIZING] -> DONE
//   any stage -> CANCELLED
//
// One cycle runs at a time per dispatcher; a second dispatch() call blocks
// until the first returns. The user turn is committed to ConversationState when
// the cycle starts; every other turn the cycle produces is committed in one
// step when it reaches DONE. A cancelled or failed cycle commits nothing else.

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <string>
#include <vector>

#include "types.h"
#include "cancellation.h"
#include "command_validator.h"
#include "console.h"
#include "conversation_state.h"
#include "model_client.h"
#include "process_runner.h"
#include "archchan/export.h"

namespace archchan {

/// Boundary to whoever approves privileged commands.
class ARCHCHAN_API ConfirmationHandler {
public:
    virtual ~ConfirmationHandler() = default;

    /// Ask for approval. May block.
    /// Must return (with any value) once the token is cancelled.
    virtual bool confirm(const ConfirmationRequest& request, CancellationToken& token) = 0;
};

/// Synchronous confirmation through a callback (terminal prompt, tests).
class ARCHCHAN_API CallbackConfirmation : public ConfirmationHandler {
public:
    using Callback = std::function<bool(const ConfirmationRequest&)>;

    explicit CallbackConfirmation(Callback callback) : callback_(std::move(callback)) {}

    bool confirm(const ConfirmationRequest& request, CancellationToken&) override {
        return callback_ ? callback_(request) : false;
    }

private:
    Callback callback_;
};

/// Confirmation answered from another thread.
///
/// confirm() publishes the request and blocks the dispatch thread until
/// resolve() is called or the cycle is cancelled.
class ARCHCHAN_API ConfirmationGate : public ConfirmationHandler {
public:
    using RequestCallback = std::function<void(const ConfirmationRequest&)>;

    /// Called (on the dispatch thread) each time a request becomes pending.
    void setRequestCallback(RequestCallback callback);

    bool confirm(const ConfirmationRequest& request, CancellationToken& token) override;

    /// The request currently waiting for an answer, if any.
    std::optional<ConfirmationRequest> pending() const;

    /// Answer the pending request.
    /// @return false if no request was pending
    bool resolve(bool approved);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    RequestCallback callback_;
    std::optional<ConfirmationRequest> pending_;
    std::optional<bool> decision_;
    bool aborted_ = false;
};

/// Receives one call per state-machine transition.
using ProgressCallback = std::function<void(DispatchStage)>;

class ARCHCHAN_API ToolDispatcher {
public:
    /// All collaborators must outlive the dispatcher.
    ToolDispatcher(const AssistantConfig& config,
                   ConversationState& state,
                   ModelClient& model,
                   ProcessRunner& runner,
                   ConfirmationHandler& confirmation);

    // Non-copyable
    ToolDispatcher(const ToolDispatcher&) = delete;
    ToolDispatcher& operator=(const ToolDispatcher&) = delete;

    /// Run one full dispatch cycle for a user message.
    /// Never throws; every failure becomes a Rejected outcome.
    ///
    /// @param userInput The user's message
    /// @param token Checked at every transition; cancelling it yields Cancelled
    /// @param progress Optional per-transition callback
    /// @return The cycle's terminal outcome
    DispatchOutcome dispatch(const std::string& userInput,
                             CancellationToken& token,
                             const ProgressCallback& progress = nullptr);

    /// Stage of the cycle in progress (IDLE between cycles).
    DispatchStage stage() const { return stage_.load(); }

    /// Rewrite a leading "sudo" to the configured graphical elevation tool.
    /// Commands without the prefix, or an empty tool, are returned unchanged.
    std::string elevate(const std::string& command) const;

    /// Get the composed system prompt.
    std::string systemPrompt() const;

    const CommandValidator& validator() const { return validator_; }

    /// Get the output handler.
    OutputHandler& console() { return *console_; }

    /// Set a custom output handler.
    void setOutputHandler(std::unique_ptr<OutputHandler> handler);

private:
    struct Cycle {
        CancellationToken& token;
        const ProgressCallback& progress;
        std::vector<Turn> pending; // Committed together at DONE
    };

    /// Enter a stage. Returns false if the cycle has been cancelled.
    bool advance(DispatchStage next, Cycle& cycle);

    DispatchOutcome finish(DispatchOutcome outcome, Cycle& cycle);
    DispatchOutcome cancelled(Cycle& cycle);

    DispatchOutcome runCycle(const std::string& userInput, Cycle& cycle);
    DispatchOutcome handleShell(const ShellCall& call, Cycle& cycle);
    DispatchOutcome handleSearch(const SearchCall& call, Cycle& cycle);
    DispatchOutcome reject(ErrorKind kind, const std::string& reason,
                           const std::string& toolTurn, Cycle& cycle);

    /// Call the model with retries on ModelUnavailable.
    /// @throws ModelError when all attempts fail
    std::string callModel(const std::vector<Turn>& context, Cycle& cycle);

    std::string composeSystemPrompt() const;

    void trace(const std::string& message) const;

    // ---- State ----
    AssistantConfig config_;
    ConversationState& state_;
    ModelClient& model_;
    ProcessRunner& runner_;
    ConfirmationHandler& confirmation_;
    CommandValidator validator_;
    std::unique_ptr<OutputHandler> console_;

    std::mutex cycleMutex_;
    std::atomic<DispatchStage> stage_{DispatchStage::IDLE};

    std::string cachedSystemPrompt_;

    // Tool format instructions appended to every system prompt
    static const std::string TOOL_FORMAT_TEMPLATE;
    static const std::string DEFAULT_PROMPT;
};

} // namespace archchan
