// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "archchan/tool_dispatcher.h"
#include "archchan/response_parser.h"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace archchan {

// Tool format instructions (the wire shapes parseModelReply() accepts)
const std::string ToolDispatcher::TOOL_FORMAT_TEMPLATE = R"(
==== TOOLS ====
For normal conversation, reply with plain text.
To act, reply with EXACTLY ONE JSON object and nothing else:

Run a shell command:
{"tool": "shell", "command": "the command", "explanation": "why it is needed"}

Search the web:
{"tool": "search", "query": "what to search for"}

RULES:
1. Never wrap the JSON in markdown or mix it with text
2. "tool" must be "shell" or "search"
3. One tool call per reply; you will see its result before answering
4. Commands that need root must start with sudo; the user will be asked to confirm
)";

const std::string ToolDispatcher::DEFAULT_PROMPT =
    "You are Arch-Chan, an AI assistant specialized in Arch Linux. "
    "You help the user inspect and administer their system, explain what you do, "
    "and keep answers short and friendly.";

namespace {

std::string describeExecution(const std::string& invocation, const ExecutionResult& result,
                              int timeoutSeconds) {
    std::ostringstream oss;
    oss << "Command: " << invocation << "\n";
    if (result.timedOut) {
        oss << "Timed out after " << timeoutSeconds << "s; output is partial.\n";
    }
    oss << "Exit code: " << result.exitCode;
    if (!result.stdoutText.empty()) {
        oss << "\nOutput:\n" << result.stdoutText;
        if (result.stdoutTruncated) oss << "\n...[output truncated]";
    }
    if (!result.stderrText.empty()) {
        oss << "\nErrors:\n" << result.stderrText;
        if (result.stderrTruncated) oss << "\n...[errors truncated]";
    }
    if (result.stdoutText.empty() && result.stderrText.empty()) {
        oss << "\n(no output)";
    }
    return oss.str();
}

std::string shellQuoteSingle(const std::string& text) {
    std::string quoted = "'";
    for (char c : text) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    return quoted + "'";
}

} // namespace

// ---- ConfirmationGate ----

void ConfirmationGate::setRequestCallback(RequestCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

bool ConfirmationGate::confirm(const ConfirmationRequest& request, CancellationToken& token) {
    RequestCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_ = request;
        decision_.reset();
        aborted_ = false;
        callback = callback_;
    }

    // Installed after the reset above so an already-cancelled token aborts at once
    CancelHookGuard guard(token, [this]() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            aborted_ = true;
        }
        cv_.notify_all();
    });

    if (callback) {
        callback(request);
    }

    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return decision_.has_value() || aborted_; });
    bool approved = !aborted_ && decision_.value_or(false);
    pending_.reset();
    decision_.reset();
    lock.unlock();
    return approved;
}

std::optional<ConfirmationRequest> ConfirmationGate::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
}

bool ConfirmationGate::resolve(bool approved) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!pending_.has_value() || decision_.has_value()) {
            return false;
        }
        decision_ = approved;
    }
    cv_.notify_all();
    return true;
}

// ---- ToolDispatcher ----

ToolDispatcher::ToolDispatcher(const AssistantConfig& config,
                               ConversationState& state,
                               ModelClient& model,
                               ProcessRunner& runner,
                               ConfirmationHandler& confirmation)
    : config_(config),
      state_(state),
      model_(model),
      runner_(runner),
      confirmation_(confirmation) {

    // Create console based on config
    if (config_.silentMode) {
        console_ = std::make_unique<SilentConsole>();
    } else {
        console_ = std::make_unique<TerminalConsole>();
    }

    cachedSystemPrompt_ = composeSystemPrompt();
}

void ToolDispatcher::setOutputHandler(std::unique_ptr<OutputHandler> handler) {
    console_ = std::move(handler);
}

std::string ToolDispatcher::systemPrompt() const {
    return cachedSystemPrompt_;
}

std::string ToolDispatcher::composeSystemPrompt() const {
    std::ostringstream oss;
    oss << (config_.systemPrompt.empty() ? DEFAULT_PROMPT : config_.systemPrompt) << "\n";
    oss << TOOL_FORMAT_TEMPLATE;
    return oss.str();
}

std::string ToolDispatcher::elevate(const std::string& command) const {
    std::string trimmed = trimWhitespace(command);
    if (config_.elevationTool.empty() || trimmed.compare(0, 5, "sudo ") != 0) {
        return command;
    }

    std::string inner = trimWhitespace(trimmed.substr(5));
    if (config_.elevationTool == "kdesu") {
        return "kdesu -c " + shellQuoteSingle(inner);
    }
    return config_.elevationTool + " " + inner;
}

void ToolDispatcher::trace(const std::string& message) const {
    if (config_.debug) {
        std::cerr << "[DISPATCH] " << message << std::endl;
    }
}

// ---- State Machine ----

bool ToolDispatcher::advance(DispatchStage next, Cycle& cycle) {
    if (cycle.token.isCancelled()) {
        return false;
    }
    stage_.store(next);
    trace("-> " + stageToString(next));
    if (config_.debug) {
        console_->printStage(next);
    }
    if (cycle.progress) {
        cycle.progress(next);
    }
    return true;
}

DispatchOutcome ToolDispatcher::finish(DispatchOutcome outcome, Cycle& cycle) {
    if (!cycle.pending.empty()) {
        state_.append(std::move(cycle.pending));
        cycle.pending.clear();
    }
    stage_.store(DispatchStage::DONE);
    trace("-> DONE");
    if (cycle.progress) {
        cycle.progress(DispatchStage::DONE);
    }
    return outcome;
}

DispatchOutcome ToolDispatcher::cancelled(Cycle& cycle) {
    cycle.pending.clear();
    console_->printCancelled();
    stage_.store(DispatchStage::CANCELLED);
    trace("-> CANCELLED");
    if (cycle.progress) {
        cycle.progress(DispatchStage::CANCELLED);
    }
    return Cancelled{};
}

DispatchOutcome ToolDispatcher::reject(ErrorKind kind, const std::string& reason,
                                       const std::string& toolTurn, Cycle& cycle) {
    console_->printRejection(kind, reason);
    if (!toolTurn.empty()) {
        cycle.pending.push_back(Turn::make(MessageRole::TOOL, toolTurn));
    }
    return finish(Rejected{kind, reason}, cycle);
}

std::string ToolDispatcher::callModel(const std::vector<Turn>& context, Cycle& cycle) {
    std::string modelId = state_.modelId();
    int attempts = 1 + std::max(0, config_.modelRetries);

    for (int attempt = 1;; ++attempt) {
        try {
            return model_.chat(modelId, context, systemPrompt(), cycle.token);
        } catch (const ModelError& e) {
            bool retry = e.kind() == ErrorKind::MODEL_UNAVAILABLE &&
                         attempt < attempts && !cycle.token.isCancelled();
            if (!retry) {
                throw;
            }
            console_->stopProgress();
            console_->printWarning(std::string("Model call failed, retrying: ") + e.what());
            console_->startProgress("Retrying");
        }
    }
}

DispatchOutcome ToolDispatcher::dispatch(const std::string& userInput,
                                         CancellationToken& token,
                                         const ProgressCallback& progress) {
    std::lock_guard<std::mutex> cycleLock(cycleMutex_);

    Cycle cycle{token, progress, {}};
    DispatchOutcome outcome;
    try {
        outcome = runCycle(userInput, cycle);
    } catch (const std::exception& e) {
        console_->stopProgress();
        console_->printError(std::string("Dispatch failed: ") + e.what());
        cycle.pending.clear();
        outcome = finish(Rejected{ErrorKind::INTERNAL, e.what()}, cycle);
    }

    stage_.store(DispatchStage::IDLE);
    return outcome;
}

DispatchOutcome ToolDispatcher::runCycle(const std::string& userInput, Cycle& cycle) {
    if (cycle.token.isCancelled()) {
        return cancelled(cycle);
    }

    state_.append(Turn::make(MessageRole::USER, userInput));
    console_->printProcessingStart(userInput, state_.modelId());

    // ---- Model Reply ----
    if (!advance(DispatchStage::AWAITING_MODEL_REPLY, cycle)) return cancelled(cycle);

    std::string reply;
    console_->startProgress("Thinking");
    try {
        reply = callModel(state_.snapshot(), cycle);
    } catch (const ModelError& e) {
        console_->stopProgress();
        if (cycle.token.isCancelled()) return cancelled(cycle);
        console_->printError(std::string("Model error: ") + e.what());
        return finish(Rejected{e.kind(), e.what()}, cycle);
    }
    console_->stopProgress();

    if (config_.debug) {
        console_->printResponse(reply, "Model Reply");
    }

    // ---- Parse ----
    if (!advance(DispatchStage::PARSING, cycle)) return cancelled(cycle);

    ParsedReply parsed = parseModelReply(reply);
    cycle.pending.push_back(Turn::make(MessageRole::ASSISTANT, reply));

    if (!parsed.isToolCall()) {
        if (parsed.isMalformedPayload()) {
            console_->printWarning(errorKindToString(ErrorKind::MALFORMED_TOOL_PAYLOAD) +
                                   ": " + parsed.diagnostic + "; showing reply as text");
        }
        console_->printFinalAnswer(reply);
        return finish(Displayed{reply}, cycle);
    }

    console_->printToolUsage(*parsed.toolCall);
    if (config_.debug) {
        console_->prettyPrintJson(toolCallToJson(*parsed.toolCall), "Tool Call");
    }

    if (const auto* shell = std::get_if<ShellCall>(&*parsed.toolCall)) {
        return handleShell(*shell, cycle);
    }
    return handleSearch(std::get<SearchCall>(*parsed.toolCall), cycle);
}

DispatchOutcome ToolDispatcher::handleShell(const ShellCall& call, Cycle& cycle) {
    // ---- Validate ----
    if (!advance(DispatchStage::VALIDATING, cycle)) return cancelled(cycle);

    ValidationVerdict verdict = validator_.validate(call.command);
    std::string invocation = call.command;

    if (verdict.isBlocked()) {
        console_->printWarning("Blocked command '" + call.command + "': " + verdict.reason);
        return reject(ErrorKind::COMMAND_BLOCKED, "Command blocked: " + verdict.reason,
                      "Command not executed: '" + call.command + "' was blocked (" +
                      verdict.reason + ").",
                      cycle);
    }

    if (verdict.needsConfirmation()) {
        if (!advance(DispatchStage::AWAITING_CONFIRMATION, cycle)) return cancelled(cycle);

        ConfirmationRequest request;
        request.command = call.command;
        request.explanation = call.explanation;
        request.reason = verdict.reason;
        request.info = validator_.describe(call.command);
        console_->printConfirmationRequest(request);

        bool approved = confirmation_.confirm(request, cycle.token);
        if (cycle.token.isCancelled()) return cancelled(cycle);

        if (!approved) {
            return reject(ErrorKind::CONFIRMATION_DENIED, "The user denied '" + call.command + "'",
                          "Command not executed: the user denied '" + call.command + "'.",
                          cycle);
        }
        invocation = elevate(call.command);
        if (invocation != call.command) {
            trace("elevated: " + invocation);
        }
    }

    // ---- Execute ----
    if (!advance(DispatchStage::EXECUTING, cycle)) return cancelled(cycle);

    ExecutionResult result;
    console_->startProgress("Running");
    try {
        result = runner_.runShell(invocation, cycle.token);
    } catch (const LaunchError& e) {
        console_->stopProgress();
        return reject(ErrorKind::LAUNCH_ERROR, e.what(),
                      "Command could not be started: '" + invocation + "': " + e.what(),
                      cycle);
    }
    console_->stopProgress();

    if (result.cancelled || cycle.token.isCancelled()) return cancelled(cycle);

    if (result.timedOut) {
        console_->printWarning(errorKindToString(ErrorKind::EXECUTION_TIMEOUT) + ": '" +
                               invocation + "' exceeded " +
                               std::to_string(config_.processTimeoutSeconds) + "s");
    }
    console_->printExecutionResult(result);
    if (config_.debug) {
        console_->prettyPrintJson(result.toJson(), "Execution Result");
    }

    std::string text = describeExecution(invocation, result, config_.processTimeoutSeconds);
    cycle.pending.push_back(Turn::make(MessageRole::TOOL, text));

    Executed executed;
    executed.call = call;
    executed.invocation = invocation;
    executed.result = std::move(result);
    executed.displayText = std::move(text);
    return finish(std::move(executed), cycle);
}

DispatchOutcome ToolDispatcher::handleSearch(const SearchCall& call, Cycle& cycle) {
    // ---- Execute ----
    if (!advance(DispatchStage::EXECUTING, cycle)) return cancelled(cycle);

    ExecutionResult result;
    console_->startProgress("Searching");
    try {
        result = runner_.runSearch(call.query, cycle.token);
    } catch (const LaunchError& e) {
        console_->stopProgress();
        return reject(ErrorKind::LAUNCH_ERROR, e.what(),
                      "Search could not be started: " + std::string(e.what()),
                      cycle);
    }
    console_->stopProgress();

    if (result.cancelled || cycle.token.isCancelled()) return cancelled(cycle);

    std::string formatted;
    if (result.stdoutText.empty() && result.exitCode != 0) {
        formatted = "Search failed (exit code " + std::to_string(result.exitCode) + ")";
        if (!result.stderrText.empty()) {
            formatted += ": " + truncateMiddle(trimWhitespace(result.stderrText), config_.maxOutputBytes);
        }
    } else {
        formatted = formatSearchResults(result.stdoutText,
                                        static_cast<size_t>(std::max(0, config_.searchResultsShown)),
                                        config_.maxOutputBytes);
    }
    if (result.timedOut) {
        console_->printWarning(errorKindToString(ErrorKind::EXECUTION_TIMEOUT) + ": search exceeded " +
                               std::to_string(config_.searchTimeoutSeconds) + "s");
    }

    std::string searchTurn = "Search results for '" + call.query + "':\n" + formatted;
    cycle.pending.push_back(Turn::make(MessageRole::TOOL, searchTurn));

    Executed executed;
    executed.call = call;
    executed.invocation = call.query;
    executed.result = std::move(result);
    executed.displayText = formatted;

    // ---- Summarize ----
    if (!advance(DispatchStage::SUMMARIZING, cycle)) return cancelled(cycle);

    std::vector<Turn> context = state_.snapshot();
    context.insert(context.end(), cycle.pending.begin(), cycle.pending.end());
    context.push_back(Turn::make(MessageRole::USER,
        "Summarize these search results for the user in a friendly, concise way. "
        "Reply with plain text only."));

    console_->startProgress("Summarizing");
    std::string reply;
    try {
        reply = callModel(context, cycle);
    } catch (const ModelError& e) {
        console_->stopProgress();
        if (cycle.token.isCancelled()) return cancelled(cycle);
        console_->printWarning(std::string("Could not summarize search results: ") + e.what());
        console_->printFinalAnswer(formatted);
        return finish(std::move(executed), cycle);
    }
    console_->stopProgress();

    if (cycle.token.isCancelled()) return cancelled(cycle);

    // Tool calls never chain: a payload here is shown as raw results instead
    ParsedReply parsed = parseModelReply(reply);
    if (parsed.isToolCall()) {
        console_->printWarning(errorKindToString(ErrorKind::MALFORMED_TOOL_PAYLOAD) +
                               ": summary reply contained a tool payload; showing raw results");
        console_->printFinalAnswer(formatted);
        return finish(std::move(executed), cycle);
    }

    cycle.pending.push_back(Turn::make(MessageRole::ASSISTANT, reply));
    executed.summary = reply;
    executed.displayText = reply;
    console_->printFinalAnswer(reply);
    return finish(std::move(executed), cycle);
}

} // namespace archchan
