// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Common value types for the archchan tool-use dispatch core.
//
// Everything in this header is a plain value: produced, consumed and discarded
// within one dispatch cycle (ToolCall, ExecutionResult, DispatchOutcome) or
// owned by ConversationState (Turn).

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace archchan {

using json = nlohmann::json;

// ---- Message Types ----

enum class MessageRole {
    SYSTEM,
    USER,
    ASSISTANT,
    TOOL
};

inline std::string roleToString(MessageRole r) {
    switch (r) {
        case MessageRole::SYSTEM:    return "system";
        case MessageRole::USER:      return "user";
        case MessageRole::ASSISTANT: return "assistant";
        case MessageRole::TOOL:      return "tool";
    }
    return "unknown";
}

inline std::optional<MessageRole> roleFromString(const std::string& s) {
    if (s == "system")    return MessageRole::SYSTEM;
    if (s == "user")      return MessageRole::USER;
    if (s == "assistant") return MessageRole::ASSISTANT;
    if (s == "tool")      return MessageRole::TOOL;
    return std::nullopt;
}

/// One message unit of the conversation history.
struct Turn {
    MessageRole role = MessageRole::USER;
    std::string content;
    std::chrono::system_clock::time_point timestamp;

    static Turn make(MessageRole role, std::string content) {
        Turn t;
        t.role = role;
        t.content = std::move(content);
        t.timestamp = std::chrono::system_clock::now();
        return t;
    }

    /// Wire form used in model requests: {"role": ..., "content": ...}.
    json toJson() const {
        return json{{"role", roleToString(role)}, {"content", content}};
    }
};

// ---- Tool Calls ----

struct ShellCall {
    std::string command;
    std::string explanation;
};

struct SearchCall {
    std::string query;
};

/// Closed set of tool invocations the model may request.
/// Only the response parser produces these.
using ToolCall = std::variant<ShellCall, SearchCall>;

inline std::string toolName(const ToolCall& call) {
    return std::holds_alternative<ShellCall>(call) ? "shell" : "search";
}

inline json toolCallToJson(const ToolCall& call) {
    if (const auto* shell = std::get_if<ShellCall>(&call)) {
        return json{{"tool", "shell"}, {"command", shell->command}, {"explanation", shell->explanation}};
    }
    return json{{"tool", "search"}, {"query", std::get<SearchCall>(call).query}};
}

// ---- Validation ----

enum class Verdict {
    SAFE,
    REQUIRES_CONFIRMATION,
    BLOCKED
};

inline std::string verdictToString(Verdict v) {
    switch (v) {
        case Verdict::SAFE:                  return "SAFE";
        case Verdict::REQUIRES_CONFIRMATION: return "REQUIRES_CONFIRMATION";
        case Verdict::BLOCKED:               return "BLOCKED";
    }
    return "UNKNOWN";
}

struct ValidationVerdict {
    Verdict verdict = Verdict::SAFE;
    std::string reason; // Empty for SAFE

    static ValidationVerdict safe() { return {}; }
    static ValidationVerdict requiresConfirmation(std::string reason) {
        return {Verdict::REQUIRES_CONFIRMATION, std::move(reason)};
    }
    static ValidationVerdict blocked(std::string reason) {
        return {Verdict::BLOCKED, std::move(reason)};
    }

    bool isSafe() const { return verdict == Verdict::SAFE; }
    bool isBlocked() const { return verdict == Verdict::BLOCKED; }
    bool needsConfirmation() const { return verdict == Verdict::REQUIRES_CONFIRMATION; }
};

/// Advisory description of a command, shown next to a confirmation prompt.
/// Never changes the verdict.
struct CommandInfo {
    ValidationVerdict verdict;
    std::string baseCommand;
    std::string description;
    std::string riskLevel; // "low", "medium", "high" or "unknown"
    bool whitelisted = false;
};

/// Everything the confirmation collaborator needs to ask the user.
struct ConfirmationRequest {
    std::string command;
    std::string explanation;
    std::string reason;
    CommandInfo info;
};

// ---- Execution ----

struct ExecutionResult {
    int exitCode = -1;
    std::string stdoutText;
    std::string stderrText;
    std::chrono::milliseconds duration{0};
    bool timedOut = false;
    bool cancelled = false;
    bool stdoutTruncated = false;
    bool stderrTruncated = false;

    json toJson() const {
        return json{
            {"exit_code", exitCode},
            {"stdout", stdoutText},
            {"stderr", stderrText},
            {"duration_ms", duration.count()},
            {"timed_out", timedOut},
            {"cancelled", cancelled},
            {"stdout_truncated", stdoutTruncated},
            {"stderr_truncated", stderrTruncated}
        };
    }
};

// ---- Errors ----

enum class ErrorKind {
    MALFORMED_TOOL_PAYLOAD,
    COMMAND_BLOCKED,
    CONFIRMATION_DENIED,
    LAUNCH_ERROR,
    EXECUTION_TIMEOUT,
    MODEL_UNAVAILABLE,
    MODEL_TIMEOUT,
    CANCELLED_BY_USER,
    INTERNAL
};

inline std::string errorKindToString(ErrorKind k) {
    switch (k) {
        case ErrorKind::MALFORMED_TOOL_PAYLOAD: return "MalformedToolPayload";
        case ErrorKind::COMMAND_BLOCKED:        return "CommandBlocked";
        case ErrorKind::CONFIRMATION_DENIED:    return "ConfirmationDenied";
        case ErrorKind::LAUNCH_ERROR:           return "LaunchError";
        case ErrorKind::EXECUTION_TIMEOUT:      return "ExecutionTimeout";
        case ErrorKind::MODEL_UNAVAILABLE:      return "ModelUnavailable";
        case ErrorKind::MODEL_TIMEOUT:          return "ModelTimeout";
        case ErrorKind::CANCELLED_BY_USER:      return "CancelledByUser";
        case ErrorKind::INTERNAL:               return "Internal";
    }
    return "Unknown";
}

// ---- Dispatch State Machine ----

enum class DispatchStage {
    IDLE,
    AWAITING_MODEL_REPLY,
    PARSING,
    VALIDATING,
    AWAITING_CONFIRMATION,
    EXECUTING,
    SUMMARIZING,
    DONE,
    CANCELLED
};

inline std::string stageToString(DispatchStage s) {
    switch (s) {
        case DispatchStage::IDLE:                  return "IDLE";
        case DispatchStage::AWAITING_MODEL_REPLY:  return "AWAITING_MODEL_REPLY";
        case DispatchStage::PARSING:               return "PARSING";
        case DispatchStage::VALIDATING:            return "VALIDATING";
        case DispatchStage::AWAITING_CONFIRMATION: return "AWAITING_CONFIRMATION";
        case DispatchStage::EXECUTING:             return "EXECUTING";
        case DispatchStage::SUMMARIZING:           return "SUMMARIZING";
        case DispatchStage::DONE:                  return "DONE";
        case DispatchStage::CANCELLED:             return "CANCELLED";
    }
    return "UNKNOWN";
}

// ---- Dispatch Outcome ----

/// The model answered in plain text.
struct Displayed {
    std::string text;
};

/// A tool call ran to completion (whatever its exit code).
struct Executed {
    ToolCall call;
    std::string invocation;              // Command line actually run (after elevation rewrite)
    ExecutionResult result;
    std::optional<std::string> summary;  // Model summary (search only)
    std::string displayText;             // What the user should see
};

/// The cycle ended without executing anything useful.
struct Rejected {
    ErrorKind kind = ErrorKind::INTERNAL;
    std::string reason;
};

struct Cancelled {};

/// Terminal value of one dispatch cycle.
using DispatchOutcome = std::variant<Displayed, Executed, Rejected, Cancelled>;

inline std::string outcomeText(const DispatchOutcome& outcome) {
    if (const auto* d = std::get_if<Displayed>(&outcome)) return d->text;
    if (const auto* e = std::get_if<Executed>(&outcome)) return e->displayText;
    if (const auto* r = std::get_if<Rejected>(&outcome)) return r->reason;
    return "Cancelled.";
}

// ---- Configuration ----

/// Sampling parameters for one model identifier.
/// Forwarded verbatim as request options; the core never interprets them.
struct ModelProfile {
    std::string id;
    int contextLength = 4096;
    double temperature = 0.7;
    int topK = 40;
    double topP = 0.9;
};

struct AssistantConfig {
    // Model endpoint
    std::string baseUrl = "http://localhost:11434";
    std::string modelId = "arch-chan";
    std::vector<ModelProfile> models = {
        {"arch-chan", 4096, 0.7, 40, 0.9},
        {"arch-chan-lite", 2048, 0.6, 30, 0.85}
    };
    int connectTimeoutSeconds = 10;
    int readTimeoutSeconds = 120;
    int modelRetries = 1;       // Extra attempts after a failed model call
    std::string systemPrompt;   // Empty = built-in assistant prompt

    // Conversation
    int maxHistory = 20;        // Exchanges kept (2 turns each, 0 = unlimited)

    // Process execution
    int processTimeoutSeconds = 30;
    int searchTimeoutSeconds = 30;
    size_t maxOutputBytes = 64 * 1024; // Per stream
    std::string searchCommand = "ddgr";
    int searchResultCount = 5;
    int searchResultsShown = 3;
    std::string elevationTool = "pkexec"; // Empty = keep sudo

    bool debug = false;
    bool silentMode = false;
};

} // namespace archchan
