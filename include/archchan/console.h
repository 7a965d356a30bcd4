// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Console output for the dispatch core.
//
// The dispatcher reports everything it does through an abstract OutputHandler.
// TerminalConsole renders with ANSI colors; SilentConsole suppresses output
// and is used by tests and front ends that render events themselves.

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "types.h"
#include "archchan/export.h"

namespace archchan {

using json = nlohmann::json;

/// Abstract output handler interface.
class ARCHCHAN_API OutputHandler {
public:
    virtual ~OutputHandler() = default;

    // === Dispatch Cycle ===
    virtual void printProcessingStart(const std::string& input, const std::string& modelId = "") = 0;
    virtual void printStage(DispatchStage stage) = 0;

    // === Tool Execution ===
    virtual void printToolUsage(const ToolCall& call) = 0;
    virtual void printConfirmationRequest(const ConfirmationRequest& request) = 0;
    virtual void printExecutionResult(const ExecutionResult& result) = 0;
    virtual void printRejection(ErrorKind kind, const std::string& reason) = 0;
    virtual void prettyPrintJson(const json& data, const std::string& title = "") = 0;

    // === Status Messages ===
    virtual void printError(const std::string& message) = 0;
    virtual void printWarning(const std::string& message) = 0;
    virtual void printInfo(const std::string& message) = 0;

    // === Progress Indicators ===
    virtual void startProgress(const std::string& message) = 0;
    virtual void stopProgress() = 0;

    // === Completion ===
    virtual void printFinalAnswer(const std::string& answer) = 0;
    virtual void printCancelled() = 0;

    // === Optional Methods (default no-op) ===
    virtual void printResponse(const std::string& /*response*/, const std::string& /*title*/ = "Response") {}
    virtual void printHeader(const std::string& /*text*/) {}
    virtual void printSeparator(int /*length*/ = 50) {}
};

/// Terminal console with ANSI color output.
class ARCHCHAN_API TerminalConsole : public OutputHandler {
public:
    void printProcessingStart(const std::string& input, const std::string& modelId = "") override;
    void printStage(DispatchStage stage) override;
    void printToolUsage(const ToolCall& call) override;
    void printConfirmationRequest(const ConfirmationRequest& request) override;
    void printExecutionResult(const ExecutionResult& result) override;
    void printRejection(ErrorKind kind, const std::string& reason) override;
    void prettyPrintJson(const json& data, const std::string& title = "") override;
    void printError(const std::string& message) override;
    void printWarning(const std::string& message) override;
    void printInfo(const std::string& message) override;
    void startProgress(const std::string& message) override;
    void stopProgress() override;
    void printFinalAnswer(const std::string& answer) override;
    void printCancelled() override;
    void printResponse(const std::string& response, const std::string& title = "Response") override;
    void printHeader(const std::string& text) override;
    void printSeparator(int length = 50) override;

private:
    // ANSI color codes
    static constexpr const char* RESET   = "\033[0m";
    static constexpr const char* BOLD    = "\033[1m";
    static constexpr const char* DIM     = "\033[90m";
    static constexpr const char* RED     = "\033[91m";
    static constexpr const char* GREEN   = "\033[92m";
    static constexpr const char* YELLOW  = "\033[93m";
    static constexpr const char* BLUE    = "\033[94m";
    static constexpr const char* MAGENTA = "\033[95m";
    static constexpr const char* CYAN    = "\033[96m";
};

/// Silent console that suppresses all output.
/// Used for testing and when events are rendered elsewhere.
class ARCHCHAN_API SilentConsole : public OutputHandler {
public:
    explicit SilentConsole(bool silenceFinalAnswer = false)
        : silenceFinalAnswer_(silenceFinalAnswer) {}

    void printProcessingStart(const std::string&, const std::string&) override {}
    void printStage(DispatchStage) override {}
    void printToolUsage(const ToolCall&) override {}
    void printConfirmationRequest(const ConfirmationRequest&) override {}
    void printExecutionResult(const ExecutionResult&) override {}
    void printRejection(ErrorKind, const std::string&) override {}
    void prettyPrintJson(const json&, const std::string&) override {}
    void printError(const std::string&) override {}
    void printWarning(const std::string&) override {}
    void printInfo(const std::string&) override {}
    void startProgress(const std::string&) override {}
    void stopProgress() override {}
    void printFinalAnswer(const std::string& answer) override;
    void printCancelled() override {}

private:
    bool silenceFinalAnswer_;
};

} // namespace archchan
