// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "archchan/console.h"
#include "archchan/response_parser.h"

#include <iostream>

namespace archchan {

namespace {

constexpr size_t kMaxShownOutput = 4000;

} // namespace

// ---- TerminalConsole ----

void TerminalConsole::printProcessingStart(const std::string& input, const std::string& modelId) {
    std::cout << "\n" << BOLD << CYAN << "You" << RESET << ": " << input << "\n";
    if (!modelId.empty()) {
        std::cout << DIM << "Model: " << modelId << RESET << "\n";
    }
}

void TerminalConsole::printStage(DispatchStage stage) {
    std::cout << DIM << "[" << stageToString(stage) << "]" << RESET << "\n";
}

void TerminalConsole::printToolUsage(const ToolCall& call) {
    if (const auto* shell = std::get_if<ShellCall>(&call)) {
        std::cout << YELLOW << "Shell: " << BOLD << shell->command << RESET << "\n";
        if (!shell->explanation.empty()) {
            std::cout << DIM << "  " << shell->explanation << RESET << "\n";
        }
    } else {
        std::cout << YELLOW << "Search: " << BOLD << std::get<SearchCall>(call).query << RESET << "\n";
    }
}

void TerminalConsole::printConfirmationRequest(const ConfirmationRequest& request) {
    std::cout << BOLD << MAGENTA << "Confirmation required" << RESET << "\n"
              << "  Command: " << BOLD << request.command << RESET << "\n";
    if (!request.explanation.empty()) {
        std::cout << "  Purpose: " << request.explanation << "\n";
    }
    std::cout << "  Reason:  " << request.reason << "\n"
              << DIM << "  " << request.info.description
              << " (risk: " << request.info.riskLevel << ")" << RESET << "\n";
}

void TerminalConsole::printExecutionResult(const ExecutionResult& result) {
    const char* color = (result.exitCode == 0 && !result.timedOut) ? GREEN : RED;
    std::cout << color << "Exit code " << result.exitCode << RESET
              << DIM << " (" << result.duration.count() << "ms)" << RESET << "\n";
    if (result.timedOut) {
        std::cout << YELLOW << "Command timed out; partial output shown." << RESET << "\n";
    }
    if (!result.stdoutText.empty()) {
        std::cout << truncateMiddle(result.stdoutText, kMaxShownOutput) << "\n";
    }
    if (!result.stderrText.empty()) {
        std::cout << RED << truncateMiddle(result.stderrText, kMaxShownOutput) << RESET << "\n";
    }
}

void TerminalConsole::printRejection(ErrorKind kind, const std::string& reason) {
    std::cout << RED << errorKindToString(kind) << ": " << RESET << reason << "\n";
}

void TerminalConsole::prettyPrintJson(const json& data, const std::string& title) {
    if (!title.empty()) {
        std::cout << DIM << title << ":" << RESET << "\n";
    }
    std::cout << truncateMiddle(data.dump(2), 2000) << "\n";
}

void TerminalConsole::printError(const std::string& message) {
    std::cout << RED << "ERROR: " << RESET << message << "\n";
}

void TerminalConsole::printWarning(const std::string& message) {
    std::cout << YELLOW << "WARNING: " << RESET << message << "\n";
}

void TerminalConsole::printInfo(const std::string& message) {
    std::cout << BLUE << "INFO: " << RESET << message << "\n";
}

void TerminalConsole::startProgress(const std::string& message) {
    std::cout << DIM << message << "..." << RESET << std::flush;
}

void TerminalConsole::stopProgress() {
    std::cout << "\n";
}

void TerminalConsole::printFinalAnswer(const std::string& answer) {
    std::cout << "\n" << BOLD << GREEN << "Arch-Chan:" << RESET << "\n" << answer << "\n";
}

void TerminalConsole::printCancelled() {
    std::cout << YELLOW << "Cancelled." << RESET << "\n";
}

void TerminalConsole::printResponse(const std::string& response, const std::string& title) {
    std::cout << DIM << title << ":" << RESET << "\n" << response << "\n";
}

void TerminalConsole::printHeader(const std::string& text) {
    std::cout << "\n" << BOLD << text << RESET << "\n";
}

void TerminalConsole::printSeparator(int length) {
    std::cout << std::string(static_cast<size_t>(length), '-') << "\n";
}

// ---- SilentConsole ----

void SilentConsole::printFinalAnswer(const std::string& answer) {
    if (!silenceFinalAnswer_) {
        std::cout << answer << "\n";
    }
}

} // namespace archchan
