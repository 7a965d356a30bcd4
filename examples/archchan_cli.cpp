// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Terminal front end for the Arch-Chan assistant.
//
// Usage:
//   ./archchan_cli [config.json]
//   You: how much disk space do I have?
//
// Commands:
//   /clear          clear the conversation
//   /model <id>     switch model (e.g. arch-chan-lite)
//   /models         list models installed on the endpoint
//   /export <file>  write the transcript as JSON
//   quit            exit
//
// Requirements:
//   - Ollama running at http://localhost:11434 with the arch-chan model
//   - ddgr on PATH for web searches

#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include <archchan/config.h>
#include <archchan/session.h>

namespace {

archchan::AssistantConfig loadConfig(int argc, char** argv) {
    if (argc < 2) {
        return archchan::AssistantConfig{};
    }
    std::ifstream in(argv[1]);
    if (!in) {
        throw std::runtime_error(std::string("Cannot open config file: ") + argv[1]);
    }
    return archchan::configFromJson(archchan::json::parse(in));
}

/// Drain events for one job, answering confirmation requests on stdin.
void waitForJob(archchan::AssistantSession& session, uint64_t jobId) {
    using namespace std::chrono_literals;

    while (true) {
        if (session.pendingConfirmation().has_value()) {
            std::cout << "Run this command? [y/N]: " << std::flush;
            std::string answer;
            std::getline(std::cin, answer);
            if (answer == "y" || answer == "Y" || answer == "yes") {
                session.approve();
            } else {
                session.deny();
            }
        }

        auto event = session.events().pop(100ms);
        if (!event || event->jobId != jobId) continue;

        if (event->type == archchan::WorkerEventType::RESULT ||
            event->type == archchan::WorkerEventType::CANCELLED) {
            return;
        }
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        archchan::AssistantConfig config = loadConfig(argc, argv);
        archchan::OllamaClient probe(config);
        archchan::AssistantSession session(config);

        archchan::OutputHandler& console = session.dispatcher().console();

        console.printHeader("Arch-Chan");
        console.printSeparator();
        if (!probe.checkHealth()) {
            console.printWarning("No model endpoint at " + config.baseUrl +
                                 " (is 'ollama serve' running?)");
        }

        std::cout << "Ready! Type 'quit' to exit." << std::endl;
        std::cout << "Try: 'Which processes use the most CPU?'" << std::endl;
        std::cout << "  or 'Search for the latest Arch Linux news'\n" << std::endl;

        std::string userInput;
        while (true) {
            std::cout << "You: " << std::flush;
            if (!std::getline(std::cin, userInput)) break;

            if (userInput.empty()) continue;
            if (userInput == "quit" || userInput == "exit" || userInput == "q") break;

            if (userInput == "/clear") {
                session.clearChat();
                console.printInfo("Conversation cleared.");
                continue;
            }
            if (userInput.rfind("/model ", 0) == 0) {
                try {
                    session.selectModel(userInput.substr(7));
                    console.printInfo("Using model " + session.currentModel());
                } catch (const std::invalid_argument& e) {
                    console.printError(e.what());
                }
                continue;
            }
            if (userInput == "/models") {
                try {
                    for (const auto& name : probe.listModels()) {
                        std::cout << "  " << name << std::endl;
                    }
                } catch (const archchan::ModelError& e) {
                    console.printError(e.what());
                }
                continue;
            }
            if (userInput.rfind("/export ", 0) == 0) {
                std::ofstream out(userInput.substr(8));
                out << session.exportTranscript().dump(2) << std::endl;
                if (out) {
                    console.printInfo("Transcript written.");
                } else {
                    console.printError("Could not write transcript.");
                }
                continue;
            }

            uint64_t jobId = session.submit(userInput);
            waitForJob(session, jobId);
        }

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
