// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "archchan/session.h"

#include <stdexcept>

namespace archchan {

AssistantSession::AssistantSession(const AssistantConfig& config)
    : AssistantSession(config,
                       std::make_unique<OllamaClient>(config),
                       std::make_unique<SubprocessRunner>(config)) {}

AssistantSession::AssistantSession(const AssistantConfig& config,
                                   std::unique_ptr<ModelClient> model,
                                   std::unique_ptr<ProcessRunner> runner)
    : config_(config),
      state_(config.maxHistory, config.modelId),
      model_(std::move(model)),
      runner_(std::move(runner)) {
    if (!model_ || !runner_) {
        throw std::invalid_argument("AssistantSession needs a model client and a process runner");
    }
    dispatcher_ = std::make_unique<ToolDispatcher>(config_, state_, *model_, *runner_, gate_);
    worker_ = std::make_unique<ExecutionWorker>(*dispatcher_);
}

AssistantSession::~AssistantSession() {
    // Stop the worker before the collaborators it uses are destroyed
    worker_.reset();
}

uint64_t AssistantSession::submit(const std::string& userInput) {
    return worker_->submit(userInput);
}

bool AssistantSession::cancel(uint64_t jobId) {
    return worker_->cancel(jobId);
}

bool AssistantSession::approve() {
    return gate_.resolve(true);
}

bool AssistantSession::deny() {
    return gate_.resolve(false);
}

std::optional<ConfirmationRequest> AssistantSession::pendingConfirmation() const {
    return gate_.pending();
}

void AssistantSession::onConfirmationRequest(ConfirmationGate::RequestCallback callback) {
    gate_.setRequestCallback(std::move(callback));
}

void AssistantSession::clearChat() {
    state_.clear();
}

void AssistantSession::selectModel(const std::string& modelId) {
    if (modelId.empty()) {
        throw std::invalid_argument("Model id must not be empty");
    }
    state_.setModelId(modelId);
}

std::string AssistantSession::currentModel() const {
    return state_.modelId();
}

std::vector<std::string> AssistantSession::knownModels() const {
    std::vector<std::string> ids;
    for (const auto& profile : config_.models) {
        ids.push_back(profile.id);
    }
    return ids;
}

json AssistantSession::exportTranscript() const {
    return state_.toJson();
}

} // namespace archchan
