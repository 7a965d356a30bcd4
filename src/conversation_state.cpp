// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "archchan/conversation_state.h"

#include <ctime>
#include <stdexcept>

namespace archchan {

namespace {

std::string isoTimestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&t, &utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buffer;
}

} // namespace

ConversationState::ConversationState(int maxHistory, std::string modelId)
    : maxHistory_(maxHistory), modelId_(std::move(modelId)) {
    if (maxHistory < 0) {
        throw std::invalid_argument("maxHistory must be >= 0");
    }
}

size_t ConversationState::capacity() const {
    return static_cast<size_t>(maxHistory_) * 2;
}

void ConversationState::evictLocked() {
    size_t cap = capacity();
    if (cap == 0) return;
    while (turns_.size() > cap) {
        turns_.pop_front();
    }
}

void ConversationState::append(Turn turn) {
    std::lock_guard<std::mutex> lock(mutex_);
    turns_.push_back(std::move(turn));
    evictLocked();
}

void ConversationState::append(std::vector<Turn> turns) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& turn : turns) {
        turns_.push_back(std::move(turn));
    }
    evictLocked();
}

std::vector<Turn> ConversationState::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<Turn>(turns_.begin(), turns_.end());
}

void ConversationState::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    turns_.clear();
}

size_t ConversationState::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return turns_.size();
}

std::string ConversationState::modelId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return modelId_;
}

void ConversationState::setModelId(const std::string& modelId) {
    std::lock_guard<std::mutex> lock(mutex_);
    modelId_ = modelId;
}

json ConversationState::toJson() const {
    std::lock_guard<std::mutex> lock(mutex_);
    json turns = json::array();
    for (const auto& turn : turns_) {
        turns.push_back({
            {"role", roleToString(turn.role)},
            {"content", turn.content},
            {"timestamp", isoTimestamp(turn.timestamp)}
        });
    }
    return json{
        {"model", modelId_},
        {"max_history", maxHistory_},
        {"turns", turns}
    };
}

} // namespace archchan
