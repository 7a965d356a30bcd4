// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Bounded, thread-safe conversation history for one session.
//
// Holds at most 2 * maxHistory turns (one exchange = user + assistant).
// When an append exceeds the bound the oldest turns are evicted first.
// Snapshots are point-in-time copies; an append is never observed half-done.

#pragma once

#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "types.h"
#include "archchan/export.h"

namespace archchan {

using json = nlohmann::json;

class ARCHCHAN_API ConversationState {
public:
    /// @param maxHistory Exchanges to retain (0 = unlimited)
    /// @param modelId Model used for subsequent dispatch cycles
    explicit ConversationState(int maxHistory = 20, std::string modelId = "arch-chan");

    // Non-copyable (owns a mutex)
    ConversationState(const ConversationState&) = delete;
    ConversationState& operator=(const ConversationState&) = delete;

    /// Append one turn, evicting the oldest turns beyond capacity.
    void append(Turn turn);

    /// Append several turns as one atomic step.
    void append(std::vector<Turn> turns);

    /// Ordered copy of the retained turns (oldest first).
    std::vector<Turn> snapshot() const;

    void clear();

    size_t size() const;

    /// Maximum number of turns kept (0 = unlimited).
    size_t capacity() const;

    int maxHistory() const { return maxHistory_; }

    std::string modelId() const;
    void setModelId(const std::string& modelId);

    /// Transcript export:
    /// {"model": ..., "max_history": ..., "turns": [{"role", "content", "timestamp"}]}
    json toJson() const;

private:
    void evictLocked();

    mutable std::mutex mutex_;
    std::deque<Turn> turns_;
    const int maxHistory_;
    std::string modelId_;
};

} // namespace archchan
