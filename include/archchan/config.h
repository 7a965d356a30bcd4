// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Mapping between AssistantConfig and its JSON form.
//
// The JSON layout follows the assistant's settings file:
//   {
//     "general":  {"model": ..., "max_history": ..., "debug": ...},
//     "model":    {"base_url": ..., "connect_timeout": ..., "read_timeout": ...,
//                  "retries": ..., "system_prompt": ..., "profiles": [...]},
//     "advanced": {"timeout_duration": ..., "search_timeout": ...,
//                  "max_output_bytes": ..., "search_command": ...,
//                  "search_results": ..., "search_results_shown": ...,
//                  "elevation_tool": ...}
//   }
// Reading the file itself is left to the caller.

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "types.h"
#include "archchan/export.h"

namespace archchan {

using json = nlohmann::json;

/// Build a config from JSON. Missing sections and keys keep their defaults.
/// @throws std::invalid_argument if a key is present with the wrong type,
///         or a numeric value is out of range.
ARCHCHAN_API AssistantConfig configFromJson(const json& j);

/// Serialize a config to the same layout configFromJson() reads.
ARCHCHAN_API json configToJson(const AssistantConfig& config);

/// Look up the sampling profile for a model identifier.
/// Unknown identifiers get a default profile carrying that id.
ARCHCHAN_API ModelProfile findModelProfile(const AssistantConfig& config, const std::string& modelId);

} // namespace archchan
