// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Parsing of model replies into plain text or a structured tool call,
// plus decoding of the search collaborator's output.
//
// Tool payloads are accepted only when the whole reply (modulo surrounding
// whitespace) is exactly one JSON object of one of these shapes:
//   {"tool": "shell",  "command": <string>, "explanation": <string>}
//   {"tool": "search", "query": <string>}
// Anything else is plain text. There is no extraction from code fences or
// surrounding prose: a payload hidden inside conversational text never runs.

#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "types.h"
#include "archchan/export.h"

namespace archchan {

using json = nlohmann::json;

/// Result of classifying one model reply.
struct ParsedReply {
    std::string text;                 // The reply exactly as received
    std::optional<ToolCall> toolCall; // Set only for a well-formed payload
    std::string diagnostic;           // Why a JSON-looking reply was rejected

    bool isToolCall() const { return toolCall.has_value(); }

    /// True when the reply looked like a tool payload but did not validate.
    bool isMalformedPayload() const { return !toolCall.has_value() && !diagnostic.empty(); }
};

/// Classify a raw model reply.
/// Pure function: the same input always yields the same classification.
///
/// @param reply Raw reply text from the model
/// @return ParsedReply with toolCall set, or plain text carrying the reply unchanged
ARCHCHAN_API ParsedReply parseModelReply(const std::string& reply);

/// Validate an already-decoded JSON object against the two payload shapes.
///
/// @param payload Decoded JSON value
/// @param diagnostic Receives the rejection reason when non-null
/// @return ToolCall, or std::nullopt if the shape does not match exactly
ARCHCHAN_API std::optional<ToolCall> parseToolPayload(const json& payload,
                                                      std::string* diagnostic = nullptr);

/// Strip leading and trailing whitespace (space, tab, CR, LF, VT, FF).
ARCHCHAN_API std::string trimWhitespace(const std::string& text);

/// Cap text at maxBytes, keeping the head and a short tail around a marker.
/// Text within the limit is returned unchanged.
ARCHCHAN_API std::string truncateMiddle(const std::string& text, size_t maxBytes);

/// Render search collaborator output for the user and the model.
///
/// The collaborator prints a JSON array of {"title", "abstract", "url"}
/// objects. The first maxResults entries are formatted as a numbered list.
/// Output that is not such an array is returned raw, capped at maxBytes.
ARCHCHAN_API std::string formatSearchResults(const std::string& rawOutput,
                                             size_t maxResults,
                                             size_t maxBytes);

} // namespace archchan
