// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "archchan/response_parser.h"

#include <set>
#include <sstream>

namespace archchan {

namespace {

constexpr const char* kWhitespace = " \t\n\r\v\f";

bool readRequiredString(const json& payload, const char* key, std::string& out,
                        std::string& why) {
    auto it = payload.find(key);
    if (it == payload.end()) {
        why = std::string("missing field '") + key + "'";
        return false;
    }
    if (!it->is_string()) {
        why = std::string("field '") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

std::string stringField(const json& entry, const char* key, const char* fallback) {
    auto it = entry.find(key);
    if (it == entry.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

bool onlyKeys(const json& payload, const std::set<std::string>& allowed, std::string& why) {
    for (auto it = payload.begin(); it != payload.end(); ++it) {
        if (!allowed.count(it.key())) {
            why = "unexpected field '" + it.key() + "'";
            return false;
        }
    }
    return true;
}

} // namespace

std::string trimWhitespace(const std::string& text) {
    auto start = text.find_first_not_of(kWhitespace);
    if (start == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(kWhitespace);
    return text.substr(start, end - start + 1);
}

std::string truncateMiddle(const std::string& text, size_t maxBytes) {
    if (text.size() <= maxBytes) {
        return text;
    }
    static const std::string kMarker = "\n...[truncated]...\n";
    if (maxBytes <= kMarker.size()) {
        return text.substr(0, maxBytes);
    }
    size_t budget = maxBytes - kMarker.size();
    size_t tail = budget / 4;
    size_t head = budget - tail;
    return text.substr(0, head) + kMarker + text.substr(text.size() - tail);
}

std::optional<ToolCall> parseToolPayload(const json& payload, std::string* diagnostic) {
    std::string why;
    auto fail = [&]() -> std::optional<ToolCall> {
        if (diagnostic) *diagnostic = why;
        return std::nullopt;
    };

    if (!payload.is_object()) {
        why = "payload is not an object";
        return fail();
    }

    std::string tool;
    if (!readRequiredString(payload, "tool", tool, why)) {
        return fail();
    }

    if (tool == "shell") {
        ShellCall call;
        if (!onlyKeys(payload, {"tool", "command", "explanation"}, why) ||
            !readRequiredString(payload, "command", call.command, why) ||
            !readRequiredString(payload, "explanation", call.explanation, why)) {
            return fail();
        }
        if (trimWhitespace(call.command).empty()) {
            why = "empty command";
            return fail();
        }
        return ToolCall{std::move(call)};
    }

    if (tool == "search") {
        SearchCall call;
        if (!onlyKeys(payload, {"tool", "query"}, why) ||
            !readRequiredString(payload, "query", call.query, why)) {
            return fail();
        }
        if (trimWhitespace(call.query).empty()) {
            why = "empty query";
            return fail();
        }
        return ToolCall{std::move(call)};
    }

    why = "unknown tool '" + tool + "'";
    return fail();
}

ParsedReply parseModelReply(const std::string& reply) {
    ParsedReply parsed;
    parsed.text = reply;

    std::string trimmed = trimWhitespace(reply);

    // Fast path: plain text
    if (trimmed.empty() || trimmed.front() != '{') {
        return parsed;
    }
    if (trimmed.back() != '}') {
        parsed.diagnostic = "trailing content after JSON object";
        return parsed;
    }

    // Whole-input parse: json::parse rejects a second object or trailing prose.
    // Duplicate top-level keys are tracked because the library keeps the last one,
    // which would make {"tool":"search","tool":"shell",...} ambiguous.
    std::set<std::string> seenKeys;
    bool duplicateKey = false;
    json::parser_callback_t onEvent = [&](int depth, json::parse_event_t event, json& value) {
        if (event == json::parse_event_t::key && depth == 1) {
            if (!seenKeys.insert(value.get<std::string>()).second) {
                duplicateKey = true;
            }
        }
        return true;
    };

    json payload;
    try {
        payload = json::parse(trimmed, onEvent);
    } catch (const json::parse_error& e) {
        parsed.diagnostic = std::string("invalid JSON: ") + e.what();
        return parsed;
    }

    if (duplicateKey) {
        parsed.diagnostic = "duplicate field in payload";
        return parsed;
    }

    std::string why;
    auto call = parseToolPayload(payload, &why);
    if (!call.has_value()) {
        parsed.diagnostic = why;
        return parsed;
    }

    parsed.toolCall = std::move(call);
    return parsed;
}

std::string formatSearchResults(const std::string& rawOutput, size_t maxResults, size_t maxBytes) {
    json results;
    try {
        results = json::parse(rawOutput);
    } catch (const json::parse_error&) {
        return truncateMiddle(rawOutput, maxBytes);
    }

    if (!results.is_array()) {
        return truncateMiddle(rawOutput, maxBytes);
    }
    if (results.empty()) {
        return "No results found.";
    }

    std::ostringstream oss;
    size_t shown = 0;
    for (const auto& entry : results) {
        if (shown >= maxResults) break;
        if (!entry.is_object()) continue;

        ++shown;
        if (shown > 1) oss << "\n\n";
        oss << shown << ". " << stringField(entry, "title", "(untitled)") << "\n"
            << "   " << stringField(entry, "abstract", "(no description)") << "\n"
            << "   " << stringField(entry, "url", "(no url)");
    }

    if (shown == 0) {
        return "No results found.";
    }
    return truncateMiddle(oss.str(), maxBytes);
}

} // namespace archchan
