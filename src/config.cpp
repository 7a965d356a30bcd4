// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "archchan/config.h"

#include <cstdint>
#include <limits>
#include <stdexcept>

namespace archchan {

namespace {

const json& sectionOf(const json& root, const char* name) {
    static const json kEmpty = json::object();
    if (!root.contains(name)) {
        return kEmpty;
    }
    const json& section = root[name];
    if (!section.is_object()) {
        throw std::invalid_argument(std::string("Config section '") + name + "' must be an object");
    }
    return section;
}

void readString(const json& section, const char* key, std::string& out) {
    if (!section.contains(key)) return;
    if (!section[key].is_string()) {
        throw std::invalid_argument(std::string("Config key '") + key + "' must be a string");
    }
    out = section[key].get<std::string>();
}

void readBool(const json& section, const char* key, bool& out) {
    if (!section.contains(key)) return;
    if (!section[key].is_boolean()) {
        throw std::invalid_argument(std::string("Config key '") + key + "' must be a boolean");
    }
    out = section[key].get<bool>();
}

void readInt(const json& section, const char* key, int& out, int minValue) {
    if (!section.contains(key)) return;
    if (!section[key].is_number_integer()) {
        throw std::invalid_argument(std::string("Config key '") + key + "' must be an integer");
    }
    const json& node = section[key];
    if (node.is_number_unsigned() ?
            node.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max()) :
            node.get<int64_t>() > std::numeric_limits<int>::max()) {
        throw std::invalid_argument(std::string("Config key '") + key + "' must be <= " +
                                    std::to_string(std::numeric_limits<int>::max()));
    }
    int64_t value = node.get<int64_t>();
    if (value < minValue) {
        throw std::invalid_argument(std::string("Config key '") + key + "' must be >= " +
                                    std::to_string(minValue));
    }
    out = static_cast<int>(value);
}

void readDouble(const json& section, const char* key, double& out) {
    if (!section.contains(key)) return;
    if (!section[key].is_number()) {
        throw std::invalid_argument(std::string("Config key '") + key + "' must be a number");
    }
    out = section[key].get<double>();
}

ModelProfile profileFromJson(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Model profile must be an object");
    }
    ModelProfile profile;
    readString(j, "id", profile.id);
    if (profile.id.empty()) {
        throw std::invalid_argument("Model profile is missing 'id'");
    }
    readInt(j, "context_length", profile.contextLength, 1);
    readDouble(j, "temperature", profile.temperature);
    readInt(j, "top_k", profile.topK, 0);
    readDouble(j, "top_p", profile.topP);
    return profile;
}

} // namespace

AssistantConfig configFromJson(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Config root must be an object");
    }

    AssistantConfig config;

    const json& general = sectionOf(j, "general");
    readString(general, "model", config.modelId);
    readInt(general, "max_history", config.maxHistory, 0);
    readBool(general, "debug", config.debug);
    readBool(general, "silent", config.silentMode);

    const json& model = sectionOf(j, "model");
    readString(model, "base_url", config.baseUrl);
    readInt(model, "connect_timeout", config.connectTimeoutSeconds, 1);
    readInt(model, "read_timeout", config.readTimeoutSeconds, 1);
    readInt(model, "retries", config.modelRetries, 0);
    readString(model, "system_prompt", config.systemPrompt);
    if (model.contains("profiles")) {
        if (!model["profiles"].is_array()) {
            throw std::invalid_argument("Config key 'profiles' must be an array");
        }
        config.models.clear();
        for (const auto& p : model["profiles"]) {
            config.models.push_back(profileFromJson(p));
        }
    }

    const json& advanced = sectionOf(j, "advanced");
    readInt(advanced, "timeout_duration", config.processTimeoutSeconds, 1);
    readInt(advanced, "search_timeout", config.searchTimeoutSeconds, 1);
    if (advanced.contains("max_output_bytes")) {
        const json& value = advanced["max_output_bytes"];
        if (!value.is_number_integer() || value.get<long long>() <= 0) {
            throw std::invalid_argument("Config key 'max_output_bytes' must be a positive integer");
        }
        config.maxOutputBytes = advanced["max_output_bytes"].get<size_t>();
    }
    readString(advanced, "search_command", config.searchCommand);
    readInt(advanced, "search_results", config.searchResultCount, 1);
    readInt(advanced, "search_results_shown", config.searchResultsShown, 1);
    readString(advanced, "elevation_tool", config.elevationTool);

    return config;
}

json configToJson(const AssistantConfig& config) {
    json profiles = json::array();
    for (const auto& p : config.models) {
        profiles.push_back({
            {"id", p.id},
            {"context_length", p.contextLength},
            {"temperature", p.temperature},
            {"top_k", p.topK},
            {"top_p", p.topP}
        });
    }

    return json{
        {"general", {
            {"model", config.modelId},
            {"max_history", config.maxHistory},
            {"debug", config.debug},
            {"silent", config.silentMode}
        }},
        {"model", {
            {"base_url", config.baseUrl},
            {"connect_timeout", config.connectTimeoutSeconds},
            {"read_timeout", config.readTimeoutSeconds},
            {"retries", config.modelRetries},
            {"system_prompt", config.systemPrompt},
            {"profiles", profiles}
        }},
        {"advanced", {
            {"timeout_duration", config.processTimeoutSeconds},
            {"search_timeout", config.searchTimeoutSeconds},
            {"max_output_bytes", config.maxOutputBytes},
            {"search_command", config.searchCommand},
            {"search_results", config.searchResultCount},
            {"search_results_shown", config.searchResultsShown},
            {"elevation_tool", config.elevationTool}
        }}
    };
}

ModelProfile findModelProfile(const AssistantConfig& config, const std::string& modelId) {
    for (const auto& p : config.models) {
        if (p.id == modelId) {
            return p;
        }
    }
    ModelProfile fallback;
    fallback.id = modelId;
    return fallback;
}

} // namespace archchan
