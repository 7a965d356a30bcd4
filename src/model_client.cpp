// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "archchan/model_client.h"
#include "archchan/config.h"

#include <chrono>
#include <iostream>
#include <stdexcept>

#include <httplib.h>

namespace archchan {

namespace {

std::string originOf(const Endpoint& ep) {
    return std::string(ep.useSSL ? "https://" : "http://") + ep.host + ":" + std::to_string(ep.port);
}

} // namespace

Endpoint parseBaseUrl(const std::string& baseUrl) {
    Endpoint ep;
    std::string rest = baseUrl;

    // Extract scheme
    if (rest.substr(0, 8) == "https://") {
        ep.useSSL = true;
        ep.port = 443;
        rest = rest.substr(8);
    } else if (rest.substr(0, 7) == "http://") {
        rest = rest.substr(7);
    }

    // Extract host:port and path
    auto slashPos = rest.find('/');
    std::string hostPort = rest.substr(0, slashPos);
    if (slashPos != std::string::npos) {
        ep.path = rest.substr(slashPos);
        while (!ep.path.empty() && ep.path.back() == '/') {
            ep.path.pop_back();
        }
    }

    auto colonPos = hostPort.find(':');
    if (colonPos != std::string::npos) {
        std::string portStr = hostPort.substr(colonPos + 1);
        try {
            size_t used = 0;
            ep.port = std::stoi(portStr, &used);
            if (used != portStr.size() || ep.port <= 0 || ep.port > 65535) {
                throw std::invalid_argument(portStr);
            }
        } catch (const std::exception&) {
            throw std::invalid_argument("Invalid port in base URL: " + baseUrl);
        }
        hostPort = hostPort.substr(0, colonPos);
    }

    if (hostPort.empty()) {
        throw std::invalid_argument("Missing host in base URL: " + baseUrl);
    }
    ep.host = hostPort;
    return ep;
}

// ---- OllamaClient ----

OllamaClient::OllamaClient(const AssistantConfig& config)
    : config_(config), endpoint_(parseBaseUrl(config.baseUrl)) {}

json OllamaClient::buildRequest(const std::string& modelId,
                                const std::vector<Turn>& context,
                                const std::string& systemPrompt) const {
    ModelProfile profile = findModelProfile(config_, modelId);

    json msgArray = json::array();
    if (!systemPrompt.empty()) {
        msgArray.push_back({{"role", "system"}, {"content", systemPrompt}});
    }
    for (const auto& turn : context) {
        msgArray.push_back(turn.toJson());
    }

    json requestBody;
    requestBody["model"] = modelId;
    requestBody["messages"] = msgArray;
    requestBody["stream"] = false;
    requestBody["options"] = {
        {"temperature", profile.temperature},
        {"top_k", profile.topK},
        {"top_p", profile.topP},
        {"num_ctx", profile.contextLength}
    };
    return requestBody;
}

std::string OllamaClient::extractContent(const std::string& body) {
    json response;
    try {
        response = json::parse(body);
    } catch (const json::parse_error& e) {
        throw ModelError(ErrorKind::MODEL_UNAVAILABLE,
                         std::string("Model returned an undecodable body: ") + e.what());
    }

    // Native /api/chat shape
    if (response.contains("message") && response["message"].is_object()) {
        const auto& message = response["message"];
        if (message.contains("content") && message["content"].is_string()) {
            return message["content"].get<std::string>();
        }
    }

    // OpenAI-compatible shape
    if (response.contains("choices") && response["choices"].is_array() &&
        !response["choices"].empty()) {
        const auto& choice = response["choices"][0];
        if (choice.contains("message") && choice["message"].contains("content") &&
            choice["message"]["content"].is_string()) {
            return choice["message"]["content"].get<std::string>();
        }
    }

    if (response.contains("error") && response["error"].is_string()) {
        throw ModelError(ErrorKind::MODEL_UNAVAILABLE,
                         "Model error: " + response["error"].get<std::string>());
    }

    throw ModelError(ErrorKind::MODEL_UNAVAILABLE, "Model response has no message content");
}

std::string OllamaClient::chat(const std::string& modelId,
                               const std::vector<Turn>& context,
                               const std::string& systemPrompt,
                               CancellationToken& token) {
    json requestBody = buildRequest(modelId, context, systemPrompt);
    std::string path = endpoint_.path + "/api/chat";

    if (config_.debug) {
        std::cerr << "[MODEL] Calling " << endpoint_.host << ":" << endpoint_.port << path << std::endl;
        std::cerr << "[MODEL] Model: " << modelId << ", messages: "
                  << requestBody["messages"].size() << std::endl;
    }

    httplib::Client cli(originOf(endpoint_));
    if (!cli.is_valid()) {
        throw ModelError(ErrorKind::MODEL_UNAVAILABLE,
                         "Cannot create HTTP client for " + config_.baseUrl);
    }
    cli.set_connection_timeout(config_.connectTimeoutSeconds);
    cli.set_read_timeout(config_.readTimeoutSeconds);

    // Cancellation closes the socket; the blocked Post() then returns an error
    CancelHookGuard guard(token, [&cli]() { cli.stop(); });
    // A token cancelled before the socket exists leaves stop() nothing to close
    if (token.isCancelled()) {
        throw ModelError(ErrorKind::CANCELLED_BY_USER, "Model request cancelled");
    }

    auto start = std::chrono::steady_clock::now();
    auto res = cli.Post(path, requestBody.dump(), "application/json");
    auto elapsed = std::chrono::steady_clock::now() - start;

    if (!res) {
        if (elapsed >= std::chrono::seconds(config_.readTimeoutSeconds)) {
            throw ModelError(ErrorKind::MODEL_TIMEOUT,
                             "Model did not reply within " +
                             std::to_string(config_.readTimeoutSeconds) + "s");
        }
        throw ModelError(ErrorKind::MODEL_UNAVAILABLE,
                         "Model request failed: connection error to " +
                         endpoint_.host + ":" + std::to_string(endpoint_.port));
    }
    if (res->status != 200) {
        throw ModelError(ErrorKind::MODEL_UNAVAILABLE,
                         "Model request failed with status " +
                         std::to_string(res->status) + ": " + res->body);
    }

    std::string content = extractContent(res->body);

    if (config_.debug) {
        std::cerr << "[MODEL] Reply (" << content.size() << " chars) in "
                  << std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count()
                  << "ms" << std::endl;
    }
    return content;
}

bool OllamaClient::checkHealth() const {
    httplib::Client cli(originOf(endpoint_));
    if (!cli.is_valid()) return false;
    cli.set_connection_timeout(config_.connectTimeoutSeconds);
    cli.set_read_timeout(config_.connectTimeoutSeconds);
    auto res = cli.Get(endpoint_.path + "/api/tags");
    return res && res->status == 200;
}

std::vector<std::string> OllamaClient::listModels() const {
    httplib::Client cli(originOf(endpoint_));
    if (!cli.is_valid()) {
        throw ModelError(ErrorKind::MODEL_UNAVAILABLE,
                         "Cannot create HTTP client for " + config_.baseUrl);
    }
    cli.set_connection_timeout(config_.connectTimeoutSeconds);
    cli.set_read_timeout(config_.readTimeoutSeconds);

    auto res = cli.Get(endpoint_.path + "/api/tags");
    if (!res || res->status != 200) {
        throw ModelError(ErrorKind::MODEL_UNAVAILABLE,
                         "Cannot list models at " + config_.baseUrl);
    }

    std::vector<std::string> names;
    try {
        json body = json::parse(res->body);
        for (const auto& model : body.value("models", json::array())) {
            if (model.contains("name") && model["name"].is_string()) {
                names.push_back(model["name"].get<std::string>());
            }
        }
    } catch (const json::exception& e) {
        throw ModelError(ErrorKind::MODEL_UNAVAILABLE,
                         std::string("Undecodable model list: ") + e.what());
    }
    return names;
}

} // namespace archchan
