// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Client for the locally hosted language model.
//
// ModelClient is the seam the Tool Dispatcher talks to; OllamaClient is the
// HTTP implementation for an Ollama-compatible /api/chat endpoint.

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "types.h"
#include "cancellation.h"
#include "archchan/export.h"

namespace archchan {

using json = nlohmann::json;

/// A model call failed. kind() is MODEL_UNAVAILABLE or MODEL_TIMEOUT.
class ARCHCHAN_API ModelError : public std::runtime_error {
public:
    ModelError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class ARCHCHAN_API ModelClient {
public:
    virtual ~ModelClient() = default;

    /// Send one chat request and return the reply text.
    ///
    /// @param modelId Model identifier to address
    /// @param context Ordered conversation turns (oldest first)
    /// @param systemPrompt Prepended as a system message when non-empty
    /// @param token Cancelling it abandons the in-flight request
    /// @return Raw reply text
    /// @throws ModelError on connection failure, bad status, bad body or timeout
    virtual std::string chat(const std::string& modelId,
                             const std::vector<Turn>& context,
                             const std::string& systemPrompt,
                             CancellationToken& token) = 0;
};

/// Parsed form of AssistantConfig::baseUrl.
struct Endpoint {
    std::string host;
    int port = 80;
    std::string path; // Prefix for API paths, without trailing slash
    bool useSSL = false;
};

/// Split "http[s]://host[:port][/prefix]" into its parts.
/// @throws std::invalid_argument on an empty host or a non-numeric port
ARCHCHAN_API Endpoint parseBaseUrl(const std::string& baseUrl);

class ARCHCHAN_API OllamaClient : public ModelClient {
public:
    explicit OllamaClient(const AssistantConfig& config = AssistantConfig{});

    std::string chat(const std::string& modelId,
                     const std::vector<Turn>& context,
                     const std::string& systemPrompt,
                     CancellationToken& token) override;

    /// Request body for POST /api/chat (non-streaming, sampling options
    /// taken from the model's profile).
    json buildRequest(const std::string& modelId,
                      const std::vector<Turn>& context,
                      const std::string& systemPrompt) const;

    /// Reply text from a /api/chat body. Also accepts the OpenAI-compatible
    /// choices[0].message.content shape.
    /// @throws ModelError(MODEL_UNAVAILABLE) if neither shape is present
    static std::string extractContent(const std::string& body);

    /// True if the endpoint answers GET /api/tags with 200.
    bool checkHealth() const;

    /// Names of the models installed on the endpoint (GET /api/tags).
    /// @throws ModelError(MODEL_UNAVAILABLE) if the endpoint cannot be queried
    std::vector<std::string> listModels() const;

    const Endpoint& endpoint() const { return endpoint_; }

private:
    AssistantConfig config_;
    Endpoint endpoint_;
};

} // namespace archchan
