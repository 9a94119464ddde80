/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace distill::infrastructure {

class OllamaClient {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434, int readTimeoutSeconds = 600);

    /** @brief Sends a POST request to /api/generate. */
    std::optional<std::string> generate(const std::string& model,
                                        const std::string& system,
                                        const std::string& prompt,
                                        bool forceJson = false);

    /** @brief Fetches available models from /api/tags. */
    std::vector<std::string> getAvailableModels();

    /** @brief Text of the most recent transport or HTTP error. */
    const std::string& lastError() const { return m_lastError; }

private:
    std::string m_host;
    int m_port;
    int m_readTimeoutSeconds;
    std::string m_lastError;
};

} // namespace distill::infrastructure
