/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace blogforge::infrastructure {

/**
 * @struct GenerateResponse
 * @brief Model answer plus the token counts Ollama reports.
 */
struct GenerateResponse {
    std::string text;
    std::uint64_t promptTokens = 0;
    std::uint64_t completionTokens = 0;

    std::uint64_t usageUnits() const { return promptTokens + completionTokens; }
};

class OllamaClient {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434, int readTimeoutSeconds = 600);

    /**
     * @brief Sends a POST request to /api/generate.
     * @throws domain::RetryableError on connection failures, 408, 429 and 5xx.
     * @throws domain::FatalError on other HTTP errors and unreadable bodies.
     */
    GenerateResponse generate(const std::string& model,
                              const std::string& system,
                              const std::string& prompt,
                              bool forceJson = false) const;

    /** @brief Fetches available models from /api/tags. Empty when the server is unreachable. */
    std::vector<std::string> getAvailableModels() const;

    /** @brief Statuses worth retrying: 408, 429 and 5xx. */
    static bool IsRetryableStatus(int status);

    /**
     * @brief Decodes a non-streaming /api/generate body.
     * @throws domain::FatalError when the body is not JSON or has no "response".
     */
    static GenerateResponse ParseGenerateBody(const std::string& body);

    const std::string& host() const { return m_host; }
    int port() const { return m_port; }

private:
    std::string m_host;
    int m_port;
    int m_readTimeoutSeconds;
};

} // namespace blogforge::infrastructure
