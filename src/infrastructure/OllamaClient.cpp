#include "infrastructure/OllamaClient.hpp"
#include "domain/Content.hpp"
#include "domain/StageErrors.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>

namespace blogforge::infrastructure {

using json = nlohmann::json;

namespace {
constexpr double kDeterministicTemperature = 0.0;
constexpr double kDeterministicTopP = 1.0;
constexpr int kDeterministicSeed = 42;
constexpr std::size_t kMaxLoggedBody = 200;

std::string Truncate(const std::string& text) {
    return text.size() > kMaxLoggedBody ? domain::TruncateUtf8(text, kMaxLoggedBody) + "..." : text;
}
}

OllamaClient::OllamaClient(const std::string& host, int port, int readTimeoutSeconds)
    : m_host(host), m_port(port), m_readTimeoutSeconds(readTimeoutSeconds) {}

bool OllamaClient::IsRetryableStatus(int status) {
    return status == 408 || status == 429 || (status >= 500 && status <= 599);
}

GenerateResponse OllamaClient::ParseGenerateBody(const std::string& body) {
    json parsed;
    try {
        parsed = json::parse(body);
    } catch (const json::parse_error& e) {
        throw domain::FatalError(std::string("Ollama returned a non-JSON body: ") + e.what(), "INVALID_RESPONSE");
    }
    if (!parsed.is_object() || !parsed.contains("response") || !parsed["response"].is_string()) {
        throw domain::FatalError("Ollama response has no 'response' field", "INVALID_RESPONSE");
    }

    GenerateResponse response;
    response.text = parsed["response"].get<std::string>();
    response.promptTokens = parsed.value("prompt_eval_count", std::uint64_t{0});
    response.completionTokens = parsed.value("eval_count", std::uint64_t{0});
    return response;
}

GenerateResponse OllamaClient::generate(const std::string& model,
                                        const std::string& system,
                                        const std::string& prompt,
                                        bool forceJson) const {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(m_readTimeoutSeconds);

    json requestData = {
        {"model", model},
        {"system", system},
        {"prompt", prompt},
        {"stream", false},
        {"options", {
            {"temperature", kDeterministicTemperature},
            {"top_p", kDeterministicTopP},
            {"seed", kDeterministicSeed}
        }}
    };
    if (forceJson) {
        requestData["format"] = "json";
    }

    auto res = cli.Post("/api/generate", requestData.dump(), "application/json");
    if (!res) {
        std::cerr << "[OllamaClient] Connection failed: " << httplib::to_string(res.error()) << std::endl;
        domain::RetryableError error("Connection to Ollama at " + m_host + ":" + std::to_string(m_port) +
                                         " failed: " + httplib::to_string(res.error()),
                                     "CONNECTION_FAILED");
        error.addContext("host", m_host);
        error.addContext("model", model);
        throw error;
    }

    if (res->status != 200) {
        std::cerr << "[OllamaClient] HTTP Error " << res->status << ": " << Truncate(res->body) << std::endl;
        const std::string message = "Ollama returned HTTP " + std::to_string(res->status) + ": " + Truncate(res->body);
        if (IsRetryableStatus(res->status)) {
            std::optional<std::chrono::milliseconds> retryAfter;
            if (res->has_header("Retry-After")) {
                try {
                    retryAfter = std::chrono::seconds(std::stoi(res->get_header_value("Retry-After")));
                } catch (const std::exception&) {
                    std::cerr << "[OllamaClient] Ignoring malformed Retry-After header." << std::endl;
                }
            }
            domain::RetryableError error(message, res->status == 429 ? "RATE_LIMITED" : "HTTP_" + std::to_string(res->status),
                                         retryAfter);
            error.addContext("status", std::to_string(res->status));
            error.addContext("model", model);
            throw error;
        }
        domain::FatalError error(message, "HTTP_" + std::to_string(res->status));
        error.addContext("status", std::to_string(res->status));
        error.addContext("model", model);
        throw error;
    }

    return ParseGenerateBody(res->body);
}

std::vector<std::string> OllamaClient::getAvailableModels() const {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(5);

    auto res = cli.Get("/api/tags");
    std::vector<std::string> models;
    if (!res || res->status != 200) {
        std::cerr << "[OllamaClient] Could not list models from " << m_host << ":" << m_port << std::endl;
        return models;
    }
    try {
        auto body = json::parse(res->body);
        if (body.contains("models") && body["models"].is_array()) {
            for (const auto& item : body["models"]) {
                if (item.contains("name")) {
                    models.push_back(item["name"].get<std::string>());
                }
            }
        }
    } catch (const json::exception& e) {
        std::cerr << "[OllamaClient] Tags JSON Parse Error: " << e.what() << std::endl;
    }
    return models;
}

} // namespace blogforge::infrastructure
