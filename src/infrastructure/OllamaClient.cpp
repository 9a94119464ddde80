#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <iostream>
#include <nlohmann/json.hpp>

namespace distill::infrastructure {

using json = nlohmann::json;

namespace {
constexpr double kDeterministicTemperature = 0.0;
constexpr double kDeterministicTopP = 1.0;
constexpr int kDeterministicSeed = 42;
}

OllamaClient::OllamaClient(const std::string& host, int port, int readTimeoutSeconds)
    : m_host(host), m_port(port), m_readTimeoutSeconds(readTimeoutSeconds) {}

std::optional<std::string> OllamaClient::generate(const std::string& model,
                                                  const std::string& system,
                                                  const std::string& prompt,
                                                  bool forceJson) {
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
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("response")) {
                m_lastError.clear();
                return body["response"].get<std::string>();
            }
            m_lastError = "response field missing";
        } catch (const std::exception& e) {
            m_lastError = std::string("JSON parse error: ") + e.what();
            std::cerr << "[OllamaClient] " << m_lastError << std::endl;
        }
    } else if (res) {
        m_lastError = "HTTP " + std::to_string(res->status);
        std::cerr << "[OllamaClient] HTTP Error " << res->status << ": " << res->body << std::endl;
    } else {
        m_lastError = "connection failed: " + httplib::to_string(res.error());
        std::cerr << "[OllamaClient] " << m_lastError << std::endl;
    }
    return std::nullopt;
}

std::vector<std::string> OllamaClient::getAvailableModels() {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(5);

    auto res = cli.Get("/api/tags");
    std::vector<std::string> models;
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("models") && body["models"].is_array()) {
                for (const auto& item : body["models"]) {
                    if (item.contains("name")) {
                        models.push_back(item["name"].get<std::string>());
                    }
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "[OllamaClient] Failed to parse model list: " << e.what() << std::endl;
        }
    }
    return models;
}

} // namespace distill::infrastructure
