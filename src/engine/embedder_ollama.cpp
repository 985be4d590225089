#include "embedder.hpp"
#include "http_client.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

using json = nlohmann::json;

namespace morgue::engine {

    class OllamaEmbedder : public Embedder {
    public:
        OllamaEmbedder(const std::string& model, const std::string& endpoint, long timeout_ms)
            : m_model(model), m_endpoint(endpoint), m_timeout_ms(timeout_ms) {}

        std::vector<float> embed(const std::string& text) override {
            std::vector<float> embedding;

            std::string json_str;
            try {
                json body = {
                    {"model", m_model},
                    {"prompt", text}
                };
                json_str = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
            } catch (const json::exception& e) {
                std::cerr << "[OllamaEmbedder] JSON serialization error: " << e.what() << "\n";
                return embedding;
            }

            auto response = http_post_json(m_endpoint, json_str, {}, m_timeout_ms);
            if (!response.ok) {
                std::cerr << "[OllamaEmbedder] Request failed: " << response.error << "\n";
                return embedding;
            }
            if (response.status != 200) {
                std::cerr << "[OllamaEmbedder] HTTP " << response.status << " from " << m_endpoint << "\n";
                return embedding;
            }

            try {
                auto resp_json = json::parse(response.body);
                if (resp_json.contains("embedding")) {
                    embedding = resp_json["embedding"].get<std::vector<float>>();
                }
            } catch (const json::exception& e) {
                std::cerr << "[OllamaEmbedder] JSON parse error: " << e.what() << "\n";
            }
            return embedding;
        }

    private:
        std::string m_model;
        std::string m_endpoint;
        long m_timeout_ms;
    };

    std::unique_ptr<Embedder> create_ollama_embedder(const std::string& model, const std::string& endpoint, long timeout_ms) {
        return std::make_unique<OllamaEmbedder>(model, endpoint, timeout_ms);
    }

}
