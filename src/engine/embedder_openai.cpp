#include "embedder.hpp"
#include "http_client.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

using json = nlohmann::json;

namespace morgue::engine {

    class OpenAIEmbedder : public Embedder {
    public:
        OpenAIEmbedder(const std::string& api_key, const std::string& model, long timeout_ms)
            : m_api_key(api_key), m_model(model), m_timeout_ms(timeout_ms) {}

        std::vector<float> embed(const std::string& text) override {
            std::vector<float> embedding;

            json body = {
                {"model", m_model},
                {"input", text}
            };
            std::string json_str = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

            auto response = http_post_json("https://api.openai.com/v1/embeddings", json_str,
                                           {"Authorization: Bearer " + m_api_key}, m_timeout_ms);
            if (!response.ok) {
                std::cerr << "[OpenAIEmbedder] Request failed: " << response.error << "\n";
                return embedding;
            }

            try {
                auto resp_json = json::parse(response.body);
                if (resp_json.contains("error")) {
                    std::cerr << "[OpenAIEmbedder] API Error: " << resp_json["error"].dump() << "\n";
                } else if (resp_json.contains("data") && !resp_json["data"].empty()) {
                    embedding = resp_json["data"][0]["embedding"].get<std::vector<float>>();
                }
            } catch (const json::exception& e) {
                std::cerr << "[OpenAIEmbedder] JSON parse error: " << e.what() << "\n";
            }
            return embedding;
        }

    private:
        std::string m_api_key;
        std::string m_model;
        long m_timeout_ms;
    };

    std::unique_ptr<Embedder> create_openai_embedder(const std::string& api_key, const std::string& model, long timeout_ms) {
        return std::make_unique<OpenAIEmbedder>(api_key, model, timeout_ms);
    }

}
