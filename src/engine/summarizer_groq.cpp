#include "summarizer.hpp"
#include "http_client.hpp"
#include "text_util.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace morgue::engine {

    /**
     * @brief Groq cloud chat-completions backend.
     */
    class GroqSummarizer : public Summarizer {
    public:
        GroqSummarizer(const std::string& api_key, const std::string& model, const std::string& endpoint, long timeout_ms)
            : m_api_key(api_key), m_model(model), m_endpoint(endpoint), m_timeout_ms(timeout_ms) {}

        std::string name() const override { return "groq"; }

        // A key is all the cloud API needs
        bool probe() override { return !m_api_key.empty(); }

        Synthesis summarize(const std::string& query, const std::vector<Passage>& passages) override {
            auto prompt = build_summary_prompt(query, passages);
            json body = {
                {"model", m_model},
                {"messages", json::array({
                    {{"role", "system"}, {"content", prompt.system}},
                    {{"role", "user"}, {"content", prompt.user}}
                })},
                {"temperature", 0.3},
                {"max_tokens", 600}
            };

            auto response = http_post_json(m_endpoint, body.dump(-1, ' ', false, json::error_handler_t::replace),
                                           {"Authorization: Bearer " + m_api_key}, m_timeout_ms);
            if (!response.ok) return Synthesis::failure("groq request failed: " + response.error);

            try {
                auto resp_json = json::parse(response.body);
                if (resp_json.contains("error")) {
                    return Synthesis::failure("groq API error: " + resp_json["error"].dump());
                }
                if (response.status != 200) {
                    return Synthesis::failure("groq HTTP " + std::to_string(response.status));
                }
                auto text = trim(resp_json.at("choices").at(0).at("message").at("content").get<std::string>());
                if (text.empty()) return Synthesis::failure("groq returned an empty answer");
                return Synthesis::success(text);
            } catch (const json::exception& e) {
                return Synthesis::failure(std::string("groq response unreadable: ") + e.what());
            }
        }

    private:
        std::string m_api_key;
        std::string m_model;
        std::string m_endpoint;
        long m_timeout_ms;
    };

    std::unique_ptr<Summarizer> create_groq_summarizer(const std::string& api_key, const std::string& model,
                                                       const std::string& endpoint, long timeout_ms) {
        return std::make_unique<GroqSummarizer>(api_key, model, endpoint, timeout_ms);
    }

}
