#include "summarizer.hpp"
#include "http_client.hpp"
#include "text_util.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace morgue::engine {

    /**
     * @brief Local Ollama generate backend.
     */
    class OllamaSummarizer : public Summarizer {
    public:
        OllamaSummarizer(const std::string& model, const std::string& base_url, long timeout_ms)
            : m_model(model), m_base_url(base_url), m_timeout_ms(timeout_ms) {
            while (!m_base_url.empty() && m_base_url.back() == '/') m_base_url.pop_back();
        }

        std::string name() const override { return "ollama"; }

        bool probe() override {
            auto response = http_get(m_base_url + "/api/tags", kProbeTimeoutMs);
            return response.ok && response.status == 200;
        }

        Synthesis summarize(const std::string& query, const std::vector<Passage>& passages) override {
            auto prompt = build_summary_prompt(query, passages);
            json body = {
                {"model", m_model},
                {"system", prompt.system},
                {"prompt", prompt.user},
                {"stream", false},
                {"options", {{"temperature", 0.3}, {"num_predict", 600}}}
            };

            auto response = http_post_json(m_base_url + "/api/generate",
                                           body.dump(-1, ' ', false, json::error_handler_t::replace), {}, m_timeout_ms);
            if (!response.ok) return Synthesis::failure("ollama request failed: " + response.error);
            if (response.status != 200) return Synthesis::failure("ollama HTTP " + std::to_string(response.status));

            try {
                auto resp_json = json::parse(response.body);
                auto text = trim(resp_json.value("response", std::string()));
                if (text.empty()) return Synthesis::failure("ollama returned an empty answer");
                return Synthesis::success(text);
            } catch (const json::exception& e) {
                return Synthesis::failure(std::string("ollama response unreadable: ") + e.what());
            }
        }

    private:
        static constexpr long kProbeTimeoutMs = 3000;

        std::string m_model;
        std::string m_base_url;
        long m_timeout_ms;
    };

    std::unique_ptr<Summarizer> create_ollama_summarizer(const std::string& model, const std::string& base_url,
                                                         long timeout_ms) {
        return std::make_unique<OllamaSummarizer>(model, base_url, timeout_ms);
    }

}
