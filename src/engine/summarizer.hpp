#pragma once

#include <string>
#include <vector>
#include <memory>
#include "morgue/types.hpp"

namespace morgue::engine {

    struct Config;

    /**
     * @brief Outcome of one summarization call. Failures carry a reason instead of throwing.
     */
    struct Synthesis {
        bool ok = false;
        std::string text;
        std::string error;

        static Synthesis success(std::string text) { return {true, std::move(text), ""}; }
        static Synthesis failure(std::string error) { return {false, "", std::move(error)}; }
    };

    /**
     * @brief Abstract LLM backend that turns retrieved passages into a prose answer.
     */
    class Summarizer {
    public:
        virtual ~Summarizer() = default;

        virtual std::string name() const = 0;

        /**
         * @brief Checks once whether the backend can be reached.
         */
        virtual bool probe() = 0;

        virtual Synthesis summarize(const std::string& query, const std::vector<Passage>& passages) = 0;
    };

    struct SummaryPrompt {
        std::string system;
        std::string user;
    };

    /**
     * @brief Builds the research-assistant prompt from the top passages.
     */
    SummaryPrompt build_summary_prompt(const std::string& query, const std::vector<Passage>& passages,
                                       size_t max_passages = 5, size_t snippet_chars = 500);

    std::unique_ptr<Summarizer> create_groq_summarizer(const std::string& api_key, const std::string& model,
                                                       const std::string& endpoint, long timeout_ms);
    std::unique_ptr<Summarizer> create_ollama_summarizer(const std::string& model, const std::string& base_url,
                                                         long timeout_ms);

    /**
     * @brief Picks the backend named by summarizer_backend; nullptr for "none" or unknown names.
     */
    std::unique_ptr<Summarizer> create_summarizer(const Config& config);

}
