#pragma once

#include <string>
#include <memory>
#include "summarizer.hpp"

namespace morgue::engine {

    /**
     * @brief Optionally replaces the extractive answer with an LLM summary.
     *
     * The backend is probed once at construction and the result is cached for
     * the process lifetime. Any failure leaves the extractive answer in place.
     */
    class AnswerSynthesizer {
    public:
        explicit AnswerSynthesizer(std::unique_ptr<Summarizer> summarizer);

        bool available() const { return m_available; }
        std::string backend() const;

        /**
         * @brief Rewrites response.answer when a summary was produced. Returns true if it did.
         */
        bool augment(const std::string& query, QueryResponse& response);

    private:
        std::unique_ptr<Summarizer> m_summarizer;
        bool m_available = false;
    };

}
