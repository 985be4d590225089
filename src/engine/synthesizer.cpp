#include "synthesizer.hpp"
#include <iostream>

namespace morgue::engine {

    AnswerSynthesizer::AnswerSynthesizer(std::unique_ptr<Summarizer> summarizer)
        : m_summarizer(std::move(summarizer)) {
        if (!m_summarizer) return;
        m_available = m_summarizer->probe();
        if (m_available) {
            std::cout << "[Synthesizer] Using " << m_summarizer->name() << " backend\n";
        } else {
            std::cerr << "[Synthesizer] " << m_summarizer->name() << " backend unavailable, answers stay extractive\n";
        }
    }

    std::string AnswerSynthesizer::backend() const {
        return m_summarizer ? m_summarizer->name() : "none";
    }

    bool AnswerSynthesizer::augment(const std::string& query, QueryResponse& response) {
        if (!m_available || response.sources.empty()) return false;

        Synthesis result = m_summarizer->summarize(query, response.sources);
        if (!result.ok) {
            std::cerr << "[Synthesizer] Keeping extractive answer: " << result.error << "\n";
            return false;
        }
        response.answer = result.text;
        response.synthesized = true;
        return true;
    }

}
