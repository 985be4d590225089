#include "summarizer.hpp"
#include "config.hpp"
#include "text_util.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>

namespace morgue::engine {

    namespace {
        const char* kSystemPrompt =
            "You are a knowledgeable historical research assistant specializing in Utah history "
            "and the Utah Digital Newspapers archive.\n"
            "\n"
            "Your job:\n"
            "1. Read the user's question and the retrieved newspaper excerpts\n"
            "2. Synthesize a clear, informative answer based ONLY on what the sources say\n"
            "3. Note important details: dates, people, places, events\n"
            "4. Acknowledge that text may have OCR errors from scanning old newspapers\n"
            "5. If the sources don't clearly answer the question, say so honestly\n"
            "\n"
            "Rules:\n"
            "- Be concise (3-5 sentences max for the summary)\n"
            "- Only state facts found in the sources - do NOT make things up\n"
            "- Reference which source(s) support your points\n"
            "- If text is garbled from OCR, interpret what you can and note the limitation";
    }

    SummaryPrompt build_summary_prompt(const std::string& query, const std::vector<Passage>& passages,
                                       size_t max_passages, size_t snippet_chars) {
        std::ostringstream context;
        size_t n = std::min(max_passages, passages.size());
        for (size_t i = 0; i < n; ++i) {
            const auto& p = passages[i];
            if (i > 0) context << "\n---\n";
            context << "Source " << (i + 1) << ": " << (p.title.empty() ? "Untitled" : p.title) << "\n"
                    << "Paper: " << (p.paper.empty() ? "Unknown" : p.paper)
                    << " | Date: " << (p.date.empty() ? "Unknown date" : p.date) << "\n"
                    << "Text: " << truncate_utf8(p.snippet, snippet_chars) << "\n";
        }

        SummaryPrompt prompt;
        prompt.system = kSystemPrompt;
        prompt.user = "User question: \"" + query + "\"\n\n"
                      "Here are the most relevant newspaper excerpts found in the archive:\n\n" +
                      context.str() +
                      "\n\nBased on these historical sources, provide a clear and informative answer "
                      "to the user's question:";
        return prompt;
    }

    std::unique_ptr<Summarizer> create_summarizer(const Config& config) {
        const auto& backend = config.summarizer_backend;
        if (backend == "groq") {
            return create_groq_summarizer(config.groq_key,
                                          config.summarizer_model.empty() ? "llama-3.3-70b-versatile" : config.summarizer_model,
                                          config.summarizer_endpoint.empty() ? "https://api.groq.com/openai/v1/chat/completions"
                                                                             : config.summarizer_endpoint,
                                          config.summarizer_timeout_ms);
        }
        if (backend == "ollama") {
            return create_ollama_summarizer(config.summarizer_model.empty() ? "llama3.2" : config.summarizer_model,
                                            config.summarizer_endpoint.empty() ? "http://localhost:11434"
                                                                               : config.summarizer_endpoint,
                                            config.summarizer_timeout_ms);
        }
        if (backend != "none" && !backend.empty()) {
            std::cerr << "[Summarizer] Unknown backend: " << backend << "\n";
        }
        return nullptr;
    }

}
