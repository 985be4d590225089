#pragma once

#include <string>
#include <vector>
#include <memory>

namespace morgue::engine {

    struct Config;

    /**
     * @brief Abstract base class for query embedding.
     */
    class Embedder {
    public:
        virtual ~Embedder() = default;

        /**
         * @brief Generates an embedding vector for the given text.
         * @return The embedding, or an empty vector when the backend failed.
         */
        virtual std::vector<float> embed(const std::string& text) = 0;
    };

    std::unique_ptr<Embedder> create_ollama_embedder(const std::string& model, const std::string& endpoint, long timeout_ms);
    std::unique_ptr<Embedder> create_openai_embedder(const std::string& api_key, const std::string& model, long timeout_ms);

    /**
     * @brief Picks the backend named by embedding_backend. Returns nullptr for unknown backends.
     */
    std::unique_ptr<Embedder> create_embedder(const Config& config);

}
