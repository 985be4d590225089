#include "embedder.hpp"
#include "config.hpp"
#include <iostream>

namespace morgue::engine {

    std::unique_ptr<Embedder> create_embedder(const Config& config) {
        if (config.embedding_backend == "ollama") {
            return create_ollama_embedder(config.embedding_model, config.embedding_endpoint, config.embedding_timeout_ms);
        }
        if (config.embedding_backend == "openai") {
            if (config.openai_key.empty()) {
                std::cerr << "[Embedder] openai backend selected but no API key configured\n";
                return nullptr;
            }
            return create_openai_embedder(config.openai_key, config.embedding_model, config.embedding_timeout_ms);
        }
        std::cerr << "[Embedder] Unknown backend: " << config.embedding_backend << "\n";
        return nullptr;
    }

}
