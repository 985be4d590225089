#pragma once

#include <string>
#include <vector>
#include <stdexcept>
#include "morgue/types.hpp"
#include "config.hpp"
#include "embedder.hpp"
#include "metadata_store.hpp"
#include "text_resolver.hpp"
#include "vector_index.hpp"

namespace morgue::engine {

    /**
     * @brief Raised when a query cannot be embedded. Never retried.
     */
    class RetrievalError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    inline constexpr const char* kEmptyQueryAnswer = "Please enter a search query.";
    inline constexpr const char* kNoResultsAnswer =
        "No relevant articles found for your query. Try different keywords or a broader search term.";

    /**
     * @brief Query-time join of vector search hits with metadata and source text.
     *
     * Holds references only; the owner keeps the index, store, embedder and
     * resolver alive. Safe to call from several threads once the index is loaded.
     */
    class Retriever {
    public:
        Retriever(const VectorIndex& index, const MetadataStore& store, Embedder& embedder,
                  const TextResolver& resolver, const Config& config);

        /**
         * @brief Embeds the query, searches, joins metadata and builds the extractive answer.
         * @throws RetrievalError when the embedder fails or returns the wrong dimension.
         */
        QueryResponse retrieve(const std::string& query, size_t top_k) const;

        Passage format_passage(const ChunkRecord& record, const std::string& text, float similarity) const;

        std::string extractive_summary(const std::vector<Passage>& passages) const;

    private:
        const VectorIndex& m_index;
        const MetadataStore& m_store;
        Embedder& m_embedder;
        const TextResolver& m_resolver;
        Config m_config;
    };

}
