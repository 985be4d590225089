#pragma once

#include <string>
#include <memory>
#include "morgue/types.hpp"
#include "config.hpp"
#include "chunk_source.hpp"
#include "embedder.hpp"
#include "metadata_store.hpp"
#include "retriever.hpp"
#include "summarizer.hpp"
#include "synthesizer.hpp"
#include "text_resolver.hpp"
#include "vector_index.hpp"

namespace morgue::engine {

    struct ServiceStatus {
        bool initialized = false;
        std::string error;
        IndexMode mode = IndexMode::Exact;
        Deployment deployment = Deployment::Full;
        size_t dimension = 0;
        uint64_t documents = 0;
        std::string summarizer = "none";
        bool summarizer_available = false;
    };

    /**
     * @brief Owns everything the serving process needs: the loaded index, the
     * read-only metadata store, the embedder, the retriever and the synthesizer.
     *
     * initialize() runs once. When it fails the service stays in the
     * not-initialized state and error() explains why.
     */
    class Service {
    public:
        explicit Service(Config config);

        /**
         * @brief Injects the embedding and summarizer backends instead of building them from config.
         */
        Service(Config config, std::unique_ptr<Embedder> embedder, std::unique_ptr<Summarizer> summarizer);
        ~Service();

        Service(const Service&) = delete;
        Service& operator=(const Service&) = delete;

        bool initialize();
        bool initialized() const { return m_initialized; }
        const std::string& error() const { return m_error; }

        ServiceStatus status() const;

        /**
         * @brief Answers one query. Throws RetrievalError when the query cannot
         * be embedded or the service is not initialized.
         */
        QueryResponse query(const QueryRequest& request);

        const Config& config() const { return m_config; }

    private:
        bool fail(const std::string& reason);

        Config m_config;
        bool m_attempted = false;
        bool m_initialized = false;
        std::string m_error;

        IndexMode m_mode = IndexMode::Exact;
        MetadataStore m_store;
        std::unique_ptr<VectorIndex> m_index;
        std::unique_ptr<Embedder> m_embedder;
        std::unique_ptr<Summarizer> m_summarizer;
        std::unique_ptr<TextResolver> m_resolver;
        std::unique_ptr<Retriever> m_retriever;
        std::unique_ptr<AnswerSynthesizer> m_synthesizer;
    };

}
