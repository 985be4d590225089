#include "service.hpp"
#include <iostream>

namespace morgue::engine {

    Service::Service(Config config) : m_config(std::move(config)) {}

    Service::Service(Config config, std::unique_ptr<Embedder> embedder, std::unique_ptr<Summarizer> summarizer)
        : m_config(std::move(config)), m_embedder(std::move(embedder)), m_summarizer(std::move(summarizer)) {}

    Service::~Service() = default;

    bool Service::fail(const std::string& reason) {
        m_error = reason;
        std::cerr << "[Service] Not initialized: " << reason << "\n";
        return false;
    }

    bool Service::initialize() {
        if (m_attempted) return m_initialized;
        m_attempted = true;

        const auto index_path = m_config.index_path();
        const auto db_path = m_config.database_path();
        bool has_index = std::filesystem::exists(index_path);
        bool has_db = std::filesystem::exists(db_path);

        if (has_index && !has_db) return fail("metadata store " + db_path.string() + " is missing for " + index_path.string());
        if (!has_index) return fail("no index at " + index_path.string() + "; run morgue-build first");
        if (!m_store.open(db_path, true)) return fail("cannot open metadata store " + db_path.string());

        auto mode = m_store.get_setting("mode");
        if (!mode) return fail("metadata store has no recorded index mode");
        m_mode = (*mode == "compressed") ? IndexMode::Compressed : IndexMode::Exact;

        if (auto dim = m_store.get_setting("dimension"); dim && *dim != std::to_string(m_config.dimension)) {
            return fail("index was built with dimension " + *dim + ", config says " + std::to_string(m_config.dimension));
        }
        if (auto deployment = m_store.get_setting("deployment")) {
            m_config.deployment = (*deployment == "lite") ? Deployment::Lite : Deployment::Full;
        }

        try {
            m_index = load_vector_index(m_mode, index_path, m_config.dimension, m_config.nprobe);
        } catch (const IndexError& e) {
            return fail(e.what());
        }

        uint64_t committed = m_store.committed_count();
        if (m_index->count() != committed) {
            return fail("index holds " + std::to_string(m_index->count()) + " vectors but metadata store has " +
                        std::to_string(committed) + " rows; rerun morgue-build to recover");
        }

        if (!m_embedder) m_embedder = create_embedder(m_config);
        if (!m_embedder) return fail("no usable embedding backend '" + m_config.embedding_backend + "'");

        if (!m_summarizer) m_summarizer = create_summarizer(m_config);
        m_synthesizer = std::make_unique<AnswerSynthesizer>(std::move(m_summarizer));

        ChunkSource source(m_config.embeddings_dir, m_config.chunks_dir);
        m_resolver = create_text_resolver(m_config.deployment, source);
        m_retriever = std::make_unique<Retriever>(*m_index, m_store, *m_embedder, *m_resolver, m_config);

        m_initialized = true;
        std::cout << "[Service] Ready: " << committed << " documents, " << to_string(m_mode) << " index, "
                  << to_string(m_config.deployment) << " deployment\n";
        return true;
    }

    ServiceStatus Service::status() const {
        ServiceStatus s;
        s.initialized = m_initialized;
        s.error = m_error;
        s.mode = m_mode;
        s.deployment = m_config.deployment;
        s.dimension = m_config.dimension;
        if (m_index) s.documents = m_index->count();
        if (m_synthesizer) {
            s.summarizer = m_synthesizer->backend();
            s.summarizer_available = m_synthesizer->available();
        }
        return s;
    }

    QueryResponse Service::query(const QueryRequest& request) {
        if (!m_initialized) throw RetrievalError("service not initialized: " + m_error);

        size_t top_k = request.top_k == 0 ? m_config.default_top_k : request.top_k;
        QueryResponse response = m_retriever->retrieve(request.query, top_k);
        if (request.synthesize) m_synthesizer->augment(request.query, response);
        return response;
    }

}
