#pragma once

#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include "config.hpp"
#include "chunk_source.hpp"
#include "metadata_store.hpp"
#include "resume_tracker.hpp"
#include "vector_index.hpp"

namespace morgue::engine {

    struct BuildOptions {
        bool lite = false;     // Inline text, sampled files, exact index
        size_t max_files = 0;  // 0 considers every source file
        bool rebuild = false;  // Discard persisted artifacts first
    };

    struct BuildReport {
        IndexMode mode = IndexMode::Exact;
        size_t files_total = 0;
        size_t processed = 0;
        size_t skipped_committed = 0;
        size_t skipped_missing_metadata = 0;
        size_t errored = 0;
        uint64_t total_vectors = 0;
        uint64_t metadata_rows = 0;
    };

    /**
     * @brief Builds the vector index and metadata store from the chunk source.
     *
     * Ingestion is resumable at file granularity: vectors and metadata of each
     * file are staged together and become durable at the next checkpoint,
     * which persists the index, commits the metadata transaction and appends
     * the file names to the resume log, in that order.
     */
    class IndexBuilder {
    public:
        explicit IndexBuilder(Config config, BuildOptions options = {});
        ~IndexBuilder();

        /**
         * @brief Runs the build. Throws IndexError on fatal failures
         * (training, index persistence, metadata writes).
         */
        BuildReport build();

    private:
        std::vector<SourcePair> select_sources() const;
        void remove_artifacts();
        IndexMode resolve_mode(size_t file_count);
        void open_index(IndexMode mode, const std::vector<SourcePair>& sources);
        void recover();
        void train(const std::vector<SourcePair>& sources);
        bool ingest(const SourcePair& source, size_t file_index, BuildReport& report);
        void checkpoint();

        Config m_config;
        BuildOptions m_options;
        ChunkSource m_source;
        MetadataStore m_store;
        ResumeTracker m_tracker;
        std::unique_ptr<VectorIndex> m_index;

        uint64_t m_next_id = 0;
        std::vector<std::string> m_staged;
        std::chrono::steady_clock::time_point m_started;
    };

}
