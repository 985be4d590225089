#pragma once

#include <vector>
#include <memory>
#include <stdexcept>
#include <filesystem>
#include "morgue/types.hpp"
#include "config.hpp"

namespace morgue::engine {

    class IndexError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    struct CompressedParams {
        size_t nlist = 1;
        size_t pq_subvectors = 1;
        size_t pq_bits = 8;
        size_t nprobe = 1;
    };

    /**
     * @brief Nearest-neighbor index over unit vectors, addressed by dense ids.
     *
     * Ids are implicit: add() assigns count(), count() + 1, ... in order, so an
     * id is the position of the vector in ingestion order. Scores are inner
     * products of unit vectors (cosine similarity).
     */
    class VectorIndex {
    public:
        virtual ~VectorIndex() = default;

        virtual IndexMode mode() const = 0;
        virtual size_t dimension() const = 0;
        virtual size_t count() const = 0;

        /**
         * @brief True until train() succeeded, for index types that need training.
         */
        virtual bool needs_training() const = 0;

        /**
         * @brief Learns the coarse clusters and codebooks. Throws IndexError.
         */
        virtual void train(const float* data, size_t n) = 0;

        /**
         * @brief Appends n row-major vectors. Throws IndexError.
         */
        virtual void add(const float* data, size_t n) = 0;

        /**
         * @brief Returns up to k hits ordered by decreasing similarity. Throws IndexError.
         */
        virtual std::vector<SearchHit> search(const float* query, size_t k) const = 0;

        /**
         * @brief Drops every vector with id >= new_count. Throws IndexError.
         */
        virtual void truncate(size_t new_count) = 0;

        /**
         * @brief Writes the index atomically (temp file + rename). Throws IndexError.
         */
        virtual void save(const std::filesystem::path& path) const = 0;

        /**
         * @brief Clusters probed per query; ignored by exhaustive indexes.
         */
        virtual void set_nprobe(size_t nprobe) { (void)nprobe; }
    };

    std::unique_ptr<VectorIndex> create_exact_index(size_t dim, size_t initial_capacity = 1024);
    std::unique_ptr<VectorIndex> create_compressed_index(size_t dim, const CompressedParams& params);

    /**
     * @brief Loads a persisted index of the given mode. Throws IndexError when unreadable.
     */
    std::unique_ptr<VectorIndex> load_vector_index(IndexMode mode, const std::filesystem::path& path, size_t dim, size_t nprobe);

    /**
     * @brief Exact search up to the threshold (inclusive), compressed above it.
     */
    IndexMode select_index_mode(size_t file_count, size_t exact_threshold);

    /**
     * @brief Sizes the IVF+PQ index for a training sample, shrinking it for small samples.
     */
    CompressedParams plan_compressed_params(size_t dim, size_t samples, const Config& config);

    /**
     * @brief Scales each of the n rows to unit length in place. Zero rows stay zero.
     */
    void normalize_l2(float* data, size_t n, size_t dim);

    /**
     * @brief Maps a cosine similarity onto the [0, 100] relevance scale.
     */
    int relevance_percent(float similarity);

    /**
     * @brief Moves a fully written temp file over its destination.
     */
    void replace_file(const std::filesystem::path& tmp, const std::filesystem::path& path);

}
