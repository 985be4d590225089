#include "vector_index.hpp"
#include <faiss/IndexFlat.h>
#include <faiss/IndexIVFPQ.h>
#include <faiss/impl/FaissException.h>
#include <faiss/impl/IDSelector.h>
#include <faiss/index_io.h>
#include <algorithm>
#include <iostream>

namespace morgue::engine {

    /**
     * @brief Inverted file + product quantization over inner product (faiss IVF+PQ).
     */
    class CompressedIndex : public VectorIndex {
    public:
        CompressedIndex(size_t dim, const CompressedParams& params) : m_dim(dim) {
            try {
                auto quantizer = std::make_unique<faiss::IndexFlatIP>(static_cast<faiss::idx_t>(dim));
                m_index = std::make_unique<faiss::IndexIVFPQ>(quantizer.get(), dim, params.nlist, params.pq_subvectors,
                                                              params.pq_bits, faiss::METRIC_INNER_PRODUCT);
                // The IVF index owns the quantizer from here on
                m_index->own_fields = true;
                quantizer.release();
                m_index->nprobe = params.nprobe;
            } catch (const faiss::FaissException& e) {
                throw IndexError(std::string("cannot create IVF+PQ index: ") + e.what());
            }
        }

        explicit CompressedIndex(std::unique_ptr<faiss::IndexIVFPQ> index)
            : m_index(std::move(index)), m_dim(static_cast<size_t>(m_index->d)) {}

        IndexMode mode() const override { return IndexMode::Compressed; }
        size_t dimension() const override { return m_dim; }
        size_t count() const override { return static_cast<size_t>(m_index->ntotal); }
        bool needs_training() const override { return !m_index->is_trained; }

        void train(const float* data, size_t n) override {
            if (n == 0) throw IndexError("cannot train on an empty sample");
            try {
                m_index->train(static_cast<faiss::idx_t>(n), data);
            } catch (const faiss::FaissException& e) {
                throw IndexError(std::string("training failed: ") + e.what());
            }
        }

        void add(const float* data, size_t n) override {
            if (needs_training()) throw IndexError("index is not trained");
            try {
                m_index->add(static_cast<faiss::idx_t>(n), data);
            } catch (const faiss::FaissException& e) {
                throw IndexError(std::string("IVF+PQ add failed: ") + e.what());
            }
        }

        std::vector<SearchHit> search(const float* query, size_t k) const override {
            std::vector<SearchHit> hits;
            k = std::min(k, count());
            if (k == 0) return hits;

            std::vector<float> scores(k);
            std::vector<faiss::idx_t> labels(k);
            try {
                m_index->search(1, query, static_cast<faiss::idx_t>(k), scores.data(), labels.data());
            } catch (const faiss::FaissException& e) {
                throw IndexError(std::string("IVF+PQ search failed: ") + e.what());
            }

            for (size_t i = 0; i < k; ++i) {
                if (labels[i] < 0) continue; // Fewer than k vectors in the probed lists
                hits.push_back({static_cast<uint64_t>(labels[i]), scores[i]});
            }
            return hits;
        }

        void truncate(size_t new_count) override {
            if (new_count >= count()) return;
            faiss::IDSelectorRange tail(static_cast<faiss::idx_t>(new_count), m_index->ntotal);
            try {
                m_index->remove_ids(tail);
            } catch (const faiss::FaissException& e) {
                throw IndexError(std::string("IVF+PQ truncate failed: ") + e.what());
            }
        }

        void save(const std::filesystem::path& path) const override {
            auto tmp = path;
            tmp += ".tmp";
            try {
                faiss::write_index(m_index.get(), tmp.c_str());
            } catch (const faiss::FaissException& e) {
                throw IndexError("failed to save " + path.string() + ": " + e.what());
            }
            replace_file(tmp, path);
        }

        void set_nprobe(size_t nprobe) override {
            m_index->nprobe = std::clamp<size_t>(nprobe, 1, m_index->nlist);
        }

    private:
        std::unique_ptr<faiss::IndexIVFPQ> m_index;
        size_t m_dim;
    };

    std::unique_ptr<VectorIndex> create_compressed_index(size_t dim, const CompressedParams& params) {
        return std::make_unique<CompressedIndex>(dim, params);
    }

    std::unique_ptr<VectorIndex> load_compressed_index(const std::filesystem::path& path, size_t dim, size_t nprobe) {
        std::unique_ptr<faiss::Index> raw;
        try {
            raw.reset(faiss::read_index(path.c_str()));
        } catch (const faiss::FaissException& e) {
            throw IndexError("failed to load " + path.string() + ": " + e.what());
        }

        auto* ivfpq = dynamic_cast<faiss::IndexIVFPQ*>(raw.get());
        if (!ivfpq) throw IndexError("not an IVF+PQ index: " + path.string());
        if (static_cast<size_t>(ivfpq->d) != dim) {
            throw IndexError("index dimension " + std::to_string(ivfpq->d) + " does not match " + std::to_string(dim));
        }
        raw.release();

        auto index = std::make_unique<CompressedIndex>(std::unique_ptr<faiss::IndexIVFPQ>(ivfpq));
        index->set_nprobe(nprobe);
        std::cout << "[CompressedIndex] Loaded " << index->count() << " vectors from " << path << "\n";
        return index;
    }

}
