#include "vector_index.hpp"
#include <hnswlib/hnswlib.h>
#include <algorithm>
#include <cstring>
#include <fstream>
#include <iostream>

namespace morgue::engine {

    /**
     * @brief Brute-force inner-product search. hnswlib reports 1 - ip as the distance.
     */
    class ExactIndex : public VectorIndex {
    public:
        ExactIndex(size_t dim, size_t capacity) : m_space(dim), m_dim(dim) {
            m_index = std::make_unique<hnswlib::BruteforceSearch<float>>(&m_space, std::max<size_t>(1, capacity));
        }

        ExactIndex(size_t dim, const std::filesystem::path& path) : m_space(dim), m_dim(dim) {
            validate_file(path);
            try {
                m_index = std::make_unique<hnswlib::BruteforceSearch<float>>(&m_space, path.string());
            } catch (const std::exception& e) {
                throw IndexError("failed to load " + path.string() + ": " + e.what());
            }
            // loadIndex restores the raw rows but not the label map
            rebuild_labels();
        }

        IndexMode mode() const override { return IndexMode::Exact; }
        size_t dimension() const override { return m_dim; }
        size_t count() const override { return m_index->cur_element_count; }
        bool needs_training() const override { return false; }

        void train(const float*, size_t) override {}

        void add(const float* data, size_t n) override {
            reserve(count() + n);
            size_t next_id = count();
            try {
                for (size_t i = 0; i < n; ++i) {
                    m_index->addPoint(data + i * m_dim, next_id + i);
                }
            } catch (const std::exception& e) {
                throw IndexError(std::string("exact add failed: ") + e.what());
            }
        }

        std::vector<SearchHit> search(const float* query, size_t k) const override {
            std::vector<SearchHit> hits;
            k = std::min(k, count());
            if (k == 0) return hits;

            auto pq = m_index->searchKnn(query, k);
            while (!pq.empty()) {
                hits.push_back({static_cast<uint64_t>(pq.top().second), 1.0f - pq.top().first});
                pq.pop();
            }
            // Queue pops furthest first
            std::reverse(hits.begin(), hits.end());
            return hits;
        }

        // Compacts in place; removePoint would leave stale labels behind when it drops the last row
        void truncate(size_t new_count) override {
            if (new_count >= count()) return;

            const size_t row_size = m_index->size_per_element_;
            size_t kept = 0;
            for (size_t i = 0; i < m_index->cur_element_count; ++i) {
                char* row = m_index->data_ + row_size * i;
                if (label_at(i) >= new_count) continue;
                if (kept != i) std::memmove(m_index->data_ + row_size * kept, row, row_size);
                ++kept;
            }
            m_index->cur_element_count = kept;
            rebuild_labels();
        }

        void save(const std::filesystem::path& path) const override {
            auto tmp = path;
            tmp += ".tmp";
            try {
                m_index->saveIndex(tmp.string());
            } catch (const std::exception& e) {
                throw IndexError("failed to save " + path.string() + ": " + e.what());
            }
            replace_file(tmp, path);
        }

    private:
        hnswlib::labeltype label_at(size_t slot) const {
            hnswlib::labeltype label;
            std::memcpy(&label, m_index->data_ + m_index->size_per_element_ * slot + m_index->data_size_, sizeof(label));
            return label;
        }

        void rebuild_labels() {
            m_index->dict_external_to_internal.clear();
            for (size_t i = 0; i < m_index->cur_element_count; ++i) {
                m_index->dict_external_to_internal[label_at(i)] = i;
            }
        }

        void reserve(size_t needed) {
            if (needed <= m_index->maxelements_) return;

            size_t capacity = std::max(needed, m_index->maxelements_ * 2);
            auto grown = std::make_unique<hnswlib::BruteforceSearch<float>>(&m_space, capacity);
            std::memcpy(grown->data_, m_index->data_, m_index->cur_element_count * m_index->size_per_element_);
            grown->cur_element_count = m_index->cur_element_count;
            grown->dict_external_to_internal = m_index->dict_external_to_internal;
            m_index = std::move(grown);
        }

        // Checks the header against the file size before hnswlib allocates from it
        void validate_file(const std::filesystem::path& path) const {
            std::ifstream in(path, std::ios::binary);
            size_t max_elements = 0, size_per_element = 0, element_count = 0;
            in.read(reinterpret_cast<char*>(&max_elements), sizeof(size_t));
            in.read(reinterpret_cast<char*>(&size_per_element), sizeof(size_t));
            in.read(reinterpret_cast<char*>(&element_count), sizeof(size_t));
            if (!in) throw IndexError("index header unreadable: " + path.string());

            size_t expected_row = m_dim * sizeof(float) + sizeof(hnswlib::labeltype);
            if (size_per_element != expected_row) {
                throw IndexError("index dimension does not match " + std::to_string(m_dim) + ": " + path.string());
            }
            if (element_count > max_elements) {
                throw IndexError("index header corrupt: " + path.string());
            }
            auto expected_size = 3 * sizeof(size_t) + max_elements * size_per_element;
            if (std::filesystem::file_size(path) < expected_size) {
                throw IndexError("index file truncated: " + path.string());
            }
        }

        hnswlib::InnerProductSpace m_space;
        std::unique_ptr<hnswlib::BruteforceSearch<float>> m_index;
        size_t m_dim;
    };

    std::unique_ptr<VectorIndex> create_exact_index(size_t dim, size_t initial_capacity) {
        return std::make_unique<ExactIndex>(dim, initial_capacity);
    }

    std::unique_ptr<VectorIndex> load_exact_index(const std::filesystem::path& path, size_t dim) {
        auto index = std::make_unique<ExactIndex>(dim, path);
        std::cout << "[ExactIndex] Loaded " << index->count() << " vectors from " << path << "\n";
        return index;
    }

}
