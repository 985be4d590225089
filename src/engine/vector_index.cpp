#include "vector_index.hpp"
#include <algorithm>
#include <cmath>

namespace morgue::engine {

    std::unique_ptr<VectorIndex> load_exact_index(const std::filesystem::path& path, size_t dim);
    std::unique_ptr<VectorIndex> load_compressed_index(const std::filesystem::path& path, size_t dim, size_t nprobe);

    std::unique_ptr<VectorIndex> load_vector_index(IndexMode mode, const std::filesystem::path& path, size_t dim, size_t nprobe) {
        if (!std::filesystem::exists(path)) {
            throw IndexError("index file not found: " + path.string());
        }
        if (mode == IndexMode::Exact) return load_exact_index(path, dim);
        return load_compressed_index(path, dim, nprobe);
    }

    IndexMode select_index_mode(size_t file_count, size_t exact_threshold) {
        return file_count <= exact_threshold ? IndexMode::Exact : IndexMode::Compressed;
    }

    CompressedParams plan_compressed_params(size_t dim, size_t samples, const Config& config) {
        CompressedParams params;

        size_t per_cluster = std::max<size_t>(1, config.samples_per_cluster);
        params.nlist = std::clamp<size_t>(samples / per_cluster, 1, std::max<size_t>(1, config.max_clusters));

        // Sub-quantizers must split the dimension evenly
        params.pq_subvectors = 1;
        for (size_t m = std::min(config.pq_subvectors, dim); m >= 1; --m) {
            if (dim % m == 0) {
                params.pq_subvectors = m;
                break;
            }
        }

        // Each codebook needs at least as many samples as centroids
        params.pq_bits = std::clamp<size_t>(config.pq_bits, 1, 16);
        while (params.pq_bits > 1 && (size_t{1} << params.pq_bits) > samples) {
            --params.pq_bits;
        }

        params.nprobe = std::clamp<size_t>(config.nprobe, 1, params.nlist);
        return params;
    }

    void normalize_l2(float* data, size_t n, size_t dim) {
        for (size_t i = 0; i < n; ++i) {
            float* v = data + i * dim;
            double s = 0.0;
            for (size_t j = 0; j < dim; ++j) s += static_cast<double>(v[j]) * v[j];
            if (s <= 0.0) continue;
            float norm = static_cast<float>(std::sqrt(std::max(s, 1e-12)));
            for (size_t j = 0; j < dim; ++j) v[j] /= norm;
        }
    }

    int relevance_percent(float similarity) {
        float clamped = std::clamp(similarity, 0.0f, 1.0f);
        return static_cast<int>(std::lround(clamped * 100.0f));
    }

    void replace_file(const std::filesystem::path& tmp, const std::filesystem::path& path) {
        std::error_code ec;
        std::filesystem::rename(tmp, path, ec);
        if (ec) {
            std::filesystem::remove(tmp, ec);
            throw IndexError("failed to replace " + path.string());
        }
    }

}
