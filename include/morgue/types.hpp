#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace morgue::engine {

    /**
     * @brief One metadata row, keyed by the global id shared with the vector index.
     */
    struct ChunkRecord {
        uint64_t global_id = 0;
        std::string article_id;
        std::string article_title;
        std::string date;
        std::string paper;
        std::string source_file;
        uint32_t row_offset = 0;
        std::optional<std::string> text; // Only set in lite deployments
    };

    enum class IndexMode {
        Exact,
        Compressed
    };

    enum class Deployment {
        Full, // Text resolved lazily from the chunk CSVs
        Lite  // Text stored inline in the metadata store
    };

    struct SearchHit {
        uint64_t id;
        float similarity; // Inner product of unit vectors
    };

    struct Passage {
        uint64_t id = 0;
        std::string title;
        std::string snippet;
        std::string text;
        std::string date;
        std::string paper;
        std::string article_id;
        std::string link;
        int relevance = 0; // Percentage in [0, 100]
    };

    struct QueryRequest {
        std::string query;
        size_t top_k = 5;
        bool synthesize = false;
    };

    struct QueryResponse {
        std::string answer;
        std::vector<Passage> sources;
        bool synthesized = false;
    };

    inline const char* to_string(IndexMode mode) {
        return mode == IndexMode::Exact ? "exact" : "compressed";
    }

    inline const char* to_string(Deployment deployment) {
        return deployment == Deployment::Lite ? "lite" : "full";
    }

}
