#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <istream>
#include <filesystem>

namespace morgue::engine {

    /**
     * @brief One embedding batch and its positionally aligned metadata batch.
     */
    struct SourcePair {
        std::string name; // Shared base name, e.g. "udn_chunks_part7"
        std::filesystem::path vectors;
        std::filesystem::path metadata;
        bool has_metadata = false;
    };

    /**
     * @brief Row-major float32 matrix loaded from a .npy file.
     */
    struct VectorBatch {
        size_t rows = 0;
        size_t dim = 0;
        std::vector<float> data;

        const float* row(size_t i) const { return data.data() + i * dim; }
    };

    struct MetadataRow {
        std::string article_id;
        std::string article_title;
        std::string date;
        std::string paper;
        std::string chunk_text; // Empty unless requested
    };

    /**
     * @brief Reads one RFC 4180 record. Quoted fields may contain separators and newlines.
     * @return false at end of stream.
     */
    bool read_csv_record(std::istream& in, std::vector<std::string>& fields);

    /**
     * @brief Parses a NumPy .npy file holding a 2-D float32 or float64 C-order array.
     */
    std::optional<VectorBatch> load_npy(const std::filesystem::path& path);

    /**
     * @brief Byte position of every record in a metadata CSV, so a row can be
     * read back with one seek instead of a scan.
     */
    struct CsvRowIndex {
        size_t text_column = 0;
        std::vector<uint64_t> offsets; // Start of each record after the header
    };

    class ChunkSource {
    public:
        ChunkSource(std::filesystem::path embeddings_dir, std::filesystem::path chunks_dir);

        /**
         * @brief Lists every vector batch in the embeddings directory, sorted by name.
         * Batches without a metadata CSV are still listed with has_metadata = false.
         */
        std::vector<SourcePair> list_sources() const;

        std::filesystem::path metadata_path(const std::string& source_file) const;

        /**
         * @brief Loads all metadata rows of a CSV batch.
         * @param with_text Also keep the chunk_text column (lite builds).
         */
        static std::optional<std::vector<MetadataRow>> load_metadata(const std::filesystem::path& path, bool with_text);

        /**
         * @brief Scans a metadata CSV once and records where each record starts.
         * Fails when the file is unreadable or has no chunk_text column.
         */
        static std::optional<CsvRowIndex> index_rows(const std::filesystem::path& path);

        /**
         * @brief Reads the chunk text of one row by seeking to its recorded offset.
         */
        static std::optional<std::string> read_text_at(const std::filesystem::path& path, const CsvRowIndex& index,
                                                       uint32_t row_offset);

    private:
        std::filesystem::path m_embeddings_dir;
        std::filesystem::path m_chunks_dir;
    };

}
