#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <sqlite3.h>
#include "morgue/types.hpp"

namespace morgue::engine {

    /**
     * @brief Id range owned by one committed source file.
     */
    struct SourceRange {
        std::string name;
        uint64_t first_id = 0;
        uint64_t row_count = 0;

        uint64_t end_id() const { return first_id + row_count; }
    };

    class MetadataStore {
    public:
        MetadataStore();
        ~MetadataStore();

        MetadataStore(const MetadataStore&) = delete;
        MetadataStore& operator=(const MetadataStore&) = delete;

        /**
         * @brief Opens (and creates, unless read_only) the database.
         * Read-only handles use SQLite's serialized mode so queries may share them.
         */
        bool open(const std::filesystem::path& path, bool read_only = false);
        void close();
        bool is_open() const { return m_db != nullptr; }

        /**
         * @brief Initializes the schema if it doesn't exist.
         */
        bool initialize_schema();

        bool begin();
        bool commit();
        bool rollback();

        /**
         * @brief Upserts a batch of rows keyed by global id.
         */
        bool upsert_rows(const std::vector<ChunkRecord>& rows);

        /**
         * @brief Records the id range of a source file.
         */
        bool record_source(const SourceRange& range);

        /**
         * @brief Point lookup by global id.
         */
        std::optional<ChunkRecord> get(uint64_t id) const;

        /**
         * @brief Exact number of document rows (full table scan).
         */
        uint64_t row_count() const;

        /**
         * @brief Sum of the committed source ranges; cheap on large stores.
         */
        uint64_t committed_count() const;

        std::vector<SourceRange> sources() const;

        /**
         * @brief Removes every row and source range at or beyond the given id.
         * @return The names of the sources that were removed, or nullopt if a delete failed.
         */
        std::optional<std::vector<std::string>> truncate_from(uint64_t id);

        bool set_setting(const std::string& key, const std::string& value);
        std::optional<std::string> get_setting(const std::string& key) const;

    private:
        bool exec(const char* sql);

        sqlite3* m_db = nullptr;
        bool m_in_transaction = false;
    };

}
