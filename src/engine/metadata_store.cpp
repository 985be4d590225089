#include "metadata_store.hpp"
#include <iostream>

namespace morgue::engine {

    namespace {
        std::string column_string(sqlite3_stmt* stmt, int col) {
            const unsigned char* text = sqlite3_column_text(stmt, col);
            return text ? reinterpret_cast<const char*>(text) : "";
        }
    }

    MetadataStore::MetadataStore() = default;
    MetadataStore::~MetadataStore() { close(); }

    bool MetadataStore::open(const std::filesystem::path& path, bool read_only) {
        close();
        int flags = read_only ? (SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX)
                              : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
        if (sqlite3_open_v2(path.c_str(), &m_db, flags, nullptr) != SQLITE_OK) {
            std::cerr << "[MetadataStore] Failed to open " << path << ": " << sqlite3_errmsg(m_db) << "\n";
            sqlite3_close(m_db);
            m_db = nullptr;
            return false;
        }
        if (read_only) return true;

        if (!exec("PRAGMA journal_mode=WAL;") || !exec("PRAGMA synchronous=NORMAL;")) return false;
        return initialize_schema();
    }

    void MetadataStore::close() {
        if (m_db) {
            if (m_in_transaction) rollback();
            sqlite3_close(m_db);
            m_db = nullptr;
        }
    }

    bool MetadataStore::exec(const char* sql) {
        char* err_msg = nullptr;
        if (sqlite3_exec(m_db, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
            std::cerr << "[MetadataStore] SQL error: " << (err_msg ? err_msg : "unknown") << "\n";
            sqlite3_free(err_msg);
            return false;
        }
        return true;
    }

    bool MetadataStore::initialize_schema() {
        const char* sql =
            "CREATE TABLE IF NOT EXISTS documents ("
            "  idx INTEGER PRIMARY KEY,"
            "  article_id TEXT,"
            "  article_title TEXT,"
            "  date TEXT,"
            "  paper TEXT,"
            "  source_file TEXT,"
            "  row_num INTEGER,"
            "  chunk_text TEXT"
            ");"
            "CREATE TABLE IF NOT EXISTS sources ("
            "  name TEXT PRIMARY KEY,"
            "  first_id INTEGER NOT NULL,"
            "  row_count INTEGER NOT NULL"
            ");"
            "CREATE TABLE IF NOT EXISTS settings ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT"
            ");";
        return exec(sql);
    }

    bool MetadataStore::begin() {
        if (m_in_transaction) return true;
        m_in_transaction = exec("BEGIN;");
        return m_in_transaction;
    }

    bool MetadataStore::commit() {
        if (!m_in_transaction) return true;
        bool ok = exec("COMMIT;");
        if (ok) m_in_transaction = false;
        return ok;
    }

    bool MetadataStore::rollback() {
        if (!m_in_transaction) return true;
        m_in_transaction = false;
        return exec("ROLLBACK;");
    }

    bool MetadataStore::upsert_rows(const std::vector<ChunkRecord>& rows) {
        const char* sql =
            "INSERT INTO documents (idx, article_id, article_title, date, paper, source_file, row_num, chunk_text) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?) "
            "ON CONFLICT(idx) DO UPDATE SET "
            "article_id = excluded.article_id, "
            "article_title = excluded.article_title, "
            "date = excluded.date, "
            "paper = excluded.paper, "
            "source_file = excluded.source_file, "
            "row_num = excluded.row_num, "
            "chunk_text = excluded.chunk_text;";

        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            std::cerr << "[MetadataStore] Prepare failed: " << sqlite3_errmsg(m_db) << "\n";
            return false;
        }

        bool success = true;
        for (const auto& row : rows) {
            sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(row.global_id));
            sqlite3_bind_text(stmt, 2, row.article_id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 3, row.article_title.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 4, row.date.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 5, row.paper.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 6, row.source_file.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(stmt, 7, row.row_offset);
            if (row.text) {
                sqlite3_bind_text(stmt, 8, row.text->c_str(), -1, SQLITE_TRANSIENT);
            } else {
                sqlite3_bind_null(stmt, 8);
            }

            if (sqlite3_step(stmt) != SQLITE_DONE) {
                std::cerr << "[MetadataStore] Insert failed for id " << row.global_id << ": " << sqlite3_errmsg(m_db) << "\n";
                success = false;
                break;
            }
            sqlite3_reset(stmt);
            sqlite3_clear_bindings(stmt);
        }
        sqlite3_finalize(stmt);
        return success;
    }

    bool MetadataStore::record_source(const SourceRange& range) {
        const char* sql =
            "INSERT INTO sources (name, first_id, row_count) VALUES (?, ?, ?) "
            "ON CONFLICT(name) DO UPDATE SET first_id = excluded.first_id, row_count = excluded.row_count;";
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) return false;

        sqlite3_bind_text(stmt, 1, range.name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(range.first_id));
        sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(range.row_count));

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);
        return success;
    }

    std::optional<ChunkRecord> MetadataStore::get(uint64_t id) const {
        const char* sql =
            "SELECT article_id, article_title, date, paper, source_file, row_num, chunk_text "
            "FROM documents WHERE idx = ?;";
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) return std::nullopt;

        sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(id));
        std::optional<ChunkRecord> record;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            ChunkRecord r;
            r.global_id = id;
            r.article_id = column_string(stmt, 0);
            r.article_title = column_string(stmt, 1);
            r.date = column_string(stmt, 2);
            r.paper = column_string(stmt, 3);
            r.source_file = column_string(stmt, 4);
            r.row_offset = static_cast<uint32_t>(sqlite3_column_int64(stmt, 5));
            if (sqlite3_column_type(stmt, 6) != SQLITE_NULL) r.text = column_string(stmt, 6);
            record = std::move(r);
        }
        sqlite3_finalize(stmt);
        return record;
    }

    uint64_t MetadataStore::row_count() const {
        sqlite3_stmt* stmt;
        uint64_t count = 0;
        if (sqlite3_prepare_v2(m_db, "SELECT COUNT(*) FROM documents;", -1, &stmt, nullptr) == SQLITE_OK) {
            if (sqlite3_step(stmt) == SQLITE_ROW) count = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
            sqlite3_finalize(stmt);
        }
        return count;
    }

    uint64_t MetadataStore::committed_count() const {
        sqlite3_stmt* stmt;
        uint64_t count = 0;
        if (sqlite3_prepare_v2(m_db, "SELECT COALESCE(SUM(row_count), 0) FROM sources;", -1, &stmt, nullptr) == SQLITE_OK) {
            if (sqlite3_step(stmt) == SQLITE_ROW) count = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
            sqlite3_finalize(stmt);
        }
        return count;
    }

    std::vector<SourceRange> MetadataStore::sources() const {
        std::vector<SourceRange> ranges;
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(m_db, "SELECT name, first_id, row_count FROM sources ORDER BY first_id;", -1, &stmt, nullptr) == SQLITE_OK) {
            while (sqlite3_step(stmt) == SQLITE_ROW) {
                SourceRange r;
                r.name = column_string(stmt, 0);
                r.first_id = static_cast<uint64_t>(sqlite3_column_int64(stmt, 1));
                r.row_count = static_cast<uint64_t>(sqlite3_column_int64(stmt, 2));
                ranges.push_back(std::move(r));
            }
            sqlite3_finalize(stmt);
        }
        return ranges;
    }

    std::optional<std::vector<std::string>> MetadataStore::truncate_from(uint64_t id) {
        std::vector<std::string> removed;
        for (const auto& range : sources()) {
            if (range.end_id() > id) removed.push_back(range.name);
        }

        for (const char* sql : {"DELETE FROM documents WHERE idx >= ?;",
                                "DELETE FROM sources WHERE first_id + row_count > ?;"}) {
            sqlite3_stmt* stmt;
            if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
                std::cerr << "[MetadataStore] Truncate failed: " << sqlite3_errmsg(m_db) << "\n";
                return std::nullopt;
            }
            sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(id));
            bool ok = sqlite3_step(stmt) == SQLITE_DONE;
            if (!ok) std::cerr << "[MetadataStore] Truncate failed: " << sqlite3_errmsg(m_db) << "\n";
            sqlite3_finalize(stmt);
            if (!ok) return std::nullopt;
        }
        return removed;
    }

    bool MetadataStore::set_setting(const std::string& key, const std::string& value) {
        const char* sql = "INSERT INTO settings (key, value) VALUES (?, ?) ON CONFLICT(key) DO UPDATE SET value = excluded.value;";
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) return false;

        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);
        return success;
    }

    std::optional<std::string> MetadataStore::get_setting(const std::string& key) const {
        sqlite3_stmt* stmt;
        std::optional<std::string> value;
        if (sqlite3_prepare_v2(m_db, "SELECT value FROM settings WHERE key = ?;", -1, &stmt, nullptr) == SQLITE_OK) {
            sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
            if (sqlite3_step(stmt) == SQLITE_ROW) value = column_string(stmt, 0);
            sqlite3_finalize(stmt);
        }
        return value;
    }

}
