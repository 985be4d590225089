#pragma once

#include <string>
#include <vector>
#include <set>
#include <map>
#include <filesystem>

namespace morgue::engine {

    enum class IngestionState {
        Pending,
        InProgress,
        Committed
    };

    /**
     * @brief Tracks which source files are durably ingested.
     *
     * Committed names live in a plaintext, append-only log (one name per line).
     * In-progress state is held in memory only, so after a restart every file
     * that was not committed reads back as pending.
     */
    class ResumeTracker {
    public:
        explicit ResumeTracker(std::filesystem::path log_path);

        /**
         * @brief Reads the committed set from the log. A missing log is an empty set.
         */
        bool load();

        IngestionState state(const std::string& name) const;
        bool is_committed(const std::string& name) const { return m_committed.count(name) > 0; }

        void mark_in_progress(const std::string& name);

        /**
         * @brief Appends names to the log, flushes it to disk and marks them committed.
         */
        bool commit(const std::vector<std::string>& names);

        /**
         * @brief Replaces the log with exactly the given committed set.
         */
        bool rewrite(const std::set<std::string>& committed);

        /**
         * @brief Deletes the log and forgets all state.
         */
        bool clear();

        const std::set<std::string>& committed() const { return m_committed; }
        const std::filesystem::path& path() const { return m_path; }

    private:
        std::filesystem::path m_path;
        std::set<std::string> m_committed;
        std::map<std::string, IngestionState> m_pending;
    };

}
