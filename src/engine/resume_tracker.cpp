#include "resume_tracker.hpp"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <unistd.h>

namespace morgue::engine {

    namespace {
        bool write_lines(const std::filesystem::path& path, const char* mode, const std::vector<std::string>& lines) {
            FILE* f = std::fopen(path.c_str(), mode);
            if (!f) {
                std::cerr << "[ResumeTracker] Cannot open " << path << " for writing\n";
                return false;
            }
            bool ok = true;
            for (const auto& line : lines) {
                if (std::fprintf(f, "%s\n", line.c_str()) < 0) {
                    ok = false;
                    break;
                }
            }
            ok = ok && std::fflush(f) == 0 && ::fsync(fileno(f)) == 0;
            ok = (std::fclose(f) == 0) && ok;
            if (!ok) std::cerr << "[ResumeTracker] Write failed on " << path << "\n";
            return ok;
        }
    }

    ResumeTracker::ResumeTracker(std::filesystem::path log_path) : m_path(std::move(log_path)) {}

    bool ResumeTracker::load() {
        m_committed.clear();
        m_pending.clear();
        if (!std::filesystem::exists(m_path)) return true;

        std::ifstream in(m_path);
        if (!in) {
            std::cerr << "[ResumeTracker] Cannot read " << m_path << "\n";
            return false;
        }
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (!line.empty()) m_committed.insert(line);
        }
        return true;
    }

    IngestionState ResumeTracker::state(const std::string& name) const {
        if (is_committed(name)) return IngestionState::Committed;
        auto it = m_pending.find(name);
        return it == m_pending.end() ? IngestionState::Pending : it->second;
    }

    void ResumeTracker::mark_in_progress(const std::string& name) {
        if (!is_committed(name)) m_pending[name] = IngestionState::InProgress;
    }

    bool ResumeTracker::commit(const std::vector<std::string>& names) {
        if (names.empty()) return true;
        if (m_path.has_parent_path()) std::filesystem::create_directories(m_path.parent_path());
        if (!write_lines(m_path, "a", names)) return false;

        for (const auto& name : names) {
            m_committed.insert(name);
            m_pending.erase(name);
        }
        return true;
    }

    bool ResumeTracker::rewrite(const std::set<std::string>& committed) {
        if (m_path.has_parent_path()) std::filesystem::create_directories(m_path.parent_path());
        auto tmp = m_path;
        tmp += ".tmp";
        std::vector<std::string> lines(committed.begin(), committed.end());
        if (!write_lines(tmp, "w", lines)) return false;

        std::error_code ec;
        std::filesystem::rename(tmp, m_path, ec);
        if (ec) {
            std::cerr << "[ResumeTracker] Rename failed: " << ec.message() << "\n";
            return false;
        }
        m_committed = committed;
        return true;
    }

    bool ResumeTracker::clear() {
        m_committed.clear();
        m_pending.clear();
        std::error_code ec;
        std::filesystem::remove(m_path, ec);
        return !ec;
    }

}
