#include "text_resolver.hpp"
#include <iostream>

namespace morgue::engine {

    std::optional<std::string> InlineTextResolver::resolve(const ChunkRecord& record) const {
        return record.text;
    }

    SourceFileTextResolver::SourceFileTextResolver(ChunkSource source) : m_source(std::move(source)) {}

    std::shared_ptr<const CsvRowIndex> SourceFileTextResolver::row_index(const std::string& source_file) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_rows.find(source_file);
        if (it != m_rows.end()) return it->second;

        auto index = ChunkSource::index_rows(m_source.metadata_path(source_file));
        if (!index) return nullptr;
        auto shared = std::make_shared<const CsvRowIndex>(std::move(*index));
        m_rows.emplace(source_file, shared);
        return shared;
    }

    std::optional<std::string> SourceFileTextResolver::resolve(const ChunkRecord& record) const {
        if (record.text) return record.text;

        std::optional<std::string> text;
        if (auto index = row_index(record.source_file)) {
            text = ChunkSource::read_text_at(m_source.metadata_path(record.source_file), *index, record.row_offset);
        }
        if (!text) {
            std::cerr << "[TextResolver] No text for " << record.source_file << " row " << record.row_offset << "\n";
        }
        return text;
    }

    std::unique_ptr<TextResolver> create_text_resolver(Deployment deployment, const ChunkSource& source) {
        if (deployment == Deployment::Lite) return std::make_unique<InlineTextResolver>();
        return std::make_unique<SourceFileTextResolver>(source);
    }

}
