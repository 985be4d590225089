#pragma once

#include <string>
#include <memory>
#include <optional>
#include <mutex>
#include <unordered_map>
#include "morgue/types.hpp"
#include "chunk_source.hpp"

namespace morgue::engine {

    /**
     * @brief Locates the full text of a chunk from its metadata record.
     */
    class TextResolver {
    public:
        virtual ~TextResolver() = default;
        virtual std::optional<std::string> resolve(const ChunkRecord& record) const = 0;
    };

    // Lite deployments: the text lives in the metadata row
    class InlineTextResolver : public TextResolver {
    public:
        std::optional<std::string> resolve(const ChunkRecord& record) const override;
    };

    // Full deployments: re-read the row from its source CSV. Each CSV is
    // indexed on first use and later lookups seek straight to the row.
    class SourceFileTextResolver : public TextResolver {
    public:
        explicit SourceFileTextResolver(ChunkSource source);
        std::optional<std::string> resolve(const ChunkRecord& record) const override;

    private:
        std::shared_ptr<const CsvRowIndex> row_index(const std::string& source_file) const;

        ChunkSource m_source;
        mutable std::mutex m_mutex;
        mutable std::unordered_map<std::string, std::shared_ptr<const CsvRowIndex>> m_rows;
    };

    std::unique_ptr<TextResolver> create_text_resolver(Deployment deployment, const ChunkSource& source);

}
