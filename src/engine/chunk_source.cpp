#include "chunk_source.hpp"
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <unordered_map>

namespace morgue::engine {

    namespace {

        constexpr uint32_t kMaxNpyHeader = 1 << 20;

        // Extracts the value text following 'key': in a .npy header dict.
        std::string header_field(const std::string& header, const std::string& key) {
            auto pos = header.find("'" + key + "'");
            if (pos == std::string::npos) return "";
            pos = header.find(':', pos);
            if (pos == std::string::npos) return "";
            ++pos;
            while (pos < header.size() && header[pos] == ' ') ++pos;
            if (pos >= header.size()) return "";

            if (header[pos] == '\'') {
                auto end = header.find('\'', pos + 1);
                return end == std::string::npos ? "" : header.substr(pos + 1, end - pos - 1);
            }
            if (header[pos] == '(') {
                auto end = header.find(')', pos);
                return end == std::string::npos ? "" : header.substr(pos + 1, end - pos - 1);
            }
            auto end = header.find_first_of(",}", pos);
            return header.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
        }

        std::vector<size_t> parse_shape(const std::string& text) {
            std::vector<size_t> shape;
            std::stringstream ss(text);
            std::string part;
            while (std::getline(ss, part, ',')) {
                part.erase(std::remove(part.begin(), part.end(), ' '), part.end());
                if (part.empty()) continue;
                try {
                    shape.push_back(static_cast<size_t>(std::stoull(part)));
                } catch (const std::exception&) {
                    return {};
                }
            }
            return shape;
        }

    }

    bool read_csv_record(std::istream& in, std::vector<std::string>& fields) {
        fields.clear();
        if (in.peek() == std::char_traits<char>::eof()) return false;

        std::string field;
        bool in_quotes = false;
        char c;
        while (in.get(c)) {
            if (in_quotes) {
                if (c == '"') {
                    if (in.peek() == '"') {
                        in.get(c);
                        field += '"';
                    } else {
                        in_quotes = false;
                    }
                } else {
                    field += c;
                }
                continue;
            }

            if (c == '"') {
                in_quotes = true;
            } else if (c == ',') {
                fields.push_back(std::move(field));
                field.clear();
            } else if (c == '\r') {
                if (in.peek() == '\n') in.get(c);
                break;
            } else if (c == '\n') {
                break;
            } else {
                field += c;
            }
        }
        fields.push_back(std::move(field));
        return true;
    }

    std::optional<VectorBatch> load_npy(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            std::cerr << "[ChunkSource] Cannot open " << path << "\n";
            return std::nullopt;
        }

        char magic[6];
        if (!in.read(magic, 6) || std::memcmp(magic, "\x93NUMPY", 6) != 0) {
            std::cerr << "[ChunkSource] Not a .npy file: " << path << "\n";
            return std::nullopt;
        }

        uint8_t version[2];
        if (!in.read(reinterpret_cast<char*>(version), 2)) return std::nullopt;

        uint32_t header_len = 0;
        if (version[0] == 1) {
            uint8_t len[2];
            if (!in.read(reinterpret_cast<char*>(len), 2)) return std::nullopt;
            header_len = len[0] | (len[1] << 8);
        } else {
            uint8_t len[4];
            if (!in.read(reinterpret_cast<char*>(len), 4)) return std::nullopt;
            header_len = len[0] | (len[1] << 8) | (len[2] << 16) | (static_cast<uint32_t>(len[3]) << 24);
        }

        if (header_len == 0 || header_len > kMaxNpyHeader) {
            std::cerr << "[ChunkSource] Implausible header length " << header_len << " in " << path << "\n";
            return std::nullopt;
        }
        const uint64_t data_start = (version[0] == 1 ? 10 : 12) + static_cast<uint64_t>(header_len);

        std::string header(header_len, '\0');
        if (!in.read(header.data(), header_len)) return std::nullopt;

        std::string descr = header_field(header, "descr");
        std::string fortran = header_field(header, "fortran_order");
        auto shape = parse_shape(header_field(header, "shape"));

        if (fortran.find("True") != std::string::npos) {
            std::cerr << "[ChunkSource] Fortran-ordered arrays are not supported: " << path << "\n";
            return std::nullopt;
        }
        if (shape.size() != 2) {
            std::cerr << "[ChunkSource] Expected a 2-D array in " << path << "\n";
            return std::nullopt;
        }

        size_t element_size = 0;
        if (descr == "<f4") {
            element_size = sizeof(float);
        } else if (descr == "<f8") {
            element_size = sizeof(double);
        } else {
            std::cerr << "[ChunkSource] Unsupported dtype '" << descr << "' in " << path << "\n";
            return std::nullopt;
        }

        // The payload must match the file exactly before anything is allocated
        const size_t rows = shape[0];
        const size_t dim = shape[1];
        const size_t max_count = std::numeric_limits<size_t>::max() / element_size;
        if (dim != 0 && rows > max_count / dim) {
            std::cerr << "[ChunkSource] Shape overflows in " << path << "\n";
            return std::nullopt;
        }
        const size_t count = rows * dim;

        std::error_code ec;
        const uint64_t file_size = std::filesystem::file_size(path, ec);
        if (ec || file_size < data_start || file_size - data_start != static_cast<uint64_t>(count) * element_size) {
            std::cerr << "[ChunkSource] Shape (" << rows << ", " << dim << ") does not match the data size of "
                      << path << "\n";
            return std::nullopt;
        }

        VectorBatch batch;
        batch.rows = rows;
        batch.dim = dim;
        batch.data.resize(count);

        if (element_size == sizeof(float)) {
            if (!in.read(reinterpret_cast<char*>(batch.data.data()), count * sizeof(float))) {
                std::cerr << "[ChunkSource] Truncated data in " << path << "\n";
                return std::nullopt;
            }
        } else {
            std::vector<double> wide(count);
            if (!in.read(reinterpret_cast<char*>(wide.data()), count * sizeof(double))) {
                std::cerr << "[ChunkSource] Truncated data in " << path << "\n";
                return std::nullopt;
            }
            std::transform(wide.begin(), wide.end(), batch.data.begin(),
                           [](double v) { return static_cast<float>(v); });
        }
        return batch;
    }

    ChunkSource::ChunkSource(std::filesystem::path embeddings_dir, std::filesystem::path chunks_dir)
        : m_embeddings_dir(std::move(embeddings_dir)), m_chunks_dir(std::move(chunks_dir)) {}

    std::filesystem::path ChunkSource::metadata_path(const std::string& source_file) const {
        return m_chunks_dir / (source_file + ".csv");
    }

    std::vector<SourcePair> ChunkSource::list_sources() const {
        std::vector<SourcePair> sources;
        std::error_code ec;
        if (!std::filesystem::is_directory(m_embeddings_dir, ec)) {
            std::cerr << "[ChunkSource] Embeddings directory not found: " << m_embeddings_dir << "\n";
            return sources;
        }

        for (const auto& entry : std::filesystem::directory_iterator(m_embeddings_dir, ec)) {
            if (!entry.is_regular_file() || entry.path().extension() != ".npy") continue;

            SourcePair pair;
            pair.name = entry.path().stem().string();
            pair.vectors = entry.path();
            pair.metadata = metadata_path(pair.name);
            pair.has_metadata = std::filesystem::exists(pair.metadata);
            sources.push_back(std::move(pair));
        }

        std::sort(sources.begin(), sources.end(),
                  [](const SourcePair& a, const SourcePair& b) { return a.name < b.name; });
        return sources;
    }

    std::optional<std::vector<MetadataRow>> ChunkSource::load_metadata(const std::filesystem::path& path, bool with_text) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            std::cerr << "[ChunkSource] Cannot open " << path << "\n";
            return std::nullopt;
        }

        std::vector<std::string> fields;
        if (!read_csv_record(in, fields)) {
            std::cerr << "[ChunkSource] Empty metadata file: " << path << "\n";
            return std::nullopt;
        }

        std::unordered_map<std::string, size_t> columns;
        for (size_t i = 0; i < fields.size(); ++i) columns[fields[i]] = i;

        auto column = [&](const char* name) -> long {
            auto it = columns.find(name);
            return it == columns.end() ? -1 : static_cast<long>(it->second);
        };
        long c_id = column("id");
        long c_title = column("article_title");
        long c_date = column("date");
        long c_paper = column("paper");
        long c_text = column("chunk_text");

        auto get = [&](long c) -> std::string {
            return (c >= 0 && static_cast<size_t>(c) < fields.size()) ? fields[c] : std::string();
        };

        std::vector<MetadataRow> rows;
        while (read_csv_record(in, fields)) {
            MetadataRow row;
            row.article_id = get(c_id);
            row.article_title = get(c_title);
            row.date = get(c_date);
            row.paper = get(c_paper);
            if (with_text) row.chunk_text = get(c_text);
            rows.push_back(std::move(row));
        }
        return rows;
    }

    std::optional<CsvRowIndex> ChunkSource::index_rows(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) return std::nullopt;

        std::vector<std::string> fields;
        if (!read_csv_record(in, fields)) return std::nullopt;

        auto it = std::find(fields.begin(), fields.end(), "chunk_text");
        if (it == fields.end()) {
            std::cerr << "[ChunkSource] No chunk_text column in " << path << "\n";
            return std::nullopt;
        }

        CsvRowIndex index;
        index.text_column = static_cast<size_t>(it - fields.begin());
        while (true) {
            auto pos = in.tellg();
            if (pos < 0 || !read_csv_record(in, fields)) break;
            index.offsets.push_back(static_cast<uint64_t>(pos));
        }
        return index;
    }

    std::optional<std::string> ChunkSource::read_text_at(const std::filesystem::path& path, const CsvRowIndex& index,
                                                         uint32_t row_offset) {
        if (row_offset >= index.offsets.size()) return std::nullopt;

        std::ifstream in(path, std::ios::binary);
        if (!in) return std::nullopt;
        in.seekg(static_cast<std::streamoff>(index.offsets[row_offset]));

        std::vector<std::string> fields;
        if (!in || !read_csv_record(in, fields)) return std::nullopt;
        if (index.text_column >= fields.size()) return std::string();
        return fields[index.text_column];
    }

}
