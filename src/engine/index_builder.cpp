#include "index_builder.hpp"
#include "text_util.hpp"
#include <algorithm>
#include <iostream>
#include <numeric>
#include <random>
#include <set>

namespace morgue::engine {

    IndexBuilder::IndexBuilder(Config config, BuildOptions options)
        : m_config(std::move(config)),
          m_options(options),
          m_source(m_config.embeddings_dir, m_config.chunks_dir),
          m_tracker(m_config.resume_log_path()) {
        if (m_options.lite) m_config.deployment = Deployment::Lite;
    }

    IndexBuilder::~IndexBuilder() = default;

    BuildReport IndexBuilder::build() {
        m_started = std::chrono::steady_clock::now();
        if (m_options.rebuild) remove_artifacts();

        auto index_dir = m_config.index_path().parent_path();
        if (!index_dir.empty()) std::filesystem::create_directories(index_dir);

        auto sources = select_sources();
        BuildReport report;
        report.files_total = sources.size();
        std::cout << "[Builder] Found " << sources.size() << " source files in " << m_config.embeddings_dir << "\n";

        if (!m_store.open(m_config.database_path())) {
            throw IndexError("cannot open metadata store " + m_config.database_path().string());
        }
        if (!m_tracker.load()) {
            throw IndexError("cannot read resume log " + m_config.resume_log_path().string());
        }

        report.mode = resolve_mode(sources.size());
        std::cout << "[Builder] Mode: " << to_string(report.mode)
                  << " (" << to_string(m_config.deployment) << " deployment)\n";

        open_index(report.mode, sources);
        recover();

        size_t interval = report.mode == IndexMode::Compressed ? m_config.checkpoint_interval
                                                               : m_config.exact_checkpoint_interval;
        interval = std::max<size_t>(1, interval);

        for (size_t i = 0; i < sources.size(); ++i) {
            const auto& source = sources[i];
            if (m_tracker.state(source.name) == IngestionState::Committed) {
                report.skipped_committed++;
                continue;
            }
            if (ingest(source, i, report)) report.processed++;

            if (m_staged.size() >= interval) {
                checkpoint();

                auto elapsed = std::chrono::duration<double, std::ratio<60>>(std::chrono::steady_clock::now() - m_started).count();
                double rate = elapsed > 0 ? m_next_id / elapsed : 0;
                double eta = (elapsed / (i + 1)) * (sources.size() - i - 1);
                std::cout << "[Builder] [" << (i + 1) << "/" << sources.size() << "] " << m_next_id << " docs | "
                          << static_cast<uint64_t>(rate) << "/min | ETA: " << static_cast<uint64_t>(eta) << " min\n";
            }
        }
        checkpoint();

        if (!std::filesystem::exists(m_config.index_path())) {
            m_index->save(m_config.index_path());
        }

        report.total_vectors = m_index->count();
        report.metadata_rows = m_store.committed_count();
        std::cout << "[Builder] Done. processed=" << report.processed
                  << " skipped=" << (report.skipped_committed + report.skipped_missing_metadata)
                  << " errored=" << report.errored
                  << " vectors=" << report.total_vectors << "\n";
        return report;
    }

    std::vector<SourcePair> IndexBuilder::select_sources() const {
        auto sources = m_source.list_sources();
        if (m_options.max_files > 0 && sources.size() > m_options.max_files) {
            sources.resize(m_options.max_files);
        }

        size_t wanted = m_config.lite_sample_files;
        if (m_options.lite && wanted > 0 && sources.size() > wanted) {
            // Spread the sample across the whole corpus
            size_t step = std::max<size_t>(1, sources.size() / wanted);
            std::vector<SourcePair> sampled;
            for (size_t i = 0; i < sources.size() && sampled.size() < wanted; i += step) {
                sampled.push_back(sources[i]);
            }
            sources = std::move(sampled);
        }
        return sources;
    }

    void IndexBuilder::remove_artifacts() {
        const auto db = m_config.database_path().string();
        for (const std::filesystem::path& p : {m_config.index_path(), m_config.database_path(),
                                               std::filesystem::path(db + "-wal"), std::filesystem::path(db + "-shm")}) {
            std::error_code ec;
            if (std::filesystem::remove(p, ec)) std::cout << "[Builder] Removed old: " << p << "\n";
        }
        if (!m_tracker.clear()) {
            throw IndexError("cannot remove resume log " + m_config.resume_log_path().string());
        }
    }

    IndexMode IndexBuilder::resolve_mode(size_t file_count) {
        auto stored_dim = m_store.get_setting("dimension");
        if (stored_dim && *stored_dim != std::to_string(m_config.dimension)) {
            throw IndexError("store was built with dimension " + *stored_dim + ", config says " +
                             std::to_string(m_config.dimension));
        }

        IndexMode mode;
        if (auto stored = m_store.get_setting("mode")) {
            mode = (*stored == "compressed") ? IndexMode::Compressed : IndexMode::Exact;
        } else if (m_config.deployment == Deployment::Lite) {
            mode = IndexMode::Exact;
        } else {
            mode = select_index_mode(file_count, m_config.exact_threshold);
        }

        bool ok = m_store.begin() &&
                  m_store.set_setting("mode", to_string(mode)) &&
                  m_store.set_setting("dimension", std::to_string(m_config.dimension)) &&
                  m_store.set_setting("deployment", to_string(m_config.deployment)) &&
                  m_store.commit();
        if (!ok) throw IndexError("cannot record build settings");
        return mode;
    }

    void IndexBuilder::open_index(IndexMode mode, const std::vector<SourcePair>& sources) {
        auto path = m_config.index_path();
        if (std::filesystem::exists(path)) {
            m_index = load_vector_index(mode, path, m_config.dimension, m_config.nprobe);
            return;
        }

        if (mode == IndexMode::Exact) {
            m_index = create_exact_index(m_config.dimension);
        } else {
            train(sources);
        }
    }

    void IndexBuilder::recover() {
        uint64_t indexed = m_index->count();
        uint64_t committed = m_store.committed_count();

        if (committed > indexed) {
            // Metadata committed past the last index checkpoint
            if (!m_store.begin()) throw IndexError("cannot open recovery transaction");
            auto removed = m_store.truncate_from(indexed);
            if (removed) {
                committed = m_store.committed_count();
                if (!m_store.truncate_from(committed)) removed.reset();
            }
            if (!removed) {
                if (!m_store.rollback()) std::cerr << "[Builder] Recovery rollback failed\n";
                throw IndexError("cannot truncate metadata past the index checkpoint");
            }
            if (!m_store.commit()) throw IndexError("cannot commit recovery transaction");
            std::cout << "[Builder] Rolled back " << removed->size() << " source(s) past the index checkpoint\n";
        }

        if (indexed > committed) {
            // Index checkpoint written but its metadata never committed
            m_index->truncate(committed);
            m_index->save(m_config.index_path());
            std::cout << "[Builder] Truncated index from " << indexed << " to " << committed << " vectors\n";
        }

        std::set<std::string> names;
        for (const auto& range : m_store.sources()) names.insert(range.name);
        if (names != m_tracker.committed()) {
            if (!m_tracker.rewrite(names)) throw IndexError("cannot rewrite resume log");
            std::cout << "[Builder] Resume log reconciled with " << names.size() << " committed sources\n";
        }

        m_next_id = committed;
        if (committed > 0) {
            std::cout << "[Builder] Resuming at id " << committed << " (" << names.size() << " files committed)\n";
        }
    }

    void IndexBuilder::train(const std::vector<SourcePair>& sources) {
        std::cout << "[Builder] Phase 1: Training index...\n";
        const size_t dim = m_config.dimension;
        const size_t budget = m_config.training_budget;

        std::vector<float> sample;
        size_t rows = 0;
        size_t scanned = 0;
        for (const auto& source : sources) {
            if (scanned >= m_config.training_file_prefix || rows >= budget) break;
            ++scanned;
            if (!source.has_metadata) continue;

            auto batch = load_npy(source.vectors);
            if (!batch || batch->dim != dim) continue;
            sample.insert(sample.end(), batch->data.begin(), batch->data.end());
            rows += batch->rows;
        }

        if (rows == 0) throw IndexError("no training vectors found in the first " + std::to_string(scanned) + " files");
        normalize_l2(sample.data(), rows, dim);

        if (rows > budget) {
            // Uniform sample without replacement, kept in file order
            std::mt19937 rng(m_config.sample_seed);
            std::vector<size_t> order(rows);
            std::iota(order.begin(), order.end(), 0);
            for (size_t i = 0; i < budget; ++i) {
                std::uniform_int_distribution<size_t> pick(i, rows - 1);
                std::swap(order[i], order[pick(rng)]);
            }
            order.resize(budget);
            std::sort(order.begin(), order.end());

            std::vector<float> chosen(budget * dim);
            for (size_t i = 0; i < budget; ++i) {
                std::copy_n(sample.data() + order[i] * dim, dim, chosen.data() + i * dim);
            }
            sample = std::move(chosen);
            rows = budget;
        }

        auto params = plan_compressed_params(dim, rows, m_config);
        std::cout << "[Builder] Training on " << rows << " samples: " << params.nlist << " clusters, "
                  << params.pq_subvectors << "x" << params.pq_bits << "-bit PQ\n";

        m_index = create_compressed_index(dim, params);
        m_index->train(sample.data(), rows);
        std::cout << "[Builder] Trained with " << params.nlist << " clusters\n";
        std::cout << "[Builder] Phase 2: Adding vectors...\n";
    }

    bool IndexBuilder::ingest(const SourcePair& source, size_t file_index, BuildReport& report) {
        if (!source.has_metadata) {
            std::cerr << "[Builder] Skip " << source.name << ": no CSV\n";
            report.skipped_missing_metadata++;
            return false;
        }

        auto batch = load_npy(source.vectors);
        if (!batch) {
            report.errored++;
            return false;
        }
        if (batch->dim != m_config.dimension) {
            std::cerr << "[Builder] Skip " << source.name << ": dimension " << batch->dim
                      << " != " << m_config.dimension << "\n";
            report.errored++;
            return false;
        }

        const bool lite = m_config.deployment == Deployment::Lite;
        auto rows = ChunkSource::load_metadata(source.metadata, lite);
        if (!rows || rows->empty() || rows->size() != batch->rows) {
            std::cerr << "[Builder] Skip " << source.name << ": mismatch (" << batch->rows << " vectors, "
                      << (rows ? rows->size() : 0) << " rows)\n";
            report.errored++;
            return false;
        }

        std::vector<size_t> keep(batch->rows);
        std::iota(keep.begin(), keep.end(), 0);
        if (lite && m_config.lite_rows_per_file > 0 && keep.size() > m_config.lite_rows_per_file) {
            std::mt19937 rng(m_config.sample_seed + static_cast<uint32_t>(file_index));
            std::shuffle(keep.begin(), keep.end(), rng);
            keep.resize(m_config.lite_rows_per_file);
            std::sort(keep.begin(), keep.end());
        }

        const size_t dim = batch->dim;
        std::vector<float> vectors(keep.size() * dim);
        std::vector<ChunkRecord> records;
        records.reserve(keep.size());
        for (size_t k = 0; k < keep.size(); ++k) {
            const size_t row = keep[k];
            std::copy_n(batch->row(row), dim, vectors.data() + k * dim);

            const auto& meta = (*rows)[row];
            ChunkRecord record;
            record.global_id = m_next_id + k;
            record.article_id = meta.article_id;
            record.article_title = meta.article_title;
            record.date = meta.date;
            record.paper = meta.paper;
            record.source_file = source.name;
            record.row_offset = static_cast<uint32_t>(row);
            if (lite) record.text = truncate_utf8(meta.chunk_text, m_config.lite_text_limit);
            records.push_back(std::move(record));
        }
        normalize_l2(vectors.data(), keep.size(), dim);

        if (!m_store.begin()) throw IndexError("cannot open metadata transaction");
        if (!m_store.upsert_rows(records) ||
            !m_store.record_source({source.name, m_next_id, keep.size()})) {
            throw IndexError("metadata write failed for " + source.name);
        }
        m_index->add(vectors.data(), keep.size());

        m_tracker.mark_in_progress(source.name);
        m_staged.push_back(source.name);
        m_next_id += keep.size();
        return true;
    }

    void IndexBuilder::checkpoint() {
        if (m_staged.empty()) return;

        m_index->save(m_config.index_path());
        if (!m_store.commit()) {
            throw IndexError("metadata commit failed after index checkpoint");
        }
        if (!m_tracker.commit(m_staged)) {
            // Index and metadata are durable; the next run reconciles the log from the store
            std::cerr << "[Builder] Resume log append failed for " << m_staged.size() << " files\n";
        }
        m_staged.clear();
    }

}
