#pragma once

#include <string>
#include <cstdlib>
#include <iostream>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include "morgue/types.hpp"

namespace morgue::engine {

    struct Config {
        // Corpus layout
        std::string embeddings_dir = "data/embeddings"; // <base>.npy
        std::string chunks_dir = "data/chunked";        // <base>.csv
        std::string index_base = "data/index/udn";      // <base>.index, <base>.db, <base>.resume.log
        size_t dimension = 384;
        Deployment deployment = Deployment::Full;

        // Index construction
        size_t exact_threshold = 200;      // Files; above this the compressed index is built
        size_t training_budget = 500000;   // Max training vectors
        size_t training_file_prefix = 30;  // Files scanned for training samples
        size_t samples_per_cluster = 40;
        size_t max_clusters = 4096;
        size_t pq_subvectors = 48;
        size_t pq_bits = 8;
        size_t nprobe = 32;
        size_t checkpoint_interval = 50;
        size_t exact_checkpoint_interval = 10;
        uint32_t sample_seed = 42;

        // Lite builds
        size_t lite_sample_files = 10;
        size_t lite_rows_per_file = 2500;  // 0 keeps every row
        size_t lite_text_limit = 1000;

        // Embedding backend
        std::string embedding_backend = "ollama"; // ollama, openai
        std::string embedding_model = "all-minilm";
        std::string embedding_endpoint = "http://localhost:11434/api/embeddings";
        long embedding_timeout_ms = 10000;
        std::string openai_key = "";

        // Summarizer backend
        std::string summarizer_backend = "none"; // groq, ollama, none
        std::string summarizer_model = "";    // Empty picks the backend default
        std::string summarizer_endpoint = ""; // Empty picks the backend default
        long summarizer_timeout_ms = 60000;
        std::string groq_key = "";

        // Serving
        size_t default_top_k = 5;
        size_t max_top_k = 20;
        size_t snippet_length = 300;
        std::string source_link_base = "https://newspapers.lib.utah.edu/details?id=";
        std::string archive_name = "Utah Digital Newspapers";
        std::string socket_name = "morgue.sock";

        std::filesystem::path index_path() const { return index_base + ".index"; }
        std::filesystem::path database_path() const { return index_base + ".db"; }
        std::filesystem::path resume_log_path() const { return index_base + ".resume.log"; }

        /**
         * @brief Loads the config, keeping defaults for anything absent or malformed.
         */
        static Config load(const std::filesystem::path& path) {
            Config cfg;
            if (std::filesystem::exists(path)) {
                try {
                    std::ifstream f(path);
                    nlohmann::json j = nlohmann::json::parse(f);

                    cfg.embeddings_dir = j.value("embeddings_dir", cfg.embeddings_dir);
                    cfg.chunks_dir = j.value("chunks_dir", cfg.chunks_dir);
                    cfg.index_base = j.value("index_base", cfg.index_base);
                    cfg.dimension = j.value("dimension", cfg.dimension);
                    if (j.contains("deployment")) {
                        cfg.deployment = (j["deployment"] == "lite") ? Deployment::Lite : Deployment::Full;
                    }

                    cfg.exact_threshold = j.value("exact_threshold", cfg.exact_threshold);
                    cfg.training_budget = j.value("training_budget", cfg.training_budget);
                    cfg.training_file_prefix = j.value("training_file_prefix", cfg.training_file_prefix);
                    cfg.samples_per_cluster = j.value("samples_per_cluster", cfg.samples_per_cluster);
                    cfg.max_clusters = j.value("max_clusters", cfg.max_clusters);
                    cfg.pq_subvectors = j.value("pq_subvectors", cfg.pq_subvectors);
                    cfg.pq_bits = j.value("pq_bits", cfg.pq_bits);
                    cfg.nprobe = j.value("nprobe", cfg.nprobe);
                    cfg.checkpoint_interval = j.value("checkpoint_interval", cfg.checkpoint_interval);
                    cfg.exact_checkpoint_interval = j.value("exact_checkpoint_interval", cfg.exact_checkpoint_interval);
                    cfg.sample_seed = j.value("sample_seed", cfg.sample_seed);

                    cfg.lite_sample_files = j.value("lite_sample_files", cfg.lite_sample_files);
                    cfg.lite_rows_per_file = j.value("lite_rows_per_file", cfg.lite_rows_per_file);
                    cfg.lite_text_limit = j.value("lite_text_limit", cfg.lite_text_limit);

                    cfg.embedding_backend = j.value("embedding_backend", cfg.embedding_backend);
                    cfg.embedding_model = j.value("embedding_model", cfg.embedding_model);
                    cfg.embedding_endpoint = j.value("embedding_endpoint", cfg.embedding_endpoint);
                    cfg.embedding_timeout_ms = j.value("embedding_timeout_ms", cfg.embedding_timeout_ms);
                    cfg.openai_key = j.value("openai_key", cfg.openai_key);

                    cfg.summarizer_backend = j.value("summarizer_backend", cfg.summarizer_backend);
                    cfg.summarizer_model = j.value("summarizer_model", cfg.summarizer_model);
                    cfg.summarizer_endpoint = j.value("summarizer_endpoint", cfg.summarizer_endpoint);
                    cfg.summarizer_timeout_ms = j.value("summarizer_timeout_ms", cfg.summarizer_timeout_ms);
                    cfg.groq_key = j.value("groq_key", cfg.groq_key);

                    cfg.default_top_k = j.value("default_top_k", cfg.default_top_k);
                    cfg.max_top_k = j.value("max_top_k", cfg.max_top_k);
                    cfg.snippet_length = j.value("snippet_length", cfg.snippet_length);
                    cfg.source_link_base = j.value("source_link_base", cfg.source_link_base);
                    cfg.archive_name = j.value("archive_name", cfg.archive_name);
                    cfg.socket_name = j.value("socket_name", cfg.socket_name);
                } catch (const nlohmann::json::exception& e) {
                    std::cerr << "[Config] Ignoring " << path << ": " << e.what() << "\n";
                }
            }

            if (const char* key = std::getenv("OPENAI_API_KEY")) cfg.openai_key = key;
            if (const char* key = std::getenv("GROQ_API_KEY")) cfg.groq_key = key;
            return cfg;
        }

        void save(const std::filesystem::path& path) const {
            nlohmann::json j;
            j["embeddings_dir"] = embeddings_dir;
            j["chunks_dir"] = chunks_dir;
            j["index_base"] = index_base;
            j["dimension"] = dimension;
            j["deployment"] = to_string(deployment);
            j["exact_threshold"] = exact_threshold;
            j["training_budget"] = training_budget;
            j["nprobe"] = nprobe;
            j["checkpoint_interval"] = checkpoint_interval;
            j["embedding_backend"] = embedding_backend;
            j["embedding_model"] = embedding_model;
            j["embedding_endpoint"] = embedding_endpoint;
            j["summarizer_backend"] = summarizer_backend;
            j["summarizer_model"] = summarizer_model;
            j["default_top_k"] = default_top_k;
            j["max_top_k"] = max_top_k;
            j["socket_name"] = socket_name;

            std::ofstream f(path);
            f << j.dump(4);
        }
    };

}
