#include <iostream>
#include <string>
#include <filesystem>
#include "platform.hpp"
#include "engine/config.hpp"
#include "engine/index_builder.hpp"

namespace {

    void usage() {
        std::cerr << "Usage: morgue-build [--config <path>] [--lite] [--max-files N] [--rebuild]\n";
        std::cerr << "  --lite         Sample files, store text inline, always exact search\n";
        std::cerr << "  --max-files N  Only consider the first N source files\n";
        std::cerr << "  --rebuild      Delete the existing index, database and resume log first\n";
    }

}

int main(int argc, char* argv[]) {
    std::filesystem::path config_path;
    morgue::engine::BuildOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--lite") {
            options.lite = true;
        } else if (arg == "--rebuild") {
            options.rebuild = true;
        } else if (arg == "--max-files" && i + 1 < argc) {
            try {
                options.max_files = std::stoul(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: invalid file count '" << argv[i] << "'\n";
                return 1;
            }
        } else {
            usage();
            return 1;
        }
    }
    if (config_path.empty()) config_path = morgue::platform::system::get_config_dir() / "config.json";

    auto config = morgue::engine::Config::load(config_path);
    std::cout << "[Builder] Config path: " << config_path << "\n";

    try {
        morgue::engine::IndexBuilder builder(config, options);
        auto report = builder.build();

        std::cout << "\nBuild summary\n"
                  << "  mode:                " << morgue::engine::to_string(report.mode) << "\n"
                  << "  files:               " << report.files_total << "\n"
                  << "  processed:           " << report.processed << "\n"
                  << "  already committed:   " << report.skipped_committed << "\n"
                  << "  missing metadata:    " << report.skipped_missing_metadata << "\n"
                  << "  errored:             " << report.errored << "\n"
                  << "  total vectors:       " << report.total_vectors << "\n"
                  << "  metadata rows:       " << report.metadata_rows << "\n";
    } catch (const morgue::engine::IndexError& e) {
        std::cerr << "[Builder] Fatal: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
