#include <iostream>
#include <thread>
#include <chrono>
#include <csignal>
#include <atomic>
#include <filesystem>
#include <string>

#include "platform.hpp"
#include "engine/config.hpp"
#include "engine/http_client.hpp"
#include "engine/request_handler.hpp"
#include "engine/service.hpp"

// Global stop signal
std::atomic<bool> g_running{true};

void signal_handler(int signum) {
    (void)signum;
    g_running = false;
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::cout << "[Morgue] Starting daemon (v0.1.0)...\n";

    std::filesystem::path config_path;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            std::cerr << "Usage: morgued [--config <path>]\n";
            return 1;
        }
    }
    if (config_path.empty()) {
        auto config_dir = morgue::platform::system::get_config_dir();
        if (!config_dir.empty()) {
            std::filesystem::create_directories(config_dir);
        }
        config_path = config_dir / "config.json";
    }
    std::cout << "[Morgue] Config path: " << config_path << "\n";

    auto config = morgue::engine::Config::load(config_path);
    std::cout << "[Morgue] Index: " << config.index_path() << "\n";

    if (morgue::platform::system::is_daemon_running(config.socket_name)) {
        std::cerr << "[Morgue] Another daemon is already listening on " << config.socket_name << "\n";
        return 1;
    }

    morgue::engine::CurlSession curl;

    // Load and validate before accepting connections
    morgue::engine::Service service(config);
    if (!service.initialize()) {
        std::cerr << "[Morgue] Serving in not-initialized state: " << service.error() << "\n";
    }

    auto bridge = morgue::platform::Bridge::create();
    if (!bridge) return 1;

    bridge->set_handler([&service](const std::string& request) -> std::string {
        return morgue::engine::handle_request(service, request, [] { g_running = false; });
    });

    if (!bridge->listen(config.socket_name)) return 1;
    std::cout << "[Morgue] Ready.\n";

    std::thread bridge_thread([&bridge]() { bridge->run(); });

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(100));

    std::cout << "[Morgue] Shutting down...\n";
    bridge->stop();
    if (bridge_thread.joinable()) bridge_thread.join();

    return 0;
}
