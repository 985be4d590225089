#include <iostream>
#include <vector>
#include <string>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "platform.hpp"
#include "engine/config.hpp"

using json = nlohmann::json;

namespace {

    void usage() {
        std::cerr << "Usage: morgue [--config <path>] <command> [args...]\n";
        std::cerr << "Commands:\n";
        std::cerr << "  ping                            - Test connection\n";
        std::cerr << "  status                          - Show index and backend status\n";
        std::cerr << "  query <text> [-k N] [--synthesize] [--json]\n";
        std::cerr << "  shutdown                        - Stop the daemon\n";
    }

    void print_answer(const json& result) {
        std::cout << result.value("answer", "") << "\n";
        const auto& sources = result.value("sources", json::array());
        if (sources.empty()) return;

        std::cout << "\nSources:\n";
        int i = 1;
        for (const auto& s : sources) {
            std::cout << "  " << i++ << ". " << s.value("title", "") << " (" << s.value("paper", "")
                      << ", " << s.value("date", "") << ") - " << s.value("relevance", 0) << "%\n";
            auto link = s.value("link", "");
            if (!link.empty()) std::cout << "     " << link << "\n";
            std::cout << "     " << s.value("snippet", "") << "\n";
        }
    }

}

int main(int argc, char* argv[]) {
    std::filesystem::path config_path;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            args.push_back(arg);
        }
    }
    if (args.empty()) {
        usage();
        return 1;
    }
    if (config_path.empty()) config_path = morgue::platform::system::get_config_dir() / "config.json";
    auto config = morgue::engine::Config::load(config_path);

    std::string command = args[0];
    json request = {{"method", command}};
    bool raw = false;

    if (command == "query") {
        std::string text;
        json params = json::object();
        for (size_t i = 1; i < args.size(); ++i) {
            if ((args[i] == "-k" || args[i] == "--top-k") && i + 1 < args.size()) {
                try {
                    params["top_k"] = std::stoul(args[++i]);
                } catch (const std::exception&) {
                    std::cerr << "Error: invalid result count '" << args[i] << "'\n";
                    return 1;
                }
            } else if (args[i] == "--synthesize") {
                params["synthesize"] = true;
            } else if (args[i] == "--json") {
                raw = true;
            } else {
                if (!text.empty()) text += " ";
                text += args[i];
            }
        }
        params["query"] = text;
        request["params"] = params;
    } else if (command != "ping" && command != "status" && command != "shutdown") {
        usage();
        return 1;
    }

    auto client = morgue::platform::Client::create();
    if (!client) {
        std::cerr << "Error: Failed to create client platform interface.\n";
        return 1;
    }

    if (!client->connect(config.socket_name)) {
        std::cerr << "Error: Could not connect to morgued daemon. Is it running?\n";
        return 1;
    }

    std::string response = client->send(request.dump());
    if (response.empty()) {
        std::cerr << "Error: No response from daemon.\n";
        return 1;
    }

    json reply;
    try {
        reply = json::parse(response);
    } catch (const json::parse_error&) {
        std::cout << response << "\n";
        return 1;
    }

    if (reply.contains("error")) {
        std::cerr << "Error: " << reply["error"].get<std::string>();
        if (reply.contains("status")) std::cerr << " (" << reply["status"].get<std::string>() << ")";
        std::cerr << "\n";
        return 1;
    }

    if (command == "query" && !raw) {
        print_answer(reply["result"]);
    } else {
        std::cout << reply["result"].dump(2) << "\n";
    }
    return 0;
}
