#include "request_handler.hpp"
#include <iostream>

using json = nlohmann::json;

namespace morgue::engine {

    namespace {
        // Paths and corpus text may hold invalid UTF-8
        std::string dump_reply(const json& j) {
            return j.dump(-1, ' ', false, json::error_handler_t::replace);
        }

        std::string error_reply(const std::string& message, const std::string& status = "") {
            json j = {{"error", message}};
            if (!status.empty()) j["status"] = status;
            return dump_reply(j);
        }
    }

    json to_json(const Passage& p) {
        return {
            {"title", p.title},
            {"snippet", p.snippet},
            {"date", p.date},
            {"paper", p.paper},
            {"article_id", p.article_id},
            {"link", p.link},
            {"relevance", p.relevance}
        };
    }

    json to_json(const QueryResponse& response) {
        json sources = json::array();
        for (const auto& p : response.sources) sources.push_back(to_json(p));
        return {
            {"answer", response.answer},
            {"sources", sources},
            {"synthesized", response.synthesized}
        };
    }

    json to_json(const ServiceStatus& s) {
        json j = {
            {"initialized", s.initialized},
            {"documents", s.documents},
            {"mode", to_string(s.mode)},
            {"deployment", to_string(s.deployment)},
            {"dimension", s.dimension},
            {"summarizer", s.summarizer},
            {"summarizer_available", s.summarizer_available}
        };
        if (!s.initialized) j["error"] = s.error;
        return j;
    }

    QueryRequest parse_query_request(const json& params, const Config& config) {
        QueryRequest request;
        request.top_k = config.default_top_k;
        if (params.is_string()) {
            request.query = params.get<std::string>();
        } else if (params.is_array() && !params.empty() && params[0].is_string()) {
            request.query = params[0].get<std::string>();
        } else if (params.is_object()) {
            request.query = params.value("query", std::string());
            request.top_k = params.value("top_k", config.default_top_k);
            request.synthesize = params.value("synthesize", false);
        }
        return request;
    }

    std::string handle_request(Service& service, const std::string& request, const std::function<void()>& on_shutdown) {
        json j;
        try {
            j = json::parse(request);
        } catch (const json::parse_error&) {
            return error_reply("invalid json");
        }
        if (!j.is_object()) return error_reply("invalid json");

        std::string method;
        if (j.contains("method") && j["method"].is_string()) method = j["method"].get<std::string>();
        if (method == "ping") return json({{"result", "pong"}}).dump();
        if (method == "status") return dump_reply({{"result", to_json(service.status())}});
        if (method == "shutdown" && on_shutdown) {
            on_shutdown();
            return json({{"result", "shutting down"}}).dump();
        }

        if (method == "query") {
            if (!service.initialized()) return error_reply(service.error(), "not_initialized");
            try {
                auto query = parse_query_request(j.value("params", json::object()), service.config());
                auto response = service.query(query);
                return dump_reply({{"result", to_json(response)}});
            } catch (const json::exception& e) {
                return error_reply(std::string("invalid params: ") + e.what());
            } catch (const RetrievalError& e) {
                std::cerr << "[Service] Query failed: " << e.what() << "\n";
                return error_reply(e.what(), "embedding_unavailable");
            } catch (const IndexError& e) {
                std::cerr << "[Service] Search failed: " << e.what() << "\n";
                return error_reply(e.what(), "search_failed");
            }
        }
        return error_reply("unknown method");
    }

}
