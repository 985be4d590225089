#pragma once

#include <string>
#include <functional>
#include <nlohmann/json.hpp>
#include "service.hpp"

namespace morgue::engine {

    nlohmann::json to_json(const Passage& passage);
    nlohmann::json to_json(const QueryResponse& response);
    nlohmann::json to_json(const ServiceStatus& status);

    /**
     * @brief Parses a query request's params object, applying the configured defaults.
     */
    QueryRequest parse_query_request(const nlohmann::json& params, const Config& config);

    /**
     * @brief Dispatches one bridge message ({"method": ..., "params": {...}}) to the service.
     * Always returns a JSON document with either "result" or "error".
     * "shutdown" is only accepted when on_shutdown is set.
     */
    std::string handle_request(Service& service, const std::string& request,
                               const std::function<void()>& on_shutdown = {});

}
