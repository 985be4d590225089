#pragma once

#include <string>
#include <vector>

namespace morgue::engine {

    struct HttpResponse {
        bool ok = false;       // Transport succeeded
        long status = 0;       // HTTP status code
        std::string body;
        std::string error;     // curl error text when !ok
    };

    /**
     * @brief Blocking JSON POST with a hard timeout.
     */
    HttpResponse http_post_json(const std::string& url, const std::string& body,
                                const std::vector<std::string>& headers, long timeout_ms);

    HttpResponse http_get(const std::string& url, long timeout_ms);

    /**
     * @brief Keeps libcurl's global state alive for the lifetime of the object.
     */
    class CurlSession {
    public:
        CurlSession();
        ~CurlSession();
        CurlSession(const CurlSession&) = delete;
        CurlSession& operator=(const CurlSession&) = delete;
    };

}
