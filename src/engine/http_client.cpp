#include "http_client.hpp"
#include <curl/curl.h>

namespace morgue::engine {

    namespace {

        size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
            ((std::string*)userp)->append((char*)contents, size * nmemb);
            return size * nmemb;
        }

        HttpResponse perform(CURL* curl, long timeout_ms) {
            HttpResponse response;
            curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
            curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
            curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
            curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

            CURLcode res = curl_easy_perform(curl);
            if (res != CURLE_OK) {
                response.error = curl_easy_strerror(res);
                return response;
            }
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
            response.ok = true;
            return response;
        }

    }

    HttpResponse http_post_json(const std::string& url, const std::string& body,
                                const std::vector<std::string>& headers, long timeout_ms) {
        CURL* curl = curl_easy_init();
        if (!curl) return {false, 0, "", "curl_easy_init failed"};

        struct curl_slist* list = nullptr;
        list = curl_slist_append(list, "Content-Type: application/json");
        for (const auto& h : headers) list = curl_slist_append(list, h.c_str());

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);

        HttpResponse response = perform(curl, timeout_ms);

        curl_slist_free_all(list);
        curl_easy_cleanup(curl);
        return response;
    }

    HttpResponse http_get(const std::string& url, long timeout_ms) {
        CURL* curl = curl_easy_init();
        if (!curl) return {false, 0, "", "curl_easy_init failed"};

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        HttpResponse response = perform(curl, timeout_ms);

        curl_easy_cleanup(curl);
        return response;
    }

    CurlSession::CurlSession() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    CurlSession::~CurlSession() {
        curl_global_cleanup();
    }

}
