#include "http_client.hpp"
#include "plover/errors.hpp"
#include <curl/curl.h>

namespace plover::engine::http {

    namespace {
        size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
            static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
            return size * nmemb;
        }
    }

    Response post_json(const std::string& url, const std::string& body, const std::vector<std::string>& headers) {
        CURL* curl = curl_easy_init();
        if (!curl) throw EmbeddingError("curl_easy_init() failed");

        struct curl_slist* header_list = curl_slist_append(nullptr, "Content-Type: application/json");
        for (const auto& h : headers) header_list = curl_slist_append(header_list, h.c_str());

        Response response;
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

        CURLcode res = curl_easy_perform(curl);
        if (res == CURLE_OK) curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);

        curl_slist_free_all(header_list);
        curl_easy_cleanup(curl);

        if (res != CURLE_OK) {
            throw EmbeddingError(std::string("curl_easy_perform() failed: ") + curl_easy_strerror(res));
        }
        return response;
    }

}
