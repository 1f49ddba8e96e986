#ifndef PIIANON_UTIL_HTTP_CLIENT_HPP
#define PIIANON_UTIL_HTTP_CLIENT_HPP

#include <curl/curl.h>
#include <mutex>
#include <string>
#include <vector>

/**
 * @file http_client.hpp
 * @brief Minimal libcurl JSON POST used by the NER and LLM oracle clients.
 *
 * Every call uses its own easy handle, so one HttpClient may be shared by
 * several threads. The global curl state is initialised once per process.
 */

namespace piianon {
namespace util {

struct HttpResponse
{
    /// True when the transfer completed; a non-2xx status still counts as completed.
    bool transportOk = false;
    long status = 0;
    std::string body;
    std::string error;

    bool ok() const { return transportOk && status >= 200 && status < 300; }
};

class HttpClient {
  public:
    explicit HttpClient(long timeoutSeconds = 30) : m_timeoutSeconds(timeoutSeconds) { initCurl(); }

    /**
     * @brief POST a JSON body.
     * @param url Full request URL.
     * @param body Serialized JSON.
     * @param extraHeaders Additional "Name: value" header lines.
     */
    HttpResponse postJson(const std::string& url, const std::string& body,
                          const std::vector<std::string>& extraHeaders = {}) const {
        HttpResponse response;
        CURL* curl = curl_easy_init();
        if (!curl) {
            response.error = "curl_easy_init failed";
            return response;
        }

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");
        headers = curl_slist_append(headers, "Accept: application/json");
        for (const auto& h : extraHeaders) {
            headers = curl_slist_append(headers, h.c_str());
        }

        char errbuf[CURL_ERROR_SIZE];
        errbuf[0] = '\0';

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, m_timeoutSeconds);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

        CURLcode res = curl_easy_perform(curl);
        if (res == CURLE_OK) {
            response.transportOk = true;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
        } else {
            response.error = errbuf[0] ? std::string(errbuf) : std::string(curl_easy_strerror(res));
        }

        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);
        return response;
    }

  private:
    static void initCurl() {
        static std::once_flag flag;
        std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        if (!userdata)
            return 0;
        std::string* resp = reinterpret_cast<std::string*>(userdata);
        size_t total = size * nmemb;
        resp->append(ptr, total);
        return total;
    }

    long m_timeoutSeconds;
};

} // namespace util
} // namespace piianon

#endif // PIIANON_UTIL_HTTP_CLIENT_HPP
