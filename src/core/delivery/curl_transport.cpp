#include <printrelay/core/delivery/http_transport.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace PrintRelay {

namespace {

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), total_size);
    return total_size;
}

} // namespace

HttpResponse CurlTransport::perform(const std::string& url,
                                    const std::string* body,
                                    std::chrono::seconds timeout) {
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "curl_easy_init failed";
        return response;
    }

    struct curl_slist* headers = nullptr;
    if (body) {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    } else {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    } else {
        response.status = 0;
        response.timed_out = (res == CURLE_OPERATION_TIMEDOUT);
        response.error = curl_easy_strerror(res);
        spdlog::debug("[CurlTransport] {} {} failed: {}", body ? "POST" : "GET", url, response.error);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return response;
}

HttpResponse CurlTransport::postJson(const std::string& url,
                                     const std::string& body,
                                     std::chrono::seconds timeout) {
    return perform(url, &body, timeout);
}

HttpResponse CurlTransport::get(const std::string& url, std::chrono::seconds timeout) {
    return perform(url, nullptr, timeout);
}

} // namespace PrintRelay
