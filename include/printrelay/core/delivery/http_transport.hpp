#pragma once

#include <chrono>
#include <memory>
#include <string>

namespace PrintRelay {

/**
 * @brief Outcome of one HTTP exchange.
 * status is 0 when no response was received; error then describes why.
 */
struct HttpResponse {
    long status = 0;
    std::string body;
    std::string error;
    bool timed_out = false;

    bool transportFailed() const { return status == 0; }
};

/**
 * @class HttpTransport
 * @brief Minimal blocking HTTP client seam used by Sender.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse postJson(const std::string& url,
                                  const std::string& body,
                                  std::chrono::seconds timeout) = 0;

    virtual HttpResponse get(const std::string& url,
                             std::chrono::seconds timeout) = 0;
};

/**
 * @class CurlTransport
 * @brief libcurl easy-handle implementation; one handle per request.
 *
 * curl_global_init() must have been called by the process before use.
 */
class CurlTransport : public HttpTransport {
public:
    CurlTransport() = default;
    ~CurlTransport() override = default;

    HttpResponse postJson(const std::string& url,
                          const std::string& body,
                          std::chrono::seconds timeout) override;

    HttpResponse get(const std::string& url,
                     std::chrono::seconds timeout) override;

private:
    HttpResponse perform(const std::string& url,
                         const std::string* body,
                         std::chrono::seconds timeout);
};

} // namespace PrintRelay
