#ifndef HTTP_TRANSPORT_HPP
#define HTTP_TRANSPORT_HPP
#include <chrono>
#include <string>
#include <utility>
#include <variant>
#include <vector>

/** @brief HTTP response as received: status code and raw body text. */
struct HttpResponse {
    long status = 0;
    std::string body;
};

/**
 * @brief The request could not be completed at all.
 *
 * Covers DNS failures, refused connections, TLS errors and timeouts.
 * @c code holds the libcurl result code when the error came from libcurl.
 */
struct TransportError {
    std::string message;
    int code = 0;
};

using DeliveryResult = std::variant<HttpResponse, TransportError>;
using HeaderList = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Capability to POST a body with headers to a URL.
 *
 * Implementations never throw for network failures; they return a
 * @ref TransportError instead.
 */
class HttpTransport {
  public:
    virtual ~HttpTransport() = default;
    virtual DeliveryResult post(const std::string& url, const std::string& body,
                                const HeaderList& headers, std::chrono::seconds timeout) = 0;
};

/**
 * @brief libcurl backed transport.
 *
 * Each call uses a fresh easy handle and performs a single attempt.
 * Redirects are not followed.
 */
class CurlTransport : public HttpTransport {
  public:
    explicit CurlTransport(std::string proxy = {});
    DeliveryResult post(const std::string& url, const std::string& body,
                        const HeaderList& headers, std::chrono::seconds timeout) override;

  private:
    std::string proxy_;
};

/**
 * @brief Scoped `curl_global_init`/`curl_global_cleanup` pair.
 *
 * Create one in `main` before any transport is used.
 */
class CurlGlobalGuard {
  public:
    CurlGlobalGuard();
    ~CurlGlobalGuard();
    CurlGlobalGuard(const CurlGlobalGuard&) = delete;
    CurlGlobalGuard& operator=(const CurlGlobalGuard&) = delete;
};

#endif // HTTP_TRANSPORT_HPP
