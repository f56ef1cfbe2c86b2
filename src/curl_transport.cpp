#include "http_transport.hpp"

#include <curl/curl.h>
#include <memory>
#include <stdexcept>
#include <utility>

#include "version.hpp"

namespace {
struct CurlEasyDeleter {
    void operator()(CURL* h) const { curl_easy_cleanup(h); }
};
struct CurlSlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};
using CurlHandle = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlHeaders = std::unique_ptr<curl_slist, CurlSlistDeleter>;

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

TransportError curl_error(CURLcode rc, const char* detail) {
    TransportError err;
    err.code = static_cast<int>(rc);
    err.message = curl_easy_strerror(rc);
    if (detail && *detail)
        err.message += std::string(": ") + detail;
    return err;
}
} // namespace

CurlGlobalGuard::CurlGlobalGuard() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
        throw std::runtime_error("curl_global_init failed");
}

CurlGlobalGuard::~CurlGlobalGuard() { curl_global_cleanup(); }

CurlTransport::CurlTransport(std::string proxy) : proxy_(std::move(proxy)) {}

DeliveryResult CurlTransport::post(const std::string& url, const std::string& body,
                                   const HeaderList& headers, std::chrono::seconds timeout) {
    // Buffers handed to the easy handle must outlive curl_easy_cleanup.
    std::string response_body;
    char errbuf[CURL_ERROR_SIZE] = {0};
    const std::string user_agent = std::string("deployhook/") + DEPLOYHOOK_VERSION;
    CurlHeaders header_list;
    CurlHandle curl(curl_easy_init());
    if (!curl)
        return TransportError{"failed to create curl handle", static_cast<int>(CURLE_FAILED_INIT)};

    for (const auto& [name, value] : headers) {
        std::string line = name + ": " + value;
        curl_slist* next = curl_slist_append(header_list.get(), line.c_str());
        if (!next)
            return TransportError{"failed to build request headers",
                                  static_cast<int>(CURLE_OUT_OF_MEMORY)};
        if (!header_list)
            header_list.reset(next);
    }

    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_POST, 1L);
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout.count()));
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(h, CURLOPT_USERAGENT, user_agent.c_str());
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &response_body);
    if (!proxy_.empty())
        curl_easy_setopt(h, CURLOPT_PROXY, proxy_.c_str());

    CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK)
        return curl_error(rc, errbuf);

    HttpResponse resp;
    rc = curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &resp.status);
    if (rc != CURLE_OK)
        return curl_error(rc, errbuf);
    resp.body = std::move(response_body);
    return resp;
}
