#pragma once

/**
 * HttpTransport.hpp
 *
 * NetworkTransport over HTTP(S) using cpr (libcurl).
 */

#include "NetworkTransport.hpp"
#include "../cache/TtlCache.hpp"

#include <memory>
#include <string>

namespace harbor::core::downloader {

/**
 * @brief HTTP transport options
 */
struct HttpTransportOptions {
    int connectTimeoutMs{10000};

    // Abort when throughput stays below lowSpeedLimit bytes/s for lowSpeedTimeSeconds
    int lowSpeedLimit{1};
    int lowSpeedTimeSeconds{60};

    std::string userAgent{"Harbor/1.0"};
    bool followRedirects{true};
    bool verifySSL{true};
};

/**
 * @brief Streams a GET body to the observer
 *
 * Content-length probes (HEAD) are remembered in a TtlCache so a retried
 * URL does not pay for a second round trip.
 */
class HttpTransport : public NetworkTransport {
public:
    using SizeCache = cache::TtlCache<uint64_t>;

    explicit HttpTransport(HttpTransportOptions options = {},
                           std::shared_ptr<SizeCache> sizeCache = nullptr);
    ~HttpTransport() override;

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    TransportResult fetch(const std::string& url, TransportObserver& observer) override;
    std::optional<uint64_t> probeSize(const std::string& url) override;

private:
    HttpTransportOptions m_options;
    std::shared_ptr<SizeCache> m_sizeCache;
};

} // namespace harbor::core::downloader
