#pragma once

/**
 * NetworkTransport.hpp
 *
 * Transport seam beneath the transfer executor.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace harbor::core::downloader {

/**
 * Receives the body of a fetch as it arrives.
 * Returning false from either callback aborts the fetch.
 */
class TransportObserver {
public:
    virtual ~TransportObserver() = default;

    virtual bool onData(const char* data, size_t size) = 0;

    /**
     * Called periodically, including while no data is flowing
     * @param bytesReceived Body bytes received so far
     * @param bytesTotal Expected body size, 0 when unknown
     */
    virtual bool onProgress(uint64_t bytesReceived, uint64_t bytesTotal) = 0;
};

struct TransportResult {
    bool success{false};

    // The observer asked to stop
    bool aborted{false};

    int statusCode{0};
    std::string error;
};

/**
 * NetworkTransport - performs one fetch of one URL
 *
 * Assumed reliable once connected; authentication happens below it.
 */
class NetworkTransport {
public:
    virtual ~NetworkTransport() = default;

    virtual TransportResult fetch(const std::string& url, TransportObserver& observer) = 0;

    /**
     * Size of the resource, when the transport can learn it up front
     */
    virtual std::optional<uint64_t> probeSize(const std::string& /*url*/) {
        return std::nullopt;
    }
};

} // namespace harbor::core::downloader
