/**
 * HttpTransport.cpp
 *
 * cpr-based transport. Body bytes go straight to the observer through a
 * write callback; curl's progress callback doubles as the abort hook and
 * keeps firing while the connection is idle.
 */

#include "HttpTransport.hpp"
#include "../Logger.hpp"

#include <cpr/cpr.h>

#include <string_view>

namespace harbor::core::downloader {

HttpTransport::HttpTransport(HttpTransportOptions options, std::shared_ptr<SizeCache> sizeCache)
    : m_options(std::move(options))
    , m_sizeCache(std::move(sizeCache)) {
}

HttpTransport::~HttpTransport() = default;

TransportResult HttpTransport::fetch(const std::string& url, TransportObserver& observer) {
    TransportResult result;
    bool observerStopped = false;
    uint64_t received = 0;

    try {
        cpr::Response response = cpr::Get(
            cpr::Url{url},
            cpr::ConnectTimeout{m_options.connectTimeoutMs},
            cpr::LowSpeed{m_options.lowSpeedLimit, m_options.lowSpeedTimeSeconds},
            cpr::UserAgent{m_options.userAgent},
            cpr::Redirect{m_options.followRedirects},
            cpr::VerifySsl{m_options.verifySSL},
            cpr::WriteCallback([&](std::string_view data, intptr_t /*userdata*/) -> bool {
                if (!observer.onData(data.data(), data.size())) {
                    observerStopped = true;
                    return false;
                }
                received += data.size();
                return true;
            }),
            cpr::ProgressCallback([&](cpr::cpr_off_t downloadTotal, cpr::cpr_off_t /*downloadNow*/,
                                      cpr::cpr_off_t /*uploadTotal*/, cpr::cpr_off_t /*uploadNow*/,
                                      intptr_t /*userdata*/) -> bool {
                uint64_t total = downloadTotal > 0 ? static_cast<uint64_t>(downloadTotal) : 0;
                if (!observer.onProgress(received, total)) {
                    observerStopped = true;
                    return false;
                }
                return true;
            })
        );

        result.statusCode = static_cast<int>(response.status_code);

        if (observerStopped) {
            result.aborted = true;
            return result;
        }

        if (response.error.code != cpr::ErrorCode::OK) {
            result.error = response.error.message;
            return result;
        }

        if (response.status_code < 200 || response.status_code >= 300) {
            result.error = "HTTP " + std::to_string(response.status_code);
            return result;
        }

        result.success = true;

    } catch (const std::exception& e) {
        result.success = false;
        result.error = e.what();
    }

    return result;
}

std::optional<uint64_t> HttpTransport::probeSize(const std::string& url) {
    if (m_sizeCache) {
        if (auto cached = m_sizeCache->get(url)) {
            return cached;
        }
    }

    try {
        cpr::Response response = cpr::Head(
            cpr::Url{url},
            cpr::ConnectTimeout{m_options.connectTimeoutMs},
            cpr::Timeout{m_options.connectTimeoutMs * 2},
            cpr::UserAgent{m_options.userAgent},
            cpr::Redirect{m_options.followRedirects},
            cpr::VerifySsl{m_options.verifySSL}
        );

        if (response.error.code != cpr::ErrorCode::OK ||
            response.status_code < 200 || response.status_code >= 300) {
            return std::nullopt;
        }

        auto it = response.header.find("Content-Length");
        if (it == response.header.end()) {
            return std::nullopt;
        }

        uint64_t size = std::stoull(it->second);
        if (m_sizeCache) {
            m_sizeCache->set(url, size);
        }
        return size;

    } catch (const std::exception& e) {
        Logger::instance().debug("Size probe for {} failed: {}", url, e.what());
        return std::nullopt;
    }
}

} // namespace harbor::core::downloader
