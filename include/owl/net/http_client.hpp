#pragma once

#include "../types.hpp"
#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace owl {
namespace net {

using Headers = std::vector<std::pair<std::string, std::string>>;

/// Timeouts applied to a single request.
struct Timeouts {
    std::chrono::milliseconds connect{5000};   ///< Connection establishment
    std::chrono::milliseconds total{30000};    ///< Whole transfer, including the read
};

struct HttpResponse {
    long status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * @brief Blocking libcurl client
 *
 * Each call owns its own easy handle, so one HttpClient can be shared by the
 * fetch workers. Transport failures come back as errors; HTTP error statuses
 * are returned as responses and left to the caller.
 *
 * Error codes: ErrorCode::FetchTimeout when a timeout fires,
 * ErrorCode::FetchFailed for every other transport failure.
 */
class HttpClient {
public:
    HttpClient();

    Expected<HttpResponse> get(
        const std::string& url,
        const Headers& headers,
        const Timeouts& timeouts
    ) const;

    Expected<HttpResponse> post_json(
        const std::string& url,
        const std::string& body,
        const Headers& headers,
        const Timeouts& timeouts
    ) const;

    /// Percent-encode a single URL component.
    static std::string escape(const std::string& component);

    /// Build "base?k1=v1&k2=v2" with every key and value escaped.
    static std::string with_query(
        const std::string& base,
        const std::vector<std::pair<std::string, std::string>>& params
    );

private:
    Expected<HttpResponse> perform(
        const std::string& method,
        const std::string& url,
        const std::string* body,
        const Headers& headers,
        const Timeouts& timeouts
    ) const;
};

} // namespace net
} // namespace owl
