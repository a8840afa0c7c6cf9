#pragma once

#include "providers.hpp"
#include "../net/http_client.hpp"
#include "../types.hpp"
#include <string>

namespace owl {
namespace search {

/**
 * @brief IPageFetcher over libcurl with a desktop browser User-Agent.
 *
 * Safe to call from several fetch workers at once.
 */
class HttpPageFetcher : public IPageFetcher {
public:
    explicit HttpPageFetcher(const Config& config);

    Expected<std::string> fetch(const std::string& url) override;

private:
    net::HttpClient http_;
    net::Timeouts timeouts_;
};

} // namespace search
} // namespace owl
