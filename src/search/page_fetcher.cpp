#include "owl/search/page_fetcher.hpp"

namespace owl {
namespace search {

HttpPageFetcher::HttpPageFetcher(const Config& config) {
    timeouts_.connect = config.connect_timeout;
    timeouts_.total = config.fetch_timeout;
}

Expected<std::string> HttpPageFetcher::fetch(const std::string& url) {
    static const net::Headers headers{
        {"User-Agent", "Mozilla/5.0 (Windows NT 10.0; Win64; x64) Chrome/124 Safari/537.36"},
        {"Accept", "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8"},
        {"Accept-Language", "en-US,en;q=0.5"}
    };

    auto response = http_.get(url, headers, timeouts_);
    if (!response) {
        return tl::unexpected(response.error());
    }
    if (!response->ok()) {
        return tl::unexpected(Error{
            ErrorCode::FetchFailed,
            "HTTP " + std::to_string(response->status),
            url
        });
    }
    return std::move(response->body);
}

} // namespace search
} // namespace owl
