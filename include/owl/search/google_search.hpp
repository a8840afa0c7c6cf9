#pragma once

#include "providers.hpp"
#include "../net/http_client.hpp"
#include "../types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace owl {
namespace search {

/**
 * @brief Google Custom Search JSON API provider
 *
 * Requests `results_per_page` items per page for up to `pages` pages and
 * stops early once the API stops advertising a next page.
 */
class GoogleSearchProvider : public ISearchProvider {
public:
    static constexpr const char* kEndpoint = "https://www.googleapis.com/customsearch/v1";

    explicit GoogleSearchProvider(const Config& config);

    Expected<std::vector<SearchHit>> search(const SearchRequest& request) override;

    /// One decoded result page.
    struct Page {
        std::vector<SearchHit> hits;
        bool has_next = false;
    };

    /// Decode a Custom Search response body (exposed for tests).
    static Expected<Page> parse_page(const std::string& body);

private:
    net::HttpClient http_;
    std::optional<std::string> api_key_;
    std::optional<std::string> cse_id_;
    net::Timeouts timeouts_;
};

} // namespace search
} // namespace owl
