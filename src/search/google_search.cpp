#include "owl/search/google_search.hpp"
#include "owl/log.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <thread>

namespace owl {
namespace search {

namespace {

// Pause between page requests to stay under the per-second quota.
constexpr std::chrono::milliseconds kPageDelay{200};

std::string describe_api_error(long status, const std::string& body) {
    std::string message = "Google API error: HTTP " + std::to_string(status);
    try {
        auto j = nlohmann::json::parse(body);
        if (j.contains("error") && j["error"].is_object()) {
            message += ": " + j["error"].value("message", std::string{});
        }
    } catch (const nlohmann::json::exception&) {
        // Non-JSON error page; the status code is all we report.
    }
    return message;
}

} // namespace

GoogleSearchProvider::GoogleSearchProvider(const Config& config)
    : api_key_(config.google_api_key)
    , cse_id_(config.google_cse_id)
{
    timeouts_.connect = config.connect_timeout;
    timeouts_.total = config.fetch_timeout;
}

Expected<GoogleSearchProvider::Page> GoogleSearchProvider::parse_page(const std::string& body) {
    Page page;
    try {
        auto j = nlohmann::json::parse(body);
        if (auto items = j.find("items"); items != j.end() && items->is_array()) {
            for (const auto& item : *items) {
                SearchHit hit;
                hit.link = item.value("link", std::string{});
                if (item.contains("snippet") && item["snippet"].is_string()) {
                    hit.snippet = item["snippet"].get<std::string>();
                }
                if (item.contains("title") && item["title"].is_string()) {
                    hit.title = item["title"].get<std::string>();
                }
                page.hits.push_back(std::move(hit));
            }
        }
        if (auto queries = j.find("queries"); queries != j.end() && queries->is_object()) {
            page.has_next = queries->contains("nextPage");
        }
    } catch (const nlohmann::json::exception& e) {
        return tl::unexpected(Error{
            ErrorCode::SearchFailed,
            std::string("Search failed: malformed response: ") + e.what()
        });
    }
    return page;
}

Expected<std::vector<SearchHit>> GoogleSearchProvider::search(const SearchRequest& request) {
    if (!api_key_ || api_key_->empty() || !cse_id_ || cse_id_->empty()) {
        return tl::unexpected(Error{
            ErrorCode::MissingCredentials,
            "Missing GOOGLE_API_KEY or GOOGLE_CSE_ID"
        });
    }

    std::vector<SearchHit> results;
    int start = 1;
    for (int page_index = 0; page_index < request.pages; ++page_index) {
        std::vector<std::pair<std::string, std::string>> params{
            {"key", *api_key_},
            {"cx", *cse_id_},
            {"q", request.query},
            {"num", std::to_string(request.results_per_page)},
            {"start", std::to_string(start)},
            {"hl", "en"},
            {"gl", "us"}
        };
        if (request.date_restrict) {
            params.emplace_back("dateRestrict", *request.date_restrict);
        }

        auto response = http_.get(net::HttpClient::with_query(kEndpoint, params), {}, timeouts_);
        if (!response) {
            return tl::unexpected(Error{
                ErrorCode::SearchFailed,
                "Search failed: " + response.error().message
            });
        }
        if (!response->ok()) {
            return tl::unexpected(Error{
                ErrorCode::SearchFailed,
                describe_api_error(response->status, response->body)
            });
        }

        auto page = parse_page(response->body);
        if (!page) {
            return tl::unexpected(page.error());
        }
        OWL_LOG_DEBUG("search page %d: %zu results", page_index + 1, page->hits.size());
        results.insert(results.end(),
                       std::make_move_iterator(page->hits.begin()),
                       std::make_move_iterator(page->hits.end()));

        if (!page->has_next) {
            break;
        }
        start += request.results_per_page;
        if (page_index + 1 < request.pages) {
            std::this_thread::sleep_for(kPageDelay);
        }
    }

    return results;
}

} // namespace search
} // namespace owl
