#pragma once

#include "../types.hpp"
#include "entity_facts.hpp"
#include <optional>
#include <string>
#include <vector>

namespace owl {
namespace search {

/**
 * @brief One organic result returned by a web-search provider.
 */
struct SearchHit {
    std::string link;                       ///< Result URL
    std::optional<std::string> snippet;     ///< Provider-supplied excerpt
    std::optional<std::string> title;       ///< Result title

    bool operator==(const SearchHit& other) const {
        return link == other.link && snippet == other.snippet && title == other.title;
    }
    bool operator!=(const SearchHit& other) const { return !(*this == other); }
};

/**
 * @brief Paginated web-search query.
 */
struct SearchRequest {
    std::string query;
    int results_per_page = 10;
    int pages = 2;
    std::optional<std::string> date_restrict;   ///< e.g. "d7" for the last seven days
};

/**
 * @brief Web-search capability.
 *
 * Errors:
 * - ErrorCode::MissingCredentials when the provider is not configured;
 *   callers surface this verbatim, it is never retried
 * - ErrorCode::SearchFailed for transport, HTTP or payload failures
 */
class ISearchProvider {
public:
    virtual ~ISearchProvider() = default;
    virtual Expected<std::vector<SearchHit>> search(const SearchRequest& request) = 0;
};

/**
 * @brief Structured reference knowledge (encyclopedia + knowledge graph).
 *
 * Both lookups fail with ErrorCode::ReferenceLookupFailed when the subject
 * is unknown or the source cannot be reached.
 */
class IReferenceSource {
public:
    virtual ~IReferenceSource() = default;

    /// First `sentences` sentences of the encyclopedia summary for `title`.
    virtual Expected<std::string> summary(const std::string& title, int sentences) = 0;

    /// Date of birth of the best match for `name`.
    virtual Expected<Date> birth_date(const std::string& name) = 0;
};

/**
 * @brief Fetches the raw HTML of a page.
 *
 * Errors: ErrorCode::FetchTimeout, ErrorCode::FetchFailed (including
 * non-2xx statuses).
 */
class IPageFetcher {
public:
    virtual ~IPageFetcher() = default;
    virtual Expected<std::string> fetch(const std::string& url) = 0;
};

} // namespace search
} // namespace owl
