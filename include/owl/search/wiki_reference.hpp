#pragma once

#include "providers.hpp"
#include "../net/http_client.hpp"
#include "../types.hpp"
#include <string>

namespace owl {
namespace search {

/**
 * @brief Reference source backed by Wikipedia and Wikidata
 *
 * - summary(): Wikipedia REST page summary, no search or auto-suggest,
 *   so only exact titles (after redirects) resolve.
 * - birth_date(): Wikidata entity search, then property P569 of the
 *   first hit.
 */
class WikiReferenceSource : public IReferenceSource {
public:
    static constexpr const char* kSummaryEndpoint = "https://en.wikipedia.org/api/rest_v1/page/summary/";
    static constexpr const char* kWikidataApi = "https://www.wikidata.org/w/api.php";
    static constexpr const char* kEntityDataEndpoint = "https://www.wikidata.org/wiki/Special:EntityData/";

    explicit WikiReferenceSource(const Config& config);

    Expected<std::string> summary(const std::string& title, int sentences) override;
    Expected<Date> birth_date(const std::string& name) override;

    // Payload decoders, exposed for tests.
    static Expected<std::string> parse_summary(const std::string& body, int sentences);
    static Expected<std::string> parse_first_entity_id(const std::string& body);
    static Expected<Date> parse_birth_claim(const std::string& body, const std::string& entity_id);

private:
    Expected<std::string> get_json(const std::string& url);

    net::HttpClient http_;
    net::Timeouts timeouts_;
};

} // namespace search
} // namespace owl
