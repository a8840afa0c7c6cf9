#include "owl/search/wiki_reference.hpp"
#include "owl/log.hpp"
#include "owl/util/text.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>

namespace owl {
namespace search {

namespace {

const net::Headers& reference_headers() {
    static const net::Headers headers{
        {"User-Agent", "Mozilla/5.0 (Windows NT 10.0; Win64; x64) Chrome/124 Safari/537.36"},
        {"Accept", "application/json"}
    };
    return headers;
}

Error lookup_error(std::string message, std::optional<std::string> context = std::nullopt) {
    return Error{ErrorCode::ReferenceLookupFailed, std::move(message), std::move(context)};
}

} // namespace

WikiReferenceSource::WikiReferenceSource(const Config& config) {
    timeouts_.connect = config.connect_timeout;
    timeouts_.total = config.reference_timeout;
}

Expected<std::string> WikiReferenceSource::get_json(const std::string& url) {
    auto response = http_.get(url, reference_headers(), timeouts_);
    if (!response) {
        return tl::unexpected(lookup_error(response.error().message, url));
    }
    if (response->status != 200) {
        return tl::unexpected(lookup_error("HTTP " + std::to_string(response->status), url));
    }
    return std::move(response->body);
}

Expected<std::string> WikiReferenceSource::parse_summary(const std::string& body, int sentences) {
    std::string extract;
    try {
        auto j = nlohmann::json::parse(body);
        extract = j.value("extract", std::string{});
    } catch (const nlohmann::json::exception& e) {
        return tl::unexpected(lookup_error(std::string("malformed summary: ") + e.what()));
    }
    extract = util::trim(extract);
    if (extract.empty()) {
        return tl::unexpected(lookup_error("empty summary"));
    }
    sentences = std::max(1, sentences);

    std::vector<std::string> kept;
    bool truncated = false;
    size_t start = 0;
    while (start < extract.size()) {
        if (static_cast<int>(kept.size()) == sentences) {
            truncated = true;
            break;
        }
        size_t end = extract.find(". ", start);
        if (end == std::string::npos) {
            kept.push_back(extract.substr(start));
            break;
        }
        kept.push_back(extract.substr(start, end - start));
        start = end + 2;
    }

    // Splitting on ". " eats the separators; put them back.
    std::string text = util::join(kept, ". ");
    if (truncated) {
        text += '.';
    }
    return text;
}

Expected<std::string> WikiReferenceSource::parse_first_entity_id(const std::string& body) {
    try {
        auto j = nlohmann::json::parse(body);
        auto hits = j.find("search");
        if (hits == j.end() || !hits->is_array() || hits->empty()) {
            return tl::unexpected(lookup_error("no matching entity"));
        }
        return (*hits)[0].at("id").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        return tl::unexpected(lookup_error(std::string("malformed entity search: ") + e.what()));
    }
}

Expected<Date> WikiReferenceSource::parse_birth_claim(const std::string& body, const std::string& entity_id) {
    try {
        auto j = nlohmann::json::parse(body);
        const auto& claims = j.at("entities").at(entity_id).at("claims");
        auto dob = claims.find("P569");
        if (dob == claims.end() || !dob->is_array() || dob->empty()) {
            return tl::unexpected(lookup_error("no date of birth recorded", entity_id));
        }
        const auto time = (*dob)[0].at("mainsnak").at("datavalue").at("value").at("time").get<std::string>();
        auto date = parse_iso_date(time);
        if (!date) {
            return tl::unexpected(lookup_error("unparseable date of birth: " + time, entity_id));
        }
        return *date;
    } catch (const nlohmann::json::exception& e) {
        return tl::unexpected(lookup_error(std::string("malformed entity data: ") + e.what(), entity_id));
    }
}

Expected<std::string> WikiReferenceSource::summary(const std::string& title, int sentences) {
    auto body = get_json(kSummaryEndpoint + net::HttpClient::escape(title));
    if (!body) {
        return tl::unexpected(body.error());
    }
    return parse_summary(*body, sentences);
}

Expected<Date> WikiReferenceSource::birth_date(const std::string& name) {
    auto search_body = get_json(net::HttpClient::with_query(kWikidataApi, {
        {"action", "wbsearchentities"},
        {"language", "en"},
        {"format", "json"},
        {"search", name}
    }));
    if (!search_body) {
        return tl::unexpected(search_body.error());
    }

    auto entity_id = parse_first_entity_id(*search_body);
    if (!entity_id) {
        return tl::unexpected(entity_id.error());
    }
    OWL_LOG_DEBUG("wikidata entity for '%s': %s", name.c_str(), entity_id->c_str());

    auto entity_body = get_json(std::string(kEntityDataEndpoint) + *entity_id + ".json");
    if (!entity_body) {
        return tl::unexpected(entity_body.error());
    }
    return parse_birth_claim(*entity_body, *entity_id);
}

} // namespace search
} // namespace owl
