#include <gtest/gtest.h>
#include "owl/search/google_search.hpp"
#include "owl/search/wiki_reference.hpp"

using namespace owl;
using namespace owl::search;

// ============================================================================
// Google Custom Search payloads
// ============================================================================

TEST(GoogleSearchParsingTest, DecodesItemsAndNextPage) {
    const std::string body = R"({
        "queries": {"request": [{}], "nextPage": [{"startIndex": 11}]},
        "items": [
            {"link": "https://www.purdue.edu/", "title": "Purdue University", "snippet": "Founded in 1869."},
            {"link": "https://en.wikipedia.org/wiki/Purdue_University"}
        ]
    })";

    auto page = GoogleSearchProvider::parse_page(body);
    ASSERT_TRUE(page.has_value()) << page.error().to_string();
    EXPECT_TRUE(page->has_next);
    ASSERT_EQ(page->hits.size(), 2u);
    EXPECT_EQ(page->hits[0].link, "https://www.purdue.edu/");
    EXPECT_EQ(page->hits[0].title, std::optional<std::string>("Purdue University"));
    EXPECT_EQ(page->hits[0].snippet, std::optional<std::string>("Founded in 1869."));
    EXPECT_FALSE(page->hits[1].snippet.has_value());
    EXPECT_FALSE(page->hits[1].title.has_value());
}

TEST(GoogleSearchParsingTest, NoItemsIsAnEmptyLastPage) {
    auto page = GoogleSearchProvider::parse_page(R"({"queries": {"request": [{}]}})");
    ASSERT_TRUE(page.has_value());
    EXPECT_TRUE(page->hits.empty());
    EXPECT_FALSE(page->has_next);
}

TEST(GoogleSearchParsingTest, MalformedBody) {
    auto page = GoogleSearchProvider::parse_page("<html>rate limited</html>");
    ASSERT_FALSE(page.has_value());
    EXPECT_EQ(page.error().code, ErrorCode::SearchFailed);
    EXPECT_EQ(page.error().message.rfind("Search failed: malformed response: ", 0), 0u);
}

TEST(GoogleSearchParsingTest, MissingCredentialsNeverTouchTheNetwork) {
    Config config;
    config.google_api_key = "key";
    GoogleSearchProvider provider(config);

    SearchRequest request;
    request.query = "anything";
    auto hits = provider.search(request);

    ASSERT_FALSE(hits.has_value());
    EXPECT_EQ(hits.error().code, ErrorCode::MissingCredentials);
    EXPECT_EQ(hits.error().message, "Missing GOOGLE_API_KEY or GOOGLE_CSE_ID");
}

// ============================================================================
// Wikipedia summaries
// ============================================================================

namespace {

const std::string kSummaryBody = R"({
    "title": "Purdue University",
    "extract": "Purdue University is a public university. It was founded in 1869. Its main campus is in West Lafayette. It has many students."
})";

} // namespace

TEST(WikiParsingTest, SummaryKeepsLeadingSentences) {
    auto text = WikiReferenceSource::parse_summary(kSummaryBody, 2);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "Purdue University is a public university. It was founded in 1869.");
}

TEST(WikiParsingTest, SummaryShorterThanRequest) {
    auto text = WikiReferenceSource::parse_summary(kSummaryBody, 10);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text,
              "Purdue University is a public university. It was founded in 1869. "
              "Its main campus is in West Lafayette. It has many students.");
}

TEST(WikiParsingTest, SummaryAtLeastOneSentence) {
    auto text = WikiReferenceSource::parse_summary(kSummaryBody, 0);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "Purdue University is a public university.");
}

TEST(WikiParsingTest, EmptyOrMissingExtractFails) {
    auto empty = WikiReferenceSource::parse_summary(R"({"extract": "   "})", 3);
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().code, ErrorCode::ReferenceLookupFailed);

    EXPECT_FALSE(WikiReferenceSource::parse_summary(R"({"title": "x"})", 3).has_value());
    EXPECT_FALSE(WikiReferenceSource::parse_summary("not json", 3).has_value());
}

// ============================================================================
// Wikidata entities
// ============================================================================

TEST(WikiParsingTest, FirstEntityId) {
    auto id = WikiReferenceSource::parse_first_entity_id(
        R"({"search": [{"id": "Q76", "label": "Barack Obama"}, {"id": "Q649593"}]})");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(*id, "Q76");
}

TEST(WikiParsingTest, NoEntityFound) {
    auto id = WikiReferenceSource::parse_first_entity_id(R"({"search": []})");
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().code, ErrorCode::ReferenceLookupFailed);
}

TEST(WikiParsingTest, BirthClaim) {
    const std::string body = R"({"entities": {"Q76": {"claims": {"P569": [
        {"mainsnak": {"datavalue": {"value": {"time": "+1961-08-04T00:00:00Z", "precision": 11}}}}
    ]}}}})";

    auto date = WikiReferenceSource::parse_birth_claim(body, "Q76");
    ASSERT_TRUE(date.has_value()) << date.error().to_string();
    EXPECT_EQ(*date, (Date{1961, 8, 4}));
}

TEST(WikiParsingTest, BirthClaimMissing) {
    const std::string body = R"({"entities": {"Q90": {"claims": {"P31": []}}}})";
    auto date = WikiReferenceSource::parse_birth_claim(body, "Q90");
    ASSERT_FALSE(date.has_value());
    EXPECT_EQ(date.error().code, ErrorCode::ReferenceLookupFailed);
    EXPECT_EQ(date.error().context, std::optional<std::string>("Q90"));
}

TEST(WikiParsingTest, BirthClaimForOtherEntity) {
    const std::string body = R"({"entities": {"Q1": {"claims": {}}}})";
    EXPECT_FALSE(WikiReferenceSource::parse_birth_claim(body, "Q76").has_value());
}

TEST(WikiParsingTest, BirthClaimCoarsePrecision) {
    const std::string body = R"({"entities": {"Q5": {"claims": {"P569": [
        {"mainsnak": {"datavalue": {"value": {"time": "+1900-00-00T00:00:00Z"}}}}
    ]}}}})";
    EXPECT_FALSE(WikiReferenceSource::parse_birth_claim(body, "Q5").has_value());
}
