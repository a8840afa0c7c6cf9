#pragma once

#include "../log.hpp"
#include "../types.hpp"
#include "content_extractor.hpp"
#include "entity_facts.hpp"
#include "intent.hpp"
#include "passage_ranker.hpp"
#include "providers.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace owl {
namespace search {

/**
 * @brief Answer text plus the sources it was drawn from.
 */
struct SearchAnswer {
    std::string text;
    std::vector<std::string> citations;

    bool operator==(const SearchAnswer& other) const {
        return text == other.text && citations == other.citations;
    }
    bool operator!=(const SearchAnswer& other) const { return !(*this == other); }
};

/**
 * @brief Tuning knobs for KnowledgeResolver.
 */
struct KnowledgeResolverOptions {
    size_t max_links = 12;           ///< Links fetched for extraction
    size_t max_workers = 12;         ///< Upper bound on fetch threads
    size_t top_k = 6;                ///< Passages kept after ranking
    size_t synthesis_passages = 3;   ///< Passages joined into the answer
    size_t max_snippets = 5;         ///< Snippet fallback cap
    size_t max_citations = 3;
    int results_per_page = 10;
    int pages = 2;
    ContentExtractorOptions extraction;
};

/**
 * @brief Tiered query resolution
 *
 * Pipeline:
 * 1. Classify intent.
 * 2. Entity facts: encyclopedia summary, then (for age questions) a
 *    knowledge-graph birth date and a computed age.
 * 3. Web search recall (restricted to the last 7 days for fresh queries).
 * 4. Parallel fetch + extraction over the first deduplicated links.
 * 5. Passage ranking and extractive synthesis.
 *
 * resolve() never fails: configuration and search errors come back as the
 * answer text with no citations, per-link failures are skipped.
 *
 * @threadsafety resolve() may be called concurrently if the injected
 * collaborators are thread-safe; the resolver holds no per-query state.
 */
class KnowledgeResolver {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    using Options = KnowledgeResolverOptions;

    static constexpr const char* kWikipediaArticleBase = "https://en.wikipedia.org/wiki/";
    static constexpr const char* kWikidataCitation = "https://www.wikidata.org/";
    static constexpr const char* kNoUsefulText = "No useful text extracted.";
    static constexpr const char* kNoRelevantPassages = "No high-relevance passages found.";

    KnowledgeResolver(std::shared_ptr<ISearchProvider> search,
                      std::shared_ptr<IReferenceSource> reference,
                      std::shared_ptr<IPageFetcher> fetcher,
                      Options options = {},
                      Clock clock = [] { return std::chrono::system_clock::now(); })
        : search_(std::move(search))
        , reference_(std::move(reference))
        , fetcher_(std::move(fetcher))
        , options_(options)
        , clock_(std::move(clock))
        , extractor_(options_.extraction)
    {}

    SearchAnswer resolve(const std::string& query, int sentences = 3) const {
        const Intent intent = classify_intent(query);
        OWL_LOG_DEBUG("resolving '%s' (intent=%s)", query.c_str(), intent_to_string(intent));

        if (intent == Intent::EntityFact) {
            if (auto answer = try_entity_fact(query, sentences)) {
                return *answer;
            }
        }

        SearchRequest request;
        request.query = query;
        request.results_per_page = options_.results_per_page;
        request.pages = options_.pages;
        if (intent == Intent::Fresh) {
            request.date_restrict = "d7";
        }

        auto hits = search_->search(request);
        if (!hits) {
            OWL_LOG_WARN("web search unavailable: %s", hits.error().to_string().c_str());
            return SearchAnswer{hits.error().message, {}};
        }

        const std::vector<std::string> links = collect_links(*hits);
        std::vector<std::string> citations(
            links.begin(), links.begin() + static_cast<std::ptrdiff_t>(std::min(links.size(), options_.max_citations)));

        const std::vector<std::string> documents = extract_documents(links);
        OWL_LOG_INFO("search '%s': %zu hits, %zu links, %zu documents",
                     query.c_str(), hits->size(), links.size(), documents.size());

        if (documents.empty()) {
            std::vector<std::string> snippets;
            for (const auto& hit : *hits) {
                if (hit.snippet && !hit.snippet->empty()) {
                    snippets.push_back(*hit.snippet);
                    if (snippets.size() >= options_.max_snippets) break;
                }
            }
            const std::string text = snippets.empty() ? kNoUsefulText : util::join(snippets, "\n\n");
            return SearchAnswer{text, std::move(citations)};
        }

        std::vector<std::string> passages = PassageRanker::top_passages(query, documents, options_.top_k);
        if (passages.size() > options_.synthesis_passages) {
            passages.resize(options_.synthesis_passages);
        }
        const std::string synthesis = util::join(passages, " ");
        return SearchAnswer{synthesis.empty() ? kNoRelevantPassages : synthesis, std::move(citations)};
    }

    /// Link of every hit in first-seen order, exact duplicates dropped.
    static std::vector<std::string> collect_links(const std::vector<SearchHit>& hits) {
        std::vector<std::string> links;
        for (const auto& hit : hits) {
            if (hit.link.empty()) continue;
            if (std::find(links.begin(), links.end(), hit.link) == links.end()) {
                links.push_back(hit.link);
            }
        }
        return links;
    }

    /// Encyclopedia article URL for a query, spaces as underscores.
    static std::string wikipedia_citation(const std::string& query) {
        std::string title = query;
        std::replace(title.begin(), title.end(), ' ', '_');
        return kWikipediaArticleBase + title;
    }

private:
    std::optional<SearchAnswer> try_entity_fact(const std::string& query, int sentences) const {
        auto summary = reference_->summary(query, sentences);
        if (summary) {
            OWL_LOG_INFO("entity fact answered from encyclopedia summary");
            return SearchAnswer{*summary, {wikipedia_citation(query)}};
        }
        OWL_LOG_DEBUG("summary lookup failed: %s", summary.error().to_string().c_str());

        if (!util::contains(util::to_lower(query), "age")) {
            return std::nullopt;
        }

        std::string subject = strip_age_filler(query);
        if (subject.empty()) {
            subject = query;
        }
        auto birth = reference_->birth_date(subject);
        if (!birth) {
            OWL_LOG_DEBUG("birth date lookup failed: %s", birth.error().to_string().c_str());
            return std::nullopt;
        }

        const int age = compute_age(*birth, utc_date(clock_()));
        OWL_LOG_INFO("entity fact answered from knowledge graph");
        return SearchAnswer{
            subject + " is " + std::to_string(age) + " years old (born " + birth->to_iso() + ").",
            {kWikidataCitation}
        };
    }

    /**
     * Fetch and extract the first max_links links on a bounded pool of
     * threads. Slots are indexed by link so the output keeps link order
     * whatever the completion order.
     */
    std::vector<std::string> extract_documents(const std::vector<std::string>& links) const {
        const size_t count = std::min(links.size(), options_.max_links);
        if (count == 0) {
            return {};
        }

        std::vector<std::string> slots(count);
        std::atomic<size_t> next{0};

        auto worker = [&]() {
            for (size_t i = next.fetch_add(1); i < count; i = next.fetch_add(1)) {
                try {
                    auto html = fetcher_->fetch(links[i]);
                    if (!html) {
                        OWL_LOG_DEBUG("skipping %s: %s", links[i].c_str(), html.error().to_string().c_str());
                        continue;
                    }
                    slots[i] = extractor_.extract(*html);
                    if (slots[i].empty()) {
                        OWL_LOG_DEBUG("no readable text in %s", links[i].c_str());
                    }
                } catch (const std::exception& e) {
                    OWL_LOG_WARN("skipping %s: %s", links[i].c_str(), e.what());
                    slots[i].clear();
                }
            }
        };

        const size_t workers = std::max<size_t>(1, std::min(count, options_.max_workers));
        std::vector<std::thread> pool;
        pool.reserve(workers);
        for (size_t w = 0; w < workers; ++w) {
            try {
                pool.emplace_back(worker);
            } catch (const std::system_error& e) {
                OWL_LOG_WARN("fetch pool limited to %zu threads: %s", pool.size(), e.what());
                break;
            }
        }
        if (pool.empty()) {
            worker();
        }
        for (auto& t : pool) {
            t.join();
        }

        std::vector<std::string> documents;
        for (auto& text : slots) {
            if (!text.empty()) {
                documents.push_back(std::move(text));
            }
        }
        return documents;
    }

    std::shared_ptr<ISearchProvider> search_;
    std::shared_ptr<IReferenceSource> reference_;
    std::shared_ptr<IPageFetcher> fetcher_;
    Options options_;
    Clock clock_;
    ContentExtractor extractor_;
};

} // namespace search
} // namespace owl
