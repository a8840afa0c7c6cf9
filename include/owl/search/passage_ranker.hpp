#pragma once

#include "../util/text.hpp"
#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace owl {
namespace search {

/**
 * @brief Lexical passage ranking against a query
 *
 * Deliberately light: term frequency plus a small bonus for exact word
 * matches. Deterministic for a fixed input, ties keep first-seen order.
 */
class PassageRanker {
public:
    static constexpr size_t kMinPassageChars = 60;
    static constexpr size_t kMinTermChars = 3;
    static constexpr double kWholeWordBonus = 0.3;

    struct ScoredPassage {
        double score = 0.0;
        std::string text;
    };

    /// Distinct lower-cased word tokens of the query longer than two characters.
    static std::vector<std::string> query_terms(std::string_view query) {
        const std::string lowered = util::to_lower(query);
        std::vector<std::string> terms;
        size_t i = 0;
        while (i < lowered.size()) {
            while (i < lowered.size() && !util::is_word_char(lowered[i])) ++i;
            const size_t start = i;
            while (i < lowered.size() && util::is_word_char(lowered[i])) ++i;
            if (i - start >= kMinTermChars) {
                std::string term = lowered.substr(start, i - start);
                if (std::find(terms.begin(), terms.end(), term) == terms.end()) {
                    terms.push_back(std::move(term));
                }
            }
        }
        return terms;
    }

    /**
     * @brief Score one passage
     *
     * Sum of non-overlapping occurrences of each term in the lower-cased
     * passage, plus 0.3 for every term that is also a whole
     * whitespace-delimited word of it.
     */
    static double score_passage(const std::vector<std::string>& terms, std::string_view passage) {
        const std::string lowered = util::to_lower(passage);
        const std::vector<std::string> words = util::split_whitespace(lowered);

        double score = 0.0;
        for (const auto& term : terms) {
            score += static_cast<double>(util::count_occurrences(lowered, term));
            if (std::find(words.begin(), words.end(), term) != words.end()) {
                score += kWholeWordBonus;
            }
        }
        return score;
    }

    /**
     * @brief Best k passages across all documents, highest score first
     *
     * Documents are split on newlines; each line is trimmed and dropped if
     * shorter than 60 characters.
     */
    static std::vector<ScoredPassage> rank(std::string_view query,
                                           const std::vector<std::string>& documents,
                                           size_t k = 6) {
        const std::vector<std::string> terms = query_terms(query);

        std::vector<ScoredPassage> passages;
        for (const auto& doc : documents) {
            for (const auto& line : util::split_lines(doc)) {
                std::string para = util::trim(line);
                if (para.size() < kMinPassageChars) continue;
                const double score = score_passage(terms, para);
                passages.push_back(ScoredPassage{score, std::move(para)});
            }
        }

        std::stable_sort(passages.begin(), passages.end(),
                         [](const ScoredPassage& a, const ScoredPassage& b) {
                             return a.score > b.score;
                         });
        if (passages.size() > k) {
            passages.resize(k);
        }
        return passages;
    }

    static std::vector<std::string> top_passages(std::string_view query,
                                                 const std::vector<std::string>& documents,
                                                 size_t k = 6) {
        std::vector<std::string> out;
        for (auto& p : rank(query, documents, k)) {
            out.push_back(std::move(p.text));
        }
        return out;
    }
};

} // namespace search
} // namespace owl
