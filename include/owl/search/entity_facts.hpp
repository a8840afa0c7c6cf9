#pragma once

#include "../types.hpp"
#include "../util/text.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <optional>
#include <string>
#include <tuple>

namespace owl {
namespace search {

/// Calendar date (proleptic Gregorian, no time zone).
struct Date {
    int year = 0;
    int month = 0;
    int day = 0;

    bool operator==(const Date& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const Date& other) const { return !(*this == other); }

    std::string to_iso() const {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
        return buf;
    }
};

/**
 * @brief Parse "YYYY-MM-DD", optionally preceded by a sign and followed by
 * a time part (Wikidata renders dates as "+1961-08-04T00:00:00Z").
 */
inline std::optional<Date> parse_iso_date(const std::string& text) {
    std::string s = text;
    if (!s.empty() && (s[0] == '+' || s[0] == '-')) {
        s.erase(0, 1);
    }
    Date d;
    char dash1 = 0;
    char dash2 = 0;
    if (std::sscanf(s.c_str(), "%4d%c%2d%c%2d", &d.year, &dash1, &d.month, &dash2, &d.day) != 5) {
        return std::nullopt;
    }
    if (dash1 != '-' || dash2 != '-') return std::nullopt;
    // Wikidata uses 00 for unknown month/day at coarse precision.
    if (d.month < 1 || d.month > 12 || d.day < 1 || d.day > 31) return std::nullopt;
    return d;
}

/// UTC calendar date of a time point.
inline Date utc_date(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&t, &utc);
    return Date{utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday};
}

/**
 * @brief Age in whole years on a given day.
 *
 * One year less while this year's birthday is still ahead:
 * (today.month, today.day) < (birth.month, birth.day).
 */
inline int compute_age(const Date& birth, const Date& today) {
    const bool birthday_ahead =
        std::make_tuple(today.month, today.day) < std::make_tuple(birth.month, birth.day);
    return today.year - birth.year - (birthday_ahead ? 1 : 0);
}

/**
 * @brief Derive the subject of an age question.
 *
 * Removes the whole words "current", "age" and the phrase "years old"
 * (case-insensitive) and collapses the remaining whitespace:
 * "Barack Obama current age" -> "Barack Obama".
 */
inline std::string strip_age_filler(const std::string& query) {
    const std::string lowered = util::to_lower(query);
    std::string out;
    out.reserve(query.size());

    auto boundary_before = [&](size_t pos) {
        return pos == 0 || !util::is_word_char(lowered[pos - 1]);
    };
    auto boundary_after = [&](size_t end) {
        return end >= lowered.size() || !util::is_word_char(lowered[end]);
    };

    static const char* const kFillers[] = {"years old", "current", "age"};

    size_t i = 0;
    while (i < query.size()) {
        bool removed = false;
        if (boundary_before(i)) {
            for (const char* filler : kFillers) {
                const std::string f(filler);
                if (lowered.compare(i, f.size(), f) == 0 && boundary_after(i + f.size())) {
                    i += f.size();
                    removed = true;
                    break;
                }
            }
        }
        if (!removed) {
            out += query[i];
            ++i;
        }
    }
    return util::collapse_whitespace(out);
}

} // namespace search
} // namespace owl
