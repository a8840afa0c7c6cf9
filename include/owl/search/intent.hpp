#pragma once

#include "../util/text.hpp"
#include <array>
#include <string>
#include <string_view>

namespace owl {
namespace search {

/**
 * @brief Coarse query class used to pick a resolution strategy.
 */
enum class Intent {
    EntityFact,   ///< Ages, birth dates, founding dates
    Fresh,        ///< Recent events; restricts search to the last 7 days
    Definition,   ///< "what is", "define", "meaning of"
    General       ///< Everything else
};

[[nodiscard]] inline const char* intent_to_string(Intent intent) {
    switch (intent) {
        case Intent::EntityFact: return "entity_fact";
        case Intent::Fresh: return "fresh";
        case Intent::Definition: return "definition";
        case Intent::General: return "general";
    }
    return "unknown";
}

namespace detail {

inline constexpr std::array<std::string_view, 6> kEntityFactKeys{
    "age", "born", "birthdate", "date of birth", "founding date", "founded"
};

inline constexpr std::array<std::string_view, 6> kFreshKeys{
    "latest", "newest", "today", "this week", "just released", "video"
};

inline constexpr std::array<std::string_view, 3> kDefinitionKeys{
    "what is", "define", "meaning of"
};

template<size_t N>
bool matches_any(const std::string& lowered, const std::array<std::string_view, N>& keys) {
    for (auto key : keys) {
        if (util::contains(lowered, key)) return true;
    }
    return false;
}

} // namespace detail

/**
 * @brief Keyword classifier over the lower-cased query.
 *
 * Keys are plain substrings ("age" also hits "page"). A query hitting keys
 * of more than one class is a tie and resolves to Intent::General.
 */
inline Intent classify_intent(std::string_view query) {
    const std::string lowered = util::to_lower(query);

    const bool entity = detail::matches_any(lowered, detail::kEntityFactKeys);
    const bool fresh = detail::matches_any(lowered, detail::kFreshKeys);
    const bool definition = detail::matches_any(lowered, detail::kDefinitionKeys);

    const int hits = static_cast<int>(entity) + static_cast<int>(fresh) + static_cast<int>(definition);
    if (hits != 1) {
        return Intent::General;
    }
    if (entity) return Intent::EntityFact;
    if (fresh) return Intent::Fresh;
    return Intent::Definition;
}

} // namespace search
} // namespace owl
