#pragma once

#include "../util/text.hpp"
#include <string>
#include <string_view>

namespace owl {
namespace engine {

/**
 * @brief Remove private reasoning blocks from freshly generated text.
 *
 * Every `<think>...</think>` pair is dropped together with the whitespace
 * that follows it, scanning left to right once; the remainder is trimmed.
 * Blocks are matched lazily (the first closing tag ends the block) and
 * nothing is re-scanned, so text exposed by a removal stays as-is. An
 * opening tag without a closing tag is left untouched.
 */
inline std::string strip_reasoning(std::string_view text) {
    constexpr std::string_view kOpen = "<think>";
    constexpr std::string_view kClose = "</think>";

    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        const size_t open = text.find(kOpen, pos);
        if (open == std::string_view::npos) {
            break;
        }
        const size_t close = text.find(kClose, open + kOpen.size());
        if (close == std::string_view::npos) {
            break;
        }
        out.append(text.substr(pos, open - pos));
        pos = close + kClose.size();
        while (pos < text.size() && util::is_space(text[pos])) {
            ++pos;
        }
    }
    if (pos < text.size()) {
        out.append(text.substr(pos));
    }

    return util::trim(out);
}

} // namespace engine
} // namespace owl
