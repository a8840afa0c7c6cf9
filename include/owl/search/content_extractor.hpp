#pragma once

#include "../util/text.hpp"
#include <array>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

namespace owl {
namespace search {

struct ContentExtractorOptions {
    size_t min_body_chars = 300;        ///< Body text must be longer than this
    size_t min_paragraph_chars = 80;    ///< Fallback paragraphs must be longer than this
    size_t max_paragraphs = 6;          ///< Fallback paragraph cap
};

/**
 * @brief Readable-text extraction from raw HTML
 *
 * Two strategies share one tokenizer pass:
 * - Boilerplate removal: drops script/style/nav/header/footer/aside/form
 *   (and similar) subtrees, turns block-level tags into line breaks and
 *   keeps the non-empty whitespace-normalised lines.
 * - Paragraph fallback: text of each <p> element, used when the first
 *   strategy yields no more than `min_body_chars` characters.
 *
 * Output is always valid UTF-8: pages served in legacy encodings have
 * their stray bytes replaced with U+FFFD.
 *
 * Pure text processing, no I/O; safe to use from any thread.
 */
class ContentExtractor {
public:
    using Options = ContentExtractorOptions;

    /// Output of a single tokenizer pass.
    struct Blocks {
        std::string body;                      ///< Boilerplate-free text, one block per line
        std::vector<std::string> paragraphs;   ///< Normalised <p> texts in document order
    };

    ContentExtractor() = default;
    explicit ContentExtractor(Options options) : options_(options) {}

    /// Readable text of a page, or an empty string if nothing usable remains.
    std::string extract(std::string_view html) const {
        Blocks blocks = split_blocks(html);
        if (blocks.body.size() > options_.min_body_chars) {
            return util::to_valid_utf8(blocks.body);
        }

        std::vector<std::string> kept;
        for (auto& p : blocks.paragraphs) {
            if (p.size() > options_.min_paragraph_chars) {
                kept.push_back(std::move(p));
                if (kept.size() >= options_.max_paragraphs) break;
            }
        }
        return util::to_valid_utf8(util::join(kept, "\n"));
    }

    static Blocks split_blocks(std::string_view html) {
        Blocks out;
        std::string raw_body;
        std::string paragraph;
        int paragraph_depth = 0;

        size_t i = 0;
        while (i < html.size()) {
            const char c = html[i];

            if (c != '<') {
                const size_t next = html.find('<', i);
                const size_t end = next == std::string_view::npos ? html.size() : next;
                const std::string text = decode_entities(html.substr(i, end - i));
                raw_body += text;
                if (paragraph_depth > 0) paragraph += text;
                i = end;
                continue;
            }

            if (html.compare(i, 4, "<!--") == 0) {
                const size_t close = html.find("-->", i + 4);
                i = close == std::string_view::npos ? html.size() : close + 3;
                continue;
            }

            Tag tag = read_tag(html, i);
            if (tag.name.empty()) {
                // Stray '<' in text.
                raw_body += '<';
                if (paragraph_depth > 0) paragraph += '<';
                ++i;
                continue;
            }
            i = tag.end;

            if (!tag.closing && !tag.self_closing && is_skipped(tag.name)) {
                i = skip_element(html, i, tag.name);
                continue;
            }

            if (tag.name == "p") {
                if (!tag.closing && !tag.self_closing) {
                    if (paragraph_depth > 0) {
                        // Implicitly closed by a new <p>.
                        flush_paragraph(paragraph, out.paragraphs);
                    }
                    paragraph_depth = 1;
                } else if (tag.closing && paragraph_depth > 0) {
                    flush_paragraph(paragraph, out.paragraphs);
                    paragraph_depth = 0;
                }
            }

            if (is_block(tag.name)) {
                raw_body += '\n';
                if (paragraph_depth > 0) paragraph += ' ';
            } else {
                raw_body += ' ';
                if (paragraph_depth > 0) paragraph += ' ';
            }
        }
        if (paragraph_depth > 0) {
            flush_paragraph(paragraph, out.paragraphs);
        }

        std::vector<std::string> lines;
        for (const auto& line : util::split_lines(raw_body)) {
            std::string normalised = util::collapse_whitespace(line);
            if (!normalised.empty()) {
                lines.push_back(std::move(normalised));
            }
        }
        out.body = util::join(lines, "\n");
        return out;
    }

    /// Decode named (common subset) and numeric character references.
    static std::string decode_entities(std::string_view text) {
        std::string out;
        out.reserve(text.size());
        size_t i = 0;
        while (i < text.size()) {
            if (text[i] != '&') {
                out += text[i++];
                continue;
            }
            const size_t semi = text.find(';', i + 1);
            if (semi == std::string_view::npos || semi - i > 10) {
                out += text[i++];
                continue;
            }
            const std::string_view entity = text.substr(i + 1, semi - i - 1);
            std::string decoded;
            if (!entity.empty() && entity[0] == '#') {
                const bool hex = entity.size() > 1 && (entity[1] == 'x' || entity[1] == 'X');
                const std::string digits(entity.substr(hex ? 2 : 1));
                char* end = nullptr;
                const unsigned long cp = std::strtoul(digits.c_str(), &end, hex ? 16 : 10);
                if (!digits.empty() && end != nullptr && *end == '\0' && cp > 0 && cp <= 0x10FFFF &&
                    !(cp >= 0xD800 && cp <= 0xDFFF)) {
                    decoded = encode_utf8(static_cast<uint32_t>(cp == 0xA0 ? 0x20 : cp));
                }
            } else {
                decoded = named_entity(entity);
            }
            if (decoded.empty()) {
                out += text[i++];
                continue;
            }
            out += decoded;
            i = semi + 1;
        }
        return out;
    }

private:
    struct Tag {
        std::string name;        ///< Lower-cased tag name, empty if not a tag
        bool closing = false;
        bool self_closing = false;
        size_t end = 0;          ///< Position just past '>'
    };

    static Tag read_tag(std::string_view html, size_t start) {
        Tag tag;
        size_t i = start + 1;
        if (i < html.size() && html[i] == '/') {
            tag.closing = true;
            ++i;
        }
        if (i < html.size() && (html[i] == '!' || html[i] == '?')) {
            // Doctype or processing instruction: treat as an inline no-op tag.
            const size_t close = html.find('>', i);
            tag.name = "!";
            tag.end = close == std::string_view::npos ? html.size() : close + 1;
            return tag;
        }
        const size_t name_start = i;
        while (i < html.size() && (std::isalnum(static_cast<unsigned char>(html[i])) != 0 || html[i] == '-')) {
            ++i;
        }
        if (i == name_start) {
            return Tag{};
        }
        tag.name = util::to_lower(html.substr(name_start, i - name_start));

        char quote = 0;
        while (i < html.size()) {
            const char c = html[i];
            if (quote != 0) {
                if (c == quote) quote = 0;
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '>') {
                tag.self_closing = i > start && html[i - 1] == '/';
                tag.end = i + 1;
                return tag;
            }
            ++i;
        }
        tag.end = html.size();
        return tag;
    }

    /// Position just past the element opened before `pos`, honouring same-name nesting.
    static size_t skip_element(std::string_view html, size_t pos, const std::string& name) {
        const bool raw_text = name == "script" || name == "style" || name == "noscript";
        int depth = 1;
        size_t i = pos;
        while (i < html.size()) {
            const size_t lt = html.find('<', i);
            if (lt == std::string_view::npos) {
                return html.size();
            }
            if (!raw_text && html.compare(lt, 4, "<!--") == 0) {
                const size_t close = html.find("-->", lt + 4);
                i = close == std::string_view::npos ? html.size() : close + 3;
                continue;
            }
            Tag tag = read_tag(html, lt);
            if (tag.name != name) {
                i = tag.name.empty() ? lt + 1 : (raw_text ? lt + 1 : tag.end);
                continue;
            }
            if (tag.closing) {
                if (--depth == 0) return tag.end;
            } else if (!tag.self_closing && !raw_text) {
                ++depth;
            }
            i = tag.end;
        }
        return html.size();
    }

    static void flush_paragraph(std::string& paragraph, std::vector<std::string>& out) {
        std::string normalised = util::collapse_whitespace(paragraph);
        if (!normalised.empty()) {
            out.push_back(std::move(normalised));
        }
        paragraph.clear();
    }

    static bool is_skipped(const std::string& name) {
        static constexpr std::array<std::string_view, 13> kSkipped{
            "script", "style", "noscript", "nav", "header", "footer", "aside",
            "form", "svg", "template", "iframe", "head", "button"
        };
        for (auto s : kSkipped) {
            if (name == s) return true;
        }
        return false;
    }

    static bool is_block(const std::string& name) {
        static constexpr std::array<std::string_view, 28> kBlocks{
            "p", "div", "br", "hr", "li", "ul", "ol", "dl", "dt", "dd",
            "h1", "h2", "h3", "h4", "h5", "h6", "section", "article", "main",
            "blockquote", "pre", "table", "tr", "figure", "figcaption",
            "body", "html", "address"
        };
        for (auto b : kBlocks) {
            if (name == b) return true;
        }
        return false;
    }

    static std::string named_entity(std::string_view entity) {
        if (entity == "amp") return "&";
        if (entity == "lt") return "<";
        if (entity == "gt") return ">";
        if (entity == "quot") return "\"";
        if (entity == "apos") return "'";
        if (entity == "nbsp") return " ";
        if (entity == "mdash") return "\xE2\x80\x94";
        if (entity == "ndash") return "\xE2\x80\x93";
        if (entity == "hellip") return "\xE2\x80\xA6";
        if (entity == "rsquo") return "\xE2\x80\x99";
        if (entity == "lsquo") return "\xE2\x80\x98";
        if (entity == "rdquo") return "\xE2\x80\x9D";
        if (entity == "ldquo") return "\xE2\x80\x9C";
        if (entity == "copy") return "\xC2\xA9";
        return {};
    }

    static std::string encode_utf8(uint32_t cp) {
        std::string out;
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
        return out;
    }

    Options options_;
};

} // namespace search
} // namespace owl
