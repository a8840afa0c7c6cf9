#pragma once

#include "../types.hpp"
#include "../util/text.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <random>
#include <string>

namespace owl {

// ============================================================================
// ToolCall struct
// ============================================================================

/** @brief A tool invocation directive extracted from model output. */
struct ToolCall {
    std::string name;            ///< Name of the tool to invoke
    nlohmann::json arguments;    ///< JSON object of arguments to pass to the tool

    bool operator==(const ToolCall& other) const {
        return name == other.name && arguments == other.arguments;
    }
    bool operator!=(const ToolCall& other) const { return !(*this == other); }
};

namespace engine {

// ============================================================================
// ToolCallParser
// ============================================================================

/**
 * @brief Detects tool-call directives in raw model output.
 *
 * The directive format is
 * `{"tool_call": {"name": "<tool>", "arguments": {...}}}`.
 *
 * The whole text is parsed strictly first. When that fails, the literal
 * token `tool_call` anywhere in the text still marks the output as a
 * directive candidate and the first embedded JSON object carrying a
 * well-formed directive is used. That fallback misfires on prose which
 * quotes a directive; it is kept because backends wrap their JSON in
 * chatter. Candidates with no extractable directive are not tool calls.
 */
class ToolCallParser {
public:
    /** @brief Result of parsing model output for a tool call. */
    struct ParseResult {
        std::optional<ToolCall> tool_call;  ///< The extracted directive, if any
        bool strict = false;                ///< True if the whole text was the directive
        bool token_seen = false;            ///< True if the literal `tool_call` token appears
    };

    static ParseResult parse(const std::string& output) {
        ParseResult result;

        const std::string trimmed = util::trim(output);
        if (auto tc = parse_directive_text(trimmed)) {
            result.tool_call = std::move(tc);
            result.strict = true;
            result.token_seen = true;
            return result;
        }

        if (!util::contains(output, "tool_call")) {
            return result;
        }
        result.token_seen = true;

        auto pos = output.find('{');
        while (pos != std::string::npos) {
            auto end_pos = find_json_object_end(output, pos);
            if (end_pos != std::string::npos) {
                if (auto tc = parse_directive_text(output.substr(pos, end_pos - pos + 1))) {
                    result.tool_call = std::move(tc);
                    return result;
                }
            }
            pos = output.find('{', pos + 1);
        }

        return result;
    }

    /**
     * @brief Mint a fresh correlation token for a dispatched tool call.
     *
     * Format: "call_<16 hex digits>_<sequence>".
     */
    static std::string generate_id() {
        static std::atomic<uint64_t> counter{0};
        thread_local std::mt19937_64 rng{std::random_device{}()};
        char buf[24];
        std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(rng()));
        return "call_" + std::string(buf) + "_" +
               std::to_string(counter.fetch_add(1, std::memory_order_relaxed) + 1);
    }

private:
    static std::optional<ToolCall> parse_directive_text(const std::string& text) {
        if (text.empty() || text.front() != '{') {
            return std::nullopt;
        }
        try {
            auto j = nlohmann::json::parse(text);
            if (!j.is_object()) return std::nullopt;

            auto tc_it = j.find("tool_call");
            if (tc_it == j.end() || !tc_it->is_object()) return std::nullopt;

            auto name_it = tc_it->find("name");
            auto args_it = tc_it->find("arguments");
            if (name_it == tc_it->end() || !name_it->is_string()) return std::nullopt;
            if (args_it == tc_it->end() || !args_it->is_object()) return std::nullopt;

            return ToolCall{name_it->get<std::string>(), std::move(*args_it)};
        } catch (const nlohmann::json::exception&) {
            return std::nullopt;
        }
    }

    /**
     * @brief Find the end position of a balanced JSON object starting at start.
     *
     * Handles string escaping and nested objects.
     *
     * @return Position of the matching closing brace, or std::string::npos if unbalanced
     */
    static size_t find_json_object_end(const std::string& text, size_t start) {
        if (start >= text.size() || text[start] != '{') return std::string::npos;

        int depth = 0;
        bool in_string = false;
        bool escape_next = false;

        for (size_t i = start; i < text.size(); ++i) {
            char c = text[i];

            if (escape_next) {
                escape_next = false;
                continue;
            }

            if (c == '\\' && in_string) {
                escape_next = true;
                continue;
            }

            if (c == '"') {
                in_string = !in_string;
                continue;
            }

            if (!in_string) {
                if (c == '{') ++depth;
                else if (c == '}') {
                    --depth;
                    if (depth == 0) {
                        return i;
                    }
                }
            }
        }

        return std::string::npos;
    }
};

} // namespace engine
} // namespace owl
