#pragma once

#include "tool_registry.hpp"
#include <string>

namespace owl {
namespace engine {

/**
 * @brief Builds the system instruction for one generation call
 *
 * The instruction lists exactly the tools enabled for the call and
 * describes the directive format the parser accepts:
 * {"tool_call": {"name": "<tool>", "arguments": {...}}}
 */
class PromptBuilder {
public:
    static std::string build_system_instruction(const ToolRegistry& registry, bool search_enabled) {
        std::string prompt;
        prompt.reserve(2048);

        prompt += "You are a helpful AI assistant with ";
        prompt += search_enabled ? "access to two external tools:\n" : "access to an external tool:\n";
        prompt += registry.describe(search_enabled);
        prompt += "\n";

        if (search_enabled) {
            prompt +=
                "\n"
                "**When to use search_web:**\n"
                "- Questions about current events, news, or recent happenings\n"
                "- Information about people's current status, recent activities, or biographical details that may have changed\n"
                "- Any query where your training data might be outdated\n"
                "- Real-time information requests\n"
                "- If you're unsure whether your information is current, use the search tool\n";
        }

        prompt +=
            "\n"
            "You **MUST** call the appropriate tool whenever you identify that you need information that could be:\n"
            "- Current or real-time data ";
        prompt += search_enabled
            ? "(e.g. current weather, recent news, biographical information, current events)\n"
            : "(e.g. current weather)\n";
        prompt +=
            "- Information that changes frequently or might be outdated in your training data\n"
            "- Any query where using a tool would provide more accurate or up-to-date information\n"
            "\n"
            "To call a tool, reply with **only** a JSON object of this exact form:\n"
            "\n";
        prompt += search_enabled
            ? R"({"tool_call": {"name": "<tool_name>", "arguments": {"query": "your search query"}}})"
            : R"({"tool_call": {"name": "<tool_name>", "arguments": {"location": "City, ST"}}})";
        prompt +=
            "\n\n"
            "- No additional text or explanation should surround that JSON.\n"
            "- After the tool runs and returns its result, continue the conversation by providing your answer in natural language.\n";
        if (search_enabled) {
            prompt += "- For search_web, make your query specific and focused on what the user is asking.\n";
        }
        prompt +=
            "\n"
            "If you are absolutely certain you do **not** need a tool (for basic math, general knowledge "
            "that doesn't change, etc.), you may answer directly in natural language.";
        return prompt;
    }
};

} // namespace engine
} // namespace owl
