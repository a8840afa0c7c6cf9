#pragma once

#include <string>

namespace owl {
namespace testing {
namespace responses {

// Model output that is exactly a weather directive
inline const std::string WEATHER_CALL =
    R"({"tool_call": {"name": "get_current_weather", "arguments": {"location": "Chicago, IL"}}})";

// Model output that is exactly a search directive
inline const std::string SEARCH_CALL =
    R"({"tool_call": {"name": "search_web", "arguments": {"query": "Purdue University founding date"}}})";

// Directive wrapped in reasoning and surrounding whitespace
inline const std::string WEATHER_CALL_AFTER_THINKING =
    "<think>The user wants the weather. I should call the tool.</think>\n\n  " + WEATHER_CALL + "\n";

// Directive embedded in prose (strict parse fails, scan recovers it)
inline const std::string WEATHER_CALL_IN_PROSE =
    "Sure, let me check that for you.\n" + WEATHER_CALL + "\nOne moment.";

// Mentions the token but carries no usable directive
inline const std::string TOOL_CALL_MENTION_ONLY =
    "I could emit a tool_call here, but the answer is simply 42.";

// Directive naming a tool that does not exist
inline const std::string UNKNOWN_TOOL_CALL =
    R"({"tool_call": {"name": "get_stock_price", "arguments": {"ticker": "AAPL"}}})";

// Directive with a missing required argument
inline const std::string WEATHER_CALL_MISSING_LOCATION =
    R"({"tool_call": {"name": "get_current_weather", "arguments": {}}})";

// Directive whose arguments are not an object
inline const std::string TOOL_CALL_ARRAY_ARGUMENTS =
    R"({"tool_call": {"name": "get_current_weather", "arguments": ["Chicago, IL"]}})";

// Truncated JSON
inline const std::string INVALID_JSON =
    R"({"tool_call": {"name": "get_current_weather", "arguments": {"location": )";

// Plain answers
inline const std::string PLAIN_TEXT =
    "The capital of France is Paris.";

inline const std::string WEATHER_ANSWER =
    "It is 75 degrees and sunny in Chicago right now.";

inline const std::string THINK_ONLY =
    "<think>I am not sure what to say.</think>";

} // namespace responses
} // namespace testing
} // namespace owl
