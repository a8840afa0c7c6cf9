#include <gtest/gtest.h>
#include "owl/engine/turn_state_machine.hpp"
#include "mocks/mock_backend.hpp"
#include "mocks/mock_search.hpp"
#include "fixtures/sample_responses.hpp"

using namespace owl;
using namespace owl::engine;
using namespace owl::testing;
using namespace owl::testing::responses;

class TurnStateMachineTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend = std::make_shared<MockBackend>();
        search = std::make_shared<MockSearchProvider>();
        auto resolver = std::make_shared<const search::KnowledgeResolver>(
            search, std::make_shared<MockReferenceSource>(), std::make_shared<MockPageFetcher>());
        auto built = ToolRegistry::create_builtin(resolver);
        ASSERT_TRUE(built.has_value());
        registry = std::make_shared<const ToolRegistry>(std::move(*built));
    }

    TurnStateMachine make_machine(int max_iterations = 5) {
        return TurnStateMachine(backend, registry, max_iterations);
    }

    Expected<TurnResult> run(const std::string& prompt, bool search_enabled = false, int max_iterations = 5) {
        TurnOptions options;
        options.search_enabled = search_enabled;
        return make_machine(max_iterations).run({Message::user(prompt)}, options);
    }

    std::shared_ptr<MockBackend> backend;
    std::shared_ptr<MockSearchProvider> search;
    std::shared_ptr<const ToolRegistry> registry;
};

// ============================================================================
// TS-001: Direct answers
// ============================================================================

TEST_F(TurnStateMachineTest, PlainAnswerFinishesInOneCall) {
    backend->enqueue_response(PLAIN_TEXT);

    auto result = run("What is the capital of France?");

    ASSERT_TRUE(result.has_value()) << result.error().to_string();
    EXPECT_EQ(result->text, PLAIN_TEXT);
    EXPECT_EQ(result->iterations, 0);
    EXPECT_FALSE(result->truncated);
    ASSERT_EQ(result->messages.size(), 1u);
    EXPECT_EQ(result->messages[0], Message::assistant(PLAIN_TEXT));
    EXPECT_EQ(backend->generate_calls, 1);
}

TEST_F(TurnStateMachineTest, PriorMessagesForwardedAfterSystemInstruction) {
    std::vector<Message> prior{Message::user("first question"), Message::user("second question")};

    auto result = make_machine().run(prior, TurnOptions{});

    ASSERT_TRUE(result.has_value());
    const auto& sent = backend->received.at(0);
    ASSERT_EQ(sent.size(), 3u);
    EXPECT_EQ(sent[0].role, "system");
    EXPECT_EQ(sent[1], (backend::ChatMessage{"user", "first question"}));
    EXPECT_EQ(sent[2], (backend::ChatMessage{"user", "second question"}));
}

TEST_F(TurnStateMachineTest, TokenMentionIsAnAnswer) {
    backend->enqueue_response(TOOL_CALL_MENTION_ONLY);

    auto result = run("What is six times seven?");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->text, TOOL_CALL_MENTION_ONLY);
    EXPECT_EQ(backend->generate_calls, 1);
}

TEST_F(TurnStateMachineTest, EmptyPriorRejected) {
    auto result = make_machine().run({}, TurnOptions{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidMessageSequence);
    EXPECT_EQ(backend->generate_calls, 0);
}

// ============================================================================
// TS-002: Tool round trips
// ============================================================================

TEST_F(TurnStateMachineTest, WeatherRoundTrip) {
    backend->enqueue_response(WEATHER_CALL);
    backend->enqueue_response(WEATHER_ANSWER);

    auto result = run("What's the weather in Chicago, IL?");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->text, WEATHER_ANSWER);
    EXPECT_EQ(result->iterations, 1);
    EXPECT_EQ(backend->generate_calls, 2);

    ASSERT_EQ(result->messages.size(), 3u);
    EXPECT_EQ(result->messages[0], Message::assistant(WEATHER_CALL));
    const Message& tool = result->messages[1];
    EXPECT_EQ(tool.role, Role::Tool);
    EXPECT_EQ(tool.tool_name, std::optional<std::string>("get_current_weather"));
    ASSERT_TRUE(tool.tool_call_id.has_value());
    EXPECT_EQ(tool.tool_call_id->rfind("call_", 0), 0u);
    EXPECT_NE(tool.text.find("sunny"), std::string::npos);
    EXPECT_EQ(result->messages[2], Message::assistant(WEATHER_ANSWER));
}

TEST_F(TurnStateMachineTest, ToolResultSentAsUserTurn) {
    backend->enqueue_response(WEATHER_CALL);
    backend->enqueue_response(WEATHER_ANSWER);

    ASSERT_TRUE(run("What's the weather in Chicago, IL?").has_value());

    const auto& second = backend->received.at(1);
    ASSERT_EQ(second.size(), 4u);
    EXPECT_EQ(second[2], (backend::ChatMessage{"assistant", WEATHER_CALL}));
    EXPECT_EQ(second[3].role, "user");
    EXPECT_EQ(second[3].content.rfind("Tool result for get_current_weather: It's 75 degrees", 0), 0u);
}

TEST_F(TurnStateMachineTest, DirectiveInProseIsExecuted) {
    backend->enqueue_response(WEATHER_CALL_IN_PROSE);
    backend->enqueue_response(WEATHER_ANSWER);

    auto result = run("Weather in Chicago, IL?");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->iterations, 1);
    EXPECT_EQ(result->text, WEATHER_ANSWER);
}

TEST_F(TurnStateMachineTest, UnknownToolResultFedBack) {
    backend->enqueue_response(UNKNOWN_TOOL_CALL);
    backend->enqueue_response("I cannot look up stock prices.");

    auto result = run("What is AAPL trading at?");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->messages[1].text, "Tool get_stock_price not found");
    EXPECT_EQ(backend->last_message(1).content, "Tool result for get_stock_price: Tool get_stock_price not found");
    EXPECT_EQ(result->text, "I cannot look up stock prices.");
}

TEST_F(TurnStateMachineTest, InvalidArgumentsFedBack) {
    backend->enqueue_response(WEATHER_CALL_MISSING_LOCATION);
    backend->enqueue_response("Which city?");

    auto result = run("What's the weather?");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->messages[1].text,
              "Error: invalid arguments for get_current_weather: Missing required argument: location");
    EXPECT_EQ(result->text, "Which city?");
}

TEST_F(TurnStateMachineTest, SearchDispatchedEvenWhenNotAdvertised) {
    search->failure = Error{ErrorCode::MissingCredentials, "Missing GOOGLE_API_KEY or GOOGLE_CSE_ID"};
    backend->enqueue_response(SEARCH_CALL);
    backend->enqueue_response("Search is not configured.");

    auto result = run("When was Purdue founded?", false);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(search->calls, 1);
    EXPECT_EQ(result->messages[1].tool_name, std::optional<std::string>("search_web"));
    EXPECT_EQ(result->messages[1].text, "Missing GOOGLE_API_KEY or GOOGLE_CSE_ID");
}

TEST_F(TurnStateMachineTest, CorrelationTokensDifferPerRoundTrip) {
    backend->enqueue_response(WEATHER_CALL);
    backend->enqueue_response(WEATHER_CALL);
    backend->enqueue_response(WEATHER_ANSWER);

    auto result = run("Weather twice please");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->iterations, 2);
    ASSERT_EQ(result->messages.size(), 5u);
    EXPECT_NE(result->messages[1].tool_call_id, result->messages[3].tool_call_id);
}

// ============================================================================
// TS-003: Round-trip bound
// ============================================================================

TEST_F(TurnStateMachineTest, LoopBoundTruncates) {
    backend->default_response = WEATHER_CALL;

    auto result = run("Weather forever", false, 2);

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->truncated);
    EXPECT_EQ(result->iterations, 2);
    EXPECT_EQ(backend->generate_calls, 3);
    EXPECT_EQ(result->text, WEATHER_CALL);
    // assistant, tool, assistant, tool, assistant
    EXPECT_EQ(result->messages.size(), 5u);
    EXPECT_EQ(result->messages.back(), Message::assistant(WEATHER_CALL));
}

TEST_F(TurnStateMachineTest, DefaultBoundIsFive) {
    backend->default_response = WEATHER_CALL;

    auto result = run("Weather forever");

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->truncated);
    EXPECT_EQ(result->iterations, 5);
    EXPECT_EQ(backend->generate_calls, 6);
    EXPECT_EQ(make_machine().max_tool_iterations(), 5);
}

// ============================================================================
// TS-004: Backend failures
// ============================================================================

TEST_F(TurnStateMachineTest, TimeoutBecomesAnswerText) {
    backend->enqueue_error(ErrorCode::BackendTimeout, "request timed out (model is taking too long)");

    auto result = run("Tell me a long story");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->text, "Error: request timed out (model is taking too long).");
    EXPECT_EQ(backend->generate_calls, 1);
}

TEST_F(TurnStateMachineTest, ErrorTextKeepsSingleTrailingPeriod) {
    backend->enqueue_error(ErrorCode::BackendRequestFailed, "request failed: connection refused.");

    auto result = run("Hello");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->text, "Error: request failed: connection refused.");
}

TEST_F(TurnStateMachineTest, FailureAfterToolCallEndsTurn) {
    backend->enqueue_response(WEATHER_CALL);
    backend->enqueue_error(ErrorCode::BackendRequestFailed, "request failed: HTTP 500");

    auto result = run("Weather in Chicago, IL?");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->iterations, 1);
    EXPECT_EQ(result->text, "Error: request failed: HTTP 500.");
}

// ============================================================================
// TS-005: Reasoning blocks
// ============================================================================

TEST_F(TurnStateMachineTest, ReasoningStrippedBeforeParsing) {
    backend->enqueue_response(WEATHER_CALL_AFTER_THINKING);
    backend->enqueue_response("<think>done</think>\n" + WEATHER_ANSWER);

    auto result = run("Weather in Chicago, IL?");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->iterations, 1);
    EXPECT_EQ(result->messages[0], Message::assistant(WEATHER_CALL));
    EXPECT_EQ(result->text, WEATHER_ANSWER);
}

TEST_F(TurnStateMachineTest, ReasoningOnlyIsNoAnswer) {
    backend->enqueue_response(THINK_ONLY);

    auto result = run("Hmm?");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NoTerminalAnswer);
}

// ============================================================================
// TS-006: Per-call tool advertisement
// ============================================================================

TEST_F(TurnStateMachineTest, SearchAdvertisedOnlyWhenEnabled) {
    ASSERT_TRUE(run("Hi", false).has_value());
    ASSERT_TRUE(run("Hi", true).has_value());
    ASSERT_TRUE(run("Hi", false).has_value());

    EXPECT_EQ(backend->system_prompt(0).find("search_web"), std::string::npos);
    EXPECT_NE(backend->system_prompt(1).find("search_web"), std::string::npos);
    EXPECT_EQ(backend->system_prompt(2).find("search_web"), std::string::npos);
}

TEST_F(TurnStateMachineTest, SameInstructionAcrossRoundTrips) {
    backend->enqueue_response(WEATHER_CALL);

    ASSERT_TRUE(run("Weather in Chicago, IL?", true).has_value());

    ASSERT_EQ(backend->generate_calls, 2);
    EXPECT_EQ(backend->system_prompt(0), backend->system_prompt(1));
}

// ============================================================================
// TS-007: Prompt and wire mapping
// ============================================================================

TEST_F(TurnStateMachineTest, InstructionWithoutSearch) {
    const std::string prompt = PromptBuilder::build_system_instruction(*registry, false);
    EXPECT_EQ(prompt.rfind("You are a helpful AI assistant with access to an external tool:\n", 0), 0u);
    EXPECT_NE(prompt.find("get_current_weather(location: str)"), std::string::npos);
    EXPECT_NE(prompt.find(R"("arguments": {"location": "City, ST"})"), std::string::npos);
    EXPECT_EQ(prompt.find("search_web"), std::string::npos);
}

TEST_F(TurnStateMachineTest, InstructionWithSearch) {
    const std::string prompt = PromptBuilder::build_system_instruction(*registry, true);
    EXPECT_EQ(prompt.rfind("You are a helpful AI assistant with access to two external tools:\n", 0), 0u);
    EXPECT_NE(prompt.find("search_web(query: str)"), std::string::npos);
    EXPECT_NE(prompt.find("**When to use search_web:**"), std::string::npos);
    EXPECT_NE(prompt.find(R"("arguments": {"query": "your search query"})"), std::string::npos);
}

TEST(TurnWireMappingTest, ToChatMessages) {
    auto wire = TurnStateMachine::to_chat_messages("sys", {
        Message::user("q"),
        Message::assistant("a"),
        Message::tool("75 and sunny", "get_current_weather", "call_1")
    });

    ASSERT_EQ(wire.size(), 4u);
    EXPECT_EQ(wire[0], (backend::ChatMessage{"system", "sys"}));
    EXPECT_EQ(wire[1], (backend::ChatMessage{"user", "q"}));
    EXPECT_EQ(wire[2], (backend::ChatMessage{"assistant", "a"}));
    EXPECT_EQ(wire[3], (backend::ChatMessage{"user", "Tool result for get_current_weather: 75 and sunny"}));
}
