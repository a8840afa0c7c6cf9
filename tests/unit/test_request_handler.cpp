#include <gtest/gtest.h>
#include "owl/api/request_handler.hpp"
#include "mocks/mock_backend.hpp"
#include "mocks/mock_search.hpp"
#include "fixtures/sample_responses.hpp"

using namespace owl;
using namespace owl::testing;
using json = nlohmann::json;

class RequestHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend = std::make_shared<MockBackend>();

        Agent::Collaborators collaborators;
        collaborators.backend = backend;
        collaborators.search = std::make_shared<MockSearchProvider>();
        collaborators.reference = std::make_shared<MockReferenceSource>();
        collaborators.fetcher = std::make_shared<MockPageFetcher>();
        collaborators.history = std::make_shared<engine::InMemoryHistoryStore>();

        auto created = Agent::create(Config{}, collaborators);
        ASSERT_TRUE(created.has_value());
        agent = std::move(*created);
        handler = std::make_unique<api::RequestHandler>(*agent);
    }

    std::shared_ptr<MockBackend> backend;
    std::unique_ptr<Agent> agent;
    std::unique_ptr<api::RequestHandler> handler;
};

// ============================================================================
// RH-001: Chat
// ============================================================================

TEST_F(RequestHandlerTest, ChatReturnsResponse) {
    backend->enqueue_response("Paris.");
    auto out = handler->handle_chat(json{{"prompt", "Capital of France?"}, {"search", false}});
    EXPECT_EQ(out, (json{{"response", "Paris."}}));
}

TEST_F(RequestHandlerTest, ChatRequiresPrompt) {
    auto out = handler->handle_chat(json{{"search", true}});
    EXPECT_EQ(out["code"], static_cast<int>(ErrorCode::InvalidRequest));
    EXPECT_EQ(out["error"], "Missing string field 'prompt'");

    out = handler->handle_chat(json{{"prompt", 42}});
    EXPECT_EQ(out["code"], static_cast<int>(ErrorCode::InvalidRequest));
    EXPECT_EQ(backend->generate_calls, 0);
}

TEST_F(RequestHandlerTest, NoAnswerReportedAsError) {
    backend->enqueue_response(owl::testing::responses::THINK_ONLY);
    auto out = handler->handle_chat(json{{"prompt", "Hmm"}});
    EXPECT_EQ(out["error"], "Model produced no answer");
    EXPECT_EQ(out["code"], static_cast<int>(ErrorCode::NoTerminalAnswer));
}

// ============================================================================
// RH-002: Search flag
// ============================================================================

TEST(SearchFlagTest, AcceptedForms) {
    using api::RequestHandler;
    EXPECT_EQ(RequestHandler::parse_search_flag(json::object()), false);
    EXPECT_EQ(RequestHandler::parse_search_flag(json{{"search", nullptr}}), false);
    EXPECT_EQ(RequestHandler::parse_search_flag(json{{"search", true}}), true);
    EXPECT_EQ(RequestHandler::parse_search_flag(json{{"search", false}}), false);
    EXPECT_EQ(RequestHandler::parse_search_flag(json{{"search", "TRUE"}}), true);
    EXPECT_EQ(RequestHandler::parse_search_flag(json{{"search", " false "}}), false);
}

TEST(SearchFlagTest, RejectedForms) {
    using api::RequestHandler;
    for (const json& value : {json("yes"), json(""), json(1), json::array()}) {
        auto flag = RequestHandler::parse_search_flag(json{{"search", value}});
        ASSERT_FALSE(flag.has_value()) << value.dump();
        EXPECT_EQ(flag.error().code, ErrorCode::InvalidRequest);
    }
}

TEST_F(RequestHandlerTest, SearchFlagControlsAdvertisement) {
    handler->handle_chat(json{{"prompt", "a"}, {"search", "true"}});
    handler->handle_chat(json{{"prompt", "b"}, {"search", "False"}});

    EXPECT_NE(backend->system_prompt(0).find("search_web"), std::string::npos);
    EXPECT_EQ(backend->system_prompt(1).find("search_web"), std::string::npos);
}

// ============================================================================
// RH-003: History and clear
// ============================================================================

TEST_F(RequestHandlerTest, HistoryListsRolesAndText) {
    backend->enqueue_response("Hi there.");
    handler->handle_chat(json{{"prompt", "Hello"}, {"user_id", "alice"}});

    auto out = handler->handle_history(json{{"user_id", "alice"}});
    ASSERT_TRUE(out.is_array());
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0], (json{{"role", "user"}, {"text", "Hello"}}));
    EXPECT_EQ(out[1], (json{{"role", "assistant"}, {"text", "Hi there."}}));

    EXPECT_TRUE(handler->handle_history(json{{"user_id", "bob"}}).empty());
}

TEST_F(RequestHandlerTest, ClearEmptiesHistory) {
    handler->handle_chat(json{{"prompt", "Hello"}});

    EXPECT_EQ(handler->handle_clear(json::object()), (json{{"cleared", true}}));
    EXPECT_TRUE(handler->handle_history(json::object()).empty());
}

TEST_F(RequestHandlerTest, UserIdMustBeNonEmptyString) {
    EXPECT_EQ(handler->handle_history(json{{"user_id", 7}})["code"], static_cast<int>(ErrorCode::InvalidRequest));
    EXPECT_EQ(handler->handle_clear(json{{"user_id", ""}})["code"], static_cast<int>(ErrorCode::InvalidRequest));
}

// ============================================================================
// RH-004: Routing and wire lines
// ============================================================================

TEST_F(RequestHandlerTest, DispatchByType) {
    backend->enqueue_response("Answer.");
    EXPECT_EQ(handler->dispatch(json{{"prompt", "q"}}), (json{{"response", "Answer."}}));
    EXPECT_TRUE(handler->dispatch(json{{"type", "history"}}).is_array());
    EXPECT_EQ(handler->dispatch(json{{"type", "clear"}}), (json{{"cleared", true}}));

    auto unknown = handler->dispatch(json{{"type", "reboot"}});
    EXPECT_EQ(unknown["error"], "Unknown request type");
    EXPECT_EQ(handler->dispatch(json::array())["code"], static_cast<int>(ErrorCode::InvalidRequest));
}

TEST_F(RequestHandlerTest, HandleLine) {
    backend->enqueue_response("Pong.");
    EXPECT_EQ(json::parse(handler->handle_line(R"({"prompt": "Ping", "search": false})")),
              (json{{"response", "Pong."}}));

    EXPECT_EQ(json::parse(handler->handle_line("{not json")),
              (json{{"error", "Malformed JSON request"}, {"code", static_cast<int>(ErrorCode::InvalidRequest)}}));
}

TEST_F(RequestHandlerTest, NonStringTypeRejected) {
    std::string line;
    ASSERT_NO_THROW(line = handler->handle_line(R"({"type": 5})"));
    auto out = json::parse(line);
    EXPECT_EQ(out["code"], static_cast<int>(ErrorCode::InvalidRequest));
    EXPECT_EQ(out["error"], "Field 'type' must be a string");
    EXPECT_EQ(backend->generate_calls, 0);
}

TEST_F(RequestHandlerTest, MalformedUtf8ReplyStillSerialised) {
    backend->enqueue_response("Caf\xE9 is open.");

    std::string line;
    ASSERT_NO_THROW(line = handler->handle_line(R"({"prompt": "Is it open?", "user_id": "alice"})"));
    EXPECT_EQ(json::parse(line), (json{{"response", "Caf\xEF\xBF\xBD is open."}}));

    ASSERT_NO_THROW(line = handler->handle_line(R"({"type": "history", "user_id": "alice"})"));
    auto history = json::parse(line);
    ASSERT_TRUE(history.is_array());
    EXPECT_EQ(history.size(), 2u);
}
