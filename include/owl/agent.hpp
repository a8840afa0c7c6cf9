#pragma once

#include "types.hpp"
#include "log.hpp"
#include "backend/IBackend.hpp"
#include "engine/conversation_session.hpp"
#include "engine/history_store.hpp"
#include "engine/tool_registry.hpp"
#include "engine/turn_state_machine.hpp"
#include "search/google_search.hpp"
#include "search/knowledge_resolver.hpp"
#include "search/page_fetcher.hpp"
#include "search/wiki_reference.hpp"
#include <memory>
#include <string>
#include <vector>

namespace owl {

/**
 * @brief Main entry point for the owl conversational agent
 *
 * Wires the generation backend, the knowledge resolver, the tool registry
 * and the conversation history together and runs one turn per handle()
 * call on the calling thread.
 *
 * Per call:
 * 1. Earlier user prompts of the user are read from history.
 * 2. The current prompt is appended and the turn state machine runs.
 * 3. The prompt plus every message the turn produced (the final answer
 *    last) are committed to history in one append.
 *
 * If the turn fails fatally only the prompt is committed.
 *
 * Example Usage:
 * @code
 * auto config = load_config_from_environment();
 * auto agent = Agent::create(*config);
 * if (!agent) {
 *     std::cerr << agent.error().to_string() << std::endl;
 *     return 1;
 * }
 * auto reply = (*agent)->handle("What's the weather in Chicago, IL?", false);
 * @endcode
 *
 * @threadsafety handle() may be called concurrently; the search flag is
 * per call and history is synchronised inside the store.
 */
class Agent {
public:
    /**
     * @brief Collaborators to inject; any left null gets the production
     * implementation built from the configuration.
     */
    struct Collaborators {
        std::shared_ptr<backend::IBackend> backend;
        std::shared_ptr<search::ISearchProvider> search;
        std::shared_ptr<search::IReferenceSource> reference;
        std::shared_ptr<search::IPageFetcher> fetcher;
        std::shared_ptr<engine::IHistoryStore> history;
        search::KnowledgeResolver::Clock clock;   ///< "Today" for age answers
    };

    /**
     * @brief Factory method to create an Agent
     *
     * Validates configuration, applies the log level and builds the tool
     * registry.
     *
     * @return Expected<std::unique_ptr<Agent>> Agent or ErrorCode::InvalidConfig
     */
    static Expected<std::unique_ptr<Agent>> create(const Config& config, Collaborators collaborators = {}) {
        if (auto result = config.validate(); !result) {
            return tl::unexpected(result.error());
        }
        if (auto level = parse_log_level(config.log_level)) {
            Logger::instance().set_level(*level);
        }

        if (!collaborators.backend) {
            collaborators.backend = backend::create_backend(config);
        }
        if (!collaborators.search) {
            collaborators.search = std::make_shared<search::GoogleSearchProvider>(config);
        }
        if (!collaborators.reference) {
            collaborators.reference = std::make_shared<search::WikiReferenceSource>(config);
        }
        if (!collaborators.fetcher) {
            collaborators.fetcher = std::make_shared<search::HttpPageFetcher>(config);
        }
        if (!collaborators.history) {
            collaborators.history = engine::open_history_store(config);
        }
        if (!collaborators.clock) {
            collaborators.clock = [] { return std::chrono::system_clock::now(); };
        }
        if (!config.has_search_credentials()) {
            OWL_LOG_INFO("GOOGLE_API_KEY/GOOGLE_CSE_ID not set; web search answers will report missing credentials");
        }

        auto resolver = std::make_shared<const search::KnowledgeResolver>(
            collaborators.search,
            collaborators.reference,
            collaborators.fetcher,
            search::KnowledgeResolver::Options{},
            collaborators.clock);

        auto registry = engine::ToolRegistry::create_builtin(resolver);
        if (!registry) {
            return tl::unexpected(registry.error());
        }

        return std::unique_ptr<Agent>(new Agent(
            config,
            std::move(collaborators.backend),
            std::make_shared<const engine::ToolRegistry>(std::move(*registry)),
            std::move(collaborators.history)));
    }

    /**
     * @brief Answer one prompt for a user
     *
     * @param prompt User text
     * @param search Advertise the web lookup tool for this call
     * @param user_id Conversation owner
     * @return Reply, or the fatal error of the turn (ErrorCode::NoTerminalAnswer)
     *         or of the history store
     */
    Expected<Reply> handle(const std::string& prompt, bool search, const std::string& user_id = "default") {
        OWL_LOG_INFO("turn start: user=%s search=%s", user_id.c_str(), search ? "on" : "off");

        auto prior = session_.user_messages(user_id);
        if (!prior) {
            return tl::unexpected(prior.error());
        }

        const Message user_message = Message::user(prompt);
        std::vector<Message> working = std::move(*prior);
        working.push_back(user_message);

        TurnOptions options;
        options.search_enabled = search;
        auto result = turn_.run(std::move(working), options);

        if (!result) {
            OWL_LOG_ERROR("turn failed for user=%s: %s", user_id.c_str(), result.error().to_string().c_str());
            if (auto saved = session_.add(user_id, user_message); !saved) {
                OWL_LOG_ERROR("could not save prompt: %s", saved.error().to_string().c_str());
            }
            return tl::unexpected(result.error());
        }

        std::vector<Message> delta;
        delta.reserve(result->messages.size() + 1);
        delta.push_back(user_message);
        delta.insert(delta.end(), result->messages.begin(), result->messages.end());
        if (auto saved = session_.commit(user_id, delta); !saved) {
            return tl::unexpected(saved.error());
        }

        OWL_LOG_INFO("turn done: user=%s tool_round_trips=%d truncated=%s",
                     user_id.c_str(), result->iterations, result->truncated ? "yes" : "no");
        return Reply{std::move(result->text)};
    }

    /// Full ordered log for a user.
    Expected<std::vector<Message>> history(const std::string& user_id = "default") {
        return session_.read(user_id);
    }

    Expected<void> clear_history(const std::string& user_id = "default") {
        return session_.clear(user_id);
    }

    const Config& get_config() const { return config_; }

    const engine::ToolRegistry& tools() const { return *registry_; }

private:
    Agent(const Config& config,
          std::shared_ptr<backend::IBackend> backend,
          std::shared_ptr<const engine::ToolRegistry> registry,
          std::shared_ptr<engine::IHistoryStore> history)
        : config_(config)
        , registry_(registry)
        , turn_(std::move(backend), registry, config.max_tool_iterations)
        , session_(std::move(history))
    {}

    Config config_;
    std::shared_ptr<const engine::ToolRegistry> registry_;
    engine::TurnStateMachine turn_;
    engine::ConversationSession session_;
};

} // namespace owl
