#pragma once

#include "../backend/IBackend.hpp"
#include "../log.hpp"
#include "../types.hpp"
#include "prompt_builder.hpp"
#include "reasoning_filter.hpp"
#include "tool_call_parser.hpp"
#include "tool_registry.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace owl {
namespace engine {

/**
 * @brief Runs one conversational turn to completion
 *
 * States: Generate -> CheckForToolCall -> (ExecuteTool -> Generate)* -> Done.
 *
 * - Generate builds the system instruction for the tools enabled in this
 *   call, sends it with the working messages to the backend, strips
 *   reasoning blocks and appends the assistant message. Backend failures
 *   become the assistant text "Error: <description>".
 * - CheckForToolCall parses the latest assistant text for a directive.
 * - ExecuteTool dispatches through the registry (never throws) and appends
 *   the tool message under a fresh correlation token.
 *
 * At most max_tool_iterations tool round trips are performed. A directive
 * arriving after that ends the turn with the directive text as the answer
 * and TurnResult::truncated set.
 *
 * The machine owns no conversation state: it receives the prior messages
 * by value and returns the messages it produced; the caller commits them.
 *
 * @threadsafety run() is const and may be called concurrently as long as
 * the backend and registry are thread-safe.
 */
class TurnStateMachine {
public:
    enum class State {
        Generate,
        CheckForToolCall,
        ExecuteTool,
        Done
    };

    TurnStateMachine(std::shared_ptr<backend::IBackend> backend,
                     std::shared_ptr<const ToolRegistry> registry,
                     int max_tool_iterations = 5)
        : backend_(std::move(backend))
        , registry_(std::move(registry))
        , max_tool_iterations_(max_tool_iterations)
    {}

    /**
     * @brief Run a turn
     *
     * @param prior Conversation so far, ending with the current user prompt
     * @param options Per-call flags (search advertisement)
     * @return TurnResult, or ErrorCode::NoTerminalAnswer if the final text
     *         is empty, ErrorCode::InvalidMessageSequence if prior is empty
     */
    Expected<TurnResult> run(std::vector<Message> prior, const TurnOptions& options) const {
        if (prior.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidMessageSequence, "Turn needs at least one message"});
        }

        std::vector<Message> working = std::move(prior);
        TurnResult result;
        const std::string system_instruction =
            PromptBuilder::build_system_instruction(*registry_, options.search_enabled);

        State state = State::Generate;
        std::optional<ToolCall> pending;

        while (state != State::Done) {
            switch (state) {
                case State::Generate: {
                    std::string text = strip_reasoning(generate(system_instruction, working));
                    append(working, result, Message::assistant(text));
                    result.text = std::move(text);
                    state = State::CheckForToolCall;
                    break;
                }

                case State::CheckForToolCall: {
                    auto parsed = ToolCallParser::parse(result.text);
                    if (!parsed.tool_call.has_value()) {
                        if (parsed.token_seen) {
                            OWL_LOG_DEBUG("'tool_call' mentioned but no directive could be extracted");
                        }
                        state = State::Done;
                        break;
                    }
                    if (result.iterations >= max_tool_iterations_) {
                        OWL_LOG_WARN("tool round-trip limit (%d) reached; returning last text", max_tool_iterations_);
                        result.truncated = true;
                        state = State::Done;
                        break;
                    }
                    pending = std::move(parsed.tool_call);
                    state = State::ExecuteTool;
                    break;
                }

                case State::ExecuteTool: {
                    ToolResult tool = registry_->dispatch(*pending, ToolCallParser::generate_id());
                    OWL_LOG_DEBUG("tool %s [%s] -> %zu bytes",
                                  tool.name.c_str(), tool.tool_call_id.c_str(), tool.content.size());
                    append(working, result, Message::tool(std::move(tool.content),
                                                          std::move(tool.name),
                                                          std::move(tool.tool_call_id)));
                    pending.reset();
                    ++result.iterations;
                    state = State::Generate;
                    break;
                }

                case State::Done:
                    break;
            }
        }

        if (util::trim(result.text).empty()) {
            return tl::unexpected(Error{
                ErrorCode::NoTerminalAnswer,
                "Model produced no answer",
                "tool round trips: " + std::to_string(result.iterations)
            });
        }
        return result;
    }

    /**
     * @brief Map conversation messages to the backend wire format
     *
     * The system instruction comes first. Tool results are sent as user
     * turns: "Tool result for <name>: <content>".
     */
    static std::vector<backend::ChatMessage> to_chat_messages(const std::string& system_instruction,
                                                              const std::vector<Message>& messages) {
        std::vector<backend::ChatMessage> out;
        out.reserve(messages.size() + 1);
        out.push_back(backend::ChatMessage{"system", system_instruction});
        for (const auto& msg : messages) {
            switch (msg.role) {
                case Role::User:
                    out.push_back(backend::ChatMessage{"user", msg.text});
                    break;
                case Role::Assistant:
                    out.push_back(backend::ChatMessage{"assistant", msg.text});
                    break;
                case Role::Tool:
                    out.push_back(backend::ChatMessage{
                        "user",
                        "Tool result for " + msg.tool_name.value_or("unknown") + ": " + msg.text
                    });
                    break;
            }
        }
        return out;
    }

    int max_tool_iterations() const { return max_tool_iterations_; }

private:
    std::string generate(const std::string& system_instruction, const std::vector<Message>& working) const {
        auto generated = backend_->generate(to_chat_messages(system_instruction, working));
        if (!generated) {
            OWL_LOG_ERROR("generation failed: %s", generated.error().to_string().c_str());
            std::string text = "Error: " + generated.error().message;
            if (text.back() != '.') {
                text += '.';
            }
            return text;
        }
        return std::move(*generated);
    }

    static void append(std::vector<Message>& working, TurnResult& result, Message msg) {
        working.push_back(msg);
        result.messages.push_back(std::move(msg));
    }

    std::shared_ptr<backend::IBackend> backend_;
    std::shared_ptr<const ToolRegistry> registry_;
    int max_tool_iterations_;
};

} // namespace engine
} // namespace owl
