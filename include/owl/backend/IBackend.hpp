#pragma once

#include "../types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace owl {
namespace backend {

/**
 * @brief One entry of the message list sent to a generation backend.
 *
 * Role is one of "system", "user" or "assistant"; tool results are folded
 * into user turns before they reach this layer.
 */
struct ChatMessage {
    std::string role;
    std::string content;

    bool operator==(const ChatMessage& other) const {
        return role == other.role && content == other.content;
    }

    bool operator!=(const ChatMessage& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Abstract interface for text-generation backends
 *
 * Enables dependency injection for testing. Implementations are called
 * synchronously from the thread running the turn and may be shared by
 * concurrent turns, so they must not keep per-request state.
 *
 * Failure modes:
 * - ErrorCode::BackendTimeout: the backend did not answer in time
 * - ErrorCode::BackendRequestFailed: transport or HTTP failure
 * - ErrorCode::BackendMalformedResponse: reply did not carry generated text
 */
class IBackend {
public:
    virtual ~IBackend() = default;

    /**
     * @brief Generate a reply for an ordered list of role-tagged messages
     *
     * @param messages System instruction followed by the conversation
     * @return Expected<std::string> Generated text or error
     */
    virtual Expected<std::string> generate(const std::vector<ChatMessage>& messages) = 0;
};

/**
 * @brief Factory function for the production backend
 *
 * Returns an HttpBackend talking to the OpenAI-compatible endpoint named
 * in the configuration. For testing, inject MockBackend directly.
 */
std::unique_ptr<IBackend> create_backend(const Config& config);

} // namespace backend
} // namespace owl
