#pragma once

#include "IBackend.hpp"
#include "../net/http_client.hpp"
#include "../types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace owl {
namespace backend {

/**
 * @brief Backend speaking the OpenAI-compatible chat-completions protocol
 *
 * POSTs {"model", "messages", "stream": false} to
 * <backend_url>/v1/chat/completions (Ollama, llama-server, vLLM ...) and
 * returns choices[0].message.content.
 *
 * Thread Safety: stateless apart from immutable configuration; safe to
 * share between concurrent turns.
 */
class HttpBackend : public IBackend {
public:
    explicit HttpBackend(const Config& config);

    Expected<std::string> generate(const std::vector<ChatMessage>& messages) override;

    /// Request body for a message list (exposed for tests).
    nlohmann::json build_request(const std::vector<ChatMessage>& messages) const;

    /// Serialised request body; malformed UTF-8 in message content becomes U+FFFD.
    std::string request_body(const std::vector<ChatMessage>& messages) const;

    /// Extract generated text from a response body (exposed for tests).
    static Expected<std::string> parse_response(const std::string& body);

    const std::string& endpoint() const { return endpoint_; }

private:
    net::HttpClient http_;
    std::string endpoint_;
    std::string model_;
    net::Timeouts timeouts_;
};

} // namespace backend
} // namespace owl
