#include "owl/backend/http_backend.hpp"
#include "owl/log.hpp"
#include "owl/util/json.hpp"

namespace owl {
namespace backend {

namespace {

std::string trim_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

} // namespace

std::unique_ptr<IBackend> create_backend(const Config& config) {
    return std::make_unique<HttpBackend>(config);
}

HttpBackend::HttpBackend(const Config& config)
    : endpoint_(trim_trailing_slash(config.backend_url) + "/v1/chat/completions")
    , model_(config.model)
{
    timeouts_.connect = config.connect_timeout;
    // The total budget is connect + read so that a slow model gets the full read window.
    timeouts_.total = config.connect_timeout + config.generation_timeout;
}

nlohmann::json HttpBackend::build_request(const std::vector<ChatMessage>& messages) const {
    nlohmann::json wire = nlohmann::json::array();
    for (const auto& msg : messages) {
        wire.push_back({{"role", msg.role}, {"content", msg.content}});
    }
    return nlohmann::json{
        {"model", model_},
        {"messages", std::move(wire)},
        {"stream", false}
    };
}

Expected<std::string> HttpBackend::parse_response(const std::string& body) {
    try {
        auto j = nlohmann::json::parse(body);
        auto choices = j.find("choices");
        if (choices != j.end() && choices->is_array() && !choices->empty()) {
            const auto& message = (*choices)[0].at("message");
            auto content = message.find("content");
            if (content != message.end() && content->is_string()) {
                return content->get<std::string>();
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return tl::unexpected(Error{
            ErrorCode::BackendMalformedResponse,
            "unexpected response format",
            e.what()
        });
    }
    return tl::unexpected(Error{ErrorCode::BackendMalformedResponse, "unexpected response format"});
}

std::string HttpBackend::request_body(const std::vector<ChatMessage>& messages) const {
    return util::dump_json(build_request(messages));
}

Expected<std::string> HttpBackend::generate(const std::vector<ChatMessage>& messages) {
    const std::string body = request_body(messages);
    OWL_LOG_DEBUG("generation request: %zu messages to %s", messages.size(), endpoint_.c_str());

    auto response = http_.post_json(endpoint_, body, {}, timeouts_);
    if (!response) {
        if (response.error().code == ErrorCode::FetchTimeout) {
            OWL_LOG_WARN("generation backend timed out after %lld ms",
                         static_cast<long long>(timeouts_.total.count()));
            return tl::unexpected(Error{
                ErrorCode::BackendTimeout,
                "request timed out (model is taking too long)",
                endpoint_
            });
        }
        OWL_LOG_WARN("generation backend unreachable: %s", response.error().message.c_str());
        return tl::unexpected(Error{
            ErrorCode::BackendRequestFailed,
            "request failed: " + response.error().message,
            endpoint_
        });
    }

    if (!response->ok()) {
        OWL_LOG_WARN("generation backend returned HTTP %ld", response->status);
        return tl::unexpected(Error{
            ErrorCode::BackendRequestFailed,
            "request failed: HTTP " + std::to_string(response->status),
            endpoint_
        });
    }

    return parse_response(response->body);
}

} // namespace backend
} // namespace owl
