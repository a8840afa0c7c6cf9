#pragma once

#include "../agent.hpp"
#include "../log.hpp"
#include "../types.hpp"
#include "../util/json.hpp"
#include "../util/text.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace owl {
namespace api {

/**
 * @brief JSON envelopes around Agent
 *
 * chat:    {"prompt": str, "search": bool | "true" | "false", "user_id"?: str}
 *          -> {"response": str}
 * history: {"user_id"?: str} -> [{"role": str, "text": str}, ...]
 * clear:   {"user_id"?: str} -> {"cleared": true}
 *
 * Any failure is returned as {"error": str, "code": int}; nothing throws.
 */
class RequestHandler {
public:
    explicit RequestHandler(Agent& agent) : agent_(agent) {}

    nlohmann::json handle_chat(const nlohmann::json& request) {
        if (!request.is_object()) {
            return error_body(Error{ErrorCode::InvalidRequest, "Request must be a JSON object"});
        }
        auto prompt_it = request.find("prompt");
        if (prompt_it == request.end() || !prompt_it->is_string()) {
            return error_body(Error{ErrorCode::InvalidRequest, "Missing string field 'prompt'"});
        }
        auto search = parse_search_flag(request);
        if (!search) {
            return error_body(search.error());
        }
        auto user_id = parse_user_id(request);
        if (!user_id) {
            return error_body(user_id.error());
        }

        auto reply = agent_.handle(prompt_it->get<std::string>(), *search, *user_id);
        if (!reply) {
            return error_body(reply.error());
        }
        return nlohmann::json{{"response", reply->response}};
    }

    nlohmann::json handle_history(const nlohmann::json& request) {
        auto user_id = parse_user_id(request);
        if (!user_id) {
            return error_body(user_id.error());
        }
        auto messages = agent_.history(*user_id);
        if (!messages) {
            return error_body(messages.error());
        }
        nlohmann::json out = nlohmann::json::array();
        for (const auto& message : *messages) {
            out.push_back({{"role", role_to_string(message.role)}, {"text", message.text}});
        }
        return out;
    }

    nlohmann::json handle_clear(const nlohmann::json& request) {
        auto user_id = parse_user_id(request);
        if (!user_id) {
            return error_body(user_id.error());
        }
        if (auto cleared = agent_.clear_history(*user_id); !cleared) {
            return error_body(cleared.error());
        }
        return nlohmann::json{{"cleared", true}};
    }

    /// Route on the "type" field: "chat", "history" or "clear".
    nlohmann::json dispatch(const nlohmann::json& request) {
        if (!request.is_object()) {
            return error_body(Error{ErrorCode::InvalidRequest, "Request must be a JSON object"});
        }
        auto type_it = request.find("type");
        std::string type = "chat";
        if (type_it != request.end() && !type_it->is_null()) {
            if (!type_it->is_string()) {
                return error_body(Error{ErrorCode::InvalidRequest, "Field 'type' must be a string", type_it->dump()});
            }
            type = type_it->get<std::string>();
        }
        if (type == "chat") return handle_chat(request);
        if (type == "history") return handle_history(request);
        if (type == "clear") return handle_clear(request);
        return error_body(Error{ErrorCode::InvalidRequest, "Unknown request type", type});
    }

    /// One JSON request line in, one compact JSON response line out.
    std::string handle_line(const std::string& line) {
        nlohmann::json request = nlohmann::json::parse(line, nullptr, false);
        if (request.is_discarded()) {
            return util::dump_json(error_body(Error{ErrorCode::InvalidRequest, "Malformed JSON request"}));
        }
        return util::dump_json(dispatch(request));
    }

    /**
     * @brief Read the search flag
     *
     * Accepts a JSON boolean or the strings "true"/"false" in any case.
     * Missing means false.
     */
    static Expected<bool> parse_search_flag(const nlohmann::json& request) {
        auto it = request.find("search");
        if (it == request.end() || it->is_null()) {
            return false;
        }
        if (it->is_boolean()) {
            return it->get<bool>();
        }
        if (it->is_string()) {
            const std::string value = util::to_lower(util::trim(it->get<std::string>()));
            if (value == "true") return true;
            if (value == "false") return false;
        }
        return tl::unexpected(Error{ErrorCode::InvalidRequest, "Field 'search' must be true or false", it->dump()});
    }

    static Expected<std::string> parse_user_id(const nlohmann::json& request) {
        if (!request.is_object()) {
            return tl::unexpected(Error{ErrorCode::InvalidRequest, "Request must be a JSON object"});
        }
        auto it = request.find("user_id");
        if (it == request.end() || it->is_null()) {
            return std::string("default");
        }
        if (!it->is_string() || it->get<std::string>().empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidRequest, "Field 'user_id' must be a non-empty string"});
        }
        return it->get<std::string>();
    }

    static nlohmann::json error_body(const Error& error) {
        OWL_LOG_WARN("request failed: %s", error.to_string().c_str());
        return nlohmann::json{
            {"error", error.message},
            {"code", static_cast<int>(error.code)}
        };
    }

private:
    Agent& agent_;
};

} // namespace api
} // namespace owl
