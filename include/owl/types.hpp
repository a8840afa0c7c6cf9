#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <tl/expected.hpp>

namespace owl {

// ============================================================================
// Message Types
// ============================================================================

/**
 * @brief Message role in conversation flow
 *
 * System instructions are never stored; they are rebuilt for every
 * generation call and only exist on the wire (see backend::ChatMessage).
 */
enum class Role {
    User,       ///< Input from the end user
    Assistant,  ///< Model-generated response
    Tool        ///< Result from tool execution
};

[[nodiscard]] inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::Tool: return "tool";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<Role> role_from_string(const std::string& name) {
    if (name == "user") return Role::User;
    if (name == "assistant") return Role::Assistant;
    if (name == "tool") return Role::Tool;
    return std::nullopt;
}

/**
 * @brief Single message in conversation history
 *
 * Value type representing one turn in the conversation. Tool messages carry
 * the name of the tool that produced them and the correlation token minted
 * when the tool was dispatched; both fields stay empty for other roles.
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct Message {
    Role role;                                 ///< Message role (user/assistant/tool)
    std::string text;                          ///< UTF-8 text content
    std::optional<std::string> tool_name;      ///< Producing tool (tool messages only)
    std::optional<std::string> tool_call_id;   ///< Dispatch correlation token (tool messages only)

    // Factory methods
    static Message user(std::string text) {
        return Message{Role::User, std::move(text), std::nullopt, std::nullopt};
    }

    static Message assistant(std::string text) {
        return Message{Role::Assistant, std::move(text), std::nullopt, std::nullopt};
    }

    static Message tool(std::string text, std::string tool_name, std::string tool_call_id) {
        return Message{Role::Tool, std::move(text), std::move(tool_name), std::move(tool_call_id)};
    }

    // Equality for testing
    bool operator==(const Message& other) const {
        return role == other.role &&
               text == other.text &&
               tool_name == other.tool_name &&
               tool_call_id == other.tool_call_id;
    }

    bool operator!=(const Message& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// Error Types
// ============================================================================

/**
 * @brief Error codes organized by category range
 *
 * Error codes are grouped into ranges by category:
 * - 100-199: Configuration errors
 * - 200-299: Generation backend errors
 * - 300-399: Turn engine errors
 * - 400-499: History persistence errors
 * - 500-599: Tool system errors
 * - 600-699: Retrieval errors (search, fetch, reference sources)
 */
enum class ErrorCode {
    // Configuration errors (100-199)
    InvalidConfig = 100,
    MissingCredentials = 101,

    // Backend errors (200-299)
    BackendRequestFailed = 200,
    BackendTimeout = 201,
    BackendMalformedResponse = 202,

    // Engine errors (300-399)
    NoTerminalAnswer = 300,
    InvalidMessageSequence = 301,
    InvalidRequest = 302,

    // Persistence errors (400-499)
    StoreOpenFailed = 400,
    StoreWriteFailed = 401,
    StoreReadFailed = 402,

    // Tool errors (500-599)
    ToolNotFound = 500,
    ToolExecutionFailed = 501,
    InvalidToolArguments = 502,

    // Retrieval errors (600-699)
    SearchFailed = 600,
    FetchFailed = 601,
    FetchTimeout = 602,
    ReferenceLookupFailed = 603,

    // Unknown
    Unknown = 999
};

/**
 * @brief Error information with code, message, and optional context
 *
 * Value type representing a library error. Used with tl::expected for
 * composable error handling without exceptions.
 */
struct Error {
    ErrorCode code;                      ///< Categorized error code
    std::string message;                 ///< Human-readable error description
    std::optional<std::string> context;  ///< Additional context (e.g., URLs, paths)

    Error(ErrorCode code, std::string message, std::optional<std::string> context = std::nullopt)
        : code(code), message(std::move(message)), context(std::move(context)) {}

    std::string to_string() const {
        std::string result = "[" + std::to_string(static_cast<int>(code)) + "] " + message;
        if (context.has_value()) {
            result += " | Context: " + *context;
        }
        return result;
    }
};

// Expected type alias
template<typename T>
using Expected = tl::expected<T, Error>;

// ============================================================================
// Turn Types
// ============================================================================

/**
 * @brief Per-call turn configuration
 *
 * Threaded through a single turn invocation; never stored on the agent, so
 * concurrent turns for different users cannot observe each other's flags.
 */
struct TurnOptions {
    bool search_enabled = false;   ///< Advertise the web lookup tool for this call

    bool operator==(const TurnOptions& other) const {
        return search_enabled == other.search_enabled;
    }

    bool operator!=(const TurnOptions& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Terminal value of one turn
 *
 * Produced exactly once, when the state machine reaches Done.
 */
struct TurnResult {
    std::string text;                 ///< Final answer shown to the user
    bool truncated = false;           ///< True if the tool round-trip bound was hit
    int iterations = 0;               ///< Tool round trips performed
    std::vector<Message> messages;    ///< Assistant/tool messages produced during the turn
};

/**
 * @brief Reply envelope for an inbound chat request.
 */
struct Reply {
    std::string response;

    bool operator==(const Reply& other) const {
        return response == other.response;
    }

    bool operator!=(const Reply& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// Agent Configuration
// ============================================================================

/**
 * @brief Complete configuration for Agent initialization
 *
 * Value type holding collaborator endpoints, credentials, timeouts and
 * turn limits. Must be validated via validate() before use.
 *
 * Search credentials are optional here: their absence is reported by the
 * knowledge resolver when a query actually needs web search.
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct Config {
    // Generation backend
    std::string backend_url = "http://localhost:11434";                     ///< OpenAI-compatible server root
    std::string model = "qwen3:1.7b";                                       ///< Model name sent with each request
    std::chrono::milliseconds connect_timeout{5000};                        ///< TCP/TLS connect timeout
    std::chrono::milliseconds generation_timeout{120000};                   ///< Read timeout for generation calls

    // Web lookup
    std::optional<std::string> google_api_key;                              ///< Custom Search API key
    std::optional<std::string> google_cse_id;                               ///< Custom Search engine id
    std::chrono::milliseconds fetch_timeout{8000};                          ///< Per-page fetch timeout
    std::chrono::milliseconds reference_timeout{6000};                      ///< Wikipedia/Wikidata lookups

    // Conversation history
    std::optional<std::string> history_db_path;                             ///< SQLite file; in-process store when unset
    std::chrono::seconds history_ttl{std::chrono::hours(24 * 7)};           ///< Inactivity expiry per user

    // Turn limits
    int max_tool_iterations = 5;                                            ///< Tool round trips per turn

    // Logging
    std::string log_level = "info";                                         ///< debug | info | warn | error

    // Validation
    Expected<void> validate() const {
        if (backend_url.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Backend URL cannot be empty"});
        }
        if (model.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Model name cannot be empty"});
        }
        if (connect_timeout.count() <= 0 || generation_timeout.count() <= 0 ||
            fetch_timeout.count() <= 0 || reference_timeout.count() <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Timeouts must be positive"});
        }
        if (max_tool_iterations <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "max_tool_iterations must be positive"});
        }
        if (history_ttl.count() <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "history_ttl must be positive"});
        }
        if (log_level != "debug" && log_level != "info" && log_level != "warn" && log_level != "error") {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Unknown log level", log_level});
        }
        return {};
    }

    bool has_search_credentials() const {
        return google_api_key.has_value() && !google_api_key->empty() &&
               google_cse_id.has_value() && !google_cse_id->empty();
    }

    // Equality for testing
    bool operator==(const Config& other) const {
        return backend_url == other.backend_url &&
               model == other.model &&
               connect_timeout == other.connect_timeout &&
               generation_timeout == other.generation_timeout &&
               google_api_key == other.google_api_key &&
               google_cse_id == other.google_cse_id &&
               fetch_timeout == other.fetch_timeout &&
               reference_timeout == other.reference_timeout &&
               history_db_path == other.history_db_path &&
               history_ttl == other.history_ttl &&
               max_tool_iterations == other.max_tool_iterations &&
               log_level == other.log_level;
    }

    bool operator!=(const Config& other) const {
        return !(*this == other);
    }
};

} // namespace owl
