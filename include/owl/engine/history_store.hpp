#pragma once

#include "../log.hpp"
#include "../types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace owl {
namespace engine {

/// Wall clock used for session expiry; injectable for tests.
using HistoryClock = std::function<std::chrono::system_clock::time_point()>;

inline HistoryClock system_history_clock() {
    return [] { return std::chrono::system_clock::now(); };
}

// ============================================================================
// Message serialization
// ============================================================================

inline nlohmann::json message_to_json(const Message& message) {
    nlohmann::json j{
        {"role", role_to_string(message.role)},
        {"text", message.text}
    };
    if (message.tool_name) {
        j["tool_name"] = *message.tool_name;
    }
    if (message.tool_call_id) {
        j["tool_call_id"] = *message.tool_call_id;
    }
    return j;
}

inline Expected<Message> message_from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("role") || !j["role"].is_string() ||
        !j.contains("text") || !j["text"].is_string()) {
        return tl::unexpected(Error{ErrorCode::StoreReadFailed, "Malformed history record", j.dump()});
    }
    auto role = role_from_string(j["role"].get<std::string>());
    if (!role) {
        return tl::unexpected(Error{ErrorCode::StoreReadFailed, "Unknown role in history record", j.dump()});
    }
    Message message{*role, j["text"].get<std::string>(), std::nullopt, std::nullopt};
    if (j.contains("tool_name") && j["tool_name"].is_string()) {
        message.tool_name = j["tool_name"].get<std::string>();
    }
    if (j.contains("tool_call_id") && j["tool_call_id"].is_string()) {
        message.tool_call_id = j["tool_call_id"].get<std::string>();
    }
    return message;
}

// ============================================================================
// IHistoryStore
// ============================================================================

/**
 * @brief Per-user append-only message log with inactivity expiry
 *
 * Every successful append refreshes the user's expiry to now + TTL. Once a
 * session has expired it reads as empty and the next append starts a new
 * log.
 *
 * Implementations are internally synchronised; calls for different users
 * never interfere.
 */
class IHistoryStore {
public:
    virtual ~IHistoryStore() = default;

    /// Append messages in order, atomically per call.
    virtual Expected<void> append(const std::string& user_id, const std::vector<Message>& messages) = 0;

    /// Full ordered log for a user; empty if unknown or expired.
    virtual Expected<std::vector<Message>> read(const std::string& user_id) = 0;

    virtual Expected<void> clear(const std::string& user_id) = 0;

    /// Short name for logs ("sqlite", "memory").
    virtual const char* backend_name() const = 0;
};

// ============================================================================
// InMemoryHistoryStore
// ============================================================================

/**
 * @brief Process-local history store
 *
 * Used when no database is configured or it cannot be opened. Same expiry
 * semantics as the SQLite store; contents are lost on exit.
 */
class InMemoryHistoryStore : public IHistoryStore {
public:
    explicit InMemoryHistoryStore(std::chrono::seconds ttl = std::chrono::hours(24 * 7),
                                  HistoryClock clock = system_history_clock())
        : ttl_(ttl)
        , clock_(std::move(clock))
    {}

    Expected<void> append(const std::string& user_id, const std::vector<Message>& messages) override {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_();
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (it->second.expires_at <= now) {
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
        Session& session = sessions_[user_id];
        session.messages.insert(session.messages.end(), messages.begin(), messages.end());
        session.expires_at = now + ttl_;
        return {};
    }

    Expected<std::vector<Message>> read(const std::string& user_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(user_id);
        if (it == sessions_.end()) {
            return std::vector<Message>{};
        }
        if (it->second.expires_at <= clock_()) {
            sessions_.erase(it);
            return std::vector<Message>{};
        }
        return it->second.messages;
    }

    Expected<void> clear(const std::string& user_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.erase(user_id);
        return {};
    }

    const char* backend_name() const override { return "memory"; }

    /// Sessions currently held, expired ones included until the next append.
    size_t session_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sessions_.size();
    }

private:
    struct Session {
        std::vector<Message> messages;
        std::chrono::system_clock::time_point expires_at{};
    };

    std::chrono::seconds ttl_;
    HistoryClock clock_;
    std::unordered_map<std::string, Session> sessions_;
    mutable std::mutex mutex_;
};

/**
 * @brief Pick the history backend for a configuration
 *
 * SQLite when Config::history_db_path is set and the database opens;
 * otherwise (including on open failure, logged as a warning) the
 * in-memory store. Never fails.
 */
std::shared_ptr<IHistoryStore> open_history_store(const Config& config,
                                                  HistoryClock clock = system_history_clock());

} // namespace engine
} // namespace owl
