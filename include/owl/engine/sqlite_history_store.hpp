#pragma once

#include "history_store.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace owl {
namespace engine {

/**
 * @brief Durable SQLite-backed conversation history.
 *
 * Schema:
 * - history_sessions(user_id PRIMARY KEY, expires_at): expiry in epoch ms
 * - history_messages(id, user_id, payload): one JSON message per row,
 *   ordered by id
 *
 * Each append() runs in one transaction. Expired sessions are purged
 * lazily on read and append.
 */
class SqliteHistoryStore : public IHistoryStore {
public:
    ~SqliteHistoryStore() override;

    SqliteHistoryStore(const SqliteHistoryStore&) = delete;
    SqliteHistoryStore& operator=(const SqliteHistoryStore&) = delete;

    /**
     * @brief Open (or create) a history database
     *
     * @param path File path, or ":memory:" for a private in-memory database
     * @return ErrorCode::InvalidConfig for an empty path,
     *         ErrorCode::StoreOpenFailed if SQLite cannot open it or
     *         create the schema
     */
    static Expected<std::shared_ptr<SqliteHistoryStore>> open(
        const std::string& path,
        std::chrono::seconds ttl = std::chrono::hours(24 * 7),
        HistoryClock clock = system_history_clock());

    Expected<void> append(const std::string& user_id, const std::vector<Message>& messages) override;
    Expected<std::vector<Message>> read(const std::string& user_id) override;
    Expected<void> clear(const std::string& user_id) override;

    const char* backend_name() const override { return "sqlite"; }

    const std::string& path() const { return db_path_; }

private:
    SqliteHistoryStore(sqlite3* db, std::string db_path, std::chrono::seconds ttl, HistoryClock clock);

    Expected<void> initialize_schema();
    Expected<void> exec(const char* sql, ErrorCode code);
    Expected<void> purge_if_expired(const std::string& user_id, long long now_ms);
    long long now_ms() const;
    Error make_sql_error(ErrorCode code, const std::string& prefix) const;

    sqlite3* db_ = nullptr;
    std::string db_path_;
    std::chrono::seconds ttl_;
    HistoryClock clock_;
    mutable std::mutex mutex_;
};

} // namespace engine
} // namespace owl
