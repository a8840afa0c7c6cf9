#include "owl/engine/sqlite_history_store.hpp"
#include "owl/log.hpp"
#include "owl/util/json.hpp"

#include <nlohmann/json.hpp>

namespace owl {
namespace engine {

namespace {

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const {
        if (stmt != nullptr) {
            sqlite3_finalize(stmt);
        }
    }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

/// Rolls back an open transaction on scope exit unless commit() ran.
class TransactionGuard {
public:
    explicit TransactionGuard(sqlite3* db) : db_(db) {}
    ~TransactionGuard() {
        if (!committed_) {
            char* err_msg = nullptr;
            if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, &err_msg) != SQLITE_OK) {
                OWL_LOG_ERROR("history rollback failed: %s", err_msg != nullptr ? err_msg : "unknown");
                sqlite3_free(err_msg);
            }
        }
    }

    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

    void commit() { committed_ = true; }

private:
    sqlite3* db_;
    bool committed_ = false;
};

} // namespace

SqliteHistoryStore::SqliteHistoryStore(sqlite3* db, std::string db_path,
                                       std::chrono::seconds ttl, HistoryClock clock)
    : db_(db)
    , db_path_(std::move(db_path))
    , ttl_(ttl)
    , clock_(std::move(clock))
{}

SqliteHistoryStore::~SqliteHistoryStore() {
    if (db_ != nullptr) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Expected<std::shared_ptr<SqliteHistoryStore>> SqliteHistoryStore::open(
    const std::string& path, std::chrono::seconds ttl, HistoryClock clock) {
    if (path.empty()) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "History database path cannot be empty"});
    }

    sqlite3* db = nullptr;
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
        std::string message = "Failed to open history database";
        if (db != nullptr && sqlite3_errmsg(db) != nullptr) {
            message += std::string(": ") + sqlite3_errmsg(db);
        }
        if (db != nullptr) {
            sqlite3_close(db);
        }
        return tl::unexpected(Error{ErrorCode::StoreOpenFailed, std::move(message), path});
    }
    sqlite3_busy_timeout(db, 2000);

    auto instance = std::shared_ptr<SqliteHistoryStore>(
        new SqliteHistoryStore(db, path, ttl, std::move(clock)));
    auto init_result = instance->initialize_schema();
    if (!init_result) {
        return tl::unexpected(init_result.error());
    }
    return instance;
}

Expected<void> SqliteHistoryStore::initialize_schema() {
    auto sessions = exec(
        "CREATE TABLE IF NOT EXISTS history_sessions("
        "user_id TEXT PRIMARY KEY,"
        "expires_at INTEGER NOT NULL"
        ")", ErrorCode::StoreOpenFailed);
    if (!sessions) {
        return sessions;
    }

    auto messages = exec(
        "CREATE TABLE IF NOT EXISTS history_messages("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "user_id TEXT NOT NULL,"
        "payload TEXT NOT NULL"
        ")", ErrorCode::StoreOpenFailed);
    if (!messages) {
        return messages;
    }

    return exec(
        "CREATE INDEX IF NOT EXISTS history_messages_user ON history_messages(user_id, id)",
        ErrorCode::StoreOpenFailed);
}

Expected<void> SqliteHistoryStore::append(const std::string& user_id, const std::vector<Message>& messages) {
    std::vector<std::string> payloads;
    payloads.reserve(messages.size());
    for (const auto& message : messages) {
        payloads.push_back(util::dump_json(message_to_json(message)));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const long long now = now_ms();

    if (auto begin = exec("BEGIN IMMEDIATE", ErrorCode::StoreWriteFailed); !begin) {
        return begin;
    }
    TransactionGuard transaction(db_);

    if (auto purged = purge_if_expired(user_id, now); !purged) {
        return tl::unexpected(purged.error());
    }

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, "INSERT INTO history_messages(user_id, payload) VALUES (?1, ?2)",
                           -1, &raw, nullptr) != SQLITE_OK) {
        return tl::unexpected(make_sql_error(ErrorCode::StoreWriteFailed, "Failed to prepare history insert"));
    }
    Statement insert(raw);

    for (const auto& payload : payloads) {
        sqlite3_bind_text(insert.get(), 1, user_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(insert.get(), 2, payload.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(insert.get()) != SQLITE_DONE) {
            return tl::unexpected(make_sql_error(ErrorCode::StoreWriteFailed, "Failed to insert history message"));
        }
        sqlite3_reset(insert.get());
        sqlite3_clear_bindings(insert.get());
    }

    raw = nullptr;
    if (sqlite3_prepare_v2(db_, "INSERT OR REPLACE INTO history_sessions(user_id, expires_at) VALUES (?1, ?2)",
                           -1, &raw, nullptr) != SQLITE_OK) {
        return tl::unexpected(make_sql_error(ErrorCode::StoreWriteFailed, "Failed to prepare session update"));
    }
    Statement touch(raw);
    const long long expires_at =
        now + std::chrono::duration_cast<std::chrono::milliseconds>(ttl_).count();
    sqlite3_bind_text(touch.get(), 1, user_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(touch.get(), 2, static_cast<sqlite3_int64>(expires_at));
    if (sqlite3_step(touch.get()) != SQLITE_DONE) {
        return tl::unexpected(make_sql_error(ErrorCode::StoreWriteFailed, "Failed to refresh session expiry"));
    }

    if (auto commit = exec("COMMIT", ErrorCode::StoreWriteFailed); !commit) {
        return commit;
    }
    transaction.commit();
    return {};
}

Expected<std::vector<Message>> SqliteHistoryStore::read(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (auto purged = purge_if_expired(user_id, now_ms()); !purged) {
        return tl::unexpected(Error{ErrorCode::StoreReadFailed, purged.error().message, db_path_});
    }

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT payload FROM history_messages WHERE user_id = ?1 ORDER BY id",
                           -1, &raw, nullptr) != SQLITE_OK) {
        return tl::unexpected(make_sql_error(ErrorCode::StoreReadFailed, "Failed to prepare history query"));
    }
    Statement select(raw);
    sqlite3_bind_text(select.get(), 1, user_id.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<Message> messages;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(select.get())) == SQLITE_ROW) {
        const char* payload = reinterpret_cast<const char*>(sqlite3_column_text(select.get(), 0));
        nlohmann::json j = nlohmann::json::parse(payload != nullptr ? payload : "", nullptr, false);
        if (j.is_discarded()) {
            return tl::unexpected(Error{ErrorCode::StoreReadFailed, "Corrupt history record", db_path_});
        }
        auto message = message_from_json(j);
        if (!message) {
            return tl::unexpected(message.error());
        }
        messages.push_back(std::move(*message));
    }
    if (rc != SQLITE_DONE) {
        return tl::unexpected(make_sql_error(ErrorCode::StoreReadFailed, "Failed to read history"));
    }
    return messages;
}

Expected<void> SqliteHistoryStore::clear(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    for (const char* sql : {"DELETE FROM history_messages WHERE user_id = ?1",
                            "DELETE FROM history_sessions WHERE user_id = ?1"}) {
        sqlite3_stmt* raw = nullptr;
        if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK) {
            return tl::unexpected(make_sql_error(ErrorCode::StoreWriteFailed, "Failed to prepare history delete"));
        }
        Statement stmt(raw);
        sqlite3_bind_text(stmt.get(), 1, user_id.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            return tl::unexpected(make_sql_error(ErrorCode::StoreWriteFailed, "Failed to clear history"));
        }
    }
    return {};
}

// Caller holds mutex_.
Expected<void> SqliteHistoryStore::purge_if_expired(const std::string& user_id, long long now) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT expires_at FROM history_sessions WHERE user_id = ?1",
                           -1, &raw, nullptr) != SQLITE_OK) {
        return tl::unexpected(make_sql_error(ErrorCode::StoreWriteFailed, "Failed to prepare expiry query"));
    }
    Statement select(raw);
    sqlite3_bind_text(select.get(), 1, user_id.c_str(), -1, SQLITE_TRANSIENT);

    const int rc = sqlite3_step(select.get());
    if (rc == SQLITE_DONE) {
        return {};
    }
    if (rc != SQLITE_ROW) {
        return tl::unexpected(make_sql_error(ErrorCode::StoreWriteFailed, "Failed to read session expiry"));
    }
    const long long expires_at = static_cast<long long>(sqlite3_column_int64(select.get(), 0));
    select.reset();
    if (expires_at > now) {
        return {};
    }

    OWL_LOG_DEBUG("history for '%s' expired; purging", user_id.c_str());
    for (const char* sql : {"DELETE FROM history_messages WHERE user_id = ?1",
                            "DELETE FROM history_sessions WHERE user_id = ?1"}) {
        raw = nullptr;
        if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK) {
            return tl::unexpected(make_sql_error(ErrorCode::StoreWriteFailed, "Failed to prepare purge"));
        }
        Statement stmt(raw);
        sqlite3_bind_text(stmt.get(), 1, user_id.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            return tl::unexpected(make_sql_error(ErrorCode::StoreWriteFailed, "Failed to purge expired history"));
        }
    }
    return {};
}

Expected<void> SqliteHistoryStore::exec(const char* sql, ErrorCode code) {
    char* err_msg = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
        std::string message = err_msg != nullptr ? err_msg : "Unknown SQLite error";
        sqlite3_free(err_msg);
        return tl::unexpected(Error{code, std::move(message), db_path_});
    }
    return {};
}

long long SqliteHistoryStore::now_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(clock_().time_since_epoch()).count();
}

Error SqliteHistoryStore::make_sql_error(ErrorCode code, const std::string& prefix) const {
    return Error{code, prefix + ": " + sqlite3_errmsg(db_), db_path_};
}

std::shared_ptr<IHistoryStore> open_history_store(const Config& config, HistoryClock clock) {
    if (config.history_db_path && !config.history_db_path->empty()) {
        auto store = SqliteHistoryStore::open(*config.history_db_path, config.history_ttl, clock);
        if (store) {
            OWL_LOG_INFO("conversation history: sqlite (%s)", config.history_db_path->c_str());
            return *store;
        }
        OWL_LOG_WARN("history database unavailable (%s); falling back to in-memory store",
                     store.error().to_string().c_str());
    } else {
        OWL_LOG_INFO("conversation history: in-memory");
    }
    return std::make_shared<InMemoryHistoryStore>(config.history_ttl, std::move(clock));
}

} // namespace engine
} // namespace owl
