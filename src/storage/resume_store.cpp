#include "pqshare/storage/resume_store.hpp"
#include "pqshare/core/logger.hpp"
#include "pqshare/core/utils.hpp"
#include <sqlite3.h>
#include <algorithm>

namespace pqshare::storage {

using core::utils::TimeUtils;

namespace {
    // Finalizes on scope exit
    class Statement {
    public:
        Statement(sqlite3* db, const char* sql) : stmt_(nullptr) {
            if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
                LOG_ERROR("Failed to prepare statement: {}", sqlite3_errmsg(db));
                stmt_ = nullptr;
            }
        }
        ~Statement() {
            if (stmt_) {
                sqlite3_finalize(stmt_);
            }
        }
        Statement(const Statement&) = delete;
        Statement& operator=(const Statement&) = delete;

        sqlite3_stmt* get() const { return stmt_; }
        explicit operator bool() const { return stmt_ != nullptr; }

    private:
        sqlite3_stmt* stmt_;
    };

    std::string column_text(sqlite3_stmt* stmt, int column) {
        auto text = sqlite3_column_text(stmt, column);
        return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
    }

    std::vector<std::uint8_t> column_blob(sqlite3_stmt* stmt, int column) {
        auto data = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt, column));
        auto size = sqlite3_column_bytes(stmt, column);
        if (!data || size <= 0) {
            return {};
        }
        return std::vector<std::uint8_t>(data, data + size);
    }
}

SqliteResumeStore::SqliteResumeStore(std::filesystem::path database_path)
    : db_path_(std::move(database_path)), db_(nullptr) {
}

SqliteResumeStore::~SqliteResumeStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

bool SqliteResumeStore::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        return true;
    }

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int result = sqlite3_open_v2(db_path_.string().c_str(), &db_, flags, nullptr);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to open resume database {}: {}", db_path_.string(),
                  db_ ? sqlite3_errmsg(db_) : "out of memory");
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return false;
    }

    sqlite3_busy_timeout(db_, 5000);
    if (!create_tables()) {
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    LOG_DEBUG("Resume store ready at {}", db_path_.string());
    return true;
}

bool SqliteResumeStore::exec(const char* sql) {
    char* error_msg = nullptr;
    int result = sqlite3_exec(db_, sql, nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        LOG_ERROR("SQLite error: {}", error_msg ? error_msg : "unknown");
        sqlite3_free(error_msg);
        return false;
    }
    return true;
}

bool SqliteResumeStore::create_tables() {
    const char* create_sessions_table = R"(
        CREATE TABLE IF NOT EXISTS resume_sessions (
            session_id TEXT PRIMARY KEY,
            direction INTEGER NOT NULL,
            file_name TEXT NOT NULL,
            file_path TEXT NOT NULL,
            file_size INTEGER NOT NULL,
            chunk_size INTEGER NOT NULL,
            total_chunks INTEGER NOT NULL,
            file_hash BLOB NOT NULL,
            bitmap BLOB NOT NULL,
            resume_attempts INTEGER NOT NULL DEFAULT 0,
            download_count INTEGER NOT NULL DEFAULT 0,
            max_downloads INTEGER,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            expires_at INTEGER NOT NULL
        );
    )";

    const char* create_indexes = R"(
        CREATE INDEX IF NOT EXISTS idx_resume_expires_at ON resume_sessions(expires_at);
    )";

    return exec("PRAGMA journal_mode=WAL;") && exec(create_sessions_table) && exec(create_indexes);
}

bool SqliteResumeStore::write_locked(const PersistedSession& state) {
    const char* upsert_sql = R"(
        INSERT OR REPLACE INTO resume_sessions
        (session_id, direction, file_name, file_path, file_size, chunk_size, total_chunks,
         file_hash, bitmap, resume_attempts, download_count, max_downloads,
         created_at, updated_at, expires_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )";

    if (state.bitmap.size() != state.total_chunks) {
        LOG_ERROR("Refusing to persist session {}: bitmap size mismatch", state.session_id);
        return false;
    }

    Statement stmt(db_, upsert_sql);
    if (!stmt) {
        return false;
    }

    const auto& bitmap_bytes = state.bitmap.bytes();
    sqlite3_bind_text(stmt.get(), 1, state.session_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt.get(), 2, static_cast<int>(state.direction));
    sqlite3_bind_text(stmt.get(), 3, state.file_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 4, state.file_path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), 5, static_cast<sqlite3_int64>(state.file_size));
    sqlite3_bind_int64(stmt.get(), 6, state.chunk_size);
    sqlite3_bind_int64(stmt.get(), 7, state.total_chunks);
    sqlite3_bind_blob(stmt.get(), 8, state.file_hash.data(), static_cast<int>(state.file_hash.size()), SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt.get(), 9, bitmap_bytes.data(), static_cast<int>(bitmap_bytes.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), 10, state.resume_attempts);
    sqlite3_bind_int64(stmt.get(), 11, state.download_count);
    if (state.max_downloads) {
        sqlite3_bind_int64(stmt.get(), 12, *state.max_downloads);
    } else {
        sqlite3_bind_null(stmt.get(), 12);
    }
    sqlite3_bind_int64(stmt.get(), 13, TimeUtils::to_unix_ms(state.created_at));
    sqlite3_bind_int64(stmt.get(), 14, TimeUtils::to_unix_ms(state.updated_at));
    sqlite3_bind_int64(stmt.get(), 15, TimeUtils::to_unix_ms(state.expires_at));

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        LOG_ERROR("Failed to persist session {}: {}", state.session_id, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::optional<PersistedSession> SqliteResumeStore::read_locked(const std::string& session_id) {
    const char* select_sql = R"(
        SELECT direction, file_name, file_path, file_size, chunk_size, total_chunks,
               file_hash, bitmap, resume_attempts, download_count, max_downloads,
               created_at, updated_at, expires_at
        FROM resume_sessions WHERE session_id = ?;
    )";

    Statement stmt(db_, select_sql);
    if (!stmt) {
        return std::nullopt;
    }

    sqlite3_bind_text(stmt.get(), 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }

    PersistedSession state;
    state.session_id = session_id;
    state.direction = sqlite3_column_int(stmt.get(), 0) == 0 ? core::TransferDirection::SEND
                                                              : core::TransferDirection::RECEIVE;
    state.file_name = column_text(stmt.get(), 1);
    state.file_path = column_text(stmt.get(), 2);
    state.file_size = static_cast<std::uint64_t>(sqlite3_column_int64(stmt.get(), 3));
    state.chunk_size = static_cast<std::uint32_t>(sqlite3_column_int64(stmt.get(), 4));
    state.total_chunks = static_cast<std::uint32_t>(sqlite3_column_int64(stmt.get(), 5));

    auto hash_bytes = column_blob(stmt.get(), 6);
    if (hash_bytes.size() != state.file_hash.size()) {
        LOG_WARN("Discarding corrupt resume record {} (file hash)", session_id);
        return std::nullopt;
    }
    std::copy(hash_bytes.begin(), hash_bytes.end(), state.file_hash.begin());

    auto bitmap = ChunkBitmap::from_bytes(state.total_chunks, column_blob(stmt.get(), 7));
    if (!bitmap) {
        LOG_WARN("Discarding corrupt resume record {} (bitmap)", session_id);
        return std::nullopt;
    }
    state.bitmap = std::move(*bitmap);

    state.resume_attempts = static_cast<std::uint32_t>(sqlite3_column_int64(stmt.get(), 8));
    state.download_count = static_cast<std::uint32_t>(sqlite3_column_int64(stmt.get(), 9));
    if (sqlite3_column_type(stmt.get(), 10) != SQLITE_NULL) {
        state.max_downloads = static_cast<std::uint32_t>(sqlite3_column_int64(stmt.get(), 10));
    }
    state.created_at = TimeUtils::from_unix_ms(sqlite3_column_int64(stmt.get(), 11));
    state.updated_at = TimeUtils::from_unix_ms(sqlite3_column_int64(stmt.get(), 12));
    state.expires_at = TimeUtils::from_unix_ms(sqlite3_column_int64(stmt.get(), 13));
    return state;
}

bool SqliteResumeStore::put(const PersistedSession& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return false;
    }
    return write_locked(state);
}

std::optional<PersistedSession> SqliteResumeStore::get(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return std::nullopt;
    }
    return read_locked(session_id);
}

bool SqliteResumeStore::remove(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return false;
    }

    Statement stmt(db_, "DELETE FROM resume_sessions WHERE session_id = ?;");
    if (!stmt) {
        return false;
    }

    sqlite3_bind_text(stmt.get(), 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
    return sqlite3_step(stmt.get()) == SQLITE_DONE;
}

std::vector<std::string> SqliteResumeStore::list_active(core::WallClock::time_point now) {
    std::vector<std::string> ids;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return ids;
    }

    Statement stmt(db_, "SELECT session_id FROM resume_sessions WHERE expires_at > ? ORDER BY updated_at DESC;");
    if (!stmt) {
        return ids;
    }

    sqlite3_bind_int64(stmt.get(), 1, TimeUtils::to_unix_ms(now));
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        ids.push_back(column_text(stmt.get(), 0));
    }
    return ids;
}

bool SqliteResumeStore::update(const std::string& session_id, const Mutator& mutate) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return false;
    }

    // IMMEDIATE takes the write lock up front so concurrent processes serialize
    if (!exec("BEGIN IMMEDIATE;")) {
        return false;
    }

    auto state = read_locked(session_id);
    if (!state || !mutate(*state) || state->session_id != session_id || !write_locked(*state)) {
        exec("ROLLBACK;");
        return false;
    }

    return exec("COMMIT;");
}

size_t SqliteResumeStore::purge_expired(core::WallClock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return 0;
    }

    Statement stmt(db_, "DELETE FROM resume_sessions WHERE expires_at <= ?;");
    if (!stmt) {
        return 0;
    }

    sqlite3_bind_int64(stmt.get(), 1, TimeUtils::to_unix_ms(now));
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return 0;
    }

    auto removed = static_cast<size_t>(sqlite3_changes(db_));
    if (removed > 0) {
        LOG_INFO("Purged {} expired resume records", removed);
    }
    return removed;
}

size_t SqliteResumeStore::count() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return 0;
    }

    Statement stmt(db_, "SELECT COUNT(*) FROM resume_sessions;");
    if (!stmt || sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return 0;
    }
    return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
}

}
