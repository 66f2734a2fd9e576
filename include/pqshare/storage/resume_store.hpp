#pragma once

#include "pqshare/core/types.hpp"
#include "pqshare/crypto/crypto_types.hpp"
#include "pqshare/storage/chunk_bitmap.hpp"
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace pqshare::storage {

// Everything needed to rebuild a paused session; key material is never stored
struct PersistedSession {
    std::string session_id;
    core::TransferDirection direction = core::TransferDirection::SEND;
    std::string file_name;
    std::string file_path;       // source file when sending, output file when receiving
    std::uint64_t file_size = 0;
    std::uint32_t chunk_size = 0;
    std::uint32_t total_chunks = 0;
    crypto::Digest file_hash{};
    ChunkBitmap bitmap;
    std::uint32_t resume_attempts = 0;
    std::uint32_t download_count = 0;
    std::optional<std::uint32_t> max_downloads;
    core::WallClock::time_point created_at{};
    core::WallClock::time_point updated_at{};
    core::WallClock::time_point expires_at{};
};

// Durable store boundary. Implementations are atomic per session id.
class ResumeStore {
public:
    using Mutator = std::function<bool(PersistedSession&)>;

    virtual ~ResumeStore() = default;

    virtual bool put(const PersistedSession& state) = 0;
    virtual std::optional<PersistedSession> get(const std::string& session_id) = 0;
    virtual bool remove(const std::string& session_id) = 0;
    virtual std::vector<std::string> list_active(core::WallClock::time_point now) = 0;

    // Read-then-replace in one transaction; the mutator returns false to abort
    virtual bool update(const std::string& session_id, const Mutator& mutate) = 0;

    virtual size_t purge_expired(core::WallClock::time_point now) = 0;
};

class SqliteResumeStore : public ResumeStore {
public:
    // ":memory:" gives a private in-memory database
    explicit SqliteResumeStore(std::filesystem::path database_path);
    ~SqliteResumeStore() override;

    SqliteResumeStore(const SqliteResumeStore&) = delete;
    SqliteResumeStore& operator=(const SqliteResumeStore&) = delete;

    bool initialize();

    bool put(const PersistedSession& state) override;
    std::optional<PersistedSession> get(const std::string& session_id) override;
    bool remove(const std::string& session_id) override;
    std::vector<std::string> list_active(core::WallClock::time_point now) override;
    bool update(const std::string& session_id, const Mutator& mutate) override;
    size_t purge_expired(core::WallClock::time_point now) override;

    size_t count();

private:
    bool create_tables();
    bool exec(const char* sql);
    bool write_locked(const PersistedSession& state);
    std::optional<PersistedSession> read_locked(const std::string& session_id);

    std::filesystem::path db_path_;
    sqlite3* db_;
    std::mutex mutex_;
};

}
