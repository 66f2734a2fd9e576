#pragma once

#include "pqshare/storage/resume_store.hpp"
#include "pqshare/transfer/transfer_session.hpp"
#include <memory>
#include <string>
#include <vector>

namespace pqshare::transfer {

struct ResumableTransfer {
    std::string session_id;
    core::TransferDirection direction = core::TransferDirection::SEND;
    std::string file_name;
    std::uint64_t file_size = 0;
    std::uint32_t chunks_done = 0;
    std::uint32_t total_chunks = 0;
    std::uint32_t resume_attempts = 0;
    core::WallClock::time_point updated_at{};
    core::WallClock::time_point expires_at{};
};

// Eligibility and restoration of paused sessions over the durable store
class ResumeManager {
public:
    ResumeManager(std::shared_ptr<storage::ResumeStore> store, core::EngineSettings settings);

    std::vector<ResumableTransfer> list_resumable(core::WallClock::time_point now);

    // NONE when the session may be resumed; expired records are removed here
    TransferResult check_eligibility(const std::string& session_id, core::WallClock::time_point now);

    // Rebuilds the session in Paused. On refusal returns nullptr and fills `result`.
    std::unique_ptr<TransferSession> restore(const std::string& session_id, SessionOptions options,
                                             core::WallClock::time_point now, TransferResult& result);

    bool forget(const std::string& session_id);
    size_t purge_expired(core::WallClock::time_point now);

    const std::shared_ptr<storage::ResumeStore>& get_store() const { return store_; }

private:
    TransferResult check_record(const storage::PersistedSession& record, core::WallClock::time_point now);

    std::shared_ptr<storage::ResumeStore> store_;
    core::EngineSettings settings_;
};

}
