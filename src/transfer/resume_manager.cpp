#include "pqshare/transfer/resume_manager.hpp"
#include "pqshare/core/logger.hpp"

namespace pqshare::transfer {

ResumeManager::ResumeManager(std::shared_ptr<storage::ResumeStore> store, core::EngineSettings settings)
    : store_(std::move(store))
    , settings_(std::move(settings)) {
}

std::vector<ResumableTransfer> ResumeManager::list_resumable(core::WallClock::time_point now) {
    std::vector<ResumableTransfer> transfers;
    for (const auto& session_id : store_->list_active(now)) {
        auto record = store_->get(session_id);
        if (!record || !check_record(*record, now)) {
            continue;
        }

        ResumableTransfer transfer;
        transfer.session_id = record->session_id;
        transfer.direction = record->direction;
        transfer.file_name = record->file_name;
        transfer.file_size = record->file_size;
        transfer.chunks_done = record->bitmap.count();
        transfer.total_chunks = record->total_chunks;
        transfer.resume_attempts = record->resume_attempts;
        transfer.updated_at = record->updated_at;
        transfer.expires_at = record->expires_at;
        transfers.push_back(std::move(transfer));
    }
    return transfers;
}

TransferResult ResumeManager::check_eligibility(const std::string& session_id, core::WallClock::time_point now) {
    auto record = store_->get(session_id);
    if (!record) {
        // Completed, cancelled and failed sessions leave no record behind
        return TransferResult(TransferError::RESUME_EXPIRED, "No resumable session " + session_id);
    }
    auto result = check_record(*record, now);
    if (result.error == TransferError::RESUME_EXPIRED) {
        forget(session_id);
    }
    return result;
}

std::unique_ptr<TransferSession> ResumeManager::restore(const std::string& session_id, SessionOptions options,
                                                        core::WallClock::time_point now, TransferResult& result) {
    auto record = store_->get(session_id);
    if (!record) {
        result = TransferResult(TransferError::RESUME_EXPIRED, "No resumable session " + session_id);
        return nullptr;
    }

    result = check_record(*record, now);
    if (!result) {
        LOG_WARN("Session {} cannot be resumed: {}", session_id, result.message);
        if (result.error == TransferError::RESUME_EXPIRED) {
            forget(session_id);
        }
        return nullptr;
    }

    options.settings = settings_;
    options.store = store_;
    auto session = TransferSession::restore(*record, std::move(options));
    if (session->is_terminal()) {
        const auto& failure = session->get_failure();
        result = failure ? TransferResult(failure->error, failure->reason)
                         : TransferResult(TransferError::INVALID_STATE, "Session could not be restored");
        return nullptr;
    }
    return session;
}

bool ResumeManager::forget(const std::string& session_id) {
    return store_->remove(session_id);
}

size_t ResumeManager::purge_expired(core::WallClock::time_point now) {
    return store_->purge_expired(now);
}

TransferResult ResumeManager::check_record(const storage::PersistedSession& record,
                                           core::WallClock::time_point now) {
    if (now >= record.expires_at || now >= record.created_at + settings_.resume_expiry) {
        return TransferResult(TransferError::RESUME_EXPIRED, "Session expired");
    }
    if (record.resume_attempts >= settings_.resume_max_attempts) {
        return TransferResult(TransferError::RESUME_EXHAUSTED,
                              "Resume attempted " + std::to_string(record.resume_attempts) + " times");
    }
    if (record.bitmap.size() != record.total_chunks) {
        return TransferResult(TransferError::INVALID_METADATA, "Corrupt resume record");
    }
    return TransferResult();
}

}
