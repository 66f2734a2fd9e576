#pragma once

#include "pqshare/transfer/session_task.hpp"
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace pqshare::transfer {

struct Recipient {
    std::string id;             // 1..64 of [A-Za-z0-9_-]
    std::string name;           // 1..100 of [A-Za-z0-9 _-]
    std::optional<std::uint64_t> bandwidth_limit;  // overrides the group default
};

enum class GroupOutcome {
    COMPLETED,
    PARTIAL,
    FAILED
};

enum class RecipientStatus {
    PENDING,
    TRANSFERRING,
    SUCCEEDED,
    FAILED
};

const char* to_string(GroupOutcome outcome);
const char* to_string(RecipientStatus status);

struct RecipientFailure {
    std::string recipient_id;
    TransferError error = TransferError::RECIPIENT_FAILURE;
    std::string reason;
};

struct RecipientReport {
    std::string recipient_id;
    std::string name;
    std::string session_id;
    RecipientStatus status = RecipientStatus::PENDING;
    double progress = 0.0;
    std::optional<SessionFailure> failure;
    std::chrono::milliseconds elapsed{0};
};

struct GroupResult {
    std::string group_id;
    GroupOutcome outcome = GroupOutcome::FAILED;
    std::vector<std::string> succeeded;
    std::vector<RecipientFailure> failed;
    std::vector<RecipientReport> recipients;
    std::chrono::milliseconds elapsed{0};
};

struct GroupOptions {
    core::EngineSettings settings;
    std::shared_ptr<EventQueue> events;
    std::shared_ptr<storage::ResumeStore> store;
    std::uint64_t bandwidth_limit_per_recipient = 0;
};

// Each recipient needs its own file handle
using SourceFactory = std::function<storage::Chunker()>;

// Returns nullptr when the recipient cannot be reached. The returned channel
// may already be reading: receivers stay silent until the sender's public key.
// Called concurrently, once per recipient, from the recipients' setup threads.
using ChannelFactory = std::function<std::shared_ptr<network::MessageChannel>(const Recipient&)>;

// Fans one file out to independent per-recipient sessions. The file is hashed
// once; each recipient is then connected and started on its own setup thread,
// so a slow or unreachable recipient never holds up the others. A recipient
// that fails is recorded and reported; the others carry on untouched.
class GroupOrchestrator {
public:
    static constexpr std::size_t MAX_RECIPIENT_ID_LENGTH = 64;
    static constexpr std::size_t MAX_RECIPIENT_NAME_LENGTH = 100;
    static constexpr std::chrono::milliseconds MONITOR_INTERVAL{50};

    explicit GroupOrchestrator(GroupOptions options);
    ~GroupOrchestrator();

    GroupOrchestrator(const GroupOrchestrator&) = delete;
    GroupOrchestrator& operator=(const GroupOrchestrator&) = delete;

    static bool is_valid_recipient_id(const std::string& id);
    static bool is_valid_recipient_name(const std::string& name);

    // Rejects the whole group before any session exists
    static TransferResult validate(const std::vector<Recipient>& recipients, std::uint32_t max_recipients);

    // Returns once the setup threads are launched; IO_ERROR when the source
    // cannot be hashed
    TransferResult start(SourceFactory source, std::string file_name, std::vector<Recipient> recipients,
                         const ChannelFactory& connect);

    // Monitors the recipients, emitting group events, until all are finished
    // or the timeout passes. Returns true when all are finished.
    bool wait(std::chrono::milliseconds timeout);

    void cancel();
    bool cancel_recipient(const std::string& recipient_id);

    double get_progress() const;
    GroupResult get_result() const;
    std::string get_group_id() const;

private:
    struct Member {
        Recipient recipient;
        std::unique_ptr<SessionTask> task;
        RecipientStatus status = RecipientStatus::PENDING;
        std::optional<SessionFailure> failure;
        std::string session_id;
        double progress = 0.0;
        core::TimePoint started_at{};
        std::chrono::milliseconds elapsed{0};
        bool cancel_requested = false;
        bool reported = false;
    };

    void setup_member(std::size_t index, SourceFactory source, ChannelFactory connect, crypto::Digest file_hash);
    void refresh_locked(core::TimePoint now);
    double progress_locked() const;
    bool all_finished_locked() const;
    void emit(TransferEvent event);

    GroupOptions options_;
    std::string group_id_;
    std::string file_name_;

    mutable std::mutex mutex_;
    std::condition_variable changed_;
    bool started_ = false;
    std::vector<Member> members_;
    std::vector<std::thread> setup_threads_;
    core::TimePoint started_at_{};
    std::optional<core::TimePoint> finished_at_;
    double last_reported_progress_ = -1.0;
    std::size_t last_reported_finished_ = 0;
};

}
