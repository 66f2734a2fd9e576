#include "pqshare/transfer/group_orchestrator.hpp"
#include "pqshare/core/logger.hpp"
#include "pqshare/crypto/random.hpp"
#include <algorithm>
#include <cmath>
#include <set>

namespace pqshare::transfer {

namespace {

bool is_id_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
}

std::chrono::milliseconds since(core::TimePoint start, core::TimePoint end) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
}

}

const char* to_string(GroupOutcome outcome) {
    switch (outcome) {
        case GroupOutcome::COMPLETED: return "completed";
        case GroupOutcome::PARTIAL: return "partial";
        case GroupOutcome::FAILED: return "failed";
    }
    return "unknown";
}

const char* to_string(RecipientStatus status) {
    switch (status) {
        case RecipientStatus::PENDING: return "pending";
        case RecipientStatus::TRANSFERRING: return "transferring";
        case RecipientStatus::SUCCEEDED: return "succeeded";
        case RecipientStatus::FAILED: return "failed";
    }
    return "unknown";
}

GroupOrchestrator::GroupOrchestrator(GroupOptions options)
    : options_(std::move(options)) {
}

GroupOrchestrator::~GroupOrchestrator() {
    cancel();
    for (auto& thread : setup_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    std::lock_guard<std::mutex> lock(mutex_);
    members_.clear();
}

bool GroupOrchestrator::is_valid_recipient_id(const std::string& id) {
    if (id.empty() || id.size() > MAX_RECIPIENT_ID_LENGTH) {
        return false;
    }
    return std::all_of(id.begin(), id.end(), is_id_char);
}

bool GroupOrchestrator::is_valid_recipient_name(const std::string& name) {
    if (name.empty() || name.size() > MAX_RECIPIENT_NAME_LENGTH) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) { return is_id_char(c) || c == ' '; });
}

TransferResult GroupOrchestrator::validate(const std::vector<Recipient>& recipients, std::uint32_t max_recipients) {
    if (recipients.empty()) {
        return TransferResult(TransferError::INVALID_RECIPIENT, "At least one recipient is required");
    }
    if (recipients.size() > max_recipients) {
        return TransferResult(TransferError::INVALID_RECIPIENT,
                              "At most " + std::to_string(max_recipients) + " recipients are allowed");
    }

    std::set<std::string> seen;
    for (size_t i = 0; i < recipients.size(); ++i) {
        const auto& recipient = recipients[i];
        if (!is_valid_recipient_id(recipient.id)) {
            return TransferResult(TransferError::INVALID_RECIPIENT,
                                  "Recipient " + std::to_string(i) + " has an invalid id");
        }
        if (!is_valid_recipient_name(recipient.name)) {
            return TransferResult(TransferError::INVALID_RECIPIENT,
                                  "Recipient " + recipient.id + " has an invalid name");
        }
        if (!seen.insert(recipient.id).second) {
            return TransferResult(TransferError::INVALID_RECIPIENT, "Duplicate recipient " + recipient.id);
        }
    }
    return TransferResult();
}

TransferResult GroupOrchestrator::start(SourceFactory source, std::string file_name,
                                        std::vector<Recipient> recipients, const ChannelFactory& connect) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_) {
            return TransferResult(TransferError::INVALID_STATE, "Group transfer already started");
        }

        auto validation = validate(recipients, options_.settings.group_max_recipients);
        if (!validation) {
            LOG_ERROR("Group transfer rejected: {}", validation.message);
            return validation;
        }

        started_ = true;
        group_id_ = crypto::SecureRandom::generate_session_id();
        file_name_ = std::move(file_name);
        started_at_ = core::Clock::now();
    }

    // Every recipient gets the same bytes, so one digest serves all sessions
    crypto::Digest file_hash{};
    auto reader = source();
    auto hashed = reader.open();
    if (hashed) {
        hashed = reader.compute_file_hash(file_hash);
    }
    if (!hashed) {
        LOG_ERROR("Group {}: cannot hash source: {}", group_id_, hashed.message);
        return TransferResult(TransferError::IO_ERROR, "Cannot hash source: " + hashed.message);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    LOG_INFO("Group {} sending to {} recipients", group_id_, recipients.size());
    for (auto& recipient : recipients) {
        Member member;
        member.recipient = std::move(recipient);
        member.started_at = core::Clock::now();
        members_.push_back(std::move(member));
    }
    for (std::size_t i = 0; i < members_.size(); ++i) {
        setup_threads_.emplace_back(&GroupOrchestrator::setup_member, this, i, source, connect, file_hash);
    }
    return TransferResult();
}

void GroupOrchestrator::setup_member(std::size_t index, SourceFactory source, ChannelFactory connect,
                                     crypto::Digest file_hash) {
    Recipient recipient;
    SessionOptions session_options;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& member = members_[index];
        if (member.cancel_requested) {
            member.status = RecipientStatus::FAILED;
            member.failure = SessionFailure{TransferError::CANCELLED, "Cancelled by user"};
            changed_.notify_all();
            return;
        }
        recipient = member.recipient;
        session_options.settings = options_.settings;
        session_options.events = options_.events;
        session_options.store = options_.store;
        session_options.bandwidth_limit = recipient.bandwidth_limit.value_or(options_.bandwidth_limit_per_recipient);
    }

    auto session = TransferSession::create_sender(source(), file_name_, std::move(session_options), file_hash);
    std::shared_ptr<network::MessageChannel> channel;
    if (!session->is_terminal()) {
        channel = connect(recipient);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& member = members_[index];
    member.session_id = session->get_session_id();
    if (session->is_terminal()) {
        member.status = RecipientStatus::FAILED;
        member.failure = session->get_failure();
    } else if (!channel) {
        LOG_WARN("Group {}: recipient {} unreachable", group_id_, recipient.id);
        session->cancel(core::Clock::now());
        member.status = RecipientStatus::FAILED;
        member.failure = SessionFailure{TransferError::CONNECTION_LOST, "Recipient unreachable"};
    } else if (member.cancel_requested) {
        session->cancel(core::Clock::now());
        channel->close();
        member.status = RecipientStatus::FAILED;
        member.failure = SessionFailure{TransferError::CANCELLED, "Cancelled by user"};
    } else {
        member.task = std::make_unique<SessionTask>(std::move(session), std::move(channel));
        member.status = RecipientStatus::TRANSFERRING;
        member.task->run();
    }
    changed_.notify_all();
}

bool GroupOrchestrator::wait(std::chrono::milliseconds timeout) {
    auto deadline = core::Clock::now() + timeout;
    while (true) {
        SessionTask* pending = nullptr;
        std::unique_lock<std::mutex> lock(mutex_);
        refresh_locked(core::Clock::now());
        if (all_finished_locked()) {
            return true;
        }
        for (auto& member : members_) {
            if (member.task && !member.reported) {
                pending = member.task.get();
                break;
            }
        }

        auto now = core::Clock::now();
        if (now >= deadline) {
            return false;
        }
        auto slice = std::min<std::chrono::milliseconds>(
            MONITOR_INTERVAL, std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
        if (!pending) {
            // Only setup threads are still working
            changed_.wait_for(lock, slice);
            continue;
        }
        lock.unlock();
        pending->wait(slice);
    }
}

void GroupOrchestrator::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& member : members_) {
        if (member.status == RecipientStatus::PENDING) {
            member.cancel_requested = true;
        } else if (member.task && !member.task->is_finished()) {
            member.task->cancel();
        }
    }
}

bool GroupOrchestrator::cancel_recipient(const std::string& recipient_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& member : members_) {
        if (member.recipient.id != recipient_id) {
            continue;
        }
        if (member.status == RecipientStatus::PENDING) {
            member.cancel_requested = true;
            return true;
        }
        if (member.task && !member.task->is_finished()) {
            member.task->cancel();
            return true;
        }
        return false;
    }
    return false;
}

double GroupOrchestrator::get_progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return progress_locked();
}

std::string GroupOrchestrator::get_group_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return group_id_;
}

GroupResult GroupOrchestrator::get_result() const {
    std::lock_guard<std::mutex> lock(mutex_);

    GroupResult result;
    result.group_id = group_id_;
    for (const auto& member : members_) {
        RecipientReport report;
        report.recipient_id = member.recipient.id;
        report.name = member.recipient.name;
        report.session_id = member.session_id;
        report.status = member.status;
        report.progress = member.progress;
        report.failure = member.failure;
        report.elapsed = member.reported ? member.elapsed : since(member.started_at, core::Clock::now());
        result.recipients.push_back(report);

        if (member.status == RecipientStatus::SUCCEEDED) {
            result.succeeded.push_back(member.recipient.id);
        } else if (member.status == RecipientStatus::FAILED) {
            RecipientFailure failure;
            failure.recipient_id = member.recipient.id;
            if (member.failure) {
                failure.error = member.failure->error;
                failure.reason = member.failure->reason;
            }
            result.failed.push_back(std::move(failure));
        }
    }

    if (!result.succeeded.empty() && result.succeeded.size() == members_.size()) {
        result.outcome = GroupOutcome::COMPLETED;
    } else if (!result.succeeded.empty()) {
        result.outcome = GroupOutcome::PARTIAL;
    } else {
        result.outcome = GroupOutcome::FAILED;
    }
    result.elapsed = since(started_at_, finished_at_.value_or(core::Clock::now()));
    return result;
}

void GroupOrchestrator::refresh_locked(core::TimePoint now) {
    for (auto& member : members_) {
        if (member.reported || member.status == RecipientStatus::PENDING) {
            continue;
        }

        if (member.task) {
            member.progress = member.task->get_progress();
            member.session_id = member.task->get_session_id();
            if (!member.task->is_finished()) {
                continue;
            }

            auto state = member.task->get_state();
            if (state == SessionState::COMPLETED) {
                member.status = RecipientStatus::SUCCEEDED;
                member.progress = 1.0;
            } else {
                member.status = RecipientStatus::FAILED;
                member.failure = member.task->get_failure();
                if (state == SessionState::PAUSED) {
                    member.failure = SessionFailure{TransferError::CONNECTION_LOST,
                                                    "Connection lost; the session can be resumed"};
                } else if (!member.failure) {
                    member.failure = SessionFailure{TransferError::RECIPIENT_FAILURE,
                                                    std::string("Session ended ") + to_string(state)};
                }
            }
        }

        member.elapsed = since(member.started_at, now);
        member.reported = true;

        if (member.status == RecipientStatus::SUCCEEDED) {
            LOG_INFO("Group {}: recipient {} completed in {}ms", group_id_, member.recipient.id,
                     member.elapsed.count());
        } else {
            LOG_WARN("Group {}: recipient {} failed: {}", group_id_, member.recipient.id,
                     member.failure ? member.failure->reason : "unknown");
        }
        emit(RecipientOutcome{group_id_, member.recipient.id, member.status == RecipientStatus::SUCCEEDED,
                              member.failure});
    }

    std::size_t succeeded = 0;
    std::size_t failed = 0;
    for (const auto& member : members_) {
        if (member.status == RecipientStatus::SUCCEEDED) {
            succeeded++;
        } else if (member.status == RecipientStatus::FAILED) {
            failed++;
        }
    }

    auto progress = progress_locked();
    if (succeeded + failed != last_reported_finished_ || std::abs(progress - last_reported_progress_) >= 0.01) {
        last_reported_progress_ = progress;
        last_reported_finished_ = succeeded + failed;
        emit(GroupProgress{group_id_, progress, succeeded, failed, members_.size()});
    }

    if (!finished_at_ && all_finished_locked()) {
        finished_at_ = now;
        LOG_INFO("Group {} finished: {} succeeded, {} failed in {}ms", group_id_, succeeded, failed,
                 since(started_at_, now).count());
    }
}

// Average over every recipient; a failed one keeps the progress it reached
double GroupOrchestrator::progress_locked() const {
    if (members_.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (const auto& member : members_) {
        sum += member.progress;
    }
    return sum / static_cast<double>(members_.size());
}

bool GroupOrchestrator::all_finished_locked() const {
    return !members_.empty() && std::all_of(members_.begin(), members_.end(),
                                            [](const Member& member) { return member.reported; });
}

void GroupOrchestrator::emit(TransferEvent event) {
    if (options_.events) {
        options_.events->push(std::move(event));
    }
}

}
