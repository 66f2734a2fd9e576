#pragma once

#include "pqshare/transfer/transfer_state.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pqshare::transfer {

struct StatusChanged {
    std::string session_id;
    SessionState from = SessionState::PENDING;
    SessionState to = SessionState::PENDING;
    std::optional<SessionFailure> failure;
};

struct ChunkProgress {
    std::string session_id;
    std::uint32_t index = 0;
    std::uint32_t chunks_done = 0;
    std::uint32_t total_chunks = 0;
    std::uint64_t bytes_done = 0;
    std::uint64_t total_bytes = 0;
};

struct SpeedEstimate {
    std::string session_id;
    double bytes_per_second = 0.0;
    std::chrono::milliseconds eta{0};
};

struct ConnectionLost {
    std::string session_id;
    std::uint32_t chunks_done = 0;
    std::uint32_t total_chunks = 0;
};

struct ResumeAvailable {
    std::string session_id;
    std::string file_name;
    std::uint32_t chunks_done = 0;
    std::uint32_t total_chunks = 0;
};

struct GroupProgress {
    std::string group_id;
    double progress = 0.0;          // 0..1 over recipients still in play
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t total = 0;
};

struct RecipientOutcome {
    std::string group_id;
    std::string recipient_id;
    bool success = false;
    std::optional<SessionFailure> failure;
};

using TransferEvent = std::variant<
    StatusChanged,
    ChunkProgress,
    SpeedEstimate,
    ConnectionLost,
    ResumeAvailable,
    GroupProgress,
    RecipientOutcome>;

const char* event_name(const TransferEvent& event);

// Multi-producer queue between session tasks and whatever renders progress
class EventQueue {
public:
    void push(TransferEvent event);

    std::optional<TransferEvent> try_pop();
    std::optional<TransferEvent> wait_pop(std::chrono::milliseconds timeout);
    std::vector<TransferEvent> drain();

    std::size_t size() const;

    // Wakes waiters; later pushes are discarded
    void close();
    bool is_closed() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<TransferEvent> events_;
    bool closed_ = false;
};

}
