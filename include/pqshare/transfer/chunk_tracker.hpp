#pragma once

#include "pqshare/core/types.hpp"
#include "pqshare/storage/chunk_bitmap.hpp"
#include "pqshare/transfer/transfer_state.hpp"
#include <chrono>
#include <optional>
#include <set>
#include <utility>
#include <vector>

namespace pqshare::transfer {

enum class AckOutcome {
    ACKNOWLEDGED,
    DUPLICATE,
    UNEXPECTED      // index out of range or never sent
};

struct AckRecord {
    AckOutcome outcome = AckOutcome::UNEXPECTED;
    // Only for chunks acknowledged on their first transmission
    std::optional<std::chrono::microseconds> rtt;
};

// Sender-side chunk lifecycle: Pending -> InFlight -> {Acknowledged | Failed}.
// A timed-out InFlight chunk goes back to Pending until the retry limit.
class ChunkTracker {
public:
    ChunkTracker(std::uint32_t total_chunks, std::uint32_t max_retries,
                 std::chrono::milliseconds ack_timeout);

    // Marks chunks the peer already holds (resume)
    void mark_acknowledged(const storage::ChunkBitmap& held);

    // Lowest-index Pending chunk
    std::optional<std::uint32_t> next_pending() const;

    void mark_in_flight(std::uint32_t index, core::TimePoint now);
    AckRecord acknowledge(std::uint32_t index, core::TimePoint now);

    // Retransmission request from the peer; counts against the retry limit.
    // Returns false when the chunk has exhausted its retries and is now Failed.
    bool requeue(std::uint32_t index);

    // Reverts expired InFlight chunks; returns the indices that ran out of retries
    std::vector<std::uint32_t> expire(core::TimePoint now, std::uint32_t* timed_out = nullptr);

    // Transport loss: everything InFlight becomes Pending without a retry charge
    void revert_in_flight();

    ChunkState get_state(std::uint32_t index) const;
    std::uint32_t get_retries(std::uint32_t index) const;

    std::uint32_t get_total() const { return static_cast<std::uint32_t>(slots_.size()); }
    std::uint32_t in_flight_count() const { return in_flight_; }
    std::uint32_t acknowledged_count() const { return acknowledged_.count(); }
    std::uint32_t failed_count() const { return failed_; }
    bool all_acknowledged() const { return acknowledged_.all(); }

    const storage::ChunkBitmap& get_acknowledged() const { return acknowledged_; }
    std::optional<core::TimePoint> next_deadline() const;

    std::chrono::milliseconds get_ack_timeout() const { return ack_timeout_; }

private:
    struct Slot {
        ChunkState state = ChunkState::PENDING;
        std::uint32_t retries = 0;
        core::TimePoint sent_at{};
        core::TimePoint deadline{};
    };

    void fail(std::uint32_t index);
    void clear_deadline(std::uint32_t index);

    std::vector<Slot> slots_;
    std::set<std::uint32_t> pending_;
    // InFlight chunks ordered by ack deadline
    std::set<std::pair<core::TimePoint, std::uint32_t>> deadlines_;
    storage::ChunkBitmap acknowledged_;
    std::uint32_t max_retries_;
    std::chrono::milliseconds ack_timeout_;
    std::uint32_t in_flight_;
    std::uint32_t failed_;
};

}
