#include "pqshare/transfer/chunk_tracker.hpp"
#include <stdexcept>

namespace pqshare::transfer {

ChunkTracker::ChunkTracker(std::uint32_t total_chunks, std::uint32_t max_retries,
                           std::chrono::milliseconds ack_timeout)
    : slots_(total_chunks)
    , acknowledged_(total_chunks)
    , max_retries_(max_retries)
    , ack_timeout_(ack_timeout)
    , in_flight_(0)
    , failed_(0) {
    for (std::uint32_t i = 0; i < total_chunks; ++i) {
        pending_.insert(pending_.end(), i);
    }
}

void ChunkTracker::mark_acknowledged(const storage::ChunkBitmap& held) {
    if (held.size() != slots_.size()) {
        throw std::invalid_argument("Bitmap size does not match chunk count");
    }

    for (auto index : held.present()) {
        auto& slot = slots_[index];
        if (slot.state == ChunkState::ACKNOWLEDGED) {
            continue;
        }
        if (slot.state == ChunkState::IN_FLIGHT) {
            clear_deadline(index);
            in_flight_--;
        } else if (slot.state == ChunkState::FAILED) {
            failed_--;
        }
        pending_.erase(index);
        slot.state = ChunkState::ACKNOWLEDGED;
        acknowledged_.set(index);
    }
}

std::optional<std::uint32_t> ChunkTracker::next_pending() const {
    if (pending_.empty()) {
        return std::nullopt;
    }
    return *pending_.begin();
}

void ChunkTracker::mark_in_flight(std::uint32_t index, core::TimePoint now) {
    auto& slot = slots_.at(index);
    if (slot.state != ChunkState::PENDING) {
        throw std::logic_error("Chunk " + std::to_string(index) + " is not pending");
    }

    pending_.erase(index);
    slot.state = ChunkState::IN_FLIGHT;
    slot.sent_at = now;
    slot.deadline = now + ack_timeout_;
    deadlines_.emplace(slot.deadline, index);
    in_flight_++;
}

AckRecord ChunkTracker::acknowledge(std::uint32_t index, core::TimePoint now) {
    AckRecord record;
    if (index >= slots_.size()) {
        return record;
    }

    auto& slot = slots_[index];
    switch (slot.state) {
        case ChunkState::ACKNOWLEDGED:
            record.outcome = AckOutcome::DUPLICATE;
            return record;
        case ChunkState::IN_FLIGHT:
            clear_deadline(index);
            in_flight_--;
            if (slot.retries == 0) {
                record.rtt = std::chrono::duration_cast<std::chrono::microseconds>(now - slot.sent_at);
            }
            break;
        case ChunkState::PENDING:
            // A late ack for a chunk that already timed out still counts
            if (slot.retries == 0) {
                return record;
            }
            pending_.erase(index);
            break;
        case ChunkState::FAILED:
            failed_--;
            break;
    }

    slot.state = ChunkState::ACKNOWLEDGED;
    acknowledged_.set(index);
    record.outcome = AckOutcome::ACKNOWLEDGED;
    return record;
}

bool ChunkTracker::requeue(std::uint32_t index) {
    auto& slot = slots_.at(index);
    if (slot.state == ChunkState::ACKNOWLEDGED || slot.state == ChunkState::FAILED) {
        return slot.state != ChunkState::FAILED;
    }

    if (slot.state == ChunkState::IN_FLIGHT) {
        clear_deadline(index);
        in_flight_--;
    }
    slot.retries++;
    if (slot.retries > max_retries_) {
        pending_.erase(index);
        fail(index);
        return false;
    }

    slot.state = ChunkState::PENDING;
    pending_.insert(index);
    return true;
}

std::vector<std::uint32_t> ChunkTracker::expire(core::TimePoint now, std::uint32_t* timed_out) {
    std::vector<std::uint32_t> exhausted;
    std::uint32_t expired = 0;

    while (!deadlines_.empty() && deadlines_.begin()->first <= now) {
        auto index = deadlines_.begin()->second;
        deadlines_.erase(deadlines_.begin());

        auto& slot = slots_[index];
        expired++;
        in_flight_--;
        slot.retries++;
        if (slot.retries > max_retries_) {
            fail(index);
            exhausted.push_back(index);
        } else {
            slot.state = ChunkState::PENDING;
            pending_.insert(index);
        }
    }

    if (timed_out) *timed_out = expired;
    return exhausted;
}

void ChunkTracker::revert_in_flight() {
    for (const auto& [deadline, index] : deadlines_) {
        slots_[index].state = ChunkState::PENDING;
        pending_.insert(index);
    }
    deadlines_.clear();
    in_flight_ = 0;
}

ChunkState ChunkTracker::get_state(std::uint32_t index) const {
    return slots_.at(index).state;
}

std::uint32_t ChunkTracker::get_retries(std::uint32_t index) const {
    return slots_.at(index).retries;
}

std::optional<core::TimePoint> ChunkTracker::next_deadline() const {
    if (deadlines_.empty()) {
        return std::nullopt;
    }
    return deadlines_.begin()->first;
}

void ChunkTracker::fail(std::uint32_t index) {
    slots_[index].state = ChunkState::FAILED;
    failed_++;
}

void ChunkTracker::clear_deadline(std::uint32_t index) {
    deadlines_.erase({slots_[index].deadline, index});
}

}
