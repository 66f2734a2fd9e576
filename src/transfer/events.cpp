#include "pqshare/transfer/events.hpp"

namespace pqshare::transfer {

namespace {
    struct EventNamer {
        const char* operator()(const StatusChanged&) const { return "StatusChanged"; }
        const char* operator()(const ChunkProgress&) const { return "ChunkProgress"; }
        const char* operator()(const SpeedEstimate&) const { return "SpeedEstimate"; }
        const char* operator()(const ConnectionLost&) const { return "ConnectionLost"; }
        const char* operator()(const ResumeAvailable&) const { return "ResumeAvailable"; }
        const char* operator()(const GroupProgress&) const { return "GroupProgress"; }
        const char* operator()(const RecipientOutcome&) const { return "RecipientOutcome"; }
    };
}

const char* event_name(const TransferEvent& event) {
    return std::visit(EventNamer{}, event);
}

void EventQueue::push(TransferEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
}

std::optional<TransferEvent> EventQueue::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<TransferEvent> EventQueue::wait_pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !events_.empty() || closed_; });
    if (events_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::vector<TransferEvent> EventQueue::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransferEvent> drained(std::make_move_iterator(events_.begin()),
                                       std::make_move_iterator(events_.end()));
    events_.clear();
    return drained;
}

std::size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

void EventQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool EventQueue::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

}
