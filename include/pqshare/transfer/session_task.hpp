#pragma once

#include "pqshare/network/message_channel.hpp"
#include "pqshare/transfer/transfer_session.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <variant>

namespace pqshare::transfer {

enum class TaskStart {
    START,
    RESUME,
    ACCEPT_RESUME
};

// Drives one TransferSession on its own thread. Channel callbacks only queue
// signals for the worker; the session itself is touched by the worker alone.
// The worker exits when the session is terminal or paused without a resume
// handshake in progress, and closes the channel on the way out.
class SessionTask {
public:
    static constexpr std::chrono::milliseconds MAX_IDLE_WAIT{100};

    SessionTask(std::unique_ptr<TransferSession> session, std::shared_ptr<network::MessageChannel> channel,
                TaskStart mode = TaskStart::START);
    ~SessionTask();

    SessionTask(const SessionTask&) = delete;
    SessionTask& operator=(const SessionTask&) = delete;

    void run();
    void cancel();
    void pause();

    // True once the worker has finished
    bool wait(std::chrono::milliseconds timeout);
    bool is_finished() const { return finished_.load(); }

    SessionState get_state() const { return state_.load(); }
    double get_progress() const { return progress_.load(); }
    std::optional<SessionFailure> get_failure() const;
    std::string get_session_id() const;

    // Hands the session back after the worker finished; nullptr before that
    std::unique_ptr<TransferSession> release();

private:
    struct Incoming { std::vector<std::uint8_t> bytes; };
    struct Drained {};
    struct Closed {};
    struct CancelRequest {};
    struct PauseRequest {};
    using Signal = std::variant<Incoming, Drained, Closed, CancelRequest, PauseRequest>;

    // Shared with the channel callbacks, which may outlive the task
    struct Inbox {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<Signal> signals;
        void push(Signal signal);
    };

    void worker();
    bool begin(core::TimePoint now);
    void dispatch(Signal& signal, core::TimePoint now);
    void publish();
    bool should_exit() const;

    std::unique_ptr<TransferSession> session_;
    std::shared_ptr<network::MessageChannel> channel_;
    TaskStart mode_;
    std::string session_id_;
    std::shared_ptr<Inbox> inbox_;

    std::thread thread_;
    std::atomic<bool> started_;
    std::atomic<bool> finished_;
    std::atomic<SessionState> state_;
    std::atomic<double> progress_;

    mutable std::mutex result_mutex_;
    std::condition_variable finished_cv_;
    std::optional<SessionFailure> failure_;
};

}
