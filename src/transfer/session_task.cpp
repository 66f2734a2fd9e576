#include "pqshare/transfer/session_task.hpp"
#include "pqshare/core/logger.hpp"

namespace pqshare::transfer {

void SessionTask::Inbox::push(Signal signal) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        signals.push_back(std::move(signal));
    }
    cv.notify_one();
}

SessionTask::SessionTask(std::unique_ptr<TransferSession> session,
                         std::shared_ptr<network::MessageChannel> channel, TaskStart mode)
    : session_(std::move(session))
    , channel_(std::move(channel))
    , mode_(mode)
    , inbox_(std::make_shared<Inbox>())
    , started_(false)
    , finished_(false)
    , state_(SessionState::PENDING)
    , progress_(0.0) {

    auto inbox = inbox_;
    channel_->set_handlers(network::ChannelHandlers{
        [inbox](std::vector<std::uint8_t> bytes) { inbox->push(Incoming{std::move(bytes)}); },
        [inbox]() { inbox->push(Drained{}); },
        [inbox]() { inbox->push(Closed{}); }
    });
    session_->attach(channel_);
    publish();
}

SessionTask::~SessionTask() {
    if (thread_.joinable()) {
        if (!finished_) {
            cancel();
        }
        thread_.join();
    }
}

void SessionTask::run() {
    if (started_.exchange(true)) {
        return;
    }
    thread_ = std::thread(&SessionTask::worker, this);
}

void SessionTask::cancel() {
    inbox_->push(CancelRequest{});
}

void SessionTask::pause() {
    inbox_->push(PauseRequest{});
}

bool SessionTask::wait(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(result_mutex_);
    return finished_cv_.wait_for(lock, timeout, [this]() { return finished_.load(); });
}

std::optional<SessionFailure> SessionTask::get_failure() const {
    std::lock_guard<std::mutex> lock(result_mutex_);
    return failure_;
}

std::string SessionTask::get_session_id() const {
    std::lock_guard<std::mutex> lock(result_mutex_);
    return session_id_;
}

std::unique_ptr<TransferSession> SessionTask::release() {
    if (!finished_) {
        return nullptr;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    return std::move(session_);
}

void SessionTask::worker() {
    if (begin(core::Clock::now())) {
        while (!should_exit()) {
            auto wakeup = session_->next_wakeup(core::Clock::now());
            auto deadline = core::Clock::now() + MAX_IDLE_WAIT;
            if (wakeup && *wakeup < deadline) {
                deadline = *wakeup;
            }

            std::deque<Signal> batch;
            {
                std::unique_lock<std::mutex> lock(inbox_->mutex);
                inbox_->cv.wait_until(lock, deadline, [this]() { return !inbox_->signals.empty(); });
                batch.swap(inbox_->signals);
            }

            auto now = core::Clock::now();
            for (auto& signal : batch) {
                dispatch(signal, now);
            }
            session_->poll(now);
            publish();
        }
    }

    publish();
    if (channel_->is_open()) {
        channel_->close();
    }
    channel_->set_handlers({});
    session_->detach();

    LOG_DEBUG("Session task {} finished in state {}", get_session_id(), to_string(state_.load()));
    {
        std::lock_guard<std::mutex> lock(result_mutex_);
        finished_ = true;
    }
    finished_cv_.notify_all();
}

bool SessionTask::begin(core::TimePoint now) {
    TransferResult result;
    switch (mode_) {
        case TaskStart::START:
            result = session_->start(now);
            break;
        case TaskStart::RESUME:
            result = session_->resume(now);
            break;
        case TaskStart::ACCEPT_RESUME:
            result = session_->accept_resume(now);
            break;
    }
    publish();

    if (!result) {
        LOG_ERROR("Session task could not begin: {}", result.message);
        std::lock_guard<std::mutex> lock(result_mutex_);
        if (!failure_) {
            failure_ = SessionFailure{result.error, result.message};
        }
        return false;
    }
    return true;
}

void SessionTask::dispatch(Signal& signal, core::TimePoint now) {
    std::visit([this, now](auto& item) {
        using T = std::decay_t<decltype(item)>;
        if constexpr (std::is_same_v<T, Incoming>) {
            session_->on_message(item.bytes, now);
        } else if constexpr (std::is_same_v<T, Drained>) {
            session_->on_drain(now);
        } else if constexpr (std::is_same_v<T, Closed>) {
            session_->on_channel_closed(now);
        } else if constexpr (std::is_same_v<T, CancelRequest>) {
            session_->cancel(now);
        } else if constexpr (std::is_same_v<T, PauseRequest>) {
            auto result = session_->pause(now);
            if (!result) {
                LOG_WARN("Pause ignored: {}", result.message);
            }
        }
    }, signal);
}

void SessionTask::publish() {
    state_ = session_->get_state();
    progress_ = session_->get_progress();

    std::lock_guard<std::mutex> lock(result_mutex_);
    session_id_ = session_->get_session_id();
    if (session_->get_failure()) {
        failure_ = session_->get_failure();
    }
}

bool SessionTask::should_exit() const {
    return session_->is_terminal() || session_->is_awaiting_resume();
}

}
