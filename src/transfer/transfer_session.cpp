#include "pqshare/transfer/transfer_session.hpp"
#include "pqshare/core/logger.hpp"
#include "pqshare/crypto/hash.hpp"
#include "pqshare/crypto/kdf.hpp"
#include "pqshare/crypto/random.hpp"
#include <algorithm>

namespace pqshare::transfer {

namespace {

constexpr std::string_view NAME_CONTEXT = "name";
constexpr std::string_view PATH_CONTEXT = "path";
constexpr std::size_t MAX_FILE_NAME_LENGTH = 255;

std::optional<std::string> sanitize_file_name(const std::string& name) {
    if (name.empty() || name.size() > MAX_FILE_NAME_LENGTH) {
        return std::nullopt;
    }
    if (name.find_first_of(std::string("/\\\0", 3)) != std::string::npos) {
        return std::nullopt;
    }
    if (name == "." || name == "..") {
        return std::nullopt;
    }
    return name;
}

// Relative directory below the output directory; no absolute paths or ".."
std::optional<std::filesystem::path> sanitize_relative_path(const std::string& path) {
    std::filesystem::path candidate(path);
    if (candidate.is_absolute() || candidate.has_root_name()) {
        return std::nullopt;
    }
    for (const auto& part : candidate) {
        if (part == "..") {
            return std::nullopt;
        }
    }
    return candidate.lexically_normal();
}

}

std::unique_ptr<TransferSession> TransferSession::create_sender(storage::Chunker source,
                                                                std::string file_name,
                                                                SessionOptions options,
                                                                std::optional<crypto::Digest> known_hash) {
    std::unique_ptr<TransferSession> session(
        new TransferSession(core::TransferDirection::SEND, std::move(options)));
    session->session_id_ = crypto::SecureRandom::generate_session_id();
    session->file_name_ = std::move(file_name);
    session->relative_path_ = session->options_.relative_path;

    auto result = source.open();
    if (!result) {
        session->fail(TransferError::IO_ERROR, "Cannot open source: " + result.message);
        return session;
    }

    session->file_size_ = source.get_file_size();
    session->chunk_size_ = source.get_chunk_size();
    session->total_chunks_ = source.get_total_chunks();

    const auto& settings = session->options_.settings;
    if (!sanitize_file_name(session->file_name_)) {
        session->fail(TransferError::INVALID_METADATA, "Invalid file name");
        return session;
    }
    if (session->total_chunks_ == 0 || session->total_chunks_ > settings.max_total_chunks) {
        session->fail(TransferError::INVALID_METADATA,
                      "File needs " + std::to_string(session->total_chunks_) + " chunks");
        return session;
    }
    auto max_chunk = settings.network_mode == core::NetworkMode::LOCAL ? storage::MAX_LOCAL_CHUNK_SIZE
                                                                       : storage::MAX_WIDE_AREA_CHUNK_SIZE;
    if (session->chunk_size_ < storage::MIN_CHUNK_SIZE || session->chunk_size_ > max_chunk) {
        session->fail(TransferError::INVALID_METADATA,
                      "Chunk size " + std::to_string(session->chunk_size_) + " not allowed in " +
                      core::to_string(settings.network_mode) + " mode");
        return session;
    }

    if (known_hash) {
        session->file_hash_ = *known_hash;
    } else {
        result = source.compute_file_hash(session->file_hash_);
        if (!result) {
            session->fail(TransferError::IO_ERROR, "Cannot hash source: " + result.message);
            return session;
        }
    }

    session->chunker_.emplace(std::move(source));
    session->tracker_.emplace(session->total_chunks_, settings.max_chunk_retries, settings.ack_timeout);
    session->controller_.align_chunk_tier(session->chunk_size_);

    LOG_INFO("Session {} prepared: {} ({} bytes, {} chunks of {})", session->session_id_,
             session->file_name_, session->file_size_, session->total_chunks_, session->chunk_size_);
    return session;
}

std::unique_ptr<TransferSession> TransferSession::create_receiver(
        std::optional<std::filesystem::path> output_directory, SessionOptions options) {
    std::unique_ptr<TransferSession> session(
        new TransferSession(core::TransferDirection::RECEIVE, std::move(options)));
    session->output_directory_ = std::move(output_directory);
    return session;
}

std::unique_ptr<TransferSession> TransferSession::restore(const storage::PersistedSession& persisted,
                                                          SessionOptions options) {
    std::unique_ptr<TransferSession> session(new TransferSession(persisted.direction, std::move(options)));
    session->machine_ = SessionStateMachine(SessionState::PAUSED);
    session->session_id_ = persisted.session_id;
    session->file_name_ = persisted.file_name;
    session->file_size_ = persisted.file_size;
    session->chunk_size_ = persisted.chunk_size;
    session->total_chunks_ = persisted.total_chunks;
    session->file_hash_ = persisted.file_hash;
    session->resume_attempts_ = persisted.resume_attempts;
    session->download_count_ = persisted.download_count;
    session->created_at_ = persisted.created_at;
    if (!session->options_.max_downloads) {
        session->options_.max_downloads = persisted.max_downloads;
    }
    if (!session->options_.expires_at) {
        session->options_.expires_at = persisted.expires_at;
    }

    if (persisted.bitmap.size() != persisted.total_chunks) {
        session->fail(TransferError::INVALID_METADATA, "Persisted bitmap does not match chunk count");
        return session;
    }

    const auto& settings = session->options_.settings;
    if (persisted.direction == core::TransferDirection::SEND) {
        storage::Chunker source(persisted.file_path, persisted.chunk_size);
        auto result = source.open();
        if (!result) {
            // The file may come back; only a changed source invalidates the record
            session->fail(TransferError::IO_ERROR, "Cannot reopen source: " + result.message, true);
            return session;
        }
        crypto::Digest current{};
        result = source.compute_file_hash(current);
        if (!result) {
            session->fail(TransferError::IO_ERROR, "Cannot hash source: " + result.message, true);
            return session;
        }
        if (source.get_file_size() != persisted.file_size ||
            !crypto::hash_utils::digest_equal(current, persisted.file_hash)) {
            session->fail(TransferError::IO_ERROR, "Source file changed since the transfer started");
            return session;
        }
        session->chunker_.emplace(std::move(source));
        session->tracker_.emplace(persisted.total_chunks, settings.max_chunk_retries, settings.ack_timeout);
        session->tracker_->mark_acknowledged(persisted.bitmap);
        session->controller_.align_chunk_tier(persisted.chunk_size);
    } else {
        if (persisted.file_path.empty()) {
            session->fail(TransferError::IO_ERROR, "In-memory transfers cannot be restored");
            return session;
        }
        session->output_path_ = std::filesystem::path(persisted.file_path);
        storage::AssemblyPlan plan{persisted.total_chunks, persisted.chunk_size,
                                   persisted.file_size, persisted.file_hash};
        session->assembler_ = std::make_unique<storage::Assembler>(plan, session->output_path_);
        auto result = session->assembler_->open(&persisted.bitmap);
        if (!result) {
            session->fail(TransferError::IO_ERROR, "Cannot recover partial file: " + result.message, true);
            return session;
        }
    }

    LOG_INFO("Session {} restored: {} {}/{} chunks", session->session_id_, session->file_name_,
             persisted.bitmap.count(), persisted.total_chunks);
    return session;
}

TransferSession::TransferSession(core::TransferDirection direction, SessionOptions options)
    : direction_(direction)
    , options_(std::move(options))
    , controller_(options_.settings.network_mode, options_.settings.bitrate_mode)
    , created_at_(core::WallClock::now()) {
}

TransferSession::~TransferSession() {
    wipe_keys();
}

void TransferSession::attach(std::shared_ptr<network::MessageChannel> channel) {
    channel_ = std::move(channel);
    blocked_ = false;
    control_outbox_.clear();
}

void TransferSession::detach() {
    channel_.reset();
    blocked_ = false;
    control_outbox_.clear();
}

TransferResult TransferSession::start(core::TimePoint now) {
    if (get_state() != SessionState::PENDING) {
        return TransferResult(TransferError::INVALID_STATE,
                              std::string("Cannot start a session in state ") + to_string(get_state()));
    }
    if (!channel_) {
        return TransferResult(TransferError::INVALID_STATE, "No channel attached");
    }

    if (direction_ == core::TransferDirection::SEND) {
        TransferError error = TransferError::NONE;
        std::string reason;
        if (!check_serving_quota(core::WallClock::now(), true, error, reason)) {
            fail(error, reason);
            return TransferResult(error, reason);
        }
    }

    if (!transition(SessionState::NEGOTIATING)) {
        return TransferResult(TransferError::INVALID_STATE, "Negotiation rejected");
    }

    resuming_ = false;
    if (direction_ == core::TransferDirection::SEND) {
        role_ = crypto::KeyExchangeRole::INITIATOR;
        kex_attempts_ = 0;
        send_public_key(now);
    } else {
        role_ = crypto::KeyExchangeRole::RESPONDER;
        phase_ = Phase::AWAIT_PUBLIC_KEY;
        phase_deadline_ = now + options_.settings.kex_timeout * options_.settings.kex_max_attempts;
    }
    return TransferResult();
}

TransferResult TransferSession::resume(core::TimePoint now, core::WallClock::time_point wall_now) {
    if (get_state() != SessionState::PAUSED) {
        return TransferResult(TransferError::INVALID_STATE,
                              std::string("Cannot resume a session in state ") + to_string(get_state()));
    }
    if (!channel_) {
        return TransferResult(TransferError::INVALID_STATE, "No channel attached");
    }
    if (phase_ != Phase::IDLE) {
        return TransferResult(TransferError::INVALID_STATE, "Resume already in progress");
    }

    const auto& settings = options_.settings;
    if ((options_.expires_at && wall_now >= *options_.expires_at) ||
        wall_now >= created_at_ + settings.resume_expiry) {
        fail(TransferError::RESUME_EXPIRED, "Session expired");
        return TransferResult(TransferError::RESUME_EXPIRED, "Session expired");
    }
    if (resume_attempts_ >= settings.resume_max_attempts) {
        fail(TransferError::RESUME_EXHAUSTED, "No resume attempts left");
        return TransferResult(TransferError::RESUME_EXHAUSTED, "No resume attempts left");
    }
    if (direction_ == core::TransferDirection::SEND) {
        TransferError error = TransferError::NONE;
        std::string reason;
        if (!check_serving_quota(wall_now, false, error, reason)) {
            fail(error, reason);
            return TransferResult(error, reason);
        }
    }

    // Claimed through the store so concurrent or restarted processes never
    // exceed the attempt limit between them
    bool claimed = false;
    if (options_.store && options_.store->get(session_id_)) {
        claimed = options_.store->update(session_id_, [&](storage::PersistedSession& state) {
            if (state.resume_attempts >= settings.resume_max_attempts) {
                return false;
            }
            state.resume_attempts++;
            state.updated_at = wall_now;
            resume_attempts_ = state.resume_attempts;
            return true;
        });
        if (!claimed) {
            fail(TransferError::RESUME_EXHAUSTED, "No resume attempts left");
            return TransferResult(TransferError::RESUME_EXHAUSTED, "No resume attempts left");
        }
    } else {
        resume_attempts_++;
        persist();
    }

    LOG_INFO("Session {} resuming (attempt {}/{})", session_id_, resume_attempts_, settings.resume_max_attempts);
    resuming_ = true;
    role_ = crypto::KeyExchangeRole::INITIATOR;
    kex_attempts_ = 0;
    send_public_key(now);
    return TransferResult();
}

TransferResult TransferSession::accept_resume(core::TimePoint now, core::WallClock::time_point wall_now) {
    if (get_state() != SessionState::PAUSED) {
        return TransferResult(TransferError::INVALID_STATE,
                              std::string("Cannot resume a session in state ") + to_string(get_state()));
    }
    if (!channel_) {
        return TransferResult(TransferError::INVALID_STATE, "No channel attached");
    }
    if (phase_ != Phase::IDLE) {
        return TransferResult(TransferError::INVALID_STATE, "Resume already in progress");
    }

    const auto& settings = options_.settings;
    if ((options_.expires_at && wall_now >= *options_.expires_at) ||
        wall_now >= created_at_ + settings.resume_expiry) {
        fail(TransferError::RESUME_EXPIRED, "Session expired");
        return TransferResult(TransferError::RESUME_EXPIRED, "Session expired");
    }
    if (resume_attempts_ >= settings.resume_max_attempts) {
        fail(TransferError::RESUME_EXHAUSTED, "No resume attempts left");
        return TransferResult(TransferError::RESUME_EXHAUSTED, "No resume attempts left");
    }
    if (direction_ == core::TransferDirection::SEND) {
        TransferError error = TransferError::NONE;
        std::string reason;
        if (!check_serving_quota(wall_now, false, error, reason)) {
            fail(error, reason);
            return TransferResult(error, reason);
        }
    }

    resuming_ = true;
    role_ = crypto::KeyExchangeRole::RESPONDER;
    phase_ = Phase::AWAIT_PUBLIC_KEY;
    phase_deadline_ = now + settings.kex_timeout * settings.kex_max_attempts;
    return TransferResult();
}

TransferResult TransferSession::pause(core::TimePoint now) {
    (void)now;
    if (get_state() != SessionState::TRANSFERRING) {
        return TransferResult(TransferError::INVALID_STATE,
                              std::string("Cannot pause a session in state ") + to_string(get_state()));
    }
    enter_paused("Paused by user", false);

    // The peer sees the channel go away and pauses on its side
    if (channel_) {
        auto channel = std::move(channel_);
        channel->close();
    }
    return TransferResult();
}

void TransferSession::cancel(core::TimePoint now) {
    (void)now;
    if (is_terminal()) {
        return;
    }

    if (channel_ && channel_->is_open()) {
        auto status = channel_->send(network::encode_message(network::ErrorMessage{"Transfer cancelled"}));
        if (status != network::SendStatus::OK) {
            LOG_DEBUG("Session {}: cancel notice not delivered", session_id_);
        }
    }

    wipe_keys();
    forget_persisted();
    if (assembler_) {
        assembler_->discard();
    }
    phase_ = Phase::FINISHED;
    phase_deadline_.reset();
    idle_deadline_.reset();
    kex_retry_at_.reset();
    transition(SessionState::CANCELLED, SessionFailure{TransferError::CANCELLED, "Cancelled by user"});
}

void TransferSession::on_message(std::span<const std::uint8_t> bytes, core::TimePoint now) {
    if (is_terminal()) {
        return;
    }

    network::WireMessage message;
    try {
        message = network::decode_message(bytes);
    } catch (const network::ProtocolError& e) {
        fail(TransferError::PROTOCOL_VIOLATION, e.what());
        return;
    }

    LOG_TRACE("Session {} <- {}", session_id_, network::message_name(message));
    std::visit([this, now](auto& msg) { handle(msg, now); }, message);
}

void TransferSession::on_drain(core::TimePoint now) {
    if (is_terminal()) {
        return;
    }
    blocked_ = false;
    flush_control();
    pump(now);
}

void TransferSession::on_channel_closed(core::TimePoint now) {
    (void)now;
    channel_.reset();
    blocked_ = false;
    control_outbox_.clear();

    switch (get_state()) {
        case SessionState::NEGOTIATING:
            fail(TransferError::CONNECTION_LOST, "Channel closed during negotiation");
            break;
        case SessionState::TRANSFERRING:
            enter_paused("Channel closed", true);
            break;
        case SessionState::PAUSED:
            if (phase_ != Phase::IDLE) {
                LOG_WARN("Session {}: channel closed during resume handshake", session_id_);
                wipe_keys();
                phase_ = Phase::IDLE;
                phase_deadline_.reset();
                kex_retry_at_.reset();
                resuming_ = false;
                emit(ResumeAvailable{session_id_, file_name_, chunks_done(), total_chunks_});
            }
            break;
        default:
            break;
    }
}

void TransferSession::poll(core::TimePoint now) {
    if (is_terminal()) {
        return;
    }

    const auto& settings = options_.settings;
    keyring_.expire_retired(now);

    if (kex_retry_at_ && now >= *kex_retry_at_) {
        kex_retry_at_.reset();
        send_public_key(now);
        return;
    }

    bool deadline_passed = phase_deadline_ && now >= *phase_deadline_;
    switch (phase_) {
        case Phase::AWAIT_KEY_EXCHANGE:
            if (deadline_passed) {
                phase_deadline_.reset();
                if (kex_attempts_ >= settings.kex_max_attempts) {
                    fail(TransferError::KEY_EXCHANGE_TIMEOUT,
                         "No key exchange response after " + std::to_string(kex_attempts_) + " attempts");
                    return;
                }
                auto backoff = settings.kex_backoff * (1u << std::min<std::uint32_t>(kex_attempts_ - 1, 10));
                LOG_WARN("Session {}: key exchange attempt {} timed out, retrying in {}ms",
                         session_id_, kex_attempts_, backoff.count());
                kex_retry_at_ = now + backoff;
            }
            break;

        case Phase::AWAIT_PUBLIC_KEY:
        case Phase::AWAIT_METADATA:
            if (deadline_passed) {
                fail(TransferError::KEY_EXCHANGE_TIMEOUT, "Peer did not complete negotiation");
            }
            break;

        case Phase::AWAIT_RESUME_REQUEST:
        case Phase::AWAIT_CHUNK_REQUEST:
            if (deadline_passed) {
                fail(TransferError::RESUME_EXHAUSTED, "Resume handshake timed out");
            }
            break;

        case Phase::AWAIT_RESUME_RESPONSE:
            if (deadline_passed) {
                if (resume_requests_sent_ >= settings.resume_max_attempts) {
                    fail(TransferError::RESUME_EXHAUSTED,
                         "No resume response after " + std::to_string(resume_requests_sent_) + " requests");
                    return;
                }
                LOG_WARN("Session {}: resume request {} unanswered", session_id_, resume_requests_sent_);
                send_control(network::encode_message(network::ResumeRequestMessage{session_id_}));
                resume_requests_sent_++;
                phase_deadline_ = now + settings.resume_timeout;
            }
            break;

        case Phase::STREAMING:
            if (direction_ == core::TransferDirection::SEND) {
                std::uint32_t timed_out = 0;
                auto exhausted = tracker_->expire(now, &timed_out);
                if (timed_out > 0) {
                    stats_.ack_timeouts += timed_out;
                    timeouts_since_sample_ += timed_out;
                    report_sample(std::nullopt, now);
                }
                if (!exhausted.empty()) {
                    fail(TransferError::ACK_TIMEOUT,
                         "Chunk " + std::to_string(exhausted.front()) + " unacknowledged after " +
                         std::to_string(settings.max_chunk_retries) + " retries");
                    return;
                }
                pump(now);
            } else if (idle_deadline_ && now >= *idle_deadline_) {
                fail(TransferError::ACK_TIMEOUT, "No chunks received from sender");
            }
            break;

        case Phase::AWAIT_COMPLETE:
            if (deadline_passed) {
                fail(TransferError::ACK_TIMEOUT, "Receiver never confirmed completion");
            }
            break;

        default:
            break;
    }
}

std::optional<core::TimePoint> TransferSession::next_wakeup(core::TimePoint now) {
    if (is_terminal()) {
        return std::nullopt;
    }

    std::optional<core::TimePoint> wakeup;
    auto consider = [&wakeup](const std::optional<core::TimePoint>& candidate) {
        if (candidate && (!wakeup || *candidate < *wakeup)) {
            wakeup = candidate;
        }
    };

    consider(phase_deadline_);
    consider(idle_deadline_);
    consider(kex_retry_at_);

    if (direction_ == core::TransferDirection::SEND && phase_ == Phase::STREAMING && tracker_) {
        consider(tracker_->next_deadline());
        auto next = tracker_->next_pending();
        if (next && !blocked_ && limiter_ &&
            tracker_->in_flight_count() < controller_.get_config().concurrency) {
            auto length = storage::expected_chunk_length(file_size_, chunk_size_, *next).value_or(0);
            auto ready = now + limiter_->time_until(length, now);
            if (next_send_at_ && *next_send_at_ > ready) {
                ready = *next_send_at_;
            }
            consider(ready);
        }
    }
    return wakeup;
}

storage::ChunkBitmap TransferSession::get_progress_bitmap() const {
    if (direction_ == core::TransferDirection::SEND) {
        return tracker_ ? tracker_->get_acknowledged() : storage::ChunkBitmap(total_chunks_);
    }
    return assembler_ ? assembler_->get_received() : storage::ChunkBitmap(total_chunks_);
}

double TransferSession::get_progress() const {
    if (total_chunks_ == 0) {
        return 0.0;
    }
    return static_cast<double>(chunks_done()) / total_chunks_;
}

std::optional<std::filesystem::path> TransferSession::get_output_path() const {
    return output_path_;
}

std::optional<std::vector<std::uint8_t>> TransferSession::take_received_file() {
    auto file = std::move(received_file_);
    received_file_.reset();
    return file;
}

// Key exchange

void TransferSession::send_public_key(core::TimePoint now) {
    key_exchange_.reset();
    std::vector<std::uint8_t> public_key;
    auto result = key_exchange_.initiate(public_key);
    if (!result) {
        fail(TransferError::KEY_EXCHANGE_FAILED, result.message);
        return;
    }

    kex_attempts_++;
    phase_ = Phase::AWAIT_KEY_EXCHANGE;
    phase_deadline_ = now + options_.settings.kex_timeout;
    LOG_DEBUG("Session {}: key exchange attempt {}", session_id_, kex_attempts_);
    send_control(network::encode_message(network::PublicKeyMessage{std::move(public_key)}));
}

bool TransferSession::establish_keys(crypto::KeyExchangeRole role, core::TimePoint now) {
    auto secret = key_exchange_.take_shared_secret();
    key_exchange_.reset();
    auto result = keyring_.establish(std::move(secret), role, now);
    if (!result) {
        fail(TransferError::KEY_EXCHANGE_FAILED, result.message);
        return false;
    }
    role_ = role;
    LOG_DEBUG("Session {}: keys established as {}", session_id_,
              role == crypto::KeyExchangeRole::INITIATOR ? "initiator" : "responder");
    return true;
}

void TransferSession::after_key_agreement(core::TimePoint now) {
    const auto& settings = options_.settings;
    kex_retry_at_.reset();
    phase_deadline_.reset();

    if (role_ == crypto::KeyExchangeRole::INITIATOR) {
        if (resuming_) {
            send_control(network::encode_message(network::ResumeRequestMessage{session_id_}));
            resume_requests_sent_ = 1;
            phase_ = Phase::AWAIT_RESUME_RESPONSE;
            phase_deadline_ = now + settings.resume_timeout;
        } else {
            send_metadata(now);
        }
        return;
    }

    if (resuming_) {
        phase_ = Phase::AWAIT_RESUME_REQUEST;
        phase_deadline_ = now + settings.resume_timeout * settings.resume_max_attempts;
    } else {
        phase_ = Phase::AWAIT_METADATA;
        phase_deadline_ = now + settings.kex_timeout;
    }
}

void TransferSession::handle(network::PublicKeyMessage& msg, core::TimePoint now) {
    // A responder may be asked to redo the exchange until the session moves on
    bool responder_waiting = role_ == crypto::KeyExchangeRole::RESPONDER &&
        (phase_ == Phase::AWAIT_PUBLIC_KEY || phase_ == Phase::AWAIT_METADATA ||
         phase_ == Phase::AWAIT_RESUME_REQUEST);
    if (!responder_waiting) {
        fail(TransferError::PROTOCOL_VIOLATION, "Unexpected public key");
        return;
    }

    key_exchange_.reset();
    std::vector<std::uint8_t> ciphertext;
    auto result = key_exchange_.respond(msg.key_bytes, ciphertext);
    if (!result) {
        fail(TransferError::KEY_EXCHANGE_FAILED, result.message);
        return;
    }
    if (!establish_keys(crypto::KeyExchangeRole::RESPONDER, now)) {
        return;
    }

    send_control(network::encode_message(network::KeyExchangeMessage{std::move(ciphertext)}));
    after_key_agreement(now);
}

void TransferSession::handle(network::KeyExchangeMessage& msg, core::TimePoint now) {
    if (phase_ != Phase::AWAIT_KEY_EXCHANGE || role_ != crypto::KeyExchangeRole::INITIATOR) {
        fail(TransferError::PROTOCOL_VIOLATION, "Unexpected key exchange response");
        return;
    }

    auto result = key_exchange_.complete(msg.ciphertext_bytes);
    if (!result) {
        fail(TransferError::KEY_EXCHANGE_FAILED, result.message);
        return;
    }
    if (!establish_keys(crypto::KeyExchangeRole::INITIATOR, now)) {
        return;
    }
    after_key_agreement(now);
}

void TransferSession::handle(network::KeyRotationMessage& msg, core::TimePoint now) {
    (void)now;
    if (direction_ != core::TransferDirection::RECEIVE || msg.session_id != session_id_) {
        fail(TransferError::PROTOCOL_VIOLATION, "Unexpected key rotation notice");
        return;
    }
    // Advisory; the keyring adopts the new generation with the first chunk sealed under it
    if (msg.generation <= keyring_.get_generation()) {
        LOG_DEBUG("Session {}: stale rotation notice for generation {}", session_id_, msg.generation);
    } else {
        LOG_DEBUG("Session {}: peer rotated to generation {}", session_id_, msg.generation);
    }
}

// Sender

void TransferSession::send_metadata(core::TimePoint now) {
    network::FileMetadataMessage msg;
    msg.session_id = session_id_;
    msg.size = file_size_;
    msg.total_chunks = total_chunks_;
    msg.chunk_size = chunk_size_;
    msg.file_hash = file_hash_;

    crypto::SealedPayload sealed;
    auto result = keyring_.seal(crypto::as_bytes(file_name_), crypto::as_bytes(NAME_CONTEXT), sealed);
    if (!result) {
        fail(TransferError::KEY_EXCHANGE_FAILED, "Cannot seal file name: " + result.message);
        return;
    }
    msg.encrypted_name = network::SealedField{std::move(sealed.ciphertext), sealed.nonce};

    if (!relative_path_.empty()) {
        crypto::SealedPayload sealed_path;
        result = keyring_.seal(crypto::as_bytes(relative_path_), crypto::as_bytes(PATH_CONTEXT), sealed_path);
        if (!result) {
            fail(TransferError::KEY_EXCHANGE_FAILED, "Cannot seal path: " + result.message);
            return;
        }
        msg.encrypted_path = network::SealedField{std::move(sealed_path.ciphertext), sealed_path.nonce};
    }

    send_control(network::encode_message(msg));
    begin_streaming(now);
}

void TransferSession::begin_streaming(core::TimePoint now) {
    if (!transition(SessionState::TRANSFERRING)) {
        return;
    }
    phase_ = Phase::STREAMING;
    phase_deadline_.reset();

    const auto& config = controller_.get_config();
    limiter_.emplace(config.target_rate, chunk_size_, now);
    limiter_->set_ceiling(options_.bandwidth_limit);
    next_send_at_.reset();

    progress_.emplace(file_size_, now);
    progress_->set_baseline(bytes_in(tracker_->get_acknowledged()));

    persist();
    check_sender_done(now);
    pump(now);
}

void TransferSession::maybe_rotate(core::TimePoint now) {
    if (!keyring_.is_established() || !keyring_.needs_rotation(now, rotation_policy())) {
        return;
    }
    auto result = keyring_.rotate(now, options_.settings.rotation_grace);
    if (!result) {
        fail(TransferError::KEY_EXCHANGE_FAILED, "Key rotation failed: " + result.message);
        return;
    }
    stats_.key_rotations++;
    LOG_INFO("Session {} rotated to key generation {}", session_id_, keyring_.get_generation());
    send_control(network::encode_message(network::KeyRotationMessage{keyring_.get_generation(), session_id_}));
}

void TransferSession::pump(core::TimePoint now) {
    if (direction_ != core::TransferDirection::SEND || phase_ != Phase::STREAMING ||
        !channel_ || !tracker_ || !limiter_) {
        return;
    }

    flush_control();
    while (!blocked_ && !is_terminal() && phase_ == Phase::STREAMING &&
           tracker_->in_flight_count() < controller_.get_config().concurrency) {
        if (next_send_at_ && now < *next_send_at_) {
            break;
        }
        auto next = tracker_->next_pending();
        if (!next) {
            break;
        }
        auto length = storage::expected_chunk_length(file_size_, chunk_size_, *next).value_or(0);
        if (!limiter_->try_consume(length, now)) {
            break;
        }
        maybe_rotate(now);
        if (is_terminal() || !send_chunk(*next, now)) {
            break;
        }
        // Consecutive chunks go out at least send_interval apart
        next_send_at_ = now + controller_.send_interval(chunk_size_);
    }
}

bool TransferSession::send_chunk(std::uint32_t index, core::TimePoint now) {
    storage::Chunk chunk;
    auto result = chunker_->read_chunk(index, chunk);
    if (!result) {
        fail(TransferError::IO_ERROR, "Cannot read chunk " + std::to_string(index) + ": " + result.message);
        return false;
    }

    crypto::SealedPayload sealed;
    auto aad = crypto::chunk_associated_data(index, total_chunks_);
    result = keyring_.seal(chunk.data, aad, sealed);
    if (!result) {
        fail(TransferError::KEY_EXCHANGE_FAILED, "Cannot seal chunk: " + result.message);
        return false;
    }

    network::ChunkMessage msg;
    msg.index = index;
    msg.ciphertext = std::move(sealed.ciphertext);
    msg.nonce = sealed.nonce;
    msg.hash = chunk.hash;

    bool retransmission = tracker_->get_retries(index) > 0;
    switch (channel_->send(network::encode_message(msg))) {
        case network::SendStatus::OK:
            tracker_->mark_in_flight(index, now);
            stats_.chunks_sent++;
            if (retransmission) {
                stats_.chunks_retransmitted++;
            }
            LOG_TRACE("Session {} -> chunk {} (generation {})", session_id_, index, sealed.generation);
            return true;
        case network::SendStatus::BUFFER_FULL:
            // Stays Pending and is sealed again after the drain
            blocked_ = true;
            blocked_since_sample_ = true;
            return false;
        case network::SendStatus::CLOSED:
            return false;
    }
    return false;
}

void TransferSession::report_sample(std::optional<std::chrono::microseconds> rtt, core::TimePoint now) {
    if (rtt) {
        if (last_rtt_.count() > 0) {
            auto delta = *rtt > last_rtt_ ? *rtt - last_rtt_ : last_rtt_ - *rtt;
            jitter_ += (delta - jitter_) / 8;
        }
        last_rtt_ = *rtt;
    }

    NetworkSample sample;
    sample.rtt = last_rtt_;
    auto events = acks_since_sample_ + timeouts_since_sample_;
    sample.loss_rate = events > 0 ? static_cast<double>(timeouts_since_sample_) / events : 0.0;
    sample.jitter = jitter_;
    sample.buffer_occupancy = blocked_since_sample_ ? 1.0 : 0.0;

    acks_since_sample_ = 0;
    timeouts_since_sample_ = 0;
    blocked_since_sample_ = blocked_;

    controller_.report(sample, now);
    if (limiter_) {
        limiter_->set_rate(controller_.get_config().target_rate, now);
    }
}

void TransferSession::check_sender_done(core::TimePoint now) {
    if (phase_ == Phase::STREAMING && tracker_->all_acknowledged()) {
        LOG_DEBUG("Session {}: all chunks acknowledged, awaiting completion", session_id_);
        phase_ = Phase::AWAIT_COMPLETE;
        phase_deadline_ = now + idle_timeout();
    }
}

void TransferSession::rebuild_tracker(const storage::ChunkBitmap& held_by_peer) {
    const auto& settings = options_.settings;
    tracker_.emplace(total_chunks_, settings.max_chunk_retries, settings.ack_timeout);
    tracker_->mark_acknowledged(held_by_peer);
}

void TransferSession::handle(network::AckMessage& msg, core::TimePoint now) {
    if (direction_ != core::TransferDirection::SEND || !tracker_) {
        fail(TransferError::PROTOCOL_VIOLATION, "Unexpected acknowledgement");
        return;
    }
    if (phase_ != Phase::STREAMING && phase_ != Phase::AWAIT_COMPLETE) {
        LOG_DEBUG("Session {}: ignoring ack for chunk {} outside streaming", session_id_, msg.index);
        return;
    }
    if (msg.index >= total_chunks_) {
        fail(TransferError::PROTOCOL_VIOLATION, "Ack index out of range");
        return;
    }

    auto record = tracker_->acknowledge(msg.index, now);
    switch (record.outcome) {
        case AckOutcome::ACKNOWLEDGED: {
            acks_since_sample_++;
            auto length = storage::expected_chunk_length(file_size_, chunk_size_, msg.index).value_or(0);
            if (progress_) {
                progress_->record(length, now);
            }
            emit_progress(msg.index, now);
            report_sample(record.rtt, now);
            check_sender_done(now);
            pump(now);
            break;
        }
        case AckOutcome::DUPLICATE:
            stats_.duplicates++;
            break;
        case AckOutcome::UNEXPECTED:
            LOG_WARN("Session {}: ack for chunk {} that was never sent", session_id_, msg.index);
            break;
    }
}

void TransferSession::handle(network::CompleteMessage& msg, core::TimePoint now) {
    if (direction_ != core::TransferDirection::SEND) {
        fail(TransferError::PROTOCOL_VIOLATION, "Unexpected completion message");
        return;
    }
    if (!msg.success) {
        fail(TransferError::CORRUPTED_TRANSFER, "Receiver rejected the assembled file");
        return;
    }
    if (!tracker_ || !tracker_->all_acknowledged()) {
        fail(TransferError::PROTOCOL_VIOLATION,
             "Completion with " + std::to_string(tracker_ ? tracker_->acknowledged_count() : 0) + "/" +
             std::to_string(total_chunks_) + " chunks acknowledged");
        return;
    }
    complete(now);
}

void TransferSession::handle(network::ErrorMessage& msg, core::TimePoint now) {
    (void)now;
    fail(TransferError::PEER_ABORTED, msg.message.empty() ? "Peer aborted the transfer" : msg.message);
}

void TransferSession::handle(network::ResumeChunkRequestMessage& msg, core::TimePoint now) {
    if (direction_ != core::TransferDirection::SEND || msg.session_id != session_id_) {
        fail(TransferError::PROTOCOL_VIOLATION, "Unexpected chunk request");
        return;
    }
    for (auto index : msg.indices) {
        if (index >= total_chunks_) {
            fail(TransferError::PROTOCOL_VIOLATION, "Requested chunk index out of range");
            return;
        }
    }

    if (phase_ == Phase::AWAIT_CHUNK_REQUEST) {
        // Everything not named is already held by the receiver
        storage::ChunkBitmap held(total_chunks_);
        for (std::uint32_t i = 0; i < total_chunks_; ++i) {
            held.set(i);
        }
        for (auto index : msg.indices) {
            held.reset(index);
        }
        rebuild_tracker(held);
        stats_.resumes++;
        LOG_INFO("Session {} resumed: {} chunks requested", session_id_, msg.indices.size());
        begin_streaming(now);
        return;
    }

    if (phase_ != Phase::STREAMING && phase_ != Phase::AWAIT_COMPLETE) {
        fail(TransferError::PROTOCOL_VIOLATION, "Chunk request outside streaming");
        return;
    }

    // Receiver could not verify these chunks
    for (auto index : msg.indices) {
        stats_.integrity_failures++;
        if (!tracker_->requeue(index)) {
            fail(TransferError::CHUNK_INTEGRITY_FAILURE,
                 "Chunk " + std::to_string(index) + " failed verification repeatedly");
            return;
        }
    }
    if (phase_ == Phase::AWAIT_COMPLETE && !tracker_->all_acknowledged()) {
        phase_ = Phase::STREAMING;
        phase_deadline_.reset();
    }
    pump(now);
}

// Receiver

void TransferSession::handle(network::FileMetadataMessage& msg, core::TimePoint now) {
    if (direction_ != core::TransferDirection::RECEIVE || phase_ != Phase::AWAIT_METADATA) {
        fail(TransferError::PROTOCOL_VIOLATION, "Unexpected file metadata");
        return;
    }

    const auto& settings = options_.settings;
    if (msg.session_id.empty()) {
        fail(TransferError::INVALID_METADATA, "Missing session id");
        return;
    }
    if (msg.total_chunks == 0 || msg.total_chunks > settings.max_total_chunks) {
        fail(TransferError::INVALID_METADATA, "Chunk count " + std::to_string(msg.total_chunks) + " out of range");
        return;
    }
    if (msg.size > storage::MAX_FILE_SIZE) {
        fail(TransferError::INVALID_METADATA, "File too large");
        return;
    }
    auto max_chunk = settings.network_mode == core::NetworkMode::LOCAL ? storage::MAX_LOCAL_CHUNK_SIZE
                                                                       : storage::MAX_WIDE_AREA_CHUNK_SIZE;
    if (msg.chunk_size < storage::MIN_CHUNK_SIZE || msg.chunk_size > max_chunk) {
        fail(TransferError::INVALID_METADATA, "Chunk size " + std::to_string(msg.chunk_size) + " not accepted");
        return;
    }
    if (storage::chunk_count_for(msg.size, msg.chunk_size) != msg.total_chunks) {
        fail(TransferError::INVALID_METADATA, "Chunk count does not match file size");
        return;
    }
    if (!msg.encrypted_name) {
        fail(TransferError::INVALID_METADATA, "File name not encrypted");
        return;
    }

    std::vector<std::uint8_t> plain;
    auto result = keyring_.open(msg.encrypted_name->ciphertext, crypto::as_bytes(NAME_CONTEXT),
                                msg.encrypted_name->nonce, now, settings.rotation_grace, plain);
    if (!result) {
        fail(TransferError::INVALID_METADATA, "File name failed authentication");
        return;
    }
    auto name = sanitize_file_name(std::string(plain.begin(), plain.end()));
    if (!name) {
        fail(TransferError::INVALID_METADATA, "Invalid file name");
        return;
    }

    std::optional<std::filesystem::path> relative;
    if (msg.encrypted_path) {
        plain.clear();
        result = keyring_.open(msg.encrypted_path->ciphertext, crypto::as_bytes(PATH_CONTEXT),
                               msg.encrypted_path->nonce, now, settings.rotation_grace, plain);
        if (!result) {
            fail(TransferError::INVALID_METADATA, "Path failed authentication");
            return;
        }
        relative_path_.assign(plain.begin(), plain.end());
        relative = sanitize_relative_path(relative_path_);
        if (!relative) {
            fail(TransferError::INVALID_METADATA, "Invalid relative path");
            return;
        }
    }

    session_id_ = msg.session_id;
    file_name_ = *name;
    file_size_ = msg.size;
    chunk_size_ = msg.chunk_size;
    total_chunks_ = msg.total_chunks;
    file_hash_ = msg.file_hash;

    if (output_directory_) {
        auto directory = relative ? *output_directory_ / *relative : *output_directory_;
        output_path_ = directory / file_name_;
    }

    storage::AssemblyPlan plan{total_chunks_, chunk_size_, file_size_, file_hash_};
    assembler_ = std::make_unique<storage::Assembler>(plan, output_path_);
    auto opened = assembler_->open();
    if (!opened) {
        fail(TransferError::IO_ERROR, "Cannot prepare output: " + opened.message);
        return;
    }

    LOG_INFO("Session {} receiving {} ({} bytes, {} chunks)", session_id_, file_name_, file_size_, total_chunks_);
    begin_receiving(now);
}

void TransferSession::begin_receiving(core::TimePoint now) {
    if (!transition(SessionState::TRANSFERRING)) {
        return;
    }
    phase_ = Phase::STREAMING;
    phase_deadline_.reset();
    idle_deadline_ = now + idle_timeout();

    progress_.emplace(file_size_, now);
    progress_->set_baseline(assembler_->get_bytes_received());
    persist();

    if (assembler_->is_complete()) {
        finish_receive(now);
    }
}

void TransferSession::handle(network::ChunkMessage& msg, core::TimePoint now) {
    if (direction_ != core::TransferDirection::RECEIVE || phase_ != Phase::STREAMING) {
        fail(TransferError::PROTOCOL_VIOLATION, "Unexpected chunk");
        return;
    }
    idle_deadline_ = now + idle_timeout();

    if (msg.index >= total_chunks_) {
        fail(TransferError::PROTOCOL_VIOLATION, "Chunk index " + std::to_string(msg.index) + " out of range");
        return;
    }
    if (msg.ciphertext.size() > max_ciphertext_size()) {
        fail(TransferError::PROTOCOL_VIOLATION, "Chunk ciphertext exceeds the negotiated size");
        return;
    }
    if (assembler_->has_chunk(msg.index)) {
        stats_.duplicates++;
        send_control(network::encode_message(network::AckMessage{msg.index}));
        return;
    }

    std::vector<std::uint8_t> plaintext;
    auto aad = crypto::chunk_associated_data(msg.index, total_chunks_);
    auto result = keyring_.open(msg.ciphertext, aad, msg.nonce, now, options_.settings.rotation_grace, plaintext);
    if (!result) {
        stats_.integrity_failures++;
        LOG_WARN("Session {}: chunk {} failed authentication ({})", session_id_, msg.index, result.message);
        request_retransmission(msg.index);
        return;
    }

    switch (assembler_->add_chunk(msg.index, plaintext, msg.hash)) {
        case storage::AddChunkResult::STORED:
            send_control(network::encode_message(network::AckMessage{msg.index}));
            if (progress_) {
                progress_->record(plaintext.size(), now);
            }
            emit_progress(msg.index, now);
            if (assembler_->is_complete()) {
                finish_receive(now);
            }
            break;
        case storage::AddChunkResult::DUPLICATE:
            stats_.duplicates++;
            send_control(network::encode_message(network::AckMessage{msg.index}));
            break;
        case storage::AddChunkResult::REJECTED:
            stats_.integrity_failures++;
            LOG_WARN("Session {}: chunk {} failed hash verification", session_id_, msg.index);
            request_retransmission(msg.index);
            break;
        case storage::AddChunkResult::OUT_OF_RANGE:
            fail(TransferError::PROTOCOL_VIOLATION, "Chunk index out of range");
            break;
        case storage::AddChunkResult::IO_ERROR:
            fail(TransferError::IO_ERROR, "Cannot store chunk " + std::to_string(msg.index));
            break;
    }
}

void TransferSession::request_retransmission(std::uint32_t index) {
    network::ResumeChunkRequestMessage request;
    request.session_id = session_id_;
    request.indices.push_back(index);
    send_control(network::encode_message(request));
}

void TransferSession::finish_receive(core::TimePoint now) {
    storage::AssemblyResult result;
    if (output_path_) {
        result = assembler_->finalize();
    } else {
        std::vector<std::uint8_t> bytes;
        result = assembler_->assemble(bytes);
        if (result) {
            received_file_ = std::move(bytes);
        }
    }

    if (!result) {
        if (result.error == storage::AssemblyError::CORRUPTED_TRANSFER) {
            send_control(network::encode_message(network::CompleteMessage{false}));
            fail(TransferError::CORRUPTED_TRANSFER, result.message);
        } else if (result.error == storage::AssemblyError::INCOMPLETE_TRANSFER) {
            fail(TransferError::INCOMPLETE_TRANSFER, result.message);
        } else {
            fail(TransferError::IO_ERROR, result.message);
        }
        return;
    }

    send_control(network::encode_message(network::CompleteMessage{true}));
    complete(now);
}

// Resume handshake

void TransferSession::handle(network::ResumeRequestMessage& msg, core::TimePoint now) {
    if (phase_ != Phase::AWAIT_RESUME_REQUEST) {
        fail(TransferError::PROTOCOL_VIOLATION, "Unexpected resume request");
        return;
    }

    network::ResumeResponseMessage response;
    response.session_id = msg.session_id;
    response.total_chunks = total_chunks_;
    if (msg.session_id != session_id_) {
        response.can_resume = false;
        send_control(network::encode_message(response));
        fail(TransferError::RESUME_EXPIRED, "Peer asked to resume an unknown session");
        return;
    }

    auto bitmap = get_progress_bitmap();
    response.bitmap = bitmap.bytes();
    response.can_resume = true;
    send_control(network::encode_message(response));
    stats_.resumes++;

    if (direction_ == core::TransferDirection::RECEIVE) {
        LOG_INFO("Session {} resumed by sender: {}/{} chunks held", session_id_, bitmap.count(), total_chunks_);
        begin_receiving(now);
    } else {
        // The receiver names what it still needs
        phase_ = Phase::AWAIT_CHUNK_REQUEST;
        phase_deadline_ = now + options_.settings.resume_timeout;
    }
}

void TransferSession::handle(network::ResumeResponseMessage& msg, core::TimePoint now) {
    if (phase_ != Phase::AWAIT_RESUME_RESPONSE) {
        fail(TransferError::PROTOCOL_VIOLATION, "Unexpected resume response");
        return;
    }
    if (msg.session_id != session_id_) {
        fail(TransferError::PROTOCOL_VIOLATION, "Resume response for another session");
        return;
    }
    if (!msg.can_resume) {
        fail(TransferError::RESUME_EXPIRED, "Peer refused to resume");
        return;
    }
    if (msg.total_chunks != total_chunks_) {
        fail(TransferError::PROTOCOL_VIOLATION, "Resume response chunk count mismatch");
        return;
    }
    auto peer = storage::ChunkBitmap::from_bytes(total_chunks_, msg.bitmap);
    if (!peer) {
        fail(TransferError::PROTOCOL_VIOLATION, "Malformed resume bitmap");
        return;
    }
    stats_.resumes++;

    if (direction_ == core::TransferDirection::SEND) {
        LOG_INFO("Session {} resumed: receiver holds {}/{} chunks", session_id_, peer->count(), total_chunks_);
        rebuild_tracker(*peer);
        begin_streaming(now);
        return;
    }

    const auto& local = assembler_->get_received();
    auto lost = peer->difference(local);
    if (!lost.empty()) {
        LOG_WARN("Session {}: {} acknowledged chunks missing locally, requesting again", session_id_, lost.size());
    }
    network::ResumeChunkRequestMessage request;
    request.session_id = session_id_;
    request.indices = local.missing();
    LOG_INFO("Session {} resumed: requesting {} chunks", session_id_, request.indices.size());
    send_control(network::encode_message(request));
    begin_receiving(now);
}

void TransferSession::handle(network::UnsupportedMessage& msg, core::TimePoint now) {
    (void)now;
    LOG_WARN("Session {}: ignoring unsupported message type {:#04x} ({} bytes)", session_id_,
             msg.type, msg.payload_size);
}

// Shared

bool TransferSession::send_control(std::vector<std::uint8_t> message) {
    if (!channel_) {
        return false;
    }
    if (blocked_ || !control_outbox_.empty()) {
        control_outbox_.push_back(std::move(message));
        return true;
    }

    switch (channel_->send(message)) {
        case network::SendStatus::OK:
            return true;
        case network::SendStatus::BUFFER_FULL:
            blocked_ = true;
            blocked_since_sample_ = true;
            control_outbox_.push_back(std::move(message));
            return true;
        case network::SendStatus::CLOSED:
            return false;
    }
    return false;
}

void TransferSession::flush_control() {
    while (channel_ && !blocked_ && !control_outbox_.empty()) {
        switch (channel_->send(control_outbox_.front())) {
            case network::SendStatus::OK:
                control_outbox_.pop_front();
                break;
            case network::SendStatus::BUFFER_FULL:
                blocked_ = true;
                blocked_since_sample_ = true;
                return;
            case network::SendStatus::CLOSED:
                control_outbox_.clear();
                return;
        }
    }
}

void TransferSession::emit(TransferEvent event) {
    if (options_.events) {
        options_.events->push(std::move(event));
    }
}

void TransferSession::emit_progress(std::uint32_t index, core::TimePoint now) {
    if (!progress_) {
        return;
    }
    auto snapshot = progress_->snapshot();
    emit(ChunkProgress{session_id_, index, chunks_done(), total_chunks_, snapshot.bytes_done, file_size_});

    if (progress_->should_report(now)) {
        snapshot = progress_->snapshot();
        emit(SpeedEstimate{session_id_, snapshot.current_speed_bps, snapshot.eta});
    }
}

bool TransferSession::transition(SessionState next, std::optional<SessionFailure> failure) {
    auto from = get_state();
    auto result = machine_.transition(next);
    if (!result) {
        LOG_WARN("Session {}: {}", session_id_, result.message);
        return false;
    }
    if (failure) {
        failure_ = failure;
    }
    LOG_DEBUG("Session {}: {} -> {}", session_id_, to_string(from), to_string(next));
    emit(StatusChanged{session_id_, from, next, std::move(failure)});
    return true;
}

void TransferSession::fail(TransferError error, const std::string& reason, bool keep_record) {
    if (is_terminal()) {
        return;
    }
    LOG_ERROR("Session {} failed: {} ({})", session_id_, to_string(error), reason);

    // An ack timeout mid-transfer stays recoverable through the resume store
    bool keep_state = error == TransferError::ACK_TIMEOUT && get_state() == SessionState::TRANSFERRING;
    if (keep_state) {
        if (tracker_) {
            tracker_->revert_in_flight();
        }
        if (assembler_) {
            assembler_->flush();
        }
        persist();
    } else if (keep_record) {
        LOG_WARN("Session {}: resume record kept for a later attempt", session_id_);
    } else {
        forget_persisted();
        if (assembler_) {
            assembler_->discard();
        }
    }

    bool notify_peer = channel_ && error != TransferError::PEER_ABORTED &&
                       error != TransferError::CONNECTION_LOST;
    if (notify_peer) {
        auto status = channel_->send(network::encode_message(network::ErrorMessage{reason}));
        if (status != network::SendStatus::OK) {
            LOG_DEBUG("Session {}: error notice not delivered", session_id_);
        }
    }

    wipe_keys();
    phase_ = Phase::FINISHED;
    phase_deadline_.reset();
    idle_deadline_.reset();
    kex_retry_at_.reset();
    control_outbox_.clear();
    transition(SessionState::FAILED, SessionFailure{error, reason});
}

void TransferSession::complete(core::TimePoint now) {
    if (get_state() == SessionState::PAUSED) {
        transition(SessionState::TRANSFERRING);
    }
    if (!transition(SessionState::COMPLETED)) {
        return;
    }
    phase_ = Phase::FINISHED;
    phase_deadline_.reset();
    idle_deadline_.reset();

    if (progress_) {
        auto snapshot = progress_->snapshot();
        emit(SpeedEstimate{session_id_, snapshot.average_speed_bps, std::chrono::milliseconds(0)});
    }
    forget_persisted();
    wipe_keys();
    (void)now;

    LOG_INFO("Session {} completed: {} ({} chunks, {} retransmitted, {} rotations)", session_id_, file_name_,
             total_chunks_, stats_.chunks_retransmitted, stats_.key_rotations);
}

void TransferSession::enter_paused(const std::string& reason, bool connection_lost) {
    if (tracker_) {
        tracker_->revert_in_flight();
    }
    if (assembler_) {
        auto flushed = assembler_->flush();
        if (!flushed) {
            LOG_WARN("Session {}: cannot flush partial file: {}", session_id_, flushed.message);
        }
    }
    wipe_keys();
    phase_ = Phase::IDLE;
    phase_deadline_.reset();
    idle_deadline_.reset();
    kex_retry_at_.reset();
    resuming_ = false;
    control_outbox_.clear();
    blocked_ = false;

    if (!transition(SessionState::PAUSED)) {
        return;
    }
    persist();
    LOG_WARN("Session {} paused at {}/{} chunks: {}", session_id_, chunks_done(), total_chunks_, reason);

    if (connection_lost) {
        emit(ConnectionLost{session_id_, chunks_done(), total_chunks_});
    }
    emit(ResumeAvailable{session_id_, file_name_, chunks_done(), total_chunks_});
}

bool TransferSession::persist() {
    if (!options_.store || session_id_.empty()) {
        return false;
    }

    storage::PersistedSession state;
    state.session_id = session_id_;
    state.direction = direction_;
    state.file_name = file_name_;
    if (direction_ == core::TransferDirection::SEND) {
        state.file_path = chunker_ ? chunker_->get_path().string() : std::string();
    } else if (output_path_) {
        state.file_path = output_path_->string();
    }
    state.file_size = file_size_;
    state.chunk_size = chunk_size_;
    state.total_chunks = total_chunks_;
    state.file_hash = file_hash_;
    state.bitmap = get_progress_bitmap();
    state.resume_attempts = resume_attempts_;
    state.download_count = download_count_;
    state.max_downloads = options_.max_downloads;
    state.created_at = created_at_;
    state.updated_at = core::WallClock::now();
    state.expires_at = created_at_ + options_.settings.resume_expiry;
    if (options_.expires_at) {
        state.expires_at = std::min(state.expires_at, *options_.expires_at);
    }

    if (!options_.store->put(state)) {
        LOG_WARN("Session {}: cannot persist resume state", session_id_);
        return false;
    }
    return true;
}

void TransferSession::forget_persisted() {
    if (options_.store && !session_id_.empty() && !options_.store->remove(session_id_)) {
        LOG_DEBUG("Session {}: no persisted state to remove", session_id_);
    }
}

bool TransferSession::check_serving_quota(core::WallClock::time_point wall_now, bool new_download,
                                          TransferError& error, std::string& reason) {
    if (options_.expires_at && wall_now >= *options_.expires_at) {
        error = TransferError::RESUME_EXPIRED;
        reason = "Share expired";
        return false;
    }
    // A resume continues the download it belongs to
    if (!new_download) {
        return true;
    }
    if (options_.max_downloads && download_count_ >= *options_.max_downloads) {
        error = TransferError::INVALID_STATE;
        reason = "Download limit of " + std::to_string(*options_.max_downloads) + " reached";
        return false;
    }
    download_count_++;
    return true;
}

std::uint32_t TransferSession::chunks_done() const {
    if (direction_ == core::TransferDirection::SEND) {
        return tracker_ ? tracker_->acknowledged_count() : 0;
    }
    return assembler_ ? assembler_->get_received().count() : 0;
}

std::uint64_t TransferSession::bytes_in(const storage::ChunkBitmap& bitmap) const {
    std::uint64_t bytes = 0;
    for (auto index : bitmap.present()) {
        bytes += storage::expected_chunk_length(file_size_, chunk_size_, index).value_or(0);
    }
    return bytes;
}

std::chrono::milliseconds TransferSession::idle_timeout() const {
    return options_.settings.ack_timeout * (options_.settings.max_chunk_retries + 1);
}

std::size_t TransferSession::max_ciphertext_size() const {
    return std::min<std::size_t>(static_cast<std::size_t>(chunk_size_) + crypto::AEAD_TAG_SIZE,
                                 network::MAX_CIPHERTEXT_SIZE);
}

crypto::RotationPolicy TransferSession::rotation_policy() const {
    crypto::RotationPolicy policy;
    policy.interval = options_.settings.rotation_interval;
    policy.byte_limit = options_.settings.rotation_bytes;
    policy.grace = options_.settings.rotation_grace;
    return policy;
}

void TransferSession::wipe_keys() {
    keyring_.wipe();
    key_exchange_.reset();
}

}
