#pragma once

#include "pqshare/core/config.hpp"
#include "pqshare/core/types.hpp"
#include "pqshare/crypto/hybrid_key_exchange.hpp"
#include "pqshare/crypto/session_keyring.hpp"
#include "pqshare/network/message_channel.hpp"
#include "pqshare/network/protocol.hpp"
#include "pqshare/storage/assembler.hpp"
#include "pqshare/storage/chunker.hpp"
#include "pqshare/storage/resume_store.hpp"
#include "pqshare/transfer/adaptive_bitrate.hpp"
#include "pqshare/transfer/bandwidth_limiter.hpp"
#include "pqshare/transfer/chunk_tracker.hpp"
#include "pqshare/transfer/events.hpp"
#include "pqshare/transfer/progress.hpp"
#include "pqshare/transfer/transfer_state.hpp"
#include <deque>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace pqshare::transfer {

struct SessionOptions {
    core::EngineSettings settings;
    std::shared_ptr<EventQueue> events;
    std::shared_ptr<storage::ResumeStore> store;

    // Sender-side share policy
    std::optional<std::uint32_t> max_downloads;
    std::optional<core::WallClock::time_point> expires_at;

    // Ceiling on the paced rate; zero leaves it to the controller
    std::uint64_t bandwidth_limit = 0;

    // Sent encrypted next to the name when non-empty
    std::string relative_path;
};

struct SessionStats {
    std::uint32_t chunks_sent = 0;
    std::uint32_t chunks_retransmitted = 0;
    std::uint32_t ack_timeouts = 0;
    std::uint32_t integrity_failures = 0;
    std::uint32_t duplicates = 0;
    std::uint32_t key_rotations = 0;
    std::uint32_t resumes = 0;
};

// One file transfer between two endpoints. The session never blocks or reads
// the steady clock: callers feed it messages, channel signals and the current
// time, and it writes to the attached channel. Wall-clock time is only used for
// persisted bookkeeping. Not thread-safe; one driver at a time.
class TransferSession {
public:
    // The chunker is opened and hashed here, unless the caller already holds
    // the whole-file digest of the same content
    static std::unique_ptr<TransferSession> create_sender(storage::Chunker source,
                                                          std::string file_name,
                                                          SessionOptions options,
                                                          std::optional<crypto::Digest> known_hash = std::nullopt);

    // With an output directory the file lands there under its sent name;
    // without one it is assembled in memory (see take_received_file)
    static std::unique_ptr<TransferSession> create_receiver(std::optional<std::filesystem::path> output_directory,
                                                            SessionOptions options);

    // Rebuilds a Paused session from durable state
    static std::unique_ptr<TransferSession> restore(const storage::PersistedSession& persisted,
                                                    SessionOptions options);

    ~TransferSession();

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    // Binds the channel used for all further sends; the caller routes the
    // channel's handlers to on_message / on_drain / on_channel_closed
    void attach(std::shared_ptr<network::MessageChannel> channel);
    void detach();

    // Pending -> Negotiating; the sender opens the key exchange
    TransferResult start(core::TimePoint now);

    // Paused session, this side initiates the resume handshake
    TransferResult resume(core::TimePoint now, core::WallClock::time_point wall_now = core::WallClock::now());

    // Paused session, waits for the peer's resume handshake
    TransferResult accept_resume(core::TimePoint now, core::WallClock::time_point wall_now = core::WallClock::now());

    // Transferring -> Paused on request; persists progress
    TransferResult pause(core::TimePoint now);

    void cancel(core::TimePoint now);

    void on_message(std::span<const std::uint8_t> bytes, core::TimePoint now);
    void on_drain(core::TimePoint now);
    void on_channel_closed(core::TimePoint now);

    // Timers, key rotation and sending
    void poll(core::TimePoint now);

    // Earliest time poll() has work to do
    std::optional<core::TimePoint> next_wakeup(core::TimePoint now);

    const std::string& get_session_id() const { return session_id_; }
    core::TransferDirection get_direction() const { return direction_; }
    SessionState get_state() const { return machine_.get_state(); }
    bool is_terminal() const { return machine_.is_terminal(); }
    const std::optional<SessionFailure>& get_failure() const { return failure_; }

    // Paused with no resume handshake under way
    bool is_awaiting_resume() const { return get_state() == SessionState::PAUSED && phase_ == Phase::IDLE; }

    const std::string& get_file_name() const { return file_name_; }
    const std::string& get_relative_path() const { return relative_path_; }
    std::uint64_t get_file_size() const { return file_size_; }
    std::uint32_t get_chunk_size() const { return chunk_size_; }
    std::uint32_t get_total_chunks() const { return total_chunks_; }
    const crypto::Digest& get_file_hash() const { return file_hash_; }

    // Acknowledged (sender) or stored (receiver) chunk indices
    storage::ChunkBitmap get_progress_bitmap() const;
    double get_progress() const;

    const SessionStats& get_stats() const { return stats_; }
    const AdaptiveConfig& get_adaptive_config() const { return controller_.get_config(); }
    std::uint32_t get_key_generation() const { return keyring_.get_generation(); }

    std::optional<std::filesystem::path> get_output_path() const;

    // In-memory receivers only, after completion
    std::optional<std::vector<std::uint8_t>> take_received_file();

private:
    enum class Phase {
        IDLE,
        AWAIT_PUBLIC_KEY,
        AWAIT_KEY_EXCHANGE,
        AWAIT_METADATA,
        AWAIT_RESUME_REQUEST,
        AWAIT_RESUME_RESPONSE,
        AWAIT_CHUNK_REQUEST,
        STREAMING,
        AWAIT_COMPLETE,
        FINISHED
    };

    TransferSession(core::TransferDirection direction, SessionOptions options);

    // Dispatch
    void handle(network::PublicKeyMessage& msg, core::TimePoint now);
    void handle(network::KeyExchangeMessage& msg, core::TimePoint now);
    void handle(network::KeyRotationMessage& msg, core::TimePoint now);
    void handle(network::FileMetadataMessage& msg, core::TimePoint now);
    void handle(network::ChunkMessage& msg, core::TimePoint now);
    void handle(network::AckMessage& msg, core::TimePoint now);
    void handle(network::CompleteMessage& msg, core::TimePoint now);
    void handle(network::ErrorMessage& msg, core::TimePoint now);
    void handle(network::ResumeRequestMessage& msg, core::TimePoint now);
    void handle(network::ResumeResponseMessage& msg, core::TimePoint now);
    void handle(network::ResumeChunkRequestMessage& msg, core::TimePoint now);
    void handle(network::UnsupportedMessage& msg, core::TimePoint now);

    // Key exchange
    void send_public_key(core::TimePoint now);
    bool establish_keys(crypto::KeyExchangeRole role, core::TimePoint now);
    void after_key_agreement(core::TimePoint now);

    // Sender
    void send_metadata(core::TimePoint now);
    void begin_streaming(core::TimePoint now);
    void maybe_rotate(core::TimePoint now);
    void pump(core::TimePoint now);
    bool send_chunk(std::uint32_t index, core::TimePoint now);
    void report_sample(std::optional<std::chrono::microseconds> rtt, core::TimePoint now);
    void check_sender_done(core::TimePoint now);
    void rebuild_tracker(const storage::ChunkBitmap& held_by_peer);

    // Receiver
    void begin_receiving(core::TimePoint now);
    void request_retransmission(std::uint32_t index);
    void finish_receive(core::TimePoint now);

    // Shared
    bool send_control(std::vector<std::uint8_t> message);
    void flush_control();
    void emit(TransferEvent event);
    void emit_progress(std::uint32_t index, core::TimePoint now);
    bool transition(SessionState next, std::optional<SessionFailure> failure = std::nullopt);
    // keep_record leaves the durable resume state untouched
    void fail(TransferError error, const std::string& reason, bool keep_record = false);
    void complete(core::TimePoint now);
    void enter_paused(const std::string& reason, bool connection_lost);
    bool persist();
    void forget_persisted();
    bool check_serving_quota(core::WallClock::time_point wall_now, bool new_download,
                             TransferError& error, std::string& reason);
    std::uint32_t chunks_done() const;
    std::uint64_t bytes_in(const storage::ChunkBitmap& bitmap) const;
    std::chrono::milliseconds idle_timeout() const;
    std::size_t max_ciphertext_size() const;
    crypto::RotationPolicy rotation_policy() const;
    void wipe_keys();

    SessionStateMachine machine_;
    Phase phase_ = Phase::IDLE;
    core::TransferDirection direction_;
    SessionOptions options_;
    std::string session_id_;
    std::optional<SessionFailure> failure_;
    SessionStats stats_;

    std::shared_ptr<network::MessageChannel> channel_;
    bool blocked_ = false;
    std::deque<std::vector<std::uint8_t>> control_outbox_;

    crypto::HybridKeyExchange key_exchange_;
    crypto::SessionKeyring keyring_;
    crypto::KeyExchangeRole role_ = crypto::KeyExchangeRole::INITIATOR;
    bool resuming_ = false;
    std::uint32_t kex_attempts_ = 0;
    std::optional<core::TimePoint> kex_retry_at_;
    std::uint32_t resume_requests_sent_ = 0;
    std::optional<core::TimePoint> phase_deadline_;
    std::optional<core::TimePoint> idle_deadline_;

    // File description
    std::string file_name_;
    std::string relative_path_;
    std::uint64_t file_size_ = 0;
    std::uint32_t chunk_size_ = 0;
    std::uint32_t total_chunks_ = 0;
    crypto::Digest file_hash_{};

    // Sender side
    std::optional<storage::Chunker> chunker_;
    std::optional<ChunkTracker> tracker_;

    // Receiver side
    std::optional<std::filesystem::path> output_directory_;
    std::optional<std::filesystem::path> output_path_;
    std::unique_ptr<storage::Assembler> assembler_;
    std::optional<std::vector<std::uint8_t>> received_file_;

    AdaptiveBitrateController controller_;
    std::optional<BandwidthLimiter> limiter_;
    std::optional<core::TimePoint> next_send_at_;
    std::optional<ProgressEstimator> progress_;

    // Congestion sample accumulation since the last report
    std::uint32_t acks_since_sample_ = 0;
    std::uint32_t timeouts_since_sample_ = 0;
    bool blocked_since_sample_ = false;
    std::chrono::microseconds last_rtt_{0};
    std::chrono::microseconds jitter_{0};

    // Durable bookkeeping
    std::uint32_t resume_attempts_ = 0;
    std::uint32_t download_count_ = 0;
    core::WallClock::time_point created_at_{};
};

}
