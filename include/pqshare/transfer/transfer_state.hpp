#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace pqshare::transfer {

enum class SessionState : std::uint8_t {
    PENDING,
    NEGOTIATING,
    TRANSFERRING,
    PAUSED,
    COMPLETED,
    FAILED,
    CANCELLED
};

enum class ChunkState : std::uint8_t {
    PENDING,
    IN_FLIGHT,
    ACKNOWLEDGED,
    FAILED
};

enum class TransferError {
    NONE = 0,
    KEY_EXCHANGE_TIMEOUT,
    KEY_EXCHANGE_FAILED,
    CHUNK_INTEGRITY_FAILURE,
    ACK_TIMEOUT,
    CORRUPTED_TRANSFER,
    RESUME_EXPIRED,
    RESUME_EXHAUSTED,
    RECIPIENT_FAILURE,
    INCOMPLETE_TRANSFER,
    INVALID_METADATA,
    PROTOCOL_VIOLATION,
    PEER_ABORTED,
    IO_ERROR,
    CANCELLED,
    INVALID_RECIPIENT,
    INVALID_STATE,
    CONNECTION_LOST
};

const char* to_string(SessionState state);
const char* to_string(ChunkState state);
const char* to_string(TransferError error);

bool is_terminal(SessionState state);

// Pending -> Negotiating -> Transferring -> {Completed | Failed | Cancelled},
// Transferring <-> Paused. Nothing leaves a terminal state.
bool can_transition(SessionState from, SessionState to);

struct TransferResult {
    TransferError error;
    std::string message;

    TransferResult(TransferError err = TransferError::NONE, std::string msg = "")
        : error(err), message(std::move(msg)) {}

    bool success() const { return error == TransferError::NONE; }
    operator bool() const { return success(); }
};

// Surfaced once, with the transition into Failed or Cancelled
struct SessionFailure {
    TransferError error = TransferError::NONE;
    std::string reason;
};

class SessionStateMachine {
public:
    SessionStateMachine() : state_(SessionState::PENDING) {}
    // Sessions rebuilt from persisted state start out Paused
    explicit SessionStateMachine(SessionState initial) : state_(initial) {}

    SessionState get_state() const { return state_; }
    bool is_terminal() const { return transfer::is_terminal(state_); }

    // Rejected transitions leave the state unchanged
    TransferResult transition(SessionState next);

private:
    SessionState state_;
};

}
