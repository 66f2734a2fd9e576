#include "pqshare/transfer/transfer_state.hpp"

namespace pqshare::transfer {

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::PENDING: return "Pending";
        case SessionState::NEGOTIATING: return "Negotiating";
        case SessionState::TRANSFERRING: return "Transferring";
        case SessionState::PAUSED: return "Paused";
        case SessionState::COMPLETED: return "Completed";
        case SessionState::FAILED: return "Failed";
        case SessionState::CANCELLED: return "Cancelled";
    }
    return "Unknown";
}

const char* to_string(ChunkState state) {
    switch (state) {
        case ChunkState::PENDING: return "Pending";
        case ChunkState::IN_FLIGHT: return "InFlight";
        case ChunkState::ACKNOWLEDGED: return "Acknowledged";
        case ChunkState::FAILED: return "Failed";
    }
    return "Unknown";
}

const char* to_string(TransferError error) {
    switch (error) {
        case TransferError::NONE: return "none";
        case TransferError::KEY_EXCHANGE_TIMEOUT: return "key exchange timeout";
        case TransferError::KEY_EXCHANGE_FAILED: return "key exchange failed";
        case TransferError::CHUNK_INTEGRITY_FAILURE: return "chunk integrity failure";
        case TransferError::ACK_TIMEOUT: return "acknowledgement timeout";
        case TransferError::CORRUPTED_TRANSFER: return "corrupted transfer";
        case TransferError::RESUME_EXPIRED: return "resume expired";
        case TransferError::RESUME_EXHAUSTED: return "resume attempts exhausted";
        case TransferError::RECIPIENT_FAILURE: return "recipient failure";
        case TransferError::INCOMPLETE_TRANSFER: return "incomplete transfer";
        case TransferError::INVALID_METADATA: return "invalid metadata";
        case TransferError::PROTOCOL_VIOLATION: return "protocol violation";
        case TransferError::PEER_ABORTED: return "peer aborted";
        case TransferError::IO_ERROR: return "i/o error";
        case TransferError::CANCELLED: return "cancelled";
        case TransferError::INVALID_RECIPIENT: return "invalid recipient";
        case TransferError::INVALID_STATE: return "invalid state";
        case TransferError::CONNECTION_LOST: return "connection lost";
    }
    return "unknown";
}

bool is_terminal(SessionState state) {
    return state == SessionState::COMPLETED ||
           state == SessionState::FAILED ||
           state == SessionState::CANCELLED;
}

bool can_transition(SessionState from, SessionState to) {
    if (is_terminal(from) || from == to) {
        return false;
    }

    switch (to) {
        case SessionState::PENDING:
            return false;
        case SessionState::NEGOTIATING:
            return from == SessionState::PENDING;
        case SessionState::TRANSFERRING:
            return from == SessionState::NEGOTIATING || from == SessionState::PAUSED;
        case SessionState::PAUSED:
            return from == SessionState::TRANSFERRING;
        case SessionState::COMPLETED:
            return from == SessionState::TRANSFERRING;
        case SessionState::FAILED:
        case SessionState::CANCELLED:
            return true;
    }
    return false;
}

TransferResult SessionStateMachine::transition(SessionState next) {
    if (!can_transition(state_, next)) {
        return TransferResult(TransferError::INVALID_STATE,
                              std::string("Illegal transition ") + to_string(state_) + " -> " + to_string(next));
    }
    state_ = next;
    return TransferResult();
}

}
