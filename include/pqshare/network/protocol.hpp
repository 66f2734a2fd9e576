#pragma once

#include "pqshare/crypto/crypto_types.hpp"
#include <concepts>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace pqshare::network {

constexpr std::uint32_t PROTOCOL_MAGIC = 0x50515348; // "PQSH"
constexpr std::uint8_t PROTOCOL_VERSION = 1;
constexpr std::size_t MESSAGE_HEADER_SIZE = 8;

// Wide-area chunks are at most 256 KiB; local-path sessions negotiate up to 4 MiB
constexpr std::size_t MAX_WIDE_AREA_CIPHERTEXT_SIZE = 256 * 1024 + crypto::AEAD_TAG_SIZE;
constexpr std::size_t MAX_CIPHERTEXT_SIZE = 4 * 1024 * 1024 + crypto::AEAD_TAG_SIZE;
constexpr std::size_t MAX_MESSAGE_SIZE = MAX_CIPHERTEXT_SIZE + 1024;
constexpr std::size_t MAX_STRING_SIZE = 4096;
constexpr std::size_t MAX_KEY_MATERIAL_SIZE = 4096;

enum class MessageType : std::uint8_t {
    PUBLIC_KEY           = 0x01,
    KEY_EXCHANGE         = 0x02,
    KEY_ROTATION         = 0x03,
    FILE_METADATA        = 0x10,
    CHUNK                = 0x11,
    ACK                  = 0x12,
    COMPLETE             = 0x13,
    RESUME_REQUEST       = 0x20,
    RESUME_RESPONSE      = 0x21,
    RESUME_CHUNK_REQUEST = 0x22,
    ERROR_RESPONSE       = 0xFF
};

const char* to_string(MessageType type);

class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct MessageHeader {
    std::uint32_t magic = PROTOCOL_MAGIC;
    std::uint8_t version = PROTOCOL_VERSION;
    std::uint8_t type = 0;
    std::uint16_t reserved = 0;

    bool is_valid() const { return magic == PROTOCOL_MAGIC && version == PROTOCOL_VERSION; }

    std::vector<std::uint8_t> serialize() const;
    static MessageHeader deserialize(std::span<const std::uint8_t> data);
};

template<typename T>
concept MessagePayload = requires(T t) {
    { t.serialize() } -> std::convertible_to<std::vector<std::uint8_t>>;
    { T::deserialize(std::declval<std::span<const std::uint8_t>>()) } -> std::same_as<T>;
    { T::TYPE } -> std::convertible_to<MessageType>;
};

struct PublicKeyMessage {
    static constexpr MessageType TYPE = MessageType::PUBLIC_KEY;
    std::vector<std::uint8_t> key_bytes;

    std::vector<std::uint8_t> serialize() const;
    static PublicKeyMessage deserialize(std::span<const std::uint8_t> data);
};

struct KeyExchangeMessage {
    static constexpr MessageType TYPE = MessageType::KEY_EXCHANGE;
    std::vector<std::uint8_t> ciphertext_bytes;

    std::vector<std::uint8_t> serialize() const;
    static KeyExchangeMessage deserialize(std::span<const std::uint8_t> data);
};

struct KeyRotationMessage {
    static constexpr MessageType TYPE = MessageType::KEY_ROTATION;
    std::uint32_t generation = 0;
    std::string session_id;

    std::vector<std::uint8_t> serialize() const;
    static KeyRotationMessage deserialize(std::span<const std::uint8_t> data);
};

struct SealedField {
    std::vector<std::uint8_t> ciphertext;
    crypto::ChaCha20Nonce nonce{};
};

struct FileMetadataMessage {
    static constexpr MessageType TYPE = MessageType::FILE_METADATA;
    std::string session_id;
    std::string name;                 // empty when encrypted_name is present
    std::uint64_t size = 0;
    std::uint32_t total_chunks = 0;
    std::uint32_t chunk_size = 0;
    crypto::Digest file_hash{};
    std::optional<SealedField> encrypted_name;
    std::optional<SealedField> encrypted_path;

    std::vector<std::uint8_t> serialize() const;
    static FileMetadataMessage deserialize(std::span<const std::uint8_t> data);
};

struct ChunkMessage {
    static constexpr MessageType TYPE = MessageType::CHUNK;
    std::uint32_t index = 0;
    std::vector<std::uint8_t> ciphertext;
    crypto::ChaCha20Nonce nonce{};
    crypto::Digest hash{};

    std::vector<std::uint8_t> serialize() const;
    static ChunkMessage deserialize(std::span<const std::uint8_t> data);
};

struct AckMessage {
    static constexpr MessageType TYPE = MessageType::ACK;
    std::uint32_t index = 0;

    std::vector<std::uint8_t> serialize() const;
    static AckMessage deserialize(std::span<const std::uint8_t> data);
};

struct CompleteMessage {
    static constexpr MessageType TYPE = MessageType::COMPLETE;
    bool success = false;

    std::vector<std::uint8_t> serialize() const;
    static CompleteMessage deserialize(std::span<const std::uint8_t> data);
};

struct ErrorMessage {
    static constexpr MessageType TYPE = MessageType::ERROR_RESPONSE;
    std::string message;

    std::vector<std::uint8_t> serialize() const;
    static ErrorMessage deserialize(std::span<const std::uint8_t> data);
};

struct ResumeRequestMessage {
    static constexpr MessageType TYPE = MessageType::RESUME_REQUEST;
    std::string session_id;

    std::vector<std::uint8_t> serialize() const;
    static ResumeRequestMessage deserialize(std::span<const std::uint8_t> data);
};

struct ResumeResponseMessage {
    static constexpr MessageType TYPE = MessageType::RESUME_RESPONSE;
    std::string session_id;
    std::uint32_t total_chunks = 0;
    std::vector<std::uint8_t> bitmap;
    bool can_resume = false;

    std::vector<std::uint8_t> serialize() const;
    static ResumeResponseMessage deserialize(std::span<const std::uint8_t> data);
};

struct ResumeChunkRequestMessage {
    static constexpr MessageType TYPE = MessageType::RESUME_CHUNK_REQUEST;
    std::string session_id;
    std::vector<std::uint32_t> indices;

    std::vector<std::uint8_t> serialize() const;
    static ResumeChunkRequestMessage deserialize(std::span<const std::uint8_t> data);
};

// A well-framed message whose type tag this build does not understand
struct UnsupportedMessage {
    std::uint8_t type = 0;
    std::size_t payload_size = 0;
};

using WireMessage = std::variant<
    PublicKeyMessage,
    KeyExchangeMessage,
    KeyRotationMessage,
    FileMetadataMessage,
    ChunkMessage,
    AckMessage,
    CompleteMessage,
    ErrorMessage,
    ResumeRequestMessage,
    ResumeResponseMessage,
    ResumeChunkRequestMessage,
    UnsupportedMessage>;

template<MessagePayload T>
std::vector<std::uint8_t> encode_message(const T& payload) {
    MessageHeader header;
    header.type = static_cast<std::uint8_t>(T::TYPE);
    auto message = header.serialize();
    auto body = payload.serialize();
    message.insert(message.end(), body.begin(), body.end());
    return message;
}

// Throws ProtocolError on a bad header or malformed known payload
WireMessage decode_message(std::span<const std::uint8_t> message);

const char* message_name(const WireMessage& message);

}

static_assert(pqshare::network::MessagePayload<pqshare::network::PublicKeyMessage>);
static_assert(pqshare::network::MessagePayload<pqshare::network::KeyExchangeMessage>);
static_assert(pqshare::network::MessagePayload<pqshare::network::KeyRotationMessage>);
static_assert(pqshare::network::MessagePayload<pqshare::network::FileMetadataMessage>);
static_assert(pqshare::network::MessagePayload<pqshare::network::ChunkMessage>);
static_assert(pqshare::network::MessagePayload<pqshare::network::AckMessage>);
static_assert(pqshare::network::MessagePayload<pqshare::network::CompleteMessage>);
static_assert(pqshare::network::MessagePayload<pqshare::network::ErrorMessage>);
static_assert(pqshare::network::MessagePayload<pqshare::network::ResumeRequestMessage>);
static_assert(pqshare::network::MessagePayload<pqshare::network::ResumeResponseMessage>);
static_assert(pqshare::network::MessagePayload<pqshare::network::ResumeChunkRequestMessage>);
