#include "pqshare/network/protocol.hpp"
#include <algorithm>

namespace pqshare::network {

namespace {
    void write_uint8(std::vector<std::uint8_t>& buffer, std::uint8_t value) {
        buffer.push_back(value);
    }

    void write_uint16(std::vector<std::uint8_t>& buffer, std::uint16_t value) {
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }

    void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
        buffer.push_back((value >> 24) & 0xFF);
        buffer.push_back((value >> 16) & 0xFF);
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }

    void write_uint64(std::vector<std::uint8_t>& buffer, std::uint64_t value) {
        write_uint32(buffer, static_cast<std::uint32_t>(value >> 32));
        write_uint32(buffer, static_cast<std::uint32_t>(value & 0xFFFFFFFF));
    }

    void write_bytes(std::vector<std::uint8_t>& buffer, std::span<const std::uint8_t> data) {
        write_uint32(buffer, static_cast<std::uint32_t>(data.size()));
        buffer.insert(buffer.end(), data.begin(), data.end());
    }

    void write_string(std::vector<std::uint8_t>& buffer, const std::string& str) {
        write_uint32(buffer, static_cast<std::uint32_t>(str.size()));
        buffer.insert(buffer.end(), str.begin(), str.end());
    }

    void write_array(std::vector<std::uint8_t>& buffer, std::span<const std::uint8_t> data) {
        buffer.insert(buffer.end(), data.begin(), data.end());
    }

    void write_sealed(std::vector<std::uint8_t>& buffer, const std::optional<SealedField>& field) {
        write_uint8(buffer, field ? 1 : 0);
        if (field) {
            write_bytes(buffer, field->ciphertext);
            write_array(buffer, field->nonce);
        }
    }

    std::uint8_t read_uint8(std::span<const std::uint8_t>& data) {
        if (data.empty()) throw ProtocolError("Insufficient data for uint8");
        auto value = data[0];
        data = data.subspan(1);
        return value;
    }

    std::uint16_t read_uint16(std::span<const std::uint8_t>& data) {
        if (data.size() < 2) throw ProtocolError("Insufficient data for uint16");
        std::uint16_t value = (static_cast<std::uint16_t>(data[0]) << 8) |
                             static_cast<std::uint16_t>(data[1]);
        data = data.subspan(2);
        return value;
    }

    std::uint32_t read_uint32(std::span<const std::uint8_t>& data) {
        if (data.size() < 4) throw ProtocolError("Insufficient data for uint32");
        std::uint32_t value = (static_cast<std::uint32_t>(data[0]) << 24) |
                             (static_cast<std::uint32_t>(data[1]) << 16) |
                             (static_cast<std::uint32_t>(data[2]) << 8) |
                             static_cast<std::uint32_t>(data[3]);
        data = data.subspan(4);
        return value;
    }

    std::uint64_t read_uint64(std::span<const std::uint8_t>& data) {
        std::uint64_t high = read_uint32(data);
        std::uint64_t low = read_uint32(data);
        return (high << 32) | low;
    }

    std::vector<std::uint8_t> read_bytes(std::span<const std::uint8_t>& data, std::size_t max_size) {
        auto length = read_uint32(data);
        if (length > max_size) throw ProtocolError("Byte field exceeds limit");
        if (data.size() < length) throw ProtocolError("Insufficient data for byte field");
        std::vector<std::uint8_t> bytes(data.begin(), data.begin() + length);
        data = data.subspan(length);
        return bytes;
    }

    std::string read_string(std::span<const std::uint8_t>& data) {
        auto length = read_uint32(data);
        if (length > MAX_STRING_SIZE) throw ProtocolError("String exceeds limit");
        if (data.size() < length) throw ProtocolError("Insufficient data for string");
        std::string str(reinterpret_cast<const char*>(data.data()), length);
        data = data.subspan(length);
        return str;
    }

    template<size_t N>
    std::array<std::uint8_t, N> read_array(std::span<const std::uint8_t>& data) {
        if (data.size() < N) throw ProtocolError("Insufficient data for array");
        std::array<std::uint8_t, N> arr;
        std::copy(data.begin(), data.begin() + N, arr.begin());
        data = data.subspan(N);
        return arr;
    }

    std::optional<SealedField> read_sealed(std::span<const std::uint8_t>& data) {
        auto present = read_uint8(data);
        if (present > 1) throw ProtocolError("Invalid optional marker");
        if (!present) {
            return std::nullopt;
        }
        SealedField field;
        field.ciphertext = read_bytes(data, MAX_STRING_SIZE + crypto::AEAD_TAG_SIZE);
        field.nonce = read_array<crypto::CHACHA20_NONCE_SIZE>(data);
        return field;
    }

    void expect_end(std::span<const std::uint8_t> data) {
        if (!data.empty()) throw ProtocolError("Trailing bytes after payload");
    }
}

const char* to_string(MessageType type) {
    switch (type) {
        case MessageType::PUBLIC_KEY: return "PublicKey";
        case MessageType::KEY_EXCHANGE: return "KeyExchange";
        case MessageType::KEY_ROTATION: return "KeyRotation";
        case MessageType::FILE_METADATA: return "FileMetadata";
        case MessageType::CHUNK: return "Chunk";
        case MessageType::ACK: return "Ack";
        case MessageType::COMPLETE: return "Complete";
        case MessageType::RESUME_REQUEST: return "ResumeRequest";
        case MessageType::RESUME_RESPONSE: return "ResumeResponse";
        case MessageType::RESUME_CHUNK_REQUEST: return "ResumeChunkRequest";
        case MessageType::ERROR_RESPONSE: return "Error";
    }
    return "Unknown";
}

std::vector<std::uint8_t> MessageHeader::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(MESSAGE_HEADER_SIZE);
    write_uint32(buffer, magic);
    write_uint8(buffer, version);
    write_uint8(buffer, type);
    write_uint16(buffer, reserved);
    return buffer;
}

MessageHeader MessageHeader::deserialize(std::span<const std::uint8_t> data) {
    MessageHeader header;
    header.magic = read_uint32(data);
    header.version = read_uint8(data);
    header.type = read_uint8(data);
    header.reserved = read_uint16(data);
    return header;
}

std::vector<std::uint8_t> PublicKeyMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_bytes(buffer, key_bytes);
    return buffer;
}

PublicKeyMessage PublicKeyMessage::deserialize(std::span<const std::uint8_t> data) {
    PublicKeyMessage msg;
    msg.key_bytes = read_bytes(data, MAX_KEY_MATERIAL_SIZE);
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> KeyExchangeMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_bytes(buffer, ciphertext_bytes);
    return buffer;
}

KeyExchangeMessage KeyExchangeMessage::deserialize(std::span<const std::uint8_t> data) {
    KeyExchangeMessage msg;
    msg.ciphertext_bytes = read_bytes(data, MAX_KEY_MATERIAL_SIZE);
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> KeyRotationMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_uint32(buffer, generation);
    write_string(buffer, session_id);
    return buffer;
}

KeyRotationMessage KeyRotationMessage::deserialize(std::span<const std::uint8_t> data) {
    KeyRotationMessage msg;
    msg.generation = read_uint32(data);
    msg.session_id = read_string(data);
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> FileMetadataMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, session_id);
    write_string(buffer, name);
    write_uint64(buffer, size);
    write_uint32(buffer, total_chunks);
    write_uint32(buffer, chunk_size);
    write_array(buffer, file_hash);
    write_sealed(buffer, encrypted_name);
    write_sealed(buffer, encrypted_path);
    return buffer;
}

FileMetadataMessage FileMetadataMessage::deserialize(std::span<const std::uint8_t> data) {
    FileMetadataMessage msg;
    msg.session_id = read_string(data);
    msg.name = read_string(data);
    msg.size = read_uint64(data);
    msg.total_chunks = read_uint32(data);
    msg.chunk_size = read_uint32(data);
    msg.file_hash = read_array<crypto::DIGEST_SIZE>(data);
    msg.encrypted_name = read_sealed(data);
    msg.encrypted_path = read_sealed(data);
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> ChunkMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(4 + 4 + ciphertext.size() + nonce.size() + hash.size());
    write_uint32(buffer, index);
    write_bytes(buffer, ciphertext);
    write_array(buffer, nonce);
    write_array(buffer, hash);
    return buffer;
}

ChunkMessage ChunkMessage::deserialize(std::span<const std::uint8_t> data) {
    ChunkMessage msg;
    msg.index = read_uint32(data);
    msg.ciphertext = read_bytes(data, MAX_CIPHERTEXT_SIZE);
    msg.nonce = read_array<crypto::CHACHA20_NONCE_SIZE>(data);
    msg.hash = read_array<crypto::DIGEST_SIZE>(data);
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> AckMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_uint32(buffer, index);
    return buffer;
}

AckMessage AckMessage::deserialize(std::span<const std::uint8_t> data) {
    AckMessage msg;
    msg.index = read_uint32(data);
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> CompleteMessage::serialize() const {
    return {static_cast<std::uint8_t>(success ? 1 : 0)};
}

CompleteMessage CompleteMessage::deserialize(std::span<const std::uint8_t> data) {
    CompleteMessage msg;
    auto flag = read_uint8(data);
    if (flag > 1) throw ProtocolError("Invalid completion flag");
    msg.success = flag == 1;
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> ErrorMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, message.size() > MAX_STRING_SIZE ? message.substr(0, MAX_STRING_SIZE) : message);
    return buffer;
}

ErrorMessage ErrorMessage::deserialize(std::span<const std::uint8_t> data) {
    ErrorMessage msg;
    msg.message = read_string(data);
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> ResumeRequestMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, session_id);
    return buffer;
}

ResumeRequestMessage ResumeRequestMessage::deserialize(std::span<const std::uint8_t> data) {
    ResumeRequestMessage msg;
    msg.session_id = read_string(data);
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> ResumeResponseMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, session_id);
    write_uint32(buffer, total_chunks);
    write_bytes(buffer, bitmap);
    write_uint8(buffer, can_resume ? 1 : 0);
    return buffer;
}

ResumeResponseMessage ResumeResponseMessage::deserialize(std::span<const std::uint8_t> data) {
    ResumeResponseMessage msg;
    msg.session_id = read_string(data);
    msg.total_chunks = read_uint32(data);
    msg.bitmap = read_bytes(data, (static_cast<std::size_t>(msg.total_chunks) + 7) / 8);
    auto flag = read_uint8(data);
    if (flag > 1) throw ProtocolError("Invalid resume flag");
    msg.can_resume = flag == 1;
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> ResumeChunkRequestMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(8 + session_id.size() + indices.size() * 4);
    write_string(buffer, session_id);
    write_uint32(buffer, static_cast<std::uint32_t>(indices.size()));
    for (auto index : indices) {
        write_uint32(buffer, index);
    }
    return buffer;
}

ResumeChunkRequestMessage ResumeChunkRequestMessage::deserialize(std::span<const std::uint8_t> data) {
    ResumeChunkRequestMessage msg;
    msg.session_id = read_string(data);
    auto count = read_uint32(data);
    if (count > data.size() / 4) throw ProtocolError("Index list exceeds payload");
    msg.indices.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        msg.indices.push_back(read_uint32(data));
    }
    expect_end(data);
    return msg;
}

WireMessage decode_message(std::span<const std::uint8_t> message) {
    if (message.size() < MESSAGE_HEADER_SIZE) {
        throw ProtocolError("Message shorter than header");
    }
    if (message.size() > MAX_MESSAGE_SIZE) {
        throw ProtocolError("Message exceeds maximum size");
    }

    auto header = MessageHeader::deserialize(message.first(MESSAGE_HEADER_SIZE));
    if (!header.is_valid()) {
        throw ProtocolError("Invalid message header");
    }

    auto payload = message.subspan(MESSAGE_HEADER_SIZE);
    switch (static_cast<MessageType>(header.type)) {
        case MessageType::PUBLIC_KEY: return PublicKeyMessage::deserialize(payload);
        case MessageType::KEY_EXCHANGE: return KeyExchangeMessage::deserialize(payload);
        case MessageType::KEY_ROTATION: return KeyRotationMessage::deserialize(payload);
        case MessageType::FILE_METADATA: return FileMetadataMessage::deserialize(payload);
        case MessageType::CHUNK: return ChunkMessage::deserialize(payload);
        case MessageType::ACK: return AckMessage::deserialize(payload);
        case MessageType::COMPLETE: return CompleteMessage::deserialize(payload);
        case MessageType::ERROR_RESPONSE: return ErrorMessage::deserialize(payload);
        case MessageType::RESUME_REQUEST: return ResumeRequestMessage::deserialize(payload);
        case MessageType::RESUME_RESPONSE: return ResumeResponseMessage::deserialize(payload);
        case MessageType::RESUME_CHUNK_REQUEST: return ResumeChunkRequestMessage::deserialize(payload);
    }

    return UnsupportedMessage{header.type, payload.size()};
}

const char* message_name(const WireMessage& message) {
    return std::visit([](const auto& msg) -> const char* {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, UnsupportedMessage>) {
            return "Unsupported";
        } else {
            return to_string(T::TYPE);
        }
    }, message);
}

}
