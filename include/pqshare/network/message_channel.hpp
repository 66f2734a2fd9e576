#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace pqshare::network {

enum class SendStatus {
    OK,
    BUFFER_FULL,    // not accepted; retry after on_drain
    CLOSED
};

struct ChannelHandlers {
    std::function<void(std::vector<std::uint8_t>)> on_message;
    std::function<void()> on_drain;
    std::function<void()> on_closed;
};

// Message-oriented duplex transport. One send() is one message on the peer.
// Handlers may run on a transport thread and must not block.
class MessageChannel {
public:
    virtual ~MessageChannel() = default;

    virtual void set_handlers(ChannelHandlers handlers) = 0;
    virtual SendStatus send(std::vector<std::uint8_t> message) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;
    virtual std::string describe() const = 0;
};

enum class LoopbackDelivery {
    IMMEDIATE,      // the peer's on_message runs inside send()
    QUEUED          // messages wait for deliver_all()
};

// In-memory channel pair for tests and the self-test command
class LoopbackChannel : public MessageChannel {
public:
    using DropFilter = std::function<bool(std::span<const std::uint8_t>)>;
    using ChannelPair = std::pair<std::shared_ptr<LoopbackChannel>, std::shared_ptr<LoopbackChannel>>;

    // capacity bounds undelivered messages per direction in QUEUED mode; 0 is unbounded
    static ChannelPair create_pair(LoopbackDelivery delivery = LoopbackDelivery::IMMEDIATE,
                                   std::size_t capacity = 0,
                                   std::string name = "loopback");

    void set_handlers(ChannelHandlers handlers) override;
    SendStatus send(std::vector<std::uint8_t> message) override;
    void close() override;
    bool is_open() const override;
    std::string describe() const override;

    // Simulates a full send buffer on this side; unblocking fires on_drain
    void set_blocked(bool blocked);

    // Messages for which the filter returns true vanish after send() reports OK
    void set_drop_filter(DropFilter filter);

    // Delivers everything queued in both directions; returns the message count
    std::size_t deliver_all();
    std::size_t pending() const;

    std::uint64_t get_messages_sent() const;
    std::uint64_t get_messages_dropped() const;

private:
    struct Link;

    LoopbackChannel(std::shared_ptr<Link> link, int side);

    std::shared_ptr<Link> link_;
    int side_;
};

}
