#pragma once

#include "pqshare/network/message_channel.hpp"
#include <boost/asio.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>

namespace pqshare::network {

using boost::asio::ip::tcp;

// Owns an io_context and the thread that runs it
class IoRuntime {
public:
    IoRuntime();
    ~IoRuntime();

    IoRuntime(const IoRuntime&) = delete;
    IoRuntime& operator=(const IoRuntime&) = delete;

    void start();
    void stop();
    boost::asio::io_context& context() { return io_context_; }

private:
    boost::asio::io_context io_context_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
    std::thread thread_;
    std::atomic<bool> running_;
};

// Length-prefixed framing over a TCP stream. Writes are queued; send() reports
// BUFFER_FULL above the high water mark and on_drain fires below the low one.
// close() stops accepting sends at once but flushes queued frames first.
class TcpChannel : public MessageChannel, public std::enable_shared_from_this<TcpChannel> {
public:
    static constexpr std::size_t FRAME_PREFIX_SIZE = 4;
    static constexpr std::size_t HIGH_WATER_MARK = 16 * 1024 * 1024;
    static constexpr std::size_t LOW_WATER_MARK = 4 * 1024 * 1024;

    TcpChannel(boost::asio::io_context& io_context, tcp::socket socket);
    ~TcpChannel() override;

    // Blocking connect; returns nullptr and logs on failure
    static std::shared_ptr<TcpChannel> connect(boost::asio::io_context& io_context,
                                               const std::string& host, std::uint16_t port);

    // Begins reading; call after set_handlers
    void start();

    void set_handlers(ChannelHandlers handlers) override;
    SendStatus send(std::vector<std::uint8_t> message) override;
    void close() override;
    bool is_open() const override { return open_.load(); }
    std::string describe() const override { return remote_endpoint_; }

    std::size_t get_queued_bytes() const;

private:
    void do_read_prefix();
    void do_read_frame(std::uint32_t frame_size);
    void do_write();
    void handle_error(const boost::system::error_code& error);
    void shutdown_socket();

    boost::asio::io_context& io_context_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    tcp::socket socket_;
    std::string remote_endpoint_;
    std::atomic<bool> open_;

    mutable std::mutex mutex_;
    ChannelHandlers handlers_;
    std::deque<std::vector<std::uint8_t>> write_queue_;
    std::size_t queued_bytes_;
    bool write_in_progress_;
    bool reported_full_;

    std::array<std::uint8_t, FRAME_PREFIX_SIZE> read_prefix_buffer_;
    std::vector<std::uint8_t> read_frame_buffer_;
};

// Accepts inbound connections, one channel per call
class TcpAcceptor {
public:
    TcpAcceptor(boost::asio::io_context& io_context, std::uint16_t port);

    std::uint16_t get_port() const;

    // Blocks until a peer connects or the timeout passes
    std::shared_ptr<TcpChannel> accept(std::chrono::milliseconds timeout);
    void close();

private:
    boost::asio::io_context& io_context_;
    tcp::acceptor acceptor_;
};

}
