#include "pqshare/network/tcp_channel.hpp"
#include "pqshare/core/logger.hpp"
#include "pqshare/network/protocol.hpp"
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <future>

namespace pqshare::network {

IoRuntime::IoRuntime()
    : io_context_()
    , running_(false) {
}

IoRuntime::~IoRuntime() {
    stop();
}

void IoRuntime::start() {
    if (running_.exchange(true)) {
        return;
    }

    work_guard_.emplace(boost::asio::make_work_guard(io_context_));
    thread_ = std::thread([this]() {
        while (running_) {
            try {
                io_context_.run();
                break;
            } catch (const std::exception& e) {
                LOG_ERROR("IO context error: {}", e.what());
                if (!running_) break;
                io_context_.restart();
            }
        }
    });
}

void IoRuntime::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    work_guard_.reset();
    io_context_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

TcpChannel::TcpChannel(boost::asio::io_context& io_context, tcp::socket socket)
    : io_context_(io_context)
    , strand_(boost::asio::make_strand(io_context))
    , socket_(std::move(socket))
    , open_(true)
    , queued_bytes_(0)
    , write_in_progress_(false)
    , reported_full_(false) {

    try {
        remote_endpoint_ = socket_.remote_endpoint().address().to_string() + ":" +
                          std::to_string(socket_.remote_endpoint().port());
    } catch (const std::exception& e) {
        remote_endpoint_ = "unknown";
        LOG_WARN("Failed to get remote endpoint: {}", e.what());
    }

    boost::system::error_code ec;
    socket_.set_option(tcp::no_delay(true), ec);

    LOG_INFO("Channel open to {}", remote_endpoint_);
}

TcpChannel::~TcpChannel() {
    boost::system::error_code ec;
    socket_.close(ec);
    LOG_DEBUG("Channel to {} destroyed", remote_endpoint_);
}

std::shared_ptr<TcpChannel> TcpChannel::connect(boost::asio::io_context& io_context,
                                                const std::string& host, std::uint16_t port) {
    try {
        tcp::resolver resolver(io_context);
        auto endpoints = resolver.resolve(host, std::to_string(port));

        tcp::socket socket(io_context);
        boost::asio::connect(socket, endpoints);
        return std::make_shared<TcpChannel>(io_context, std::move(socket));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to connect to {}:{}: {}", host, port, e.what());
        return nullptr;
    }
}

void TcpChannel::start() {
    auto self = shared_from_this();
    boost::asio::post(strand_, [this, self]() {
        do_read_prefix();
    });
}

void TcpChannel::set_handlers(ChannelHandlers handlers) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_ = std::move(handlers);
}

SendStatus TcpChannel::send(std::vector<std::uint8_t> message) {
    if (message.size() > MAX_MESSAGE_SIZE) {
        LOG_ERROR("Refusing to send {} byte message to {}", message.size(), remote_endpoint_);
        return SendStatus::CLOSED;
    }

    bool start_write = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) {
            return SendStatus::CLOSED;
        }
        if (queued_bytes_ >= HIGH_WATER_MARK) {
            reported_full_ = true;
            return SendStatus::BUFFER_FULL;
        }

        std::vector<std::uint8_t> frame;
        frame.reserve(FRAME_PREFIX_SIZE + message.size());
        auto size = static_cast<std::uint32_t>(message.size());
        frame.push_back((size >> 24) & 0xFF);
        frame.push_back((size >> 16) & 0xFF);
        frame.push_back((size >> 8) & 0xFF);
        frame.push_back(size & 0xFF);
        frame.insert(frame.end(), message.begin(), message.end());

        queued_bytes_ += frame.size();
        write_queue_.push_back(std::move(frame));

        if (!write_in_progress_) {
            write_in_progress_ = true;
            start_write = true;
        }
    }

    if (start_write) {
        auto self = shared_from_this();
        boost::asio::post(strand_, [this, self]() {
            do_write();
        });
    }
    return SendStatus::OK;
}

void TcpChannel::close() {
    if (!open_.exchange(false)) {
        return;
    }

    LOG_INFO("Closing channel to {}", remote_endpoint_);

    std::function<void()> on_closed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        on_closed = handlers_.on_closed;
    }

    // Frames already queued still go out; the socket shuts down once they have
    auto self = shared_from_this();
    boost::asio::post(strand_, [this, self]() {
        bool idle = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            idle = !write_in_progress_;
        }
        if (idle) {
            shutdown_socket();
        }
    });

    if (on_closed) {
        on_closed();
    }
}

void TcpChannel::shutdown_socket() {
    if (!socket_.is_open()) {
        return;
    }
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    LOG_DEBUG("Socket to {} shut down", remote_endpoint_);
}

std::size_t TcpChannel::get_queued_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queued_bytes_;
}

void TcpChannel::do_read_prefix() {
    if (!open_) {
        return;
    }

    auto self = shared_from_this();
    boost::asio::async_read(socket_,
        boost::asio::buffer(read_prefix_buffer_),
        boost::asio::bind_executor(strand_,
            [this, self](boost::system::error_code ec, std::size_t) {
                if (ec) {
                    handle_error(ec);
                    return;
                }

                std::uint32_t frame_size = (static_cast<std::uint32_t>(read_prefix_buffer_[0]) << 24) |
                                           (static_cast<std::uint32_t>(read_prefix_buffer_[1]) << 16) |
                                           (static_cast<std::uint32_t>(read_prefix_buffer_[2]) << 8) |
                                           static_cast<std::uint32_t>(read_prefix_buffer_[3]);

                if (frame_size < MESSAGE_HEADER_SIZE || frame_size > MAX_MESSAGE_SIZE) {
                    LOG_ERROR("Invalid frame size {} from {}", frame_size, remote_endpoint_);
                    close();
                    return;
                }
                do_read_frame(frame_size);
            }));
}

void TcpChannel::do_read_frame(std::uint32_t frame_size) {
    read_frame_buffer_.resize(frame_size);

    auto self = shared_from_this();
    boost::asio::async_read(socket_,
        boost::asio::buffer(read_frame_buffer_),
        boost::asio::bind_executor(strand_,
            [this, self](boost::system::error_code ec, std::size_t) {
                if (ec) {
                    handle_error(ec);
                    return;
                }

                if (!open_) {
                    return;
                }

                std::function<void(std::vector<std::uint8_t>)> on_message;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    on_message = handlers_.on_message;
                }
                if (on_message) {
                    on_message(std::move(read_frame_buffer_));
                }
                read_frame_buffer_.clear();
                do_read_prefix();
            }));
}

void TcpChannel::do_write() {
    std::vector<std::uint8_t>* frame = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!write_queue_.empty()) {
            frame = &write_queue_.front();
        } else {
            write_in_progress_ = false;
        }
    }
    if (!frame) {
        if (!open_) {
            shutdown_socket();
        }
        return;
    }

    auto self = shared_from_this();
    boost::asio::async_write(socket_,
        boost::asio::buffer(*frame),
        boost::asio::bind_executor(strand_,
            [this, self](boost::system::error_code ec, std::size_t length) {
                if (ec) {
                    handle_error(ec);
                    return;
                }

                std::function<void()> on_drain;
                bool more = false;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (!write_queue_.empty()) {
                        write_queue_.pop_front();
                    }
                    queued_bytes_ = queued_bytes_ > length ? queued_bytes_ - length : 0;
                    if (reported_full_ && queued_bytes_ <= LOW_WATER_MARK) {
                        reported_full_ = false;
                        on_drain = handlers_.on_drain;
                    }
                    more = !write_queue_.empty();
                    if (!more) {
                        write_in_progress_ = false;
                    }
                }

                if (on_drain) {
                    on_drain();
                }
                if (more) {
                    do_write();
                } else if (!open_) {
                    shutdown_socket();
                }
            }));
}

void TcpChannel::handle_error(const boost::system::error_code& error) {
    if (error == boost::asio::error::eof) {
        LOG_INFO("Channel to {} closed by peer", remote_endpoint_);
    } else if (error == boost::asio::error::operation_aborted) {
        LOG_DEBUG("Channel operation aborted for {}", remote_endpoint_);
    } else {
        LOG_ERROR("Channel error with {}: {}", remote_endpoint_, error.message());
    }

    if (open_) {
        close();
    }
    // Pending writes complete with operation_aborted once the socket is gone
    shutdown_socket();
}

TcpAcceptor::TcpAcceptor(boost::asio::io_context& io_context, std::uint16_t port)
    : io_context_(io_context)
    , acceptor_(io_context, tcp::endpoint(tcp::v4(), port)) {
    LOG_INFO("Listening on port {}", get_port());
}

std::uint16_t TcpAcceptor::get_port() const {
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

std::shared_ptr<TcpChannel> TcpAcceptor::accept(std::chrono::milliseconds timeout) {
    auto promise = std::make_shared<std::promise<std::shared_ptr<TcpChannel>>>();
    auto future = promise->get_future();

    acceptor_.async_accept(
        [this, promise](boost::system::error_code ec, tcp::socket socket) {
            if (ec) {
                if (ec != boost::asio::error::operation_aborted) {
                    LOG_ERROR("Accept error: {}", ec.message());
                }
                promise->set_value(nullptr);
                return;
            }
            promise->set_value(std::make_shared<TcpChannel>(io_context_, std::move(socket)));
        });

    if (future.wait_for(timeout) != std::future_status::ready) {
        boost::asio::post(io_context_, [this]() {
            boost::system::error_code ec;
            acceptor_.cancel(ec);
        });
    }
    return future.get();
}

void TcpAcceptor::close() {
    boost::asio::post(io_context_, [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
    });
}

}
