#include "pqshare/network/message_channel.hpp"
#include "pqshare/core/logger.hpp"
#include <deque>
#include <mutex>

namespace pqshare::network {

struct LoopbackChannel::Link {
    mutable std::mutex mutex;
    LoopbackDelivery delivery;
    std::size_t capacity;
    std::string name;
    bool open = true;

    struct Side {
        ChannelHandlers handlers;
        DropFilter drop_filter;
        std::deque<std::vector<std::uint8_t>> outbound;
        bool blocked = false;
        bool reported_full = false;
        std::uint64_t sent = 0;
        std::uint64_t dropped = 0;
    };
    Side sides[2];
};

LoopbackChannel::ChannelPair LoopbackChannel::create_pair(LoopbackDelivery delivery,
                                                          std::size_t capacity,
                                                          std::string name) {
    auto link = std::make_shared<Link>();
    link->delivery = delivery;
    link->capacity = capacity;
    link->name = std::move(name);

    std::shared_ptr<LoopbackChannel> a(new LoopbackChannel(link, 0));
    std::shared_ptr<LoopbackChannel> b(new LoopbackChannel(link, 1));
    return {a, b};
}

LoopbackChannel::LoopbackChannel(std::shared_ptr<Link> link, int side)
    : link_(std::move(link))
    , side_(side) {
}

void LoopbackChannel::set_handlers(ChannelHandlers handlers) {
    std::lock_guard<std::mutex> lock(link_->mutex);
    link_->sides[side_].handlers = std::move(handlers);
}

SendStatus LoopbackChannel::send(std::vector<std::uint8_t> message) {
    std::function<void(std::vector<std::uint8_t>)> deliver;
    {
        std::lock_guard<std::mutex> lock(link_->mutex);
        auto& self = link_->sides[side_];

        if (!link_->open) {
            return SendStatus::CLOSED;
        }
        if (self.blocked) {
            self.reported_full = true;
            return SendStatus::BUFFER_FULL;
        }
        if (link_->delivery == LoopbackDelivery::QUEUED &&
            link_->capacity > 0 && self.outbound.size() >= link_->capacity) {
            self.reported_full = true;
            return SendStatus::BUFFER_FULL;
        }

        self.sent++;
        if (self.drop_filter && self.drop_filter(message)) {
            self.dropped++;
            return SendStatus::OK;
        }

        if (link_->delivery == LoopbackDelivery::QUEUED) {
            self.outbound.push_back(std::move(message));
            return SendStatus::OK;
        }
        deliver = link_->sides[1 - side_].handlers.on_message;
    }

    if (deliver) {
        deliver(std::move(message));
    }
    return SendStatus::OK;
}

void LoopbackChannel::close() {
    std::function<void()> closed_handlers[2];
    {
        std::lock_guard<std::mutex> lock(link_->mutex);
        if (!link_->open) {
            return;
        }
        link_->open = false;
        for (int i = 0; i < 2; ++i) {
            link_->sides[i].outbound.clear();
            closed_handlers[i] = link_->sides[i].handlers.on_closed;
        }
    }

    LOG_DEBUG("{} closed by side {}", link_->name, side_);
    for (auto& handler : closed_handlers) {
        if (handler) {
            handler();
        }
    }
}

bool LoopbackChannel::is_open() const {
    std::lock_guard<std::mutex> lock(link_->mutex);
    return link_->open;
}

std::string LoopbackChannel::describe() const {
    return link_->name + "#" + std::to_string(side_);
}

void LoopbackChannel::set_blocked(bool blocked) {
    std::function<void()> drain;
    {
        std::lock_guard<std::mutex> lock(link_->mutex);
        auto& self = link_->sides[side_];
        self.blocked = blocked;
        if (!blocked && self.reported_full) {
            self.reported_full = false;
            drain = self.handlers.on_drain;
        }
    }

    if (drain) {
        drain();
    }
}

void LoopbackChannel::set_drop_filter(DropFilter filter) {
    std::lock_guard<std::mutex> lock(link_->mutex);
    link_->sides[side_].drop_filter = std::move(filter);
}

std::size_t LoopbackChannel::deliver_all() {
    std::deque<std::vector<std::uint8_t>> batches[2];
    std::function<void(std::vector<std::uint8_t>)> receivers[2];
    std::function<void()> drains[2];
    {
        std::lock_guard<std::mutex> lock(link_->mutex);
        if (!link_->open) {
            return 0;
        }
        for (int i = 0; i < 2; ++i) {
            auto& side = link_->sides[i];
            batches[i].swap(side.outbound);
            receivers[i] = link_->sides[1 - i].handlers.on_message;
            if (side.reported_full && !side.blocked && !batches[i].empty()) {
                side.reported_full = false;
                drains[i] = side.handlers.on_drain;
            }
        }
    }

    std::size_t delivered = 0;
    for (int i = 0; i < 2; ++i) {
        for (auto& message : batches[i]) {
            if (!is_open()) {
                return delivered;
            }
            if (receivers[i]) {
                receivers[i](std::move(message));
            }
            delivered++;
        }
    }

    for (auto& drain : drains) {
        if (drain) {
            drain();
        }
    }
    return delivered;
}

std::size_t LoopbackChannel::pending() const {
    std::lock_guard<std::mutex> lock(link_->mutex);
    return link_->sides[0].outbound.size() + link_->sides[1].outbound.size();
}

std::uint64_t LoopbackChannel::get_messages_sent() const {
    std::lock_guard<std::mutex> lock(link_->mutex);
    return link_->sides[side_].sent;
}

std::uint64_t LoopbackChannel::get_messages_dropped() const {
    std::lock_guard<std::mutex> lock(link_->mutex);
    return link_->sides[side_].dropped;
}

}
