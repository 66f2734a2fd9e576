#pragma once

#include <chrono>
#include <cstdint>

namespace pqshare::core {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using WallClock = std::chrono::system_clock;

enum class TransferDirection : std::uint8_t {
    SEND = 0,
    RECEIVE = 1
};

enum class NetworkMode : std::uint8_t {
    LOCAL = 0,      // low latency, high bandwidth path
    WIDE_AREA = 1
};

enum class BitrateMode : std::uint8_t {
    AGGRESSIVE,
    BALANCED,
    CONSERVATIVE
};

inline const char* to_string(TransferDirection direction) {
    return direction == TransferDirection::SEND ? "send" : "receive";
}

inline const char* to_string(NetworkMode mode) {
    return mode == NetworkMode::LOCAL ? "local" : "wide-area";
}

inline const char* to_string(BitrateMode mode) {
    switch (mode) {
        case BitrateMode::AGGRESSIVE: return "aggressive";
        case BitrateMode::BALANCED: return "balanced";
        case BitrateMode::CONSERVATIVE: return "conservative";
    }
    return "balanced";
}

}
