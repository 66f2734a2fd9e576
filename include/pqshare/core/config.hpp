#pragma once

#include "pqshare/core/types.hpp"
#include <chrono>
#include <cstdint>
#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace pqshare::core {

class Config {
public:
    static Config& instance();

    bool load_from_file(const std::string& filename);
    bool save_to_file(const std::string& filename) const;

    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;

    bool get_bool(const std::string& key, bool default_value = false) const;
    int get_int(const std::string& key, int default_value = 0) const;
    std::int64_t get_int64(const std::string& key, std::int64_t default_value = 0) const;
    double get_double(const std::string& key, double default_value = 0.0) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;

    template<typename T>
    std::optional<T> get_as(const std::string& key) const {
        auto value = get(key);
        if (!value) {
            return std::nullopt;
        }

        std::istringstream iss(*value);
        T result;
        if (!(iss >> result) || !iss.eof()) {
            return std::nullopt;
        }
        return result;
    }

    void set_defaults();
    void clear();
    bool contains(const std::string& key) const;

private:
    Config() = default;

    std::string trim(const std::string& str) const;

    mutable std::mutex mutex_;
    std::map<std::string, std::string> values_;
};

// Typed view of the engine keys, read once when a session or group is built
struct EngineSettings {
    static constexpr std::int64_t MAX_KEX_ATTEMPTS = 10;

    std::chrono::milliseconds ack_timeout{10000};
    std::uint32_t max_chunk_retries = 3;
    std::uint32_t max_total_chunks = 100000;

    std::chrono::milliseconds kex_timeout{30000};
    std::uint32_t kex_max_attempts = 3;
    std::chrono::milliseconds kex_backoff{1000};

    std::chrono::seconds rotation_interval{300};
    std::uint64_t rotation_bytes = 1ULL << 30;
    std::chrono::milliseconds rotation_grace{10000};

    std::chrono::milliseconds resume_timeout{30000};
    std::uint32_t resume_max_attempts = 3;
    std::chrono::hours resume_expiry{168};
    std::string resume_database = "pqshare_resume.db";

    NetworkMode network_mode = NetworkMode::WIDE_AREA;
    BitrateMode bitrate_mode = BitrateMode::BALANCED;
    std::uint32_t group_max_recipients = 10;

    static EngineSettings from_config(const Config& config);
};

std::optional<NetworkMode> parse_network_mode(const std::string& name);
std::optional<BitrateMode> parse_bitrate_mode(const std::string& name);

}
