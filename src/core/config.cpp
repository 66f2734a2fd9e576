#include "pqshare/core/config.hpp"
#include <algorithm>
#include <cctype>

namespace pqshare::core {

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        if (!key.empty()) {
            values_[key] = value;
        }
    }

    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# pqshare configuration\n\n";

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, value] : values_) {
        file << key << "=" << value << "\n";
    }

    return static_cast<bool>(file);
}

void Config::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    std::string lower = *value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    return lower == "true" || lower == "1" || lower == "yes";
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get_as<int>(key);
    return value ? *value : default_value;
}

std::int64_t Config::get_int64(const std::string& key, std::int64_t default_value) const {
    auto value = get_as<std::int64_t>(key);
    return value ? *value : default_value;
}

double Config::get_double(const std::string& key, double default_value) const {
    auto value = get_as<double>(key);
    return value ? *value : default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

void Config::set_defaults() {
    std::lock_guard<std::mutex> lock(mutex_);
    values_["transfer.ack_timeout_ms"] = "10000";
    values_["transfer.max_chunk_retries"] = "3";
    values_["transfer.max_total_chunks"] = "100000";
    values_["kex.timeout_ms"] = "30000";
    values_["kex.max_attempts"] = "3";
    values_["kex.backoff_ms"] = "1000";
    values_["rotation.interval_s"] = "300";
    values_["rotation.bytes"] = "1073741824";
    values_["rotation.grace_ms"] = "10000";
    values_["resume.timeout_ms"] = "30000";
    values_["resume.max_attempts"] = "3";
    values_["resume.expiry_hours"] = "168";
    values_["resume.database"] = "pqshare_resume.db";
    values_["network.mode"] = "wan";
    values_["bitrate.mode"] = "balanced";
    values_["group.max_recipients"] = "10";
    values_["network.port"] = "9650";
    values_["peer.timeout_s"] = "300";
    values_["log.level"] = "info";
    values_["log.file"] = "pqshare.log";
}

void Config::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.clear();
}

bool Config::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.find(key) != values_.end();
}

std::string Config::trim(const std::string& str) const {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return start < end ? std::string(start, end) : std::string();
}

std::optional<NetworkMode> parse_network_mode(const std::string& name) {
    if (name == "lan" || name == "local") return NetworkMode::LOCAL;
    if (name == "wan" || name == "wide-area") return NetworkMode::WIDE_AREA;
    return std::nullopt;
}

std::optional<BitrateMode> parse_bitrate_mode(const std::string& name) {
    if (name == "aggressive") return BitrateMode::AGGRESSIVE;
    if (name == "balanced") return BitrateMode::BALANCED;
    if (name == "conservative") return BitrateMode::CONSERVATIVE;
    return std::nullopt;
}

EngineSettings EngineSettings::from_config(const Config& config) {
    EngineSettings settings;

    auto positive = [&config](const std::string& key, std::int64_t fallback) {
        auto value = config.get_int64(key, fallback);
        return value > 0 ? value : fallback;
    };

    settings.ack_timeout = std::chrono::milliseconds(positive("transfer.ack_timeout_ms", 10000));
    settings.max_chunk_retries = static_cast<std::uint32_t>(positive("transfer.max_chunk_retries", 3));
    settings.max_total_chunks = static_cast<std::uint32_t>(
        std::min<std::int64_t>(positive("transfer.max_total_chunks", 100000), 100000));

    settings.kex_timeout = std::chrono::milliseconds(positive("kex.timeout_ms", 30000));
    settings.kex_max_attempts = static_cast<std::uint32_t>(
        std::min<std::int64_t>(positive("kex.max_attempts", 3), MAX_KEX_ATTEMPTS));
    settings.kex_backoff = std::chrono::milliseconds(positive("kex.backoff_ms", 1000));

    settings.rotation_interval = std::chrono::seconds(positive("rotation.interval_s", 300));
    settings.rotation_bytes = static_cast<std::uint64_t>(positive("rotation.bytes", 1LL << 30));
    settings.rotation_grace = std::chrono::milliseconds(positive("rotation.grace_ms", 10000));

    settings.resume_timeout = std::chrono::milliseconds(positive("resume.timeout_ms", 30000));
    settings.resume_max_attempts = static_cast<std::uint32_t>(positive("resume.max_attempts", 3));
    settings.resume_expiry = std::chrono::hours(positive("resume.expiry_hours", 168));
    settings.resume_database = config.get_string("resume.database", settings.resume_database);

    if (auto mode = parse_network_mode(config.get_string("network.mode", "wan"))) {
        settings.network_mode = *mode;
    }
    if (auto mode = parse_bitrate_mode(config.get_string("bitrate.mode", "balanced"))) {
        settings.bitrate_mode = *mode;
    }
    settings.group_max_recipients = static_cast<std::uint32_t>(
        std::min<std::int64_t>(positive("group.max_recipients", 10), 10));

    return settings;
}

}
