#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace pqshare::core::utils {

class StringUtils {
public:
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static std::vector<std::string> split(const std::string& str, char delimiter);

    static std::string to_hex(std::span<const std::uint8_t> bytes);
    static std::optional<std::vector<std::uint8_t>> from_hex(const std::string& hex);

    static std::string format_bytes(std::uint64_t bytes);
    static std::string format_rate(double bytes_per_second);
    static std::string format_duration(std::chrono::milliseconds duration);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static std::optional<std::uint64_t> file_size(const std::filesystem::path& path);
    static bool create_directories(const std::filesystem::path& path);
};

class TimeUtils {
public:
    static std::int64_t to_unix_ms(std::chrono::system_clock::time_point time);
    static std::chrono::system_clock::time_point from_unix_ms(std::int64_t ms);
    static std::string to_iso_string(std::chrono::system_clock::time_point time);
};

}
