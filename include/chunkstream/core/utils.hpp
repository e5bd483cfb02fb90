#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace chunkstream::core::utils {

class StringUtils {
public:
    static std::string format_bytes(uint64_t bytes);
    static std::string format_duration(std::chrono::milliseconds duration);

    // Whole decimal string in [min, max], nothing else
    static std::optional<int64_t> parse_int(const std::string& str, int64_t min, int64_t max);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static std::filesystem::path get_home_dir();
};

class TimeUtils {
public:
    static std::string format_timestamp(const std::chrono::system_clock::time_point& time);
};

}
