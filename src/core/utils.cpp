#include "chunkstream/core/utils.hpp"
#include <charconv>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace chunkstream::core::utils {

std::string StringUtils::format_bytes(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit < 4) {
        size /= 1024.0;
        unit++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << units[unit];
    return oss.str();
}

std::string StringUtils::format_duration(std::chrono::milliseconds duration) {
    auto ms = duration.count();

    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    }

    auto seconds = ms / 1000;
    if (seconds < 60) {
        return std::to_string(seconds) + "s";
    }

    auto minutes = seconds / 60;
    seconds %= 60;

    if (minutes < 60) {
        return std::to_string(minutes) + "m " + std::to_string(seconds) + "s";
    }

    auto hours = minutes / 60;
    minutes %= 60;

    return std::to_string(hours) + "h " + std::to_string(minutes) + "m";
}

std::optional<int64_t> StringUtils::parse_int(const std::string& str, int64_t min, int64_t max) {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc() || ptr != str.data() + str.size() || str.empty()) {
        return std::nullopt;
    }
    if (value < min || value > max) {
        return std::nullopt;
    }
    return value;
}

bool FileUtils::exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

std::filesystem::path FileUtils::get_home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) {
        home = std::getenv("USERPROFILE");
    }
    return home ? std::filesystem::path(home) : std::filesystem::path(".");
}

std::string TimeUtils::format_timestamp(const std::chrono::system_clock::time_point& time) {
    auto time_t = std::chrono::system_clock::to_time_t(time);
    std::tm local_time{};
    localtime_r(&time_t, &local_time);

    std::ostringstream oss;
    oss << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

}
