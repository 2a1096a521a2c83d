#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <filesystem>
#include <cstdint>

namespace chunkrelay::core::utils {

class StringUtils {
public:
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static bool starts_with(const std::string& str, const std::string& prefix);
    static std::string format_bytes(size_t bytes);
    static std::string format_duration(std::chrono::milliseconds duration);
};

class UrlUtils {
public:
    // RFC 3986 unreserved characters pass through; everything else is %XX.
    static std::string encode(const std::string& value, bool keep_slashes = false);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static std::filesystem::path get_home_dir();
    static std::filesystem::path expand_user(const std::string& path);
};

class TimeUtils {
public:
    static std::string to_iso_string(const std::chrono::system_clock::time_point& time);

    // "Sun, 06 Nov 1994 08:49:37 GMT"
    static std::optional<std::chrono::system_clock::time_point> from_http_date(const std::string& str);
};

}
