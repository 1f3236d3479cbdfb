/// @file string_utils.cpp
/// @brief String conversion and manipulation utilities implementation

#include "string_utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <ranges>

#include <fmt/format.h>

namespace laxy {

std::string pathToUtf8(const std::filesystem::path& path) {
    auto utf8 = path.u8string();
    return std::string(utf8.begin(), utf8.end());
}

std::filesystem::path utf8ToPath(std::string_view utf8) {
    return std::filesystem::path(std::u8string(utf8.begin(), utf8.end()));
}

std::string toLowercaseAscii(std::string_view str) {
    std::string result(str);
    std::ranges::transform(result, result.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string_view trim(std::string_view str) {
    // Find first non-whitespace
    size_t start = 0;
    while (start < str.size() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }

    if (start == str.size()) {
        return {};
    }

    // Find last non-whitespace
    size_t end = str.size();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }

    return str.substr(start, end - start);
}

bool endsWithIcase(std::string_view str, std::string_view suffix) {
    if (str.size() < suffix.size()) {
        return false;
    }
    return std::ranges::equal(
        str.substr(str.size() - suffix.size()), suffix,
        [](unsigned char a, unsigned char b) { return std::tolower(a) == std::tolower(b); });
}

std::string formatSize(uint64_t bytes) {
    constexpr std::array<std::string_view, 5> units = {"KiB", "MiB", "GiB", "TiB", "PiB"};

    if (bytes < 1024) {
        return fmt::format("{} B", bytes);
    }

    double value = static_cast<double>(bytes) / 1024.0;
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < units.size()) {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.1f} {}", value, units[unit]);
}

std::string formatDuration(std::chrono::milliseconds duration) {
    auto ms = duration.count();
    if (ms < 1000) {
        return fmt::format("{} ms", ms);
    }
    if (ms < 60'000) {
        return fmt::format("{:.1f} s", static_cast<double>(ms) / 1000.0);
    }
    auto total_seconds = ms / 1000;
    return fmt::format("{} min {:02} s", total_seconds / 60, total_seconds % 60);
}

}  // namespace laxy
