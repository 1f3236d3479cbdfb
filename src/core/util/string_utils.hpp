/// @file string_utils.hpp
/// @brief String conversion and manipulation utilities

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace laxy {

/// @brief Convert filesystem path to UTF-8 string
[[nodiscard]] std::string pathToUtf8(const std::filesystem::path& path);

/// @brief Convert UTF-8 string to filesystem path
[[nodiscard]] std::filesystem::path utf8ToPath(std::string_view utf8);

/// @brief Make string lowercase (ASCII only)
[[nodiscard]] std::string toLowercaseAscii(std::string_view str);

/// @brief Trim whitespace from both ends of string
[[nodiscard]] std::string_view trim(std::string_view str);

/// @brief Check if string ends with suffix (case-insensitive, ASCII)
[[nodiscard]] bool endsWithIcase(std::string_view str, std::string_view suffix);

/// @brief Human readable byte count ("512 B", "1.5 KiB", "3.2 GiB")
[[nodiscard]] std::string formatSize(uint64_t bytes);

/// @brief Human readable duration ("850 ms", "12.4 s", "3 min 05 s")
[[nodiscard]] std::string formatDuration(std::chrono::milliseconds duration);

}  // namespace laxy
