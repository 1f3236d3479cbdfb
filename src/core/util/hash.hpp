/// @file hash.hpp
/// @brief Cryptographic hash utilities using OpenSSL EVP
///
/// Provides SHA256 hashing for copy verification.

#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace laxy {

/// @brief SHA256 hash result (32 bytes)
using Sha256Hash = std::array<uint8_t, 32>;

/// @brief Hash computation errors
enum class HashError {
    InitializationFailed,
    ComputationFailed,
    FileReadFailed,
};

/// @brief Get string representation of hash error
[[nodiscard]] constexpr std::string_view to_string(HashError error) noexcept {
    switch (error) {
    case HashError::InitializationFailed:
        return "Hash initialization failed";
    case HashError::ComputationFailed:
        return "Hash computation failed";
    case HashError::FileReadFailed:
        return "Failed to read file for hashing";
    }
    return "Unknown hash error";
}

/// @brief Compute SHA256 hash of data
/// @param data Data to hash
/// @return Hash result or error
[[nodiscard]] std::expected<Sha256Hash, HashError> sha256(std::span<const uint8_t> data);

/// @brief Compute SHA256 hash of string
/// @param str String to hash
/// @return Hash result or error
[[nodiscard]] std::expected<Sha256Hash, HashError> sha256(std::string_view str);

/// @brief Compute SHA256 hash of a file's content
///
/// Reads the file in fixed-size chunks, so memory use does not depend
/// on the file size.
/// @param path File to hash
/// @param chunk_size Read buffer size in bytes
/// @return Hash result or error
[[nodiscard]] std::expected<Sha256Hash, HashError> sha256File(const std::filesystem::path& path,
                                                              size_t chunk_size = 64 * 1024);

/// @brief Convert hash to hexadecimal string
/// @param hash Hash bytes
/// @return 64-character lowercase hex string
[[nodiscard]] std::string hashToHex(const Sha256Hash& hash);

/// @brief Compute SHA256 hash of string and return as hex string
/// @param str String to hash
/// @return Hex string or error
[[nodiscard]] std::expected<std::string, HashError> sha256Hex(std::string_view str);

}  // namespace laxy
