/// @file seven_zip_library.hpp
/// @brief Locating and loading the 7-Zip codec library used by bit7z

#pragma once

#include <expected>
#include <filesystem>
#include <memory>
#include <optional>

#include "archive_error.hpp"

namespace bit7z {
class Bit7zLibrary;
}

namespace laxy::archive {

/// @brief Find 7z.so
///
/// Search order:
/// 1. @p configured, when not empty
/// 2. $LAXY_7Z_LIBRARY
/// 3. Well-known p7zip / 7-Zip install locations
[[nodiscard]] std::optional<std::filesystem::path>
findSevenZipLibrary(const std::filesystem::path& configured = {});

/// @brief Load the library once per path and share it
[[nodiscard]] std::expected<std::shared_ptr<const bit7z::Bit7zLibrary>, ArchiveError>
loadSevenZipLibrary(const std::filesystem::path& configured = {});

}  // namespace laxy::archive
