/// @file bit7z_format.hpp
/// @brief Mapping between laxy archive types and bit7z (internal)

#pragma once

#include <bit7z/bit7z.hpp>

#include "archive_entry.hpp"
#include "archive_error.hpp"

namespace laxy::archive::detail {

/// @brief Format used to open @p format; compressed tars map to their outer stream
[[nodiscard]] const bit7z::BitInFormat& input_format(ArchiveFormat format, bool rar5);

/// @brief Format used to write @p format; compressed tars map to their outer stream
[[nodiscard]] const bit7z::BitInOutFormat& output_format(ArchiveFormat format);

[[nodiscard]] bit7z::BitCompressionLevel to_bit7z(CompressionLevel level) noexcept;

/// @brief Classify a bit7z failure
[[nodiscard]] ArchiveError from_bit_exception(const bit7z::BitException& e);

}  // namespace laxy::archive::detail
