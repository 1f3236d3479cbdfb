/// @file natural_sort.hpp
/// @brief Natural ordering for filenames
///
/// "file1", "file2", "file10" instead of "file1", "file10", "file2".

#pragma once

#include <string_view>

namespace laxy::fs {

/// @brief Compare two UTF-8 names using natural sort order
/// @return Negative if a < b, positive if a > b, zero if equal
///
/// ASCII letters compare case-insensitively; digit runs compare by value,
/// then by leading-zero count. Other bytes compare by value.
[[nodiscard]] int naturalCompare(std::string_view a, std::string_view b) noexcept;

/// @brief Comparator for natural sorting
struct NaturalComparator {
    [[nodiscard]] bool operator()(std::string_view a, std::string_view b) const noexcept {
        return naturalCompare(a, b) < 0;
    }
};

}  // namespace laxy::fs
