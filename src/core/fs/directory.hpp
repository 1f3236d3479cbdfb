/// @file directory.hpp
/// @brief Directory scanning and file listing

#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "file_entry.hpp"

namespace laxy::fs {

/// @brief Sort order for directory listings
enum class SortOrder {
    Natural,  // Natural sort (default)
    NaturalDesc,
    Name,  // Byte order
    NameDesc,
    Size,
    SizeDesc,
    Modified,
    ModifiedDesc,
    Type,  // By extension, then natural name
    TypeDesc
};

/// @brief Get string representation of SortOrder
[[nodiscard]] constexpr std::string_view to_string(SortOrder order) noexcept {
    switch (order) {
    case SortOrder::Natural:
        return "natural";
    case SortOrder::NaturalDesc:
        return "natural_desc";
    case SortOrder::Name:
        return "name";
    case SortOrder::NameDesc:
        return "name_desc";
    case SortOrder::Size:
        return "size";
    case SortOrder::SizeDesc:
        return "size_desc";
    case SortOrder::Modified:
        return "modified";
    case SortOrder::ModifiedDesc:
        return "modified_desc";
    case SortOrder::Type:
        return "type";
    case SortOrder::TypeDesc:
        return "type_desc";
    }
    return "natural";
}

/// @brief Filter and ordering options for a listing
///
/// Two listings of the same directory with equal options share a cache slot.
struct ListingOptions {
    bool include_hidden = false;
    bool directories_only = false;
    bool files_only = false;
    std::vector<std::string> extensions;  // Lowercase with dot; empty = all
    SortOrder sort = SortOrder::Natural;

    /// @brief Stable cache key for these options
    [[nodiscard]] std::string key() const;
};

/// @brief List a directory (non-recursive)
/// @param path Directory path
/// @param options Filter and sort options
/// @return Entries, or NotFound / PermissionDenied / InvalidArgument (not a directory)
[[nodiscard]] std::expected<std::vector<FileEntry>, ErrorKind>
scanDirectory(const std::filesystem::path& path, const ListingOptions& options = {});

/// @brief Sort entries in place; directories first except for type ordering
void sortEntries(std::vector<FileEntry>& entries, SortOrder order);

/// @brief Totals of a recursive walk
struct TreeSummary {
    uint64_t files = 0;
    uint64_t directories = 0;
    uint64_t bytes = 0;
};

/// @brief Count files and bytes below @p path (a single file counts as one)
///
/// Symlinks are counted as files and never followed. Unreadable
/// subdirectories are skipped.
[[nodiscard]] TreeSummary summarizeTree(const std::filesystem::path& path);

}  // namespace laxy::fs
