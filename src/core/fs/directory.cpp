/// @file directory.cpp
/// @brief Directory scanning implementation

#include "directory.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "../util/logger.hpp"
#include "../util/string_utils.hpp"
#include "natural_sort.hpp"

namespace laxy::fs {

namespace {

/// @brief Check if entry passes the listing filter
[[nodiscard]] bool passes_filter(const FileEntry& entry, const ListingOptions& options) {
    if (entry.is_hidden() && !options.include_hidden) {
        return false;
    }

    if (options.directories_only && !entry.is_directory) {
        return false;
    }
    if (options.files_only && entry.is_directory) {
        return false;
    }

    if (!options.extensions.empty() && !entry.is_directory) {
        auto ext = entry.extension();
        return std::ranges::any_of(options.extensions, [&ext](const std::string& allowed) {
            return toLowercaseAscii(allowed) == ext;
        });
    }

    return true;
}

}  // namespace

std::string ListingOptions::key() const {
    std::string result = fmt::format("h{}d{}f{}s{}", include_hidden ? 1 : 0,
                                     directories_only ? 1 : 0, files_only ? 1 : 0, to_string(sort));
    for (const auto& ext : extensions) {
        result += '|';
        result += toLowercaseAscii(ext);
    }
    return result;
}

void sortEntries(std::vector<FileEntry>& entries, SortOrder order) {
    auto compare = [order](const FileEntry& a, const FileEntry& b) -> bool {
        // Directories always come first (except for type sort)
        if (order != SortOrder::Type && order != SortOrder::TypeDesc) {
            if (a.is_directory != b.is_directory) {
                return a.is_directory;
            }
        }

        switch (order) {
        case SortOrder::Natural:
            return naturalCompare(a.name, b.name) < 0;
        case SortOrder::NaturalDesc:
            return naturalCompare(a.name, b.name) > 0;
        case SortOrder::Name:
            return a.name < b.name;
        case SortOrder::NameDesc:
            return a.name > b.name;
        case SortOrder::Size:
            return a.size < b.size;
        case SortOrder::SizeDesc:
            return a.size > b.size;
        case SortOrder::Modified:
            return a.modified_time < b.modified_time;
        case SortOrder::ModifiedDesc:
            return a.modified_time > b.modified_time;
        case SortOrder::Type: {
            auto ext_a = a.extension();
            auto ext_b = b.extension();
            if (ext_a != ext_b) {
                return ext_a < ext_b;
            }
            return naturalCompare(a.name, b.name) < 0;
        }
        case SortOrder::TypeDesc: {
            auto ext_a = a.extension();
            auto ext_b = b.extension();
            if (ext_a != ext_b) {
                return ext_a > ext_b;
            }
            return naturalCompare(a.name, b.name) > 0;
        }
        }
        return naturalCompare(a.name, b.name) < 0;
    };

    std::stable_sort(entries.begin(), entries.end(), compare);
}

std::expected<std::vector<FileEntry>, ErrorKind> scanDirectory(const std::filesystem::path& path,
                                                              const ListingOptions& options) {
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        return std::unexpected(ec ? errorKindFromCode(ec) : ErrorKind::NotFound);
    }
    if (!std::filesystem::is_directory(status)) {
        return std::unexpected(ErrorKind::InvalidArgument);
    }

    std::filesystem::directory_iterator it(path, ec);
    if (ec) {
        return std::unexpected(errorKindFromCode(ec));
    }

    std::vector<FileEntry> entries;
    for (; it != std::filesystem::directory_iterator{}; it.increment(ec)) {
        if (ec) {
            break;
        }
        auto entry = readFileEntry(it->path());
        if (!entry) {
            // Vanished between readdir and lstat
            LOG_DEBUG("Skipping {}: {}", pathToUtf8(it->path()), to_string(entry.error()));
            continue;
        }
        if (passes_filter(*entry, options)) {
            entries.push_back(std::move(*entry));
        }
    }
    if (ec) {
        LOG_WARN("Listing of {} interrupted: {}", pathToUtf8(path), ec.message());
        return std::unexpected(errorKindFromCode(ec));
    }

    sortEntries(entries, options.sort);
    return entries;
}

TreeSummary summarizeTree(const std::filesystem::path& path) {
    TreeSummary summary;
    std::error_code ec;
    auto status = std::filesystem::symlink_status(path, ec);
    if (ec) {
        return summary;
    }

    if (!std::filesystem::is_directory(status)) {
        summary.files = 1;
        if (std::filesystem::is_regular_file(status)) {
            summary.bytes = std::filesystem::file_size(path, ec);
            if (ec) {
                summary.bytes = 0;
            }
        }
        return summary;
    }

    ++summary.directories;
    std::filesystem::recursive_directory_iterator it(
        path, std::filesystem::directory_options::skip_permission_denied, ec);
    for (; !ec && it != std::filesystem::recursive_directory_iterator{}; it.increment(ec)) {
        auto entry_status = it->symlink_status(ec);
        if (ec) {
            ec.clear();
            continue;
        }
        if (std::filesystem::is_directory(entry_status)) {
            ++summary.directories;
            continue;
        }
        ++summary.files;
        if (std::filesystem::is_regular_file(entry_status)) {
            auto size = it->file_size(ec);
            if (!ec) {
                summary.bytes += size;
            }
            ec.clear();
        }
    }
    return summary;
}

}  // namespace laxy::fs
