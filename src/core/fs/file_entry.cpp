/// @file file_entry.cpp
/// @brief File metadata implementation

#include "file_entry.hpp"

#include <sys/stat.h>

#include <array>
#include <cerrno>

#include "../util/string_utils.hpp"

namespace laxy::fs {

namespace {

constexpr std::array<std::string_view, 10> kArchiveSuffixes = {
    ".tar.gz", ".tar.bz2", ".tar.xz", ".tgz", ".tbz2", ".txz", ".zip", ".tar", ".7z", ".rar"};

constexpr std::array<std::string_view, 9> kImageExtensions = {
    ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".webp", ".tiff", ".svg", ".ico"};

constexpr std::array<std::string_view, 14> kCodeExtensions = {
    ".c", ".cc", ".cpp", ".h", ".hpp", ".py", ".rs", ".go", ".js", ".ts", ".java", ".sh",
    ".cmake", ".toml"};

constexpr std::array<std::string_view, 5> kTextExtensions = {".txt", ".md", ".log", ".csv",
                                                             ".json"};

template <size_t N>
[[nodiscard]] bool contains(const std::array<std::string_view, N>& list, std::string_view value) {
    for (auto item : list) {
        if (item == value) {
            return true;
        }
    }
    return false;
}

[[nodiscard]] std::chrono::system_clock::time_point to_time_point(const struct timespec& ts) {
    auto duration = std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec);
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(duration));
}

[[nodiscard]] ErrorKind errno_to_kind(int error) {
    return errorKindFromCode(std::error_code(error, std::generic_category()));
}

}  // namespace

std::string FileEntry::extension() const {
    auto dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return {};
    }
    return toLowercaseAscii(std::string_view(name).substr(dot));
}

EnrichedFileEntry enrich(const FileEntry& entry) {
    EnrichedFileEntry enriched;
    enriched.entry = entry;
    enriched.hidden = entry.is_hidden();
    enriched.executable =
        !entry.is_directory &&
        (entry.permissions & (std::filesystem::perms::owner_exec | std::filesystem::perms::group_exec |
                              std::filesystem::perms::others_exec)) != std::filesystem::perms::none;

    auto ext = entry.extension();
    if (entry.is_directory) {
        enriched.icon_hint = "folder";
    } else if (entry.kind == FileKind::Archive) {
        enriched.icon_hint = "archive";
    } else if (entry.is_symlink) {
        enriched.icon_hint = "link";
    } else if (contains(kImageExtensions, ext)) {
        enriched.icon_hint = "image";
    } else if (contains(kCodeExtensions, ext)) {
        enriched.icon_hint = "code";
    } else if (contains(kTextExtensions, ext)) {
        enriched.icon_hint = "text";
    } else {
        enriched.icon_hint = "file";
    }
    return enriched;
}

bool isArchiveName(std::string_view filename) noexcept {
    for (auto suffix : kArchiveSuffixes) {
        if (endsWithIcase(filename, suffix)) {
            return true;
        }
    }
    return false;
}

std::expected<FileEntry, ErrorKind> readFileEntry(const std::filesystem::path& path) {
    struct stat link_info {};
    if (::lstat(path.c_str(), &link_info) != 0) {
        return std::unexpected(errno_to_kind(errno));
    }

    FileEntry entry;
    entry.path = path;
    entry.name = pathToUtf8(path.filename());
    entry.is_symlink = S_ISLNK(link_info.st_mode);

    // Describe the target of a resolvable link
    struct stat info = link_info;
    if (entry.is_symlink) {
        struct stat target {};
        if (::stat(path.c_str(), &target) == 0) {
            info = target;
        }
    }

    entry.size = S_ISREG(info.st_mode) ? static_cast<uint64_t>(info.st_size) : 0;
    entry.modified_time = to_time_point(info.st_mtim);
    entry.is_directory = S_ISDIR(info.st_mode);
    entry.permissions = static_cast<std::filesystem::perms>(info.st_mode & 07777);
    entry.device_id = static_cast<uint64_t>(info.st_dev);

    if (entry.is_symlink) {
        entry.kind = FileKind::Symlink;
    } else if (entry.is_directory) {
        entry.kind = FileKind::Directory;
    } else if (S_ISREG(info.st_mode)) {
        entry.kind = isArchiveName(entry.name) ? FileKind::Archive : FileKind::File;
    } else {
        entry.kind = FileKind::Other;
    }

    return entry;
}

std::optional<uint64_t> deviceIdOf(const std::filesystem::path& path) {
    auto current = path.empty() ? std::filesystem::path(".") : path;
    if (current.is_relative()) {
        std::error_code ec;
        current = std::filesystem::absolute(current, ec);
        if (ec) {
            return std::nullopt;
        }
    }

    while (true) {
        struct stat info {};
        if (::stat(current.c_str(), &info) == 0) {
            return static_cast<uint64_t>(info.st_dev);
        }
        if (!current.has_parent_path() || current.parent_path() == current) {
            return std::nullopt;
        }
        current = current.parent_path();
    }
}

bool sameVolume(const std::filesystem::path& a, const std::filesystem::path& b) {
    auto device_a = deviceIdOf(a);
    auto device_b = deviceIdOf(b);
    return device_a && device_b && *device_a == *device_b;
}

}  // namespace laxy::fs
