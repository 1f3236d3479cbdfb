/// @file trash.cpp
/// @brief Trash operations implementation

#include "trash.hpp"

#include <cerrno>
#include <chrono>
#include <ctime>
#include <fstream>

#include <fmt/format.h>
#include <gio/gio.h>

#include "../util/logger.hpp"
#include "../util/string_utils.hpp"

namespace laxy::fs {

namespace {

[[nodiscard]] TrashError error_code_to_trash_error(const std::error_code& ec) {
    if (ec == std::errc::no_such_file_or_directory) {
        return TrashError::NotFound;
    }
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted ||
        ec == std::errc::read_only_file_system) {
        return TrashError::AccessDenied;
    }
    return TrashError::IoError;
}

/// @brief Move to the desktop trash with GIO
/// @return true on success; false means fall back to the local directory
[[nodiscard]] bool trash_with_gio(const std::filesystem::path& path) {
    GFile* file = g_file_new_for_path(path.c_str());
    GError* error = nullptr;

    bool trashed = g_file_trash(file, nullptr, &error) != 0;
    if (!trashed) {
        LOG_DEBUG("g_file_trash failed for {}: {}", pathToUtf8(path),
                  error ? error->message : "unknown error");
    }

    if (error) {
        g_error_free(error);
    }
    g_object_unref(file);
    return trashed;
}

/// @brief Percent-encode a path for the .trashinfo Path= key
[[nodiscard]] std::string encode_trash_path(std::string_view path) {
    std::string result;
    for (unsigned char c : path) {
        bool unreserved = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                          (c >= '0' && c <= '9') || c == '/' || c == '-' || c == '_' ||
                          c == '.' || c == '~';
        if (unreserved) {
            result += static_cast<char>(c);
        } else {
            result += fmt::format("%{:02X}", c);
        }
    }
    return result;
}

[[nodiscard]] std::string deletion_date() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &local);
    return buffer;
}

/// @brief First free name in files/ whose info record is also free
[[nodiscard]] std::string unique_trash_name(const std::filesystem::path& files_dir,
                                            const std::filesystem::path& info_dir,
                                            const std::filesystem::path& original) {
    auto name = pathToUtf8(original.filename());
    auto stem = pathToUtf8(original.stem());
    auto ext = pathToUtf8(original.extension());

    std::string candidate = name;
    std::error_code ec;
    for (int counter = 1;; ++counter) {
        bool taken = std::filesystem::exists(std::filesystem::symlink_status(files_dir / candidate, ec)) ||
                     std::filesystem::exists(info_dir / (candidate + ".trashinfo"), ec);
        if (!taken) {
            return candidate;
        }
        candidate = fmt::format("{}_{}{}", stem, counter, ext);
    }
}

/// @brief Move across filesystems: copy the tree, then remove the source
[[nodiscard]] std::error_code move_across_devices(const std::filesystem::path& from,
                                                  const std::filesystem::path& to) {
    std::error_code ec;
    std::filesystem::copy(from, to,
                          std::filesystem::copy_options::recursive |
                              std::filesystem::copy_options::copy_symlinks,
                          ec);
    if (ec) {
        std::error_code cleanup;
        std::filesystem::remove_all(to, cleanup);
        return ec;
    }
    std::filesystem::remove_all(from, ec);
    return ec;
}

[[nodiscard]] std::expected<TrashedItem, TrashError>
trash_to_directory(const std::filesystem::path& path, const std::filesystem::path& trash_dir) {
    if (trash_dir.empty()) {
        return std::unexpected(TrashError::Unavailable);
    }

    auto files_dir = trash_dir / "files";
    auto info_dir = trash_dir / "info";
    std::error_code ec;
    std::filesystem::create_directories(files_dir, ec);
    if (!ec) {
        std::filesystem::create_directories(info_dir, ec);
    }
    if (ec) {
        LOG_ERROR("Cannot create trash directory {}: {}", pathToUtf8(trash_dir), ec.message());
        return std::unexpected(TrashError::Unavailable);
    }

    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        absolute = path;
    }

    auto trash_name = unique_trash_name(files_dir, info_dir, absolute);
    auto info_path = info_dir / (trash_name + ".trashinfo");
    {
        std::ofstream info(info_path);
        if (!info) {
            return std::unexpected(TrashError::IoError);
        }
        info << "[Trash Info]\n"
             << "Path=" << encode_trash_path(pathToUtf8(absolute.lexically_normal())) << "\n"
             << "DeletionDate=" << deletion_date() << "\n";
    }

    auto target = files_dir / trash_name;
    std::filesystem::rename(absolute, target, ec);
    if (ec == std::errc::cross_device_link) {
        ec = move_across_devices(absolute, target);
    }
    if (ec) {
        std::error_code cleanup;
        std::filesystem::remove(info_path, cleanup);
        LOG_ERROR("Failed to move {} to trash: {}", pathToUtf8(absolute), ec.message());
        return std::unexpected(error_code_to_trash_error(ec));
    }

    return TrashedItem{absolute, target, false};
}

}  // namespace

std::expected<TrashedItem, TrashError> trashFile(const std::filesystem::path& path,
                                                 const TrashOptions& options) {
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::symlink_status(path, ec))) {
        return std::unexpected(TrashError::NotFound);
    }

    if (options.use_system_trash && trash_with_gio(path)) {
        LOG_INFO("Moved {} to trash", pathToUtf8(path));
        return TrashedItem{path, {}, true};
    }

    auto result = trash_to_directory(path, options.trash_dir);
    if (result) {
        LOG_INFO("Moved {} to {}", pathToUtf8(path), pathToUtf8(result->location));
    }
    return result;
}

std::expected<uint64_t, TrashError> permanentDelete(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::symlink_status(path, ec))) {
        return std::unexpected(TrashError::NotFound);
    }

    auto removed = std::filesystem::remove_all(path, ec);
    if (ec) {
        LOG_ERROR("Failed to delete {}: {}", pathToUtf8(path), ec.message());
        return std::unexpected(error_code_to_trash_error(ec));
    }
    return static_cast<uint64_t>(removed);
}

}  // namespace laxy::fs
