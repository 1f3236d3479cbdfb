/// @file seven_zip_library.cpp
/// @brief 7-Zip library locator

#include "seven_zip_library.hpp"

#include <array>
#include <cstdlib>
#include <map>
#include <mutex>
#include <string_view>

#include <bit7z/bit7z.hpp>

#include "../util/logger.hpp"
#include "../util/string_utils.hpp"

namespace laxy::archive {

namespace {

constexpr std::array<std::string_view, 7> kLibraryLocations = {
    "/usr/lib/p7zip/7z.so",
    "/usr/lib/7zip/7z.so",
    "/usr/libexec/p7zip/7z.so",
    "/usr/lib64/p7zip/7z.so",
    "/usr/local/lib/p7zip/7z.so",
    "/usr/local/lib/7zip/7z.so",
    "/usr/lib/x86_64-linux-gnu/7zip/7z.so",
};

[[nodiscard]] bool is_file(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

}  // namespace

std::optional<std::filesystem::path> findSevenZipLibrary(const std::filesystem::path& configured) {
    if (!configured.empty()) {
        if (is_file(configured)) {
            return configured;
        }
        LOG_WARN("Configured 7z library {} does not exist", pathToUtf8(configured));
    }

    if (const char* env = std::getenv("LAXY_7Z_LIBRARY"); env != nullptr && *env != '\0') {
        std::filesystem::path from_env(env);
        if (is_file(from_env)) {
            return from_env;
        }
    }

    for (auto location : kLibraryLocations) {
        std::filesystem::path candidate(location);
        if (is_file(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::expected<std::shared_ptr<const bit7z::Bit7zLibrary>, ArchiveError>
loadSevenZipLibrary(const std::filesystem::path& configured) {
    static std::mutex mutex;
    static std::map<std::filesystem::path, std::shared_ptr<const bit7z::Bit7zLibrary>> loaded;

    auto path = findSevenZipLibrary(configured);
    if (!path) {
        LOG_ERROR("7z.so not found; install p7zip or set archive.seven_zip_library");
        return std::unexpected(ArchiveError::LibraryNotFound);
    }

    std::lock_guard lock(mutex);
    if (auto it = loaded.find(*path); it != loaded.end()) {
        return it->second;
    }

    try {
        auto library = std::make_shared<const bit7z::Bit7zLibrary>(path->string());
        loaded.emplace(*path, library);
        LOG_INFO("Loaded 7z library from {}", pathToUtf8(*path));
        return library;
    } catch (const bit7z::BitException& e) {
        LOG_ERROR("Failed to load {}: {}", pathToUtf8(*path), e.what());
        return std::unexpected(ArchiveError::LibraryLoadFailed);
    }
}

}  // namespace laxy::archive
