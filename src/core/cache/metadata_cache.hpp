/// @file metadata_cache.hpp
/// @brief Time-aware metadata and directory-listing cache
///
/// Two bounded LRU classes:
/// 1. File metadata keyed by path, expiring after a TTL
/// 2. Directory listings keyed by (path, listing options), usable only
///    while younger than a freshness window
///
/// Mutating file operations invalidate affected paths. Thread-safe.

#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "../config/settings.hpp"
#include "../fs/directory.hpp"
#include "../fs/file_entry.hpp"

namespace laxy::cache {

/// @brief Counters for one cache class
struct CacheClassStats {
    size_t size = 0;
    size_t capacity = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;    // Dropped for capacity
    uint64_t expirations = 0;  // Dropped for age
};

/// @brief Statistics for both cache classes
struct MetadataCacheStats {
    CacheClassStats files;
    CacheClassStats listings;
};

/// @brief Metadata and listing cache
class MetadataCache {
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;
    using MetadataProvider =
        std::function<std::expected<fs::FileEntry, ErrorKind>(const std::filesystem::path&)>;

    /// @param settings Capacities, TTL and freshness windows
    /// @param provider Loader for getOrLoad (defaults to fs::readFileEntry)
    /// @param now Clock (defaults to steady_clock::now)
    explicit MetadataCache(const config::CacheSettings& settings = {},
                           MetadataProvider provider = {}, TimeSource now = {});
    ~MetadataCache();

    // Non-copyable, non-movable
    MetadataCache(const MetadataCache&) = delete;
    MetadataCache& operator=(const MetadataCache&) = delete;
    MetadataCache(MetadataCache&&) = delete;
    MetadataCache& operator=(MetadataCache&&) = delete;

    // ===== File metadata =====

    /// @brief Cached entry, or nullopt when absent or older than the TTL
    [[nodiscard]] std::optional<fs::FileEntry> get(const std::filesystem::path& path);

    void put(const std::filesystem::path& path, fs::FileEntry entry);

    /// @brief Cached entry, or a fresh one from the provider which is then stored
    [[nodiscard]] std::expected<fs::FileEntry, ErrorKind>
    getOrLoad(const std::filesystem::path& path);

    // ===== Directory listings =====

    /// @brief Cached listing while inside its freshness window
    [[nodiscard]] std::optional<std::vector<fs::FileEntry>>
    getDirectoryListing(const std::filesystem::path& path, const fs::ListingOptions& options);

    void putDirectoryListing(const std::filesystem::path& path, const fs::ListingOptions& options,
                             std::vector<fs::FileEntry> entries);

    /// @brief Cached listing, or scan the directory and cache the result
    [[nodiscard]] std::expected<std::vector<fs::FileEntry>, ErrorKind>
    listDirectory(const std::filesystem::path& path, const fs::ListingOptions& options = {});

    // ===== Invalidation =====

    /// @brief Drop the path, everything below it and its parent's listings
    void invalidate(const std::filesystem::path& path);

    void invalidateAll();

    [[nodiscard]] MetadataCacheStats stats() const;

    [[nodiscard]] const config::CacheSettings& settings() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace laxy::cache
