/// @file metadata_cache.cpp
/// @brief Metadata cache implementation

#include "metadata_cache.hpp"

#include <mutex>
#include <optional>
#include <string>

#include "../util/logger.hpp"
#include "../util/string_utils.hpp"
#include "lru_cache.hpp"

namespace laxy::cache {

namespace {

/// @brief Value with its storage time and lifetime
template <typename T>
struct CacheRecord {
    T value;
    MetadataCache::Clock::time_point stored_at;
    std::chrono::milliseconds ttl;

    [[nodiscard]] bool expired(MetadataCache::Clock::time_point now) const {
        return now - stored_at >= ttl;
    }
};

struct ListingValue {
    std::string directory;  // Normalized key of the listed directory
    std::vector<fs::FileEntry> entries;
};

/// @brief Canonical string form used for keys and prefix checks
[[nodiscard]] std::string normalize(const std::filesystem::path& path) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    auto normal = (ec ? path : absolute).lexically_normal();
    auto text = pathToUtf8(normal);
    while (text.size() > 1 && text.back() == '/') {
        text.pop_back();
    }
    return text;
}

/// @brief True when @p candidate is @p root or lies below it
[[nodiscard]] bool is_within(const std::string& candidate, const std::string& root) {
    if (candidate.size() < root.size() || candidate.compare(0, root.size(), root) != 0) {
        return false;
    }
    if (candidate.size() == root.size()) {
        return true;
    }
    return root.back() == '/' || candidate[root.size()] == '/';
}

[[nodiscard]] std::string parent_of(const std::string& normalized) {
    auto parent = utf8ToPath(normalized).parent_path();
    return pathToUtf8(parent);
}

}  // namespace

/// @brief Cache implementation
class MetadataCache::Impl {
public:
    Impl(const config::CacheSettings& settings, MetadataProvider provider, TimeSource now)
        : settings_(settings),
          provider_(provider ? std::move(provider) : MetadataProvider(&fs::readFileEntry)),
          now_(now ? std::move(now) : TimeSource(&Clock::now)),
          files_(settings.file_capacity),
          listings_(settings.listing_capacity) {}

    [[nodiscard]] std::optional<fs::FileEntry> get(const std::filesystem::path& path) {
        auto key = normalize(path);
        std::lock_guard lock(mutex_);
        return lookup_file(key);
    }

    void put(const std::filesystem::path& path, fs::FileEntry entry) {
        auto key = normalize(path);
        std::lock_guard lock(mutex_);
        store_file(key, std::move(entry));
    }

    [[nodiscard]] std::expected<fs::FileEntry, ErrorKind>
    getOrLoad(const std::filesystem::path& path) {
        auto key = normalize(path);
        uint64_t generation = 0;
        {
            std::lock_guard lock(mutex_);
            if (auto cached = lookup_file(key)) {
                return *cached;
            }
            generation = generation_;
        }

        // Stat outside the lock
        auto loaded = provider_(path);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }

        std::lock_guard lock(mutex_);
        if (generation == generation_) {
            store_file(key, *loaded);
        }
        return *loaded;
    }

    [[nodiscard]] std::expected<std::vector<fs::FileEntry>, ErrorKind>
    listDirectory(const std::filesystem::path& path, const fs::ListingOptions& options) {
        if (auto cached = getDirectoryListing(path, options)) {
            return std::move(*cached);
        }
        uint64_t generation = 0;
        {
            std::lock_guard lock(mutex_);
            generation = generation_;
        }

        auto scanned = fs::scanDirectory(path, options);
        if (!scanned) {
            return std::unexpected(scanned.error());
        }
        store_listing(path, options, *scanned, generation);
        return scanned;
    }

    [[nodiscard]] std::optional<std::vector<fs::FileEntry>>
    getDirectoryListing(const std::filesystem::path& path, const fs::ListingOptions& options) {
        auto key = listing_key(normalize(path), options);
        std::lock_guard lock(mutex_);

        auto* record = listings_.get(key);
        if (!record) {
            ++listing_stats_.misses;
            return std::nullopt;
        }
        if (record->expired(now_())) {
            listings_.remove(key);
            ++listing_stats_.expirations;
            ++listing_stats_.misses;
            return std::nullopt;
        }
        ++listing_stats_.hits;
        return record->value.entries;
    }

    void putDirectoryListing(const std::filesystem::path& path, const fs::ListingOptions& options,
                             std::vector<fs::FileEntry> entries) {
        store_listing(path, options, std::move(entries), std::nullopt);
    }

    void invalidate(const std::filesystem::path& path) {
        auto root = normalize(path);
        auto parent = parent_of(root);

        std::lock_guard lock(mutex_);
        ++generation_;
        auto files_removed = files_.removeIf(
            [&root](const std::string& key, const auto&) { return is_within(key, root); });
        auto listings_removed =
            listings_.removeIf([&root, &parent](const std::string&, const auto& record) {
                return is_within(record.value.directory, root) || record.value.directory == parent;
            });

        if (files_removed + listings_removed > 0) {
            LOG_TRACE("Invalidated {} ({} files, {} listings)", root, files_removed,
                      listings_removed);
        }
    }

    void invalidateAll() {
        std::lock_guard lock(mutex_);
        ++generation_;
        files_.clear();
        listings_.clear();
    }

    [[nodiscard]] MetadataCacheStats stats() const {
        std::lock_guard lock(mutex_);
        MetadataCacheStats result;
        result.files = file_stats_;
        result.files.size = files_.size();
        result.files.capacity = files_.capacity();
        result.files.evictions = files_.evictions();
        result.listings = listing_stats_;
        result.listings.size = listings_.size();
        result.listings.capacity = listings_.capacity();
        result.listings.evictions = listings_.evictions();
        return result;
    }

    [[nodiscard]] const config::CacheSettings& settings() const noexcept { return settings_; }

private:
    [[nodiscard]] static std::string listing_key(const std::string& directory,
                                                 const fs::ListingOptions& options) {
        return directory + '\n' + options.key();
    }

    /// @brief Store a listing unless an invalidation ran since @p loaded_at
    void store_listing(const std::filesystem::path& path, const fs::ListingOptions& options,
                       std::vector<fs::FileEntry> entries, std::optional<uint64_t> loaded_at) {
        auto directory = normalize(path);
        auto key = listing_key(directory, options);

        // Large directories change more often relative to their listing cost
        auto freshness = entries.size() > settings_.large_listing_threshold
                             ? settings_.large_listing_freshness
                             : settings_.listing_freshness;

        std::lock_guard lock(mutex_);
        if (loaded_at && *loaded_at != generation_) {
            return;
        }
        listings_.put(key, CacheRecord<ListingValue>{
                               ListingValue{std::move(directory), std::move(entries)}, now_(),
                               freshness});
    }

    // Requires mutex_
    [[nodiscard]] std::optional<fs::FileEntry> lookup_file(const std::string& key) {
        auto* record = files_.get(key);
        if (!record) {
            ++file_stats_.misses;
            return std::nullopt;
        }
        if (record->expired(now_())) {
            files_.remove(key);
            ++file_stats_.expirations;
            ++file_stats_.misses;
            return std::nullopt;
        }
        ++file_stats_.hits;
        return record->value;
    }

    // Requires mutex_
    void store_file(const std::string& key, fs::FileEntry entry) {
        files_.put(key, CacheRecord<fs::FileEntry>{
                            std::move(entry), now_(),
                            std::chrono::duration_cast<std::chrono::milliseconds>(
                                settings_.file_ttl)});
    }

    config::CacheSettings settings_;
    MetadataProvider provider_;
    TimeSource now_;

    mutable std::mutex mutex_;
    LruCache<std::string, CacheRecord<fs::FileEntry>> files_;
    LruCache<std::string, CacheRecord<ListingValue>> listings_;
    CacheClassStats file_stats_;
    CacheClassStats listing_stats_;
    uint64_t generation_ = 0;  // Bumped by every invalidation
};

MetadataCache::MetadataCache(const config::CacheSettings& settings, MetadataProvider provider,
                             TimeSource now)
    : impl_(std::make_unique<Impl>(settings, std::move(provider), std::move(now))) {
}

MetadataCache::~MetadataCache() = default;

std::optional<fs::FileEntry> MetadataCache::get(const std::filesystem::path& path) {
    return impl_->get(path);
}

void MetadataCache::put(const std::filesystem::path& path, fs::FileEntry entry) {
    impl_->put(path, std::move(entry));
}

std::expected<fs::FileEntry, ErrorKind> MetadataCache::getOrLoad(const std::filesystem::path& path) {
    return impl_->getOrLoad(path);
}

std::optional<std::vector<fs::FileEntry>>
MetadataCache::getDirectoryListing(const std::filesystem::path& path,
                                   const fs::ListingOptions& options) {
    return impl_->getDirectoryListing(path, options);
}

void MetadataCache::putDirectoryListing(const std::filesystem::path& path,
                                        const fs::ListingOptions& options,
                                        std::vector<fs::FileEntry> entries) {
    impl_->putDirectoryListing(path, options, std::move(entries));
}

std::expected<std::vector<fs::FileEntry>, ErrorKind>
MetadataCache::listDirectory(const std::filesystem::path& path, const fs::ListingOptions& options) {
    return impl_->listDirectory(path, options);
}

void MetadataCache::invalidate(const std::filesystem::path& path) {
    impl_->invalidate(path);
}

void MetadataCache::invalidateAll() {
    impl_->invalidateAll();
}

MetadataCacheStats MetadataCache::stats() const {
    return impl_->stats();
}

const config::CacheSettings& MetadataCache::settings() const noexcept {
    return impl_->settings();
}

}  // namespace laxy::cache
