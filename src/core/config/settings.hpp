/// @file settings.hpp
/// @brief Engine settings structure definitions

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace laxy::config {

/// @brief How copies are checked after the transfer
enum class VerificationMode {
    FullHashBelowThreshold,  // SHA-256 below threshold, size only at or above
    AlwaysFullHash,          // SHA-256 regardless of size
    SizeOnly,                // Never hash
};

/// @brief Get string representation of VerificationMode
[[nodiscard]] constexpr std::string_view to_string(VerificationMode mode) noexcept {
    switch (mode) {
    case VerificationMode::FullHashBelowThreshold:
        return "threshold";
    case VerificationMode::AlwaysFullHash:
        return "full";
    case VerificationMode::SizeOnly:
        return "size";
    }
    return "threshold";
}

/// @brief Parse VerificationMode from string
[[nodiscard]] constexpr VerificationMode verificationModeFromString(std::string_view str) noexcept {
    if (str == "full")
        return VerificationMode::AlwaysFullHash;
    if (str == "size")
        return VerificationMode::SizeOnly;
    return VerificationMode::FullHashBelowThreshold;
}

/// @brief Batch execution strategy
enum class BatchStrategy {
    Sequential,  // One item at a time, in input order
    Parallel,    // Bounded worker pool
    Adaptive,    // Chosen from item count and a timed probe
};

/// @brief Get string representation of BatchStrategy
[[nodiscard]] constexpr std::string_view to_string(BatchStrategy strategy) noexcept {
    switch (strategy) {
    case BatchStrategy::Sequential:
        return "sequential";
    case BatchStrategy::Parallel:
        return "parallel";
    case BatchStrategy::Adaptive:
        return "adaptive";
    }
    return "adaptive";
}

/// @brief Parse BatchStrategy from string
[[nodiscard]] constexpr BatchStrategy batchStrategyFromString(std::string_view str) noexcept {
    if (str == "sequential")
        return BatchStrategy::Sequential;
    if (str == "parallel")
        return BatchStrategy::Parallel;
    return BatchStrategy::Adaptive;
}

/// @brief Metadata cache settings
struct CacheSettings {
    size_t file_capacity = 1000;
    std::chrono::seconds file_ttl{30};
    size_t listing_capacity = 500;
    std::chrono::milliseconds listing_freshness{3000};
    std::chrono::milliseconds large_listing_freshness{1000};
    size_t large_listing_threshold = 5000;  // Entries above which the short window applies
};

/// @brief Copy verification settings
struct VerificationSettings {
    bool enabled = true;
    VerificationMode mode = VerificationMode::FullHashBelowThreshold;
    uint64_t full_hash_threshold = 10ull * 1024 * 1024;
};

/// @brief Data transfer settings
struct TransferSettings {
    size_t chunk_size = 64 * 1024;
    bool preserve_metadata = true;  // mtime and permission bits
};

/// @brief Batch operation settings
struct BatchSettings {
    BatchStrategy default_strategy = BatchStrategy::Adaptive;
    int max_parallel = 4;
    size_t sequential_below = 10;     // Adaptive: fewer items run sequentially
    size_t parallel_threshold = 100;  // Adaptive: more copy/move items run in parallel
    size_t probe_size = 5;
    int probe_parallel = 2;
    std::chrono::milliseconds fast_item_threshold{100};
};

/// @brief Conflict resolution rules
struct ConflictSettings {
    bool overwrite_newer = true;
    bool overwrite_larger = true;
    bool backup_on_overwrite = true;
    int max_rename_attempts = 100;
};

/// @brief Recoverable deletion settings
struct TrashSettings {
    bool use_trash = true;           // Delete moves to trash unless permanent is requested
    bool use_system_trash = true;    // Try the desktop trash (GIO) first
    std::filesystem::path fallback_dir;  // Empty = $XDG_DATA_HOME/Trash
};

/// @brief Archive codec settings
struct ArchiveSettings {
    std::filesystem::path seven_zip_library;  // Empty = search well-known locations
    int default_compression_level = 6;
    bool verify_after_create = true;
};

/// @brief Logging settings
struct LoggingSettings {
    std::string level = "info";
    std::filesystem::path file;  // Empty = console only
    bool console = true;
};

/// @brief Engine settings
struct EngineSettings {
    CacheSettings cache;
    VerificationSettings verification;
    TransferSettings transfer;
    BatchSettings batch;
    ConflictSettings conflict;
    TrashSettings trash;
    ArchiveSettings archive;
    LoggingSettings logging;

    // Engine thread pool size (0 = hardware concurrency)
    int worker_threads = 0;

    /// @brief Get default settings
    [[nodiscard]] static EngineSettings defaults() { return EngineSettings{}; }
};

}  // namespace laxy::config
