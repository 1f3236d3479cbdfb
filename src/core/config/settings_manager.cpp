/// @file settings_manager.cpp
/// @brief Settings persistence implementation using toml++

#include "settings_manager.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

#include <toml++/toml.hpp>

#include "../util/logger.hpp"
#include "../util/string_utils.hpp"

namespace laxy::config {

namespace {

// Helper to get optional value from toml table
template <typename T>
T get_or(const toml::table& tbl, std::string_view key, T default_value) {
    if (auto val = tbl[key].value<T>()) {
        return *val;
    }
    return default_value;
}

// Unsigned counts are stored as TOML integers
size_t get_count_or(const toml::table& tbl, std::string_view key, size_t default_value) {
    auto value = get_or(tbl, key, static_cast<int64_t>(default_value));
    return value < 0 ? default_value : static_cast<size_t>(value);
}

std::filesystem::path get_path_or(const toml::table& tbl, std::string_view key,
                                  const std::filesystem::path& default_value) {
    if (auto* str = tbl[key].as_string()) {
        return utf8ToPath(str->get());
    }
    return default_value;
}

std::filesystem::path env_dir(const char* name, const char* home_relative) {
    if (const char* value = std::getenv(name); value && *value) {
        return std::filesystem::path(value);
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / home_relative;
    }
    return std::filesystem::temp_directory_path() / "laxy";
}

EngineSettings parse_settings(const toml::table& tbl) {
    EngineSettings settings;
    const EngineSettings defaults;

    settings.worker_threads = get_or(tbl, "worker_threads", defaults.worker_threads);

    // Metadata cache
    if (auto* cache = tbl["cache"].as_table()) {
        settings.cache.file_capacity =
            get_count_or(*cache, "file_capacity", defaults.cache.file_capacity);
        settings.cache.file_ttl = std::chrono::seconds(
            get_or(*cache, "file_ttl_seconds", static_cast<int64_t>(defaults.cache.file_ttl.count())));
        settings.cache.listing_capacity =
            get_count_or(*cache, "listing_capacity", defaults.cache.listing_capacity);
        settings.cache.listing_freshness = std::chrono::milliseconds(
            get_or(*cache, "listing_freshness_ms",
                   static_cast<int64_t>(defaults.cache.listing_freshness.count())));
        settings.cache.large_listing_freshness = std::chrono::milliseconds(
            get_or(*cache, "large_listing_freshness_ms",
                   static_cast<int64_t>(defaults.cache.large_listing_freshness.count())));
        settings.cache.large_listing_threshold =
            get_count_or(*cache, "large_listing_threshold", defaults.cache.large_listing_threshold);
    }

    // Verification
    if (auto* verification = tbl["verification"].as_table()) {
        settings.verification.enabled =
            get_or(*verification, "enabled", defaults.verification.enabled);
        auto mode_str = get_or<std::string>(*verification, "mode", "threshold");
        settings.verification.mode = verificationModeFromString(mode_str);
        settings.verification.full_hash_threshold = static_cast<uint64_t>(
            get_or(*verification, "full_hash_threshold",
                   static_cast<int64_t>(defaults.verification.full_hash_threshold)));
    }

    // Transfer
    if (auto* transfer = tbl["transfer"].as_table()) {
        settings.transfer.chunk_size =
            get_count_or(*transfer, "chunk_size", defaults.transfer.chunk_size);
        settings.transfer.preserve_metadata =
            get_or(*transfer, "preserve_metadata", defaults.transfer.preserve_metadata);
    }

    // Batch
    if (auto* batch = tbl["batch"].as_table()) {
        auto strategy_str = get_or<std::string>(*batch, "strategy", "adaptive");
        settings.batch.default_strategy = batchStrategyFromString(strategy_str);
        settings.batch.max_parallel = get_or(*batch, "max_parallel", defaults.batch.max_parallel);
        settings.batch.sequential_below =
            get_count_or(*batch, "sequential_below", defaults.batch.sequential_below);
        settings.batch.parallel_threshold =
            get_count_or(*batch, "parallel_threshold", defaults.batch.parallel_threshold);
        settings.batch.probe_size = get_count_or(*batch, "probe_size", defaults.batch.probe_size);
        settings.batch.probe_parallel =
            get_or(*batch, "probe_parallel", defaults.batch.probe_parallel);
        settings.batch.fast_item_threshold = std::chrono::milliseconds(
            get_or(*batch, "fast_item_threshold_ms",
                   static_cast<int64_t>(defaults.batch.fast_item_threshold.count())));
    }

    // Conflict rules
    if (auto* conflict = tbl["conflict"].as_table()) {
        settings.conflict.overwrite_newer =
            get_or(*conflict, "overwrite_newer", defaults.conflict.overwrite_newer);
        settings.conflict.overwrite_larger =
            get_or(*conflict, "overwrite_larger", defaults.conflict.overwrite_larger);
        settings.conflict.backup_on_overwrite =
            get_or(*conflict, "backup_on_overwrite", defaults.conflict.backup_on_overwrite);
        settings.conflict.max_rename_attempts =
            get_or(*conflict, "max_rename_attempts", defaults.conflict.max_rename_attempts);
    }

    // Trash
    if (auto* trash = tbl["trash"].as_table()) {
        settings.trash.use_trash = get_or(*trash, "use_trash", defaults.trash.use_trash);
        settings.trash.use_system_trash =
            get_or(*trash, "use_system_trash", defaults.trash.use_system_trash);
        settings.trash.fallback_dir = get_path_or(*trash, "fallback_dir", {});
    }

    // Archives
    if (auto* archive = tbl["archive"].as_table()) {
        settings.archive.seven_zip_library = get_path_or(*archive, "seven_zip_library", {});
        settings.archive.default_compression_level = get_or(
            *archive, "default_compression_level", defaults.archive.default_compression_level);
        settings.archive.verify_after_create =
            get_or(*archive, "verify_after_create", defaults.archive.verify_after_create);
    }

    // Logging
    if (auto* logging = tbl["logging"].as_table()) {
        settings.logging.level = get_or<std::string>(*logging, "level", defaults.logging.level);
        settings.logging.file = get_path_or(*logging, "file", {});
        settings.logging.console = get_or(*logging, "console", defaults.logging.console);
    }

    return settings;
}

toml::table serialize_settings(const EngineSettings& settings) {
    toml::table tbl;

    tbl.insert("worker_threads", settings.worker_threads);

    tbl.insert("cache",
               toml::table{
                   {"file_capacity", static_cast<int64_t>(settings.cache.file_capacity)},
                   {"file_ttl_seconds", static_cast<int64_t>(settings.cache.file_ttl.count())},
                   {"listing_capacity", static_cast<int64_t>(settings.cache.listing_capacity)},
                   {"listing_freshness_ms",
                    static_cast<int64_t>(settings.cache.listing_freshness.count())},
                   {"large_listing_freshness_ms",
                    static_cast<int64_t>(settings.cache.large_listing_freshness.count())},
                   {"large_listing_threshold",
                    static_cast<int64_t>(settings.cache.large_listing_threshold)},
    });

    tbl.insert("verification",
               toml::table{
                   {"enabled", settings.verification.enabled},
                   {"mode", std::string(to_string(settings.verification.mode))},
                   {"full_hash_threshold",
                    static_cast<int64_t>(settings.verification.full_hash_threshold)},
    });

    tbl.insert("transfer",
               toml::table{
                   {"chunk_size", static_cast<int64_t>(settings.transfer.chunk_size)},
                   {"preserve_metadata", settings.transfer.preserve_metadata},
    });

    tbl.insert("batch",
               toml::table{
                   {"strategy", std::string(to_string(settings.batch.default_strategy))},
                   {"max_parallel", settings.batch.max_parallel},
                   {"sequential_below", static_cast<int64_t>(settings.batch.sequential_below)},
                   {"parallel_threshold", static_cast<int64_t>(settings.batch.parallel_threshold)},
                   {"probe_size", static_cast<int64_t>(settings.batch.probe_size)},
                   {"probe_parallel", settings.batch.probe_parallel},
                   {"fast_item_threshold_ms",
                    static_cast<int64_t>(settings.batch.fast_item_threshold.count())},
    });

    tbl.insert("conflict",
               toml::table{
                   {"overwrite_newer", settings.conflict.overwrite_newer},
                   {"overwrite_larger", settings.conflict.overwrite_larger},
                   {"backup_on_overwrite", settings.conflict.backup_on_overwrite},
                   {"max_rename_attempts", settings.conflict.max_rename_attempts},
    });

    toml::table trash_tbl{
        {"use_trash", settings.trash.use_trash},
        {"use_system_trash", settings.trash.use_system_trash},
    };
    if (!settings.trash.fallback_dir.empty()) {
        trash_tbl.insert("fallback_dir", pathToUtf8(settings.trash.fallback_dir));
    }
    tbl.insert("trash", std::move(trash_tbl));

    toml::table archive_tbl{
        {"default_compression_level", settings.archive.default_compression_level},
        {"verify_after_create", settings.archive.verify_after_create},
    };
    if (!settings.archive.seven_zip_library.empty()) {
        archive_tbl.insert("seven_zip_library", pathToUtf8(settings.archive.seven_zip_library));
    }
    tbl.insert("archive", std::move(archive_tbl));

    toml::table logging_tbl{
        {"level", settings.logging.level},
        {"console", settings.logging.console},
    };
    if (!settings.logging.file.empty()) {
        logging_tbl.insert("file", pathToUtf8(settings.logging.file));
    }
    tbl.insert("logging", std::move(logging_tbl));

    return tbl;
}

}  // namespace

std::filesystem::path SettingsManager::defaultPath() {
    return env_dir("XDG_CONFIG_HOME", ".config") / "laxy" / "engine.toml";
}

std::expected<EngineSettings, ConfigError> SettingsManager::load() {
    return loadFrom(defaultPath());
}

std::expected<EngineSettings, ConfigError>
SettingsManager::loadFrom(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::unexpected(ConfigError::FileNotFound);
    }

    try {
        auto tbl = toml::parse_file(pathToUtf8(path));
        return parse_settings(tbl);
    } catch (const toml::parse_error& e) {
        LOG_ERROR("Failed to parse {}: {}", pathToUtf8(path), e.description());
        return std::unexpected(ConfigError::ParseError);
    }
}

std::expected<EngineSettings, ConfigError> SettingsManager::parse(std::string_view text) {
    try {
        auto tbl = toml::parse(text);
        return parse_settings(tbl);
    } catch (const toml::parse_error& e) {
        LOG_ERROR("Failed to parse settings: {}", e.description());
        return std::unexpected(ConfigError::ParseError);
    }
}

EngineSettings SettingsManager::loadOrDefault() {
    auto result = load();
    if (!result) {
        if (result.error() != ConfigError::FileNotFound) {
            LOG_WARN("Using default settings: {}", to_string(result.error()));
        }
        return EngineSettings::defaults();
    }

    auto validation = validate(*result);
    if (!validation.valid) {
        for (const auto& error : validation.errors) {
            LOG_WARN("Invalid setting: {}", error);
        }
        return EngineSettings::defaults();
    }
    return *result;
}

std::expected<void, ConfigError> SettingsManager::save(const EngineSettings& settings) {
    return saveTo(settings, defaultPath());
}

std::expected<void, ConfigError> SettingsManager::saveTo(const EngineSettings& settings,
                                                         const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(ConfigError::IoError);
        }
    }

    std::ofstream file(path);
    if (!file) {
        return std::unexpected(ConfigError::IoError);
    }

    file << "# laxy engine configuration\n\n" << serialize_settings(settings) << "\n";
    if (!file) {
        return std::unexpected(ConfigError::IoError);
    }
    return {};
}

ValidationResult SettingsManager::validate(const EngineSettings& settings) {
    ValidationResult result;

    if (settings.cache.file_capacity == 0) {
        result.errors.push_back("cache.file_capacity must be at least 1");
        result.valid = false;
    }

    if (settings.cache.listing_capacity == 0) {
        result.errors.push_back("cache.listing_capacity must be at least 1");
        result.valid = false;
    }

    if (settings.cache.file_ttl.count() <= 0) {
        result.errors.push_back("cache.file_ttl_seconds must be positive");
        result.valid = false;
    }

    if (settings.transfer.chunk_size < 4096 || settings.transfer.chunk_size > 64 * 1024 * 1024) {
        result.errors.push_back("transfer.chunk_size must be between 4096 and 67108864");
        result.valid = false;
    }

    if (settings.batch.max_parallel < 1 || settings.batch.max_parallel > 64) {
        result.errors.push_back("batch.max_parallel must be between 1 and 64");
        result.valid = false;
    }

    if (settings.batch.probe_parallel < 1) {
        result.errors.push_back("batch.probe_parallel must be at least 1");
        result.valid = false;
    }

    if (settings.conflict.max_rename_attempts < 1) {
        result.errors.push_back("conflict.max_rename_attempts must be at least 1");
        result.valid = false;
    }

    if (settings.archive.default_compression_level < 0 ||
        settings.archive.default_compression_level > 9) {
        result.errors.push_back("archive.default_compression_level must be between 0 and 9");
        result.valid = false;
    }

    if (settings.worker_threads < 0) {
        result.errors.push_back("worker_threads must not be negative");
        result.valid = false;
    }

    // Warnings
    if (settings.verification.enabled &&
        settings.verification.mode == VerificationMode::SizeOnly) {
        result.warnings.push_back("Size-only verification does not detect corrupted content");
    }

    if (settings.batch.max_parallel > 16) {
        result.warnings.push_back("High batch.max_parallel may saturate disk I/O");
    }

    if (settings.batch.sequential_below > settings.batch.parallel_threshold) {
        result.warnings.push_back(
            "batch.sequential_below exceeds batch.parallel_threshold; adaptive batches "
            "never run in parallel by size alone");
    }

    return result;
}

std::filesystem::path getTrashPath(const EngineSettings& settings) {
    if (!settings.trash.fallback_dir.empty()) {
        return settings.trash.fallback_dir;
    }
    return env_dir("XDG_DATA_HOME", ".local/share") / "Trash";
}

}  // namespace laxy::config
