/// @file settings_manager.hpp
/// @brief Settings persistence (toml++) and validation

#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "settings.hpp"

namespace laxy::config {

/// @brief Configuration errors
enum class ConfigError {
    FileNotFound,
    ParseError,
    ValidationError,
    IoError,
};

/// @brief Get string representation of ConfigError
[[nodiscard]] constexpr std::string_view to_string(ConfigError error) noexcept {
    switch (error) {
    case ConfigError::FileNotFound:
        return "Configuration file not found";
    case ConfigError::ParseError:
        return "Failed to parse configuration file";
    case ConfigError::ValidationError:
        return "Configuration validation failed";
    case ConfigError::IoError:
        return "I/O error";
    }
    return "Unknown configuration error";
}

/// @brief Validation result with errors and warnings
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

/// @brief Reads and writes EngineSettings as TOML
///
/// Missing keys keep their defaults, so a partial file is valid. Values
/// are range-checked by validate(), not by the loaders.
class SettingsManager {
public:
    /// @brief loadFrom(defaultPath())
    [[nodiscard]] static std::expected<EngineSettings, ConfigError> load();

    [[nodiscard]] static std::expected<EngineSettings, ConfigError>
    loadFrom(const std::filesystem::path& path);

    [[nodiscard]] static std::expected<EngineSettings, ConfigError> parse(std::string_view text);

    /// @brief Defaults when the file is missing, unreadable or fails validation
    [[nodiscard]] static EngineSettings loadOrDefault();

    [[nodiscard]] static std::expected<void, ConfigError> save(const EngineSettings& settings);

    /// @brief Write every key, creating parent directories
    [[nodiscard]] static std::expected<void, ConfigError>
    saveTo(const EngineSettings& settings, const std::filesystem::path& path);

    /// @brief Errors make the settings unusable; warnings are advisory
    [[nodiscard]] static ValidationResult validate(const EngineSettings& settings);

    /// @return $XDG_CONFIG_HOME/laxy/engine.toml (~/.config when unset)
    [[nodiscard]] static std::filesystem::path defaultPath();
};

/// @brief Resolve the local trash directory used when the desktop trash is unavailable
/// @return Configured fallback_dir, or $XDG_DATA_HOME/Trash (~/.local/share/Trash)
[[nodiscard]] std::filesystem::path getTrashPath(const EngineSettings& settings);

}  // namespace laxy::config
