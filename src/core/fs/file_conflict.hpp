/// @file file_conflict.hpp
/// @brief File conflict detection and resolution

#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>

#include "../config/settings.hpp"
#include "../operation/operation.hpp"

namespace laxy::fs {

/// @brief Why a destination cannot simply be written
enum class ConflictKind {
    Exists,      // Destination path is taken
    Permission,  // Destination directory is not writable
    Other,
};

/// @brief Get string representation of ConflictKind
[[nodiscard]] constexpr std::string_view to_string(ConflictKind kind) noexcept {
    switch (kind) {
    case ConflictKind::Exists:
        return "exists";
    case ConflictKind::Permission:
        return "permission";
    case ConflictKind::Other:
        return "other";
    }
    return "other";
}

/// @brief Action to take when a file conflict is detected
enum class ConflictAction {
    Skip,       // Leave the destination alone
    Overwrite,  // Replace the destination
    Rename,     // Write to a free "<stem>_<n><ext>" name instead
    Backup,     // Move the destination aside, then overwrite
    Ask,        // Defer to the caller's decision callback
};

/// @brief Get string representation of ConflictAction
[[nodiscard]] constexpr std::string_view to_string(ConflictAction action) noexcept {
    switch (action) {
    case ConflictAction::Skip:
        return "skip";
    case ConflictAction::Overwrite:
        return "overwrite";
    case ConflictAction::Rename:
        return "rename";
    case ConflictAction::Backup:
        return "backup";
    case ConflictAction::Ask:
        return "ask";
    }
    return "ask";
}

/// @brief Parse ConflictAction from string
[[nodiscard]] constexpr std::optional<ConflictAction>
conflictActionFromString(std::string_view str) noexcept {
    if (str == "skip")
        return ConflictAction::Skip;
    if (str == "overwrite")
        return ConflictAction::Overwrite;
    if (str == "rename")
        return ConflictAction::Rename;
    if (str == "backup")
        return ConflictAction::Backup;
    if (str == "ask")
        return ConflictAction::Ask;
    return std::nullopt;
}

/// @brief Information about a file conflict
struct ConflictInfo {
    std::filesystem::path source;
    std::filesystem::path destination;
    ConflictKind kind = ConflictKind::Exists;
    uint64_t source_size = 0;
    uint64_t destination_size = 0;
    std::chrono::system_clock::time_point source_mtime;
    std::chrono::system_clock::time_point destination_mtime;
    bool identical = false;  // Same size and sampled content
};

/// @brief Detect a conflict for writing @p source to @p destination
/// @return Conflict, or nullopt when the destination is free and writable
[[nodiscard]] std::optional<ConflictInfo> detectConflict(const std::filesystem::path& source,
                                                         const std::filesystem::path& destination);

/// @brief Quick identity check using size and sampled blocks
[[nodiscard]] bool areFilesIdentical(const std::filesystem::path& path1,
                                     const std::filesystem::path& path2);

/// @brief Check if @p dest is @p source or lies inside it (circular copy detection)
[[nodiscard]] bool isSubdirectory(const std::filesystem::path& source,
                                  const std::filesystem::path& dest);

/// @brief Caller-supplied decision for conflicts the rules cannot settle
using DecisionCallback = std::function<std::optional<ConflictAction>(const ConflictInfo&)>;

/// @brief Decides what happens when a destination is taken
///
/// Resolution order:
/// 1. Action registered for the exact (source, destination) pair
/// 2. Permission conflicts are skipped
/// 3. Newer source overwrites (overwrite_newer)
/// 4. Larger source overwrites (overwrite_larger)
/// 5. Backup when backup_on_overwrite is set
/// 6. Rename otherwise
///
/// Only conflicts of kind Other produce Ask, which the decision callback
/// settles; a callback that throws or returns nothing means skip.
/// Thread-safe.
class ConflictResolver {
public:
    explicit ConflictResolver(config::ConflictSettings rules = {});

    /// @brief Pin the action for one (source, destination) pair
    void registerAction(const std::filesystem::path& source,
                        const std::filesystem::path& destination, ConflictAction action);

    void clearRegisteredActions();

    /// @brief Decide an action; deterministic when no callback is given
    [[nodiscard]] ConflictAction resolve(const ConflictInfo& conflict,
                                         const DecisionCallback& callback = {}) const;

    /// @brief Perform the filesystem side of @p action
    /// @return Destination to write to, nullopt to skip, or the failure
    ///
    /// Backup renames the existing destination to backupPath(); Rename
    /// picks availableName(). Skip and Ask write nothing.
    [[nodiscard]] std::expected<std::optional<std::filesystem::path>, ErrorKind>
    applyAction(const ConflictInfo& conflict, ConflictAction action) const;

    /// @brief First free "<stem>_<n><ext>", then a timestamp suffix
    [[nodiscard]] std::filesystem::path availableName(const std::filesystem::path& destination) const;

    /// @brief "<stem>.backup.<unix-seconds><ext>" beside @p destination
    [[nodiscard]] static std::filesystem::path
    backupPath(const std::filesystem::path& destination,
               std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    [[nodiscard]] config::ConflictSettings rules() const;
    void setRules(const config::ConflictSettings& rules);

private:
    [[nodiscard]] ConflictAction apply_rules(const ConflictInfo& conflict) const;

    mutable std::shared_mutex mutex_;
    config::ConflictSettings rules_;
    std::map<std::pair<std::string, std::string>, ConflictAction> registered_;
};

}  // namespace laxy::fs
