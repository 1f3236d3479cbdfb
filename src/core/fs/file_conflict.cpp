/// @file file_conflict.cpp
/// @brief File conflict detection and resolution implementation

#include "file_conflict.hpp"

#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <fstream>
#include <mutex>
#include <vector>

#include <fmt/format.h>

#include "../util/logger.hpp"
#include "../util/string_utils.hpp"

namespace laxy::fs {

namespace {

/// @brief Size of blocks to compare for identity check
constexpr size_t kSampleBlockSize = 4096;

/// @brief Read a block of data from a file at specified position
[[nodiscard]] std::vector<char> read_block(const std::filesystem::path& path, uint64_t offset,
                                           size_t size) {
    std::vector<char> buffer(size);

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return {};
    }

    file.seekg(static_cast<std::streamoff>(offset));
    file.read(buffer.data(), static_cast<std::streamsize>(size));

    auto bytes_read = file.gcount();
    buffer.resize(static_cast<size_t>(bytes_read));

    return buffer;
}

[[nodiscard]] std::chrono::system_clock::time_point
mtime_of(const std::filesystem::path& path) {
    std::error_code ec;
    auto ftime = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return {};
    }
    return std::chrono::file_clock::to_sys(ftime);
}

[[nodiscard]] uint64_t size_of(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return 0;
    }
    auto size = std::filesystem::file_size(path, ec);
    return ec ? 0 : size;
}

[[nodiscard]] bool parent_writable(const std::filesystem::path& destination) {
    auto dir = destination.parent_path();
    if (dir.empty()) {
        dir = ".";
    }
    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) {
        // Created on demand by the executor
        return true;
    }
    if (::access(dir.c_str(), W_OK) == 0) {
        return true;
    }
    return errno != EACCES && errno != EROFS && errno != EPERM;
}

[[nodiscard]] std::string pair_key(const std::filesystem::path& path) {
    return path.lexically_normal().string();
}

}  // namespace

std::optional<ConflictInfo> detectConflict(const std::filesystem::path& source,
                                           const std::filesystem::path& destination) {
    std::error_code ec;
    bool exists = std::filesystem::exists(std::filesystem::symlink_status(destination, ec));
    bool writable = parent_writable(destination);

    if (!exists && writable) {
        return std::nullopt;
    }

    ConflictInfo info;
    info.source = source;
    info.destination = destination;
    info.kind = writable ? ConflictKind::Exists : ConflictKind::Permission;
    info.source_size = size_of(source);
    info.source_mtime = mtime_of(source);
    if (exists) {
        info.destination_size = size_of(destination);
        info.destination_mtime = mtime_of(destination);
        info.identical = areFilesIdentical(source, destination);
    }
    return info;
}

bool areFilesIdentical(const std::filesystem::path& path1, const std::filesystem::path& path2) {
    std::error_code ec;

    if (!std::filesystem::is_regular_file(path1, ec) ||
        !std::filesystem::is_regular_file(path2, ec)) {
        return false;
    }

    auto size1 = std::filesystem::file_size(path1, ec);
    if (ec)
        return false;

    auto size2 = std::filesystem::file_size(path2, ec);
    if (ec)
        return false;

    if (size1 != size2) {
        return false;
    }

    if (size1 == 0) {
        return true;
    }

    // First, last and middle blocks
    std::vector<uint64_t> offsets{0};
    if (size1 > kSampleBlockSize) {
        offsets.push_back(size1 - kSampleBlockSize);
    }
    if (size1 > kSampleBlockSize * 3) {
        offsets.push_back(size1 / 2);
    }

    for (auto offset : offsets) {
        auto block1 = read_block(path1, offset, kSampleBlockSize);
        auto block2 = read_block(path2, offset, kSampleBlockSize);
        if (block1.empty() || block1 != block2) {
            return false;
        }
    }

    return true;
}

bool isSubdirectory(const std::filesystem::path& source, const std::filesystem::path& dest) {
    std::error_code ec;

    auto canonical_source = std::filesystem::weakly_canonical(source, ec);
    if (ec)
        return false;

    auto canonical_dest = std::filesystem::weakly_canonical(dest, ec);
    if (ec)
        return false;

    auto relative = canonical_dest.lexically_relative(canonical_source);
    if (relative.empty()) {
        return false;
    }
    return *relative.begin() != "..";
}

// ---------------------------------------------------------------------------
// ConflictResolver
// ---------------------------------------------------------------------------

ConflictResolver::ConflictResolver(config::ConflictSettings rules) : rules_(rules) {}

void ConflictResolver::registerAction(const std::filesystem::path& source,
                                      const std::filesystem::path& destination,
                                      ConflictAction action) {
    std::unique_lock lock(mutex_);
    registered_[{pair_key(source), pair_key(destination)}] = action;
}

void ConflictResolver::clearRegisteredActions() {
    std::unique_lock lock(mutex_);
    registered_.clear();
}

config::ConflictSettings ConflictResolver::rules() const {
    std::shared_lock lock(mutex_);
    return rules_;
}

void ConflictResolver::setRules(const config::ConflictSettings& rules) {
    std::unique_lock lock(mutex_);
    rules_ = rules;
}

ConflictAction ConflictResolver::apply_rules(const ConflictInfo& conflict) const {
    std::shared_lock lock(mutex_);

    auto it = registered_.find({pair_key(conflict.source), pair_key(conflict.destination)});
    if (it != registered_.end()) {
        return it->second;
    }

    switch (conflict.kind) {
    case ConflictKind::Permission:
        return ConflictAction::Skip;
    case ConflictKind::Other:
        return ConflictAction::Ask;
    case ConflictKind::Exists:
        break;
    }

    if (rules_.overwrite_newer && conflict.source_mtime > conflict.destination_mtime) {
        return ConflictAction::Overwrite;
    }
    if (rules_.overwrite_larger && conflict.source_size > conflict.destination_size) {
        return ConflictAction::Overwrite;
    }
    if (rules_.backup_on_overwrite) {
        return ConflictAction::Backup;
    }
    return ConflictAction::Rename;
}

ConflictAction ConflictResolver::resolve(const ConflictInfo& conflict,
                                         const DecisionCallback& callback) const {
    auto action = apply_rules(conflict);
    if (action != ConflictAction::Ask || !callback) {
        LOG_DEBUG("Conflict {} -> {}: {}", pathToUtf8(conflict.source),
                  pathToUtf8(conflict.destination), to_string(action));
        return action;
    }

    try {
        auto decided = callback(conflict);
        if (!decided || *decided == ConflictAction::Ask) {
            return ConflictAction::Skip;
        }
        return *decided;
    } catch (const std::exception& e) {
        LOG_WARN("Conflict decision callback failed for {}: {}",
                 pathToUtf8(conflict.destination), e.what());
        return ConflictAction::Skip;
    } catch (...) {
        LOG_WARN("Conflict decision callback failed for {} with a non-standard exception",
                 pathToUtf8(conflict.destination));
        return ConflictAction::Skip;
    }
}

std::expected<std::optional<std::filesystem::path>, ErrorKind>
ConflictResolver::applyAction(const ConflictInfo& conflict, ConflictAction action) const {
    switch (action) {
    case ConflictAction::Skip:
    case ConflictAction::Ask:
        return std::optional<std::filesystem::path>{};

    case ConflictAction::Overwrite:
        return std::optional<std::filesystem::path>{conflict.destination};

    case ConflictAction::Rename:
        return std::optional<std::filesystem::path>{availableName(conflict.destination)};

    case ConflictAction::Backup: {
        std::error_code ec;
        if (!std::filesystem::exists(std::filesystem::symlink_status(conflict.destination, ec))) {
            return std::optional<std::filesystem::path>{conflict.destination};
        }

        auto backup = backupPath(conflict.destination);
        if (std::filesystem::exists(std::filesystem::symlink_status(backup, ec))) {
            backup = availableName(backup);
        }

        std::filesystem::rename(conflict.destination, backup, ec);
        if (ec) {
            LOG_ERROR("Failed to back up {}: {}", pathToUtf8(conflict.destination), ec.message());
            return std::unexpected(errorKindFromCode(ec));
        }
        LOG_INFO("Backed up {} to {}", pathToUtf8(conflict.destination), pathToUtf8(backup));
        return std::optional<std::filesystem::path>{conflict.destination};
    }
    }
    return std::unexpected(ErrorKind::InvalidArgument);
}

std::filesystem::path ConflictResolver::availableName(const std::filesystem::path& destination) const {
    auto parent = destination.parent_path();
    auto stem = destination.stem().string();
    auto ext = destination.extension().string();
    int attempts = rules().max_rename_attempts;

    std::error_code ec;
    for (int n = 1; n <= attempts; ++n) {
        auto candidate = parent / fmt::format("{}_{}{}", stem, n, ext);
        if (!std::filesystem::exists(std::filesystem::symlink_status(candidate, ec))) {
            return candidate;
        }
    }

    auto stamp = std::chrono::duration_cast<std::chrono::milliseconds>(
                     std::chrono::system_clock::now().time_since_epoch())
                     .count();
    return parent / fmt::format("{}_{}{}", stem, stamp, ext);
}

std::filesystem::path ConflictResolver::backupPath(const std::filesystem::path& destination,
                                                   std::chrono::system_clock::time_point now) {
    auto seconds =
        std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    return destination.parent_path() / fmt::format("{}.backup.{}{}", destination.stem().string(),
                                                   seconds, destination.extension().string());
}

}  // namespace laxy::fs
