/// @file file_operations.cpp
/// @brief File operations implementation

#include "file_operations.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <random>
#include <vector>

#include <fmt/format.h>

#include "../cache/metadata_cache.hpp"
#include "../config/settings_manager.hpp"
#include "../util/logger.hpp"
#include "../util/string_utils.hpp"
#include "directory.hpp"
#include "file_entry.hpp"
#include "trash.hpp"

namespace laxy::fs {

namespace {

constexpr size_t kDefaultChunkSize = 64 * 1024;
constexpr size_t kMaxNameBytes = 255;

/// @brief Owning POSIX file descriptor
class UniqueFd {
public:
    explicit UniqueFd(int fd = -1) noexcept : fd_(fd) {}
    ~UniqueFd() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }
    explicit operator bool() const noexcept { return fd_ >= 0; }

    /// @brief Close now and report the result
    int close() noexcept {
        int fd = fd_;
        fd_ = -1;
        return fd >= 0 ? ::close(fd) : 0;
    }

private:
    int fd_;
};

/// @brief Removes a temporary file unless released
class TempFileGuard {
public:
    explicit TempFileGuard(std::filesystem::path path) : path_(std::move(path)) {}
    ~TempFileGuard() {
        if (!path_.empty()) {
            std::error_code ec;
            std::filesystem::remove(path_, ec);
        }
    }

    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    void release() noexcept { path_.clear(); }

private:
    std::filesystem::path path_;
};

[[nodiscard]] ErrorKind errno_kind(int err) {
    return errorKindFromCode(std::error_code(err, std::system_category()));
}

/// @brief Hidden temporary path in the destination directory (same filesystem for rename)
[[nodiscard]] std::filesystem::path temp_path_for(const std::filesystem::path& dest) {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    auto name = fmt::format(".{}.laxy_tmp_{:016x}", dest.filename().string(), gen());
    return dest.parent_path() / name;
}

[[nodiscard]] bool write_all(int fd, const char* data, size_t size) {
    while (size > 0) {
        auto written = ::write(fd, data, size);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data += written;
        size -= static_cast<size_t>(written);
    }
    return true;
}

[[nodiscard]] ErrorKind trash_error_kind(TrashError error) {
    switch (error) {
    case TrashError::NotFound:
        return ErrorKind::NotFound;
    case TrashError::AccessDenied:
        return ErrorKind::PermissionDenied;
    case TrashError::Unavailable:
    case TrashError::IoError:
        return ErrorKind::IoFailure;
    }
    return ErrorKind::IoFailure;
}

/// @brief Final component, ignoring a trailing separator
[[nodiscard]] std::filesystem::path item_name(const std::filesystem::path& path) {
    auto name = path.filename();
    return name.empty() ? path.parent_path().filename() : name;
}

[[nodiscard]] bool path_exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(std::filesystem::symlink_status(path, ec));
}

/// @brief Create the destination's parent directory when missing
[[nodiscard]] VoidResult<OperationError> ensure_parent(const std::filesystem::path& destination) {
    auto parent = destination.parent_path();
    std::error_code ec;
    if (parent.empty() || std::filesystem::is_directory(parent, ec)) {
        return {};
    }
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        return logAndReturnInfo(errorKindFromCode(ec),
                                fmt::format("Cannot create {}: {}", pathToUtf8(parent),
                                            ec.message()));
    }
    return {};
}

}  // namespace

/// @brief State of one public call
struct FileOperationExecutor::Run {
    OperationType type = OperationType::Copy;
    std::string id;
    const CopyOptions* options = nullptr;
    std::stop_token stop;
    bool verify = true;
    bool preserve = true;
    OperationResult result;
    uint64_t bytes = 0;
    size_t skipped = 0;
    bool cancelled = false;
};

FileOperationExecutor::FileOperationExecutor(cache::MetadataCache& cache,
                                             progress::ProgressTracker& tracker,
                                             config::EngineSettings settings,
                                             ContentCheck check)
    : cache_(cache), tracker_(tracker), settings_(std::move(settings)),
      verifier_(VerificationPolicy::fromSettings(settings_.verification)),
      check_(std::move(check)) {
    if (!check_) {
        check_ = [this](const std::filesystem::path& source, const std::filesystem::path& copy) {
            return verifier_.check(source, copy);
        };
    }
}

OperationOutcome FileOperationExecutor::copy(std::span<const std::filesystem::path> sources,
                                             const std::filesystem::path& dest_dir,
                                             const CopyOptions& options,
                                             const OperationControl& control) {
    return into_directory(OperationType::Copy, sources, dest_dir, options, control);
}

OperationOutcome FileOperationExecutor::move(std::span<const std::filesystem::path> sources,
                                             const std::filesystem::path& dest_dir,
                                             const CopyOptions& options,
                                             const OperationControl& control) {
    return into_directory(OperationType::Move, sources, dest_dir, options, control);
}

OperationOutcome
FileOperationExecutor::into_directory(OperationType type,
                                      std::span<const std::filesystem::path> sources,
                                      const std::filesystem::path& dest_dir,
                                      const CopyOptions& options, const OperationControl& control) {
    if (sources.empty()) {
        return logAndReturnInfo(ErrorKind::InvalidArgument,
                                fmt::format("No source files to {}", to_string(type)));
    }

    std::error_code ec;
    if (!std::filesystem::exists(dest_dir, ec)) {
        std::filesystem::create_directories(dest_dir, ec);
        if (ec) {
            return logAndReturnInfo(errorKindFromCode(ec),
                                    fmt::format("Cannot create {}: {}", pathToUtf8(dest_dir),
                                                ec.message()));
        }
    } else if (!std::filesystem::is_directory(dest_dir, ec)) {
        return logAndReturnInfo(ErrorKind::InvalidArgument,
                                fmt::format("{} is not a directory", pathToUtf8(dest_dir)));
    }

    std::vector<std::filesystem::path> destinations;
    destinations.reserve(sources.size());
    for (const auto& source : sources) {
        destinations.push_back(dest_dir / item_name(source));
    }
    return transfer(type, sources, destinations, options, control);
}

OperationOutcome FileOperationExecutor::copyTo(const std::filesystem::path& source,
                                               const std::filesystem::path& destination,
                                               const CopyOptions& options,
                                               const OperationControl& control) {
    if (destination.empty() || destination.filename().empty()) {
        return logAndReturnInfo(ErrorKind::InvalidArgument, "Destination path is empty");
    }
    if (auto created = ensure_parent(destination); !created) {
        return std::unexpected(created.error());
    }
    return transfer(OperationType::Copy, std::span(&source, 1), std::span(&destination, 1),
                    options, control);
}

OperationOutcome FileOperationExecutor::moveTo(const std::filesystem::path& source,
                                               const std::filesystem::path& destination,
                                               const CopyOptions& options,
                                               const OperationControl& control) {
    if (destination.empty() || destination.filename().empty()) {
        return logAndReturnInfo(ErrorKind::InvalidArgument, "Destination path is empty");
    }
    if (auto created = ensure_parent(destination); !created) {
        return std::unexpected(created.error());
    }
    return transfer(OperationType::Move, std::span(&source, 1), std::span(&destination, 1),
                    options, control);
}

OperationOutcome FileOperationExecutor::transfer(OperationType type,
                                                 std::span<const std::filesystem::path> sources,
                                                 std::span<const std::filesystem::path> destinations,
                                                 const CopyOptions& options,
                                                 const OperationControl& control) {
    Run run;
    run.type = type;
    run.id = control.operation_id.empty() ? generateOperationId(to_string(type))
                                          : control.operation_id;
    run.options = &options;
    run.stop = control.stop_token;
    run.verify = options.verify.value_or(settings_.verification.enabled);
    run.preserve = options.preserve_metadata.value_or(settings_.transfer.preserve_metadata);

    uint64_t total_files = 0;
    uint64_t total_bytes = 0;
    for (const auto& source : sources) {
        auto summary = summarizeTree(source);
        total_files += summary.files;
        total_bytes += summary.bytes;
    }

    tracker_.create(run.id, type, total_files, total_bytes);
    if (control.observer) {
        tracker_.addCallback(run.id, control.observer);
    }

    LOG_INFO("{} {}: {} items, {} files, {}", to_string(type), run.id, sources.size(),
             total_files, formatSize(total_bytes));

    auto start = std::chrono::steady_clock::now();
    for (size_t i = 0; i < sources.size(); ++i) {
        if (stop_requested(run)) {
            break;
        }
        if (transfer_item(run, sources[i], destinations[i])) {
            run.result.affected_files.push_back(destinations[i]);
            ++run.result.items_completed;
        }
    }

    auto& result = run.result;
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    result.bytes_processed = run.bytes;
    result.cancelled = run.cancelled;
    result.success = result.errors.empty() && !run.cancelled;

    bool is_copy = type == OperationType::Copy;
    if (run.cancelled) {
        result.message = fmt::format("{} cancelled after {} items", is_copy ? "Copy" : "Move",
                                     result.items_completed);
        tracker_.cancel(run.id);
    } else if (result.errors.empty()) {
        result.message = fmt::format("{} {} files", is_copy ? "Copied" : "Moved",
                                     result.items_completed);
        tracker_.complete(run.id, true);
    } else {
        result.message = fmt::format("{} completed with {} errors", is_copy ? "Copy" : "Move",
                                     result.errors.size());
        tracker_.complete(run.id, false);
    }

    auto snapshot = tracker_.get(run.id);
    result.progress = result.success ? 100.0 : (snapshot ? snapshot->percentage() : 0.0);

    LOG_INFO("{}: {} ({}, {})", run.id, result.message, formatSize(result.bytes_processed),
             formatDuration(result.duration));
    return result;
}

bool FileOperationExecutor::stop_requested(Run& run) {
    if (!run.cancelled && (run.stop.stop_requested() || tracker_.isCancelled(run.id))) {
        LOG_INFO("{}: cancellation requested", run.id);
        run.cancelled = true;
    }
    return run.cancelled;
}

bool FileOperationExecutor::transfer_item(Run& run, const std::filesystem::path& source,
                                          const std::filesystem::path& destination) {
    std::error_code ec;
    auto status = std::filesystem::symlink_status(source, ec);
    if (ec || !std::filesystem::exists(status)) {
        record_error(run, source, ErrorKind::NotFound);
        return false;
    }

    if (run.type == OperationType::Move && std::filesystem::equivalent(source, destination, ec)) {
        LOG_DEBUG("{}: {} is already in place", run.id, pathToUtf8(source));
        return true;
    }

    if (std::filesystem::is_directory(status) && isSubdirectory(source, destination)) {
        record_error(run, source, ErrorKind::InvalidArgument,
                     "cannot copy a directory into itself");
        return false;
    }

    return place(run, source, destination, run.type == OperationType::Move);
}

bool FileOperationExecutor::place(Run& run, const std::filesystem::path& source,
                                  const std::filesystem::path& destination, bool move) {
    std::error_code ec;
    auto status = std::filesystem::symlink_status(source, ec);
    if (ec) {
        record_error(run, source, errorKindFromCode(ec), ec.message());
        return false;
    }
    bool source_is_dir = std::filesystem::is_directory(status);

    auto target = destination;
    auto dest_status = std::filesystem::symlink_status(destination, ec);
    if (std::filesystem::exists(dest_status)) {
        if (!move && std::filesystem::is_regular_file(status) &&
            verifier_.identical(source, destination)) {
            LOG_DEBUG("{}: {} is identical, nothing to copy", run.id, pathToUtf8(destination));
            tracker_.update(run.id, {1, std::filesystem::file_size(source, ec),
                                     pathToUtf8(source.filename()), std::nullopt});
            return true;
        }

        // Directories merge into an existing directory
        bool merge = source_is_dir && std::filesystem::is_directory(dest_status);
        if (!merge) {
            if (run.options->resolver != nullptr) {
                auto conflict = detectConflict(source, destination);
                if (conflict) {
                    auto action = run.options->resolver->resolve(*conflict, run.options->decide);
                    auto applied = run.options->resolver->applyAction(*conflict, action);
                    if (!applied) {
                        record_error(run, destination, applied.error());
                        return false;
                    }
                    if (!*applied) {
                        LOG_INFO("{}: skipped {}", run.id, pathToUtf8(source));
                        ++run.skipped;
                        return false;
                    }
                    target = **applied;
                }
            } else if (!run.options->overwrite_existing) {
                record_error(run, destination, ErrorKind::DestinationConflict);
                return false;
            }

            auto target_status = std::filesystem::symlink_status(target, ec);
            if (std::filesystem::exists(target_status) &&
                std::filesystem::is_directory(target_status) != source_is_dir) {
                record_error(run, target, ErrorKind::DestinationConflict,
                             "cannot replace a directory with a file or a file with a directory");
                return false;
            }
        }
    }

    bool ok = move ? move_item(run, source, target) : copy_item(run, source, target);
    cache_.invalidate(target);
    if (move) {
        cache_.invalidate(source);
    }
    return ok;
}

bool FileOperationExecutor::copy_item(Run& run, const std::filesystem::path& source,
                                      const std::filesystem::path& destination) {
    std::error_code ec;
    auto status = std::filesystem::symlink_status(source, ec);

    if (std::filesystem::is_directory(status)) {
        return copy_tree(run, source, destination);
    }
    if (std::filesystem::is_symlink(status)) {
        return copy_symlink(run, source, destination);
    }
    if (!std::filesystem::is_regular_file(status)) {
        record_error(run, source, ErrorKind::InvalidArgument, "unsupported file type");
        return false;
    }

    auto copied = copy_file_data(run, source, destination);
    if (!copied) {
        if (copied.error() == ErrorKind::Cancelled) {
            run.cancelled = true;
        } else {
            record_error(run, source, copied.error());
        }
        return false;
    }
    tracker_.update(run.id, {1, 0, std::nullopt, std::nullopt});
    return true;
}

bool FileOperationExecutor::copy_tree(Run& run, const std::filesystem::path& source,
                                      const std::filesystem::path& destination) {
    std::error_code ec;
    if (!std::filesystem::is_directory(destination, ec)) {
        std::filesystem::create_directory(destination, source, ec);
        if (ec) {
            record_error(run, destination, errorKindFromCode(ec), ec.message());
            return false;
        }
    }

    bool ok = true;
    std::filesystem::directory_iterator it(source, ec);
    if (ec) {
        record_error(run, source, errorKindFromCode(ec), ec.message());
        return false;
    }
    for (; it != std::filesystem::directory_iterator{}; it.increment(ec)) {
        if (stop_requested(run)) {
            return false;
        }
        if (!place(run, it->path(), destination / it->path().filename(), false)) {
            ok = false;
        }
    }
    if (ec) {
        record_error(run, source, errorKindFromCode(ec), ec.message());
        return false;
    }

    if (ok && run.preserve) {
        auto mtime = std::filesystem::last_write_time(source, ec);
        if (!ec) {
            std::filesystem::last_write_time(destination, mtime, ec);
        }
        if (ec) {
            LOG_WARN("Could not preserve timestamps on {}: {}", pathToUtf8(destination),
                     ec.message());
        }
    }
    return ok && !run.cancelled;
}

bool FileOperationExecutor::copy_symlink(Run& run, const std::filesystem::path& source,
                                         const std::filesystem::path& destination) {
    std::error_code ec;
    auto link_target = std::filesystem::read_symlink(source, ec);
    if (ec) {
        record_error(run, source, errorKindFromCode(ec), ec.message());
        return false;
    }

    if (path_exists(destination)) {
        std::filesystem::remove(destination, ec);
        if (ec) {
            record_error(run, destination, errorKindFromCode(ec), ec.message());
            return false;
        }
    }

    std::filesystem::create_symlink(link_target, destination, ec);
    if (ec) {
        record_error(run, destination, errorKindFromCode(ec), ec.message());
        return false;
    }
    tracker_.update(run.id, {1, 0, pathToUtf8(source.filename()), std::nullopt});
    return true;
}

std::expected<void, ErrorKind>
FileOperationExecutor::copy_file_data(Run& run, const std::filesystem::path& source,
                                      const std::filesystem::path& destination) {
    UniqueFd in(::open(source.c_str(), O_RDONLY | O_CLOEXEC));
    if (!in) {
        return std::unexpected(errno_kind(errno));
    }

    struct stat st {};
    if (::fstat(in.get(), &st) != 0) {
        return std::unexpected(errno_kind(errno));
    }

    auto temp = temp_path_for(destination);
    UniqueFd out(::open(temp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                        run.preserve ? 0600 : 0666));
    if (!out) {
        return std::unexpected(errno_kind(errno));
    }
    TempFileGuard guard(temp);

    auto current = pathToUtf8(source.filename());
    std::vector<char> buffer(settings_.transfer.chunk_size > 0 ? settings_.transfer.chunk_size
                                                               : kDefaultChunkSize);
    for (;;) {
        if (stop_requested(run)) {
            return std::unexpected(ErrorKind::Cancelled);
        }

        auto n = ::read(in.get(), buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return std::unexpected(errno_kind(errno));
        }
        if (n == 0) {
            break;
        }
        if (!write_all(out.get(), buffer.data(), static_cast<size_t>(n))) {
            return std::unexpected(errno_kind(errno));
        }

        auto chunk = static_cast<uint64_t>(n);
        bytes_copied_.fetch_add(chunk, std::memory_order_relaxed);
        run.bytes += chunk;
        tracker_.update(run.id, {0, chunk, current, std::nullopt});
    }

    if (run.preserve) {
        if (::fchmod(out.get(), st.st_mode & 07777) != 0) {
            LOG_WARN("Could not preserve permissions on {}: {}", pathToUtf8(destination),
                     std::strerror(errno));
        }
        const struct timespec times[2] = {st.st_atim, st.st_mtim};
        if (::futimens(out.get(), times) != 0) {
            LOG_WARN("Could not preserve timestamps on {}: {}", pathToUtf8(destination),
                     std::strerror(errno));
        }
    }

    if (out.close() != 0) {
        return std::unexpected(errno_kind(errno));
    }

    if (run.verify) {
        auto checked = check_(source, temp);
        if (!checked) {
            LOG_ERROR("Verification failed for {}", pathToUtf8(destination));
            return std::unexpected(checked.error());
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp, destination, ec);
    if (ec) {
        return std::unexpected(errorKindFromCode(ec));
    }
    guard.release();
    return {};
}

bool FileOperationExecutor::move_item(Run& run, const std::filesystem::path& source,
                                      const std::filesystem::path& destination) {
    std::error_code ec;
    if (sameVolume(source, destination.parent_path())) {
        auto summary = summarizeTree(source);
        std::filesystem::rename(source, destination, ec);
        if (!ec) {
            LOG_DEBUG("{}: renamed {} -> {}", run.id, pathToUtf8(source), pathToUtf8(destination));
            tracker_.update(run.id, {summary.files, summary.bytes, pathToUtf8(source.filename()),
                                     std::nullopt});
            return true;
        }
        // A non-empty destination directory is merged through the copy path
        if (ec != std::errc::cross_device_link && ec != std::errc::directory_not_empty &&
            ec != std::errc::file_exists) {
            record_error(run, source, errorKindFromCode(ec), ec.message());
            return false;
        }
        ec.clear();
    }

    if (!copy_item(run, source, destination)) {
        return false;
    }

    std::filesystem::remove_all(source, ec);
    if (ec) {
        record_error(run, source, errorKindFromCode(ec),
                     fmt::format("copied but source not removed: {}", ec.message()));
        return false;
    }
    return true;
}

void FileOperationExecutor::record_error(Run& run, const std::filesystem::path& path,
                                         ErrorKind kind, std::string_view detail) {
    auto line = formatItemError(path, kind, detail);
    LOG_ERROR("{}: {}", run.id, line);
    tracker_.update(run.id, {0, 0, std::nullopt, line});
    run.result.errors.push_back(std::move(line));
}

OperationOutcome FileOperationExecutor::remove(std::span<const std::filesystem::path> paths,
                                               const DeleteOptions& options,
                                               const OperationControl& control) {
    if (paths.empty()) {
        return logAndReturnInfo(ErrorKind::InvalidArgument, "No paths to delete");
    }

    Run run;
    run.type = OperationType::Delete;
    run.id = control.operation_id.empty() ? generateOperationId("delete") : control.operation_id;
    run.stop = control.stop_token;

    bool permanent = options.permanent || !settings_.trash.use_trash;
    TrashOptions trash_options{settings_.trash.use_system_trash, config::getTrashPath(settings_)};

    tracker_.create(run.id, OperationType::Delete, paths.size(), 0);
    if (control.observer) {
        tracker_.addCallback(run.id, control.observer);
    }

    auto start = std::chrono::steady_clock::now();
    for (const auto& path : paths) {
        if (stop_requested(run)) {
            break;
        }

        auto name = pathToUtf8(path.filename());
        if (!path_exists(path)) {
            LOG_DEBUG("{}: {} already gone", run.id, pathToUtf8(path));
            tracker_.update(run.id, {1, 0, name, std::nullopt});
            continue;
        }

        std::optional<TrashError> failure;
        if (permanent) {
            auto removed = permanentDelete(path);
            if (!removed) {
                failure = removed.error();
            }
        } else {
            auto trashed = trashFile(path, trash_options);
            if (!trashed) {
                failure = trashed.error();
            }
        }

        cache_.invalidate(path);
        if (failure && *failure != TrashError::NotFound) {
            record_error(run, path, trash_error_kind(*failure), to_string(*failure));
            continue;
        }

        run.result.affected_files.push_back(path);
        ++run.result.items_completed;
        tracker_.update(run.id, {1, 0, name, std::nullopt});
    }

    auto& result = run.result;
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    result.cancelled = run.cancelled;
    result.success = result.errors.empty() && !run.cancelled;

    if (run.cancelled) {
        result.message = fmt::format("Delete cancelled after {} items", result.items_completed);
        tracker_.cancel(run.id);
    } else if (result.errors.empty()) {
        result.message = permanent
                             ? fmt::format("Deleted {} items", result.items_completed)
                             : fmt::format("Moved {} items to trash", result.items_completed);
        tracker_.complete(run.id, true);
    } else {
        result.message = fmt::format("Delete completed with {} errors", result.errors.size());
        tracker_.complete(run.id, false);
    }
    auto snapshot = tracker_.get(run.id);
    result.progress = result.success ? 100.0 : (snapshot ? snapshot->percentage() : 0.0);

    LOG_INFO("{}: {}", run.id, result.message);
    return result;
}

OperationOutcome FileOperationExecutor::rename(const std::filesystem::path& path,
                                               std::string_view new_name,
                                               const OperationControl& control) {
    if (new_name.empty() || new_name == "." || new_name == "..") {
        return logAndReturnInfo(ErrorKind::InvalidArgument,
                                fmt::format("Invalid name '{}'", new_name));
    }
    if (!path_exists(path)) {
        return logAndReturnInfo(ErrorKind::NotFound, pathToUtf8(path));
    }

    auto id = control.operation_id.empty() ? generateOperationId("rename") : control.operation_id;
    tracker_.create(id, OperationType::Rename, 1, 0);
    if (control.observer) {
        tracker_.addCallback(id, control.observer);
    }

    auto start = std::chrono::steady_clock::now();
    OperationResult result;
    auto new_path = path.parent_path() / utf8ToPath(new_name);

    std::error_code ec;
    if (!isValidFilename(new_name)) {
        result.errors.push_back(
            formatItemError(path, ErrorKind::InvalidArgument, "name contains a path separator"));
    } else if (path_exists(new_path)) {
        result.errors.push_back(formatItemError(new_path, ErrorKind::DestinationConflict));
    } else {
        std::filesystem::rename(path, new_path, ec);
        if (ec) {
            result.errors.push_back(formatItemError(path, errorKindFromCode(ec), ec.message()));
        }
    }

    cache_.invalidate(path);
    cache_.invalidate(new_path);

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    result.success = result.errors.empty();
    if (result.success) {
        result.affected_files.push_back(new_path);
        result.items_completed = 1;
        result.progress = 100.0;
        result.message = fmt::format("Renamed {} to {}", pathToUtf8(path.filename()), new_name);
        tracker_.update(id, {1, 0, pathToUtf8(path.filename()), std::nullopt});
        LOG_INFO("{}: {}", id, result.message);
    } else {
        result.message = fmt::format("Failed to rename {}", pathToUtf8(path.filename()));
        tracker_.update(id, {0, 0, std::nullopt, result.errors.front()});
        LOG_ERROR("{}: {}", id, result.errors.front());
    }
    tracker_.complete(id, result.success);
    return result;
}

OperationOutcome FileOperationExecutor::createDirectory(const std::filesystem::path& path) {
    if (path.empty()) {
        return logAndReturnInfo(ErrorKind::InvalidArgument, "Directory path is empty");
    }

    OperationResult result;
    std::error_code ec;
    if (path_exists(path)) {
        result.errors.push_back(formatItemError(path, ErrorKind::DestinationConflict));
    } else {
        std::filesystem::create_directories(path, ec);
        if (ec) {
            result.errors.push_back(formatItemError(path, errorKindFromCode(ec), ec.message()));
        }
    }

    cache_.invalidate(path);
    result.success = result.errors.empty();
    if (result.success) {
        result.affected_files.push_back(path);
        result.items_completed = 1;
        result.progress = 100.0;
        result.message = fmt::format("Created directory {}", pathToUtf8(path.filename()));
        LOG_INFO("Created directory: {}", pathToUtf8(path));
    } else {
        result.message = fmt::format("Failed to create directory {}", pathToUtf8(path.filename()));
        LOG_ERROR("{}", result.errors.front());
    }
    return result;
}

OperationOutcome FileOperationExecutor::createFile(const std::filesystem::path& path,
                                                   std::string_view content) {
    if (path.empty() || path.filename().empty()) {
        return logAndReturnInfo(ErrorKind::InvalidArgument, "File path is empty");
    }

    OperationResult result;
    std::error_code ec;
    auto parent = path.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent, ec)) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            result.errors.push_back(formatItemError(parent, errorKindFromCode(ec), ec.message()));
        }
    }

    if (result.errors.empty()) {
        UniqueFd fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0666));
        if (!fd) {
            auto kind = errno == EEXIST ? ErrorKind::DestinationConflict : errno_kind(errno);
            result.errors.push_back(formatItemError(path, kind));
        } else if (!write_all(fd.get(), content.data(), content.size()) || fd.close() != 0) {
            result.errors.push_back(formatItemError(path, errno_kind(errno)));
        }
    }

    cache_.invalidate(path);
    result.success = result.errors.empty();
    if (result.success) {
        result.affected_files.push_back(path);
        result.items_completed = 1;
        result.bytes_processed = content.size();
        result.progress = 100.0;
        result.message = fmt::format("Created file {}", pathToUtf8(path.filename()));
        LOG_INFO("Created file: {}", pathToUtf8(path));
    } else {
        result.message = fmt::format("Failed to create file {}", pathToUtf8(path.filename()));
        LOG_ERROR("{}", result.errors.front());
    }
    return result;
}

bool isValidFilename(std::string_view name) noexcept {
    if (name.empty() || name.size() > kMaxNameBytes || name == "." || name == "..") {
        return false;
    }
    return name.find('/') == std::string_view::npos && name.find('\0') == std::string_view::npos;
}

}  // namespace laxy::fs
