/// @file archive_codec.cpp
/// @brief Archive codec implementation

#include "archive_codec.hpp"

#include <chrono>
#include <functional>

#include <fmt/format.h>

#include "../cache/metadata_cache.hpp"
#include "../util/logger.hpp"
#include "../util/string_utils.hpp"
#include "seven_zip_library.hpp"

namespace laxy::archive {

namespace {

struct CollectedSources {
    std::vector<ArchiveSource> sources;
    uint64_t files = 0;
    uint64_t bytes = 0;
};

[[nodiscard]] std::filesystem::path item_name(const std::filesystem::path& path) {
    auto name = path.filename();
    return name.empty() ? path.parent_path().filename() : name;
}

[[nodiscard]] bool is_empty_directory(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_empty(path, ec) && !ec;
}

[[nodiscard]] bool same_path(const std::filesystem::path& a, const std::filesystem::path& b) {
    std::error_code ec;
    auto ca = std::filesystem::weakly_canonical(a, ec);
    if (ec) {
        return false;
    }
    auto cb = std::filesystem::weakly_canonical(b, ec);
    return !ec && ca == cb;
}

/// @brief Expand inputs into archive entries; directories keep their name as root
[[nodiscard]] std::expected<CollectedSources, OperationError>
collect_sources(std::span<const std::filesystem::path> inputs,
                const std::filesystem::path& archive_path) {
    CollectedSources collected;

    for (const auto& input : inputs) {
        std::error_code ec;
        auto status = std::filesystem::status(input, ec);
        if (ec || !std::filesystem::exists(status)) {
            return logAndReturnInfo(ErrorKind::NotFound, pathToUtf8(input));
        }

        auto root = pathToUtf8(item_name(input));
        if (!std::filesystem::is_directory(status)) {
            collected.sources.push_back({input, root});
            ++collected.files;
            auto size = std::filesystem::file_size(input, ec);
            collected.bytes += ec ? 0 : size;
            continue;
        }

        if (is_empty_directory(input)) {
            collected.sources.push_back({input, root});
            continue;
        }

        std::filesystem::recursive_directory_iterator it(
            input, std::filesystem::directory_options::skip_permission_denied, ec);
        for (; !ec && it != std::filesystem::recursive_directory_iterator{}; it.increment(ec)) {
            const auto& entry = *it;
            auto entry_path =
                root + "/" + pathToUtf8(entry.path().lexically_relative(input));

            std::error_code entry_ec;
            if (entry.is_directory(entry_ec)) {
                if (is_empty_directory(entry.path())) {
                    collected.sources.push_back({entry.path(), entry_path});
                }
            } else if (entry.is_regular_file(entry_ec)) {
                if (same_path(entry.path(), archive_path)) {
                    continue;
                }
                collected.sources.push_back({entry.path(), entry_path});
                ++collected.files;
                auto size = entry.file_size(entry_ec);
                collected.bytes += entry_ec ? 0 : size;
            }
        }
        if (ec) {
            return logAndReturnInfo(errorKindFromCode(ec),
                                    fmt::format("Cannot read {}: {}", pathToUtf8(input),
                                                ec.message()));
        }
    }
    return collected;
}

/// @brief Forward cumulative byte counts to the tracker as deltas
///
/// A job made of several passes calls startPass() between them; each pass
/// then counts from the bytes already reported.
class TrackerProgress {
public:
    TrackerProgress(progress::ProgressTracker& tracker, std::string id, std::stop_token stop)
        : tracker_(tracker), id_(std::move(id)), stop_(std::move(stop)) {}

    bool operator()(uint64_t current, uint64_t /*total*/) {
        auto cumulative = base_ + current;
        if (cumulative > reported_) {
            tracker_.update(id_, {0, cumulative - reported_, std::nullopt, std::nullopt});
            reported_ = cumulative;
        }
        return !stop_.stop_requested() && !tracker_.isCancelled(id_);
    }

    void startPass() noexcept { base_ = reported_; }

    [[nodiscard]] uint64_t reported() const noexcept { return reported_; }

private:
    progress::ProgressTracker& tracker_;
    std::string id_;
    std::stop_token stop_;
    uint64_t base_ = 0;
    uint64_t reported_ = 0;
};

}  // namespace

ArchiveCodec::ArchiveCodec(cache::MetadataCache& cache, progress::ProgressTracker& tracker,
                           config::ArchiveSettings settings)
    : cache_(cache), tracker_(tracker), settings_(std::move(settings)) {}

OperationOutcome ArchiveCodec::create(std::span<const std::filesystem::path> files,
                                      const std::filesystem::path& archive_path,
                                      ArchiveFormat format, std::optional<CompressionLevel> level,
                                      const fs::OperationControl& control) {
    if (files.empty()) {
        return logAndReturnInfo(ErrorKind::InvalidArgument, "No files to archive");
    }
    if (archive_path.empty()) {
        return logAndReturnInfo(ErrorKind::InvalidArgument, "Archive path is empty");
    }

    if (format == ArchiveFormat::Unknown) {
        format = format_from_extension(archive_path);
    }
    if (format == ArchiveFormat::Unknown) {
        return logAndReturnInfo(ErrorKind::UnsupportedFormat,
                                fmt::format("Cannot determine archive format of {}",
                                            pathToUtf8(archive_path.filename())));
    }
    if (!can_create(format)) {
        return logAndReturnInfo(ErrorKind::UnsupportedFormat,
                                fmt::format("{} archives can only be extracted", to_string(format)));
    }

    auto collected = collect_sources(files, archive_path);
    if (!collected) {
        return std::unexpected(collected.error());
    }

    if (control.stop_token.stop_requested()) {
        auto id = control.operation_id.empty() ? generateOperationId("archive_create")
                                               : control.operation_id;
        tracker_.create(id, OperationType::CreateArchive, collected->files, collected->bytes);
        tracker_.cancel(id);
        OperationResult result;
        result.cancelled = true;
        result.message = "Archive creation cancelled";
        LOG_INFO("{}: {}", id, result.message);
        return result;
    }

    auto writer = ArchiveWriterFactory::create(settings_.seven_zip_library);
    if (!writer) {
        return logAndReturnInfo(toErrorKind(writer.error()),
                                std::string(to_string(writer.error())));
    }

    auto id = control.operation_id.empty() ? generateOperationId("archive_create")
                                           : control.operation_id;
    tracker_.create(id, OperationType::CreateArchive, collected->files, collected->bytes);
    if (control.observer) {
        tracker_.addCallback(id, control.observer);
    }

    std::error_code ec;
    bool existed = std::filesystem::exists(archive_path, ec);
    if (auto parent = archive_path.parent_path(); !parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    auto effective_level =
        level.value_or(compression_level_from_int(settings_.default_compression_level));
    LOG_INFO("{}: creating {} ({}, level {}) from {} files, {}", id, pathToUtf8(archive_path),
             to_string(format), static_cast<int>(effective_level), collected->files,
             formatSize(collected->bytes));

    auto start = std::chrono::steady_clock::now();
    TrackerProgress progress(tracker_, id, control.stop_token);
    auto written = (*writer)->write(collected->sources, archive_path, format, effective_level,
                                    std::ref(progress));

    OperationResult result;
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (!written) {
        if (!existed) {
            std::filesystem::remove(archive_path, ec);
        }
        if (written.error() == ArchiveError::Cancelled) {
            result.cancelled = true;
            result.message = "Archive creation cancelled";
            tracker_.cancel(id);
        } else {
            result.errors.push_back(formatItemError(archive_path, toErrorKind(written.error()),
                                                    to_string(written.error())));
            result.message = fmt::format("Failed to create archive {}",
                                         pathToUtf8(archive_path.filename()));
            tracker_.complete(id, false);
        }
        cache_.invalidate(archive_path);
        LOG_ERROR("{}: {}", id, result.message);
        return result;
    }

    tracker_.update(id, {collected->files, 0, std::nullopt, std::nullopt});

    if (settings_.verify_after_create) {
        auto tested = test(archive_path);
        if (!tested) {
            LOG_WARN("{}: integrity check of {} failed: {}", id, pathToUtf8(archive_path),
                     to_string(tested.error()));
        }
    }

    cache_.invalidate(archive_path);
    tracker_.complete(id, true);

    result.success = true;
    result.progress = 100.0;
    result.affected_files.push_back(archive_path);
    result.items_completed = static_cast<size_t>(collected->files);
    result.bytes_processed = collected->bytes;
    result.message = fmt::format("Created {} with {} files", pathToUtf8(archive_path.filename()),
                                 collected->files);
    LOG_INFO("{}: {}", id, result.message);
    return result;
}

OperationOutcome ArchiveCodec::extract(const std::filesystem::path& archive_path,
                                       const std::filesystem::path& dest_dir,
                                       const fs::OperationControl& control) {
    std::error_code ec;
    if (std::filesystem::exists(dest_dir, ec) && !std::filesystem::is_directory(dest_dir, ec)) {
        return logAndReturnInfo(ErrorKind::InvalidArgument,
                                fmt::format("{} is not a directory", pathToUtf8(dest_dir)));
    }

    auto id = control.operation_id.empty() ? generateOperationId("archive_extract")
                                           : control.operation_id;
    // Totals are unknown until the archive is open
    tracker_.create(id, OperationType::ExtractArchive);
    if (control.observer) {
        tracker_.addCallback(id, control.observer);
    }

    auto start = std::chrono::steady_clock::now();
    TrackerProgress progress(tracker_, id, control.stop_token);

    // Compressed tars are unpacked to a temporary tar first; that pass
    // counts the unpacked stream size towards the job
    uint64_t unwrap_total = 0;
    auto reader = open_reader(archive_path, [&](uint64_t current, uint64_t total) {
        if (total > unwrap_total) {
            unwrap_total = total;
            tracker_.setTotals(id, 0, total);
        }
        return progress(current, total);
    });
    if (!reader && reader.error() == ArchiveError::Cancelled) {
        tracker_.cancel(id);
        OperationResult result;
        result.cancelled = true;
        result.message = "Extraction cancelled";
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        LOG_INFO("{}: {}", id, result.message);
        return result;
    }
    if (!reader) {
        tracker_.complete(id, false);
        return logAndReturnInfo(toErrorKind(reader.error()),
                                fmt::format("{}: {}", pathToUtf8(archive_path),
                                            to_string(reader.error())));
    }

    auto info = (*reader)->getInfo();
    if (!info) {
        tracker_.complete(id, false);
        return logAndReturnInfo(toErrorKind(info.error()),
                                fmt::format("{}: {}", pathToUtf8(archive_path),
                                            to_string(info.error())));
    }

    tracker_.setTotals(id, info->file_count, progress.reported() + info->total_uncompressed_size);
    progress.startPass();

    LOG_INFO("{}: extracting {} ({} entries) to {}", id, pathToUtf8(archive_path),
             info->total_entries(), pathToUtf8(dest_dir));

    auto extracted = (*reader)->extractAll(dest_dir, std::ref(progress));
    cache_.invalidate(dest_dir);

    OperationResult result;
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (!extracted) {
        if (extracted.error() == ArchiveError::Cancelled) {
            result.cancelled = true;
            result.message = "Extraction cancelled";
            tracker_.cancel(id);
        } else {
            result.errors.push_back(formatItemError(archive_path, toErrorKind(extracted.error()),
                                                    to_string(extracted.error())));
            result.message = fmt::format("Failed to extract {}",
                                         pathToUtf8(archive_path.filename()));
            tracker_.complete(id, false);
        }
        LOG_ERROR("{}: {}", id, result.message);
        return result;
    }

    for (const auto& entry : info->entries) {
        if (!entry.is_directory) {
            result.affected_files.push_back(dest_dir / utf8ToPath(entry.path));
        }
    }
    tracker_.update(id, {info->file_count, 0, std::nullopt, std::nullopt});
    tracker_.complete(id, true);

    result.success = true;
    result.progress = 100.0;
    result.items_completed = static_cast<size_t>(info->file_count);
    result.bytes_processed = info->total_uncompressed_size;
    result.message = fmt::format("Extracted {} files to {}", info->file_count,
                                 pathToUtf8(dest_dir));
    LOG_INFO("{}: {}", id, result.message);
    return result;
}

std::expected<std::vector<ArchiveEntry>, ArchiveError>
ArchiveCodec::listContents(const std::filesystem::path& archive_path) const {
    auto reader = open_reader(archive_path);
    if (!reader) {
        return std::unexpected(reader.error());
    }
    return (*reader)->listEntries();
}

std::expected<ArchiveInfo, ArchiveError>
ArchiveCodec::info(const std::filesystem::path& archive_path) const {
    auto reader = open_reader(archive_path);
    if (!reader) {
        return std::unexpected(reader.error());
    }
    return (*reader)->getInfo();
}

ArchiveFormat ArchiveCodec::detectFormat(const std::filesystem::path& path) const {
    return detect_format(path);
}

std::expected<void, ArchiveError> ArchiveCodec::test(const std::filesystem::path& archive_path) const {
    auto reader = open_reader(archive_path);
    if (!reader) {
        return std::unexpected(reader.error());
    }
    return (*reader)->test();
}

std::vector<ArchiveFormatSupport> ArchiveCodec::supportedFormats() {
    return {
        {ArchiveFormat::Zip, true, true, {".zip"}},
        {ArchiveFormat::Tar, true, true, {".tar"}},
        {ArchiveFormat::TarGz, true, true, {".tar.gz", ".tgz"}},
        {ArchiveFormat::TarBz2, true, true, {".tar.bz2", ".tbz2"}},
        {ArchiveFormat::TarXz, true, true, {".tar.xz", ".txz"}},
        {ArchiveFormat::SevenZip, true, true, {".7z"}},
        {ArchiveFormat::Rar, false, true, {".rar"}},
    };
}

bool ArchiveCodec::isAvailable() const {
    return findSevenZipLibrary(settings_.seven_zip_library).has_value();
}

std::expected<std::unique_ptr<IArchiveReader>, ArchiveError>
ArchiveCodec::open_reader(const std::filesystem::path& archive_path,
                          ArchiveProgressCallback progress) const {
    std::error_code ec;
    if (!std::filesystem::exists(archive_path, ec)) {
        return std::unexpected(ArchiveError::NotFound);
    }

    auto format = detect_format(archive_path);
    if (format == ArchiveFormat::Unknown) {
        return std::unexpected(ArchiveError::UnsupportedFormat);
    }

    auto reader = ArchiveReaderFactory::create(settings_.seven_zip_library);
    if (!reader) {
        return std::unexpected(reader.error());
    }

    auto opened = (*reader)->open(archive_path, format, std::move(progress));
    if (!opened) {
        return std::unexpected(opened.error());
    }
    return std::move(*reader);
}

}  // namespace laxy::archive
