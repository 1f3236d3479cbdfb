/// @file archive_reader.cpp
/// @brief Archive reader implementation using bit7z
///
/// Compressed tars (.tar.gz, .tar.bz2, .tar.xz) are single-stream
/// archives around a tar: the stream is first unpacked to a temporary
/// tar file, which is then read like a plain tar.

#include "archive_reader.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <random>

#include <bit7z/bit7z.hpp>
#include <fmt/format.h>

#include "../util/logger.hpp"
#include "../util/string_utils.hpp"
#include "bit7z_format.hpp"
#include "seven_zip_library.hpp"

namespace laxy::archive {

namespace {

/// @brief Normalize path separators to forward slash for consistent comparison
std::string normalize_path_separators(std::string path) {
    std::replace(path.begin(), path.end(), '\\', '/');
    return path;
}

/// @brief RAR 5 signature is "Rar!\x1a\x07\x01\x00"
bool is_rar5(const std::filesystem::path& path) {
    std::array<char, 8> head{};
    std::ifstream file(path, std::ios::binary);
    file.read(head.data(), static_cast<std::streamsize>(head.size()));
    return file.gcount() == static_cast<std::streamsize>(head.size()) && head[6] == 0x01;
}

std::filesystem::path temporary_tar_path() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        dir = "/tmp";
    }
    return dir / fmt::format("laxy-{:016x}.tar", gen());
}

/// @brief Archive reader implementation using bit7z
class Bit7zReader : public IArchiveReader {
public:
    explicit Bit7zReader(std::shared_ptr<const bit7z::Bit7zLibrary> lib) : lib_(std::move(lib)) {}
    ~Bit7zReader() override { close(); }

    Bit7zReader(const Bit7zReader&) = delete;
    Bit7zReader& operator=(const Bit7zReader&) = delete;

    std::expected<void, ArchiveError> open(const std::filesystem::path& path, ArchiveFormat format,
                                           ArchiveProgressCallback progress) override {
        close();

        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return std::unexpected(ArchiveError::NotFound);
        }
        if (format == ArchiveFormat::Unknown) {
            return std::unexpected(ArchiveError::UnsupportedFormat);
        }

        try {
            if (is_compressed_tar(format)) {
                auto unwrapped = unwrap_tar(path, format, progress);
                if (!unwrapped) {
                    close();
                    return std::unexpected(unwrapped.error());
                }
                reader_ = std::make_unique<bit7z::BitArchiveReader>(*lib_, temp_tar_.string(),
                                                                    bit7z::BitFormat::Tar);
            } else {
                reader_ = std::make_unique<bit7z::BitArchiveReader>(
                    *lib_, path.string(),
                    detail::input_format(format, format == ArchiveFormat::Rar && is_rar5(path)));
            }

            archive_path_ = path;
            format_ = format;
            return {};

        } catch (const bit7z::BitException& e) {
            LOG_ERROR("Cannot open archive {}: {}", pathToUtf8(path), e.what());
            close();
            return std::unexpected(detail::from_bit_exception(e));
        }
    }

    void close() override {
        reader_.reset();
        archive_path_.clear();
        format_ = ArchiveFormat::Unknown;
        if (!temp_tar_.empty()) {
            std::error_code ec;
            std::filesystem::remove(temp_tar_, ec);
            temp_tar_.clear();
        }
    }

    bool isOpen() const noexcept override { return reader_ != nullptr; }

    std::expected<ArchiveInfo, ArchiveError> getInfo() const override {
        if (!reader_) {
            return std::unexpected(ArchiveError::IoError);
        }

        try {
            ArchiveInfo info;
            info.path = archive_path_;
            info.format = format_;
            info.is_encrypted = reader_->isEncrypted();
            info.is_solid = reader_->isSolid();

            std::error_code ec;
            info.archive_size = std::filesystem::file_size(archive_path_, ec);
            if (ec) {
                info.archive_size = 0;
            }

            for (const auto& item : reader_->items()) {
                ArchiveEntry entry;
                entry.path = normalize_path_separators(item.path());
                entry.name = item.name();
                entry.is_directory = item.isDir();
                entry.is_encrypted = item.isEncrypted();
                entry.compressed_size = item.packSize();
                entry.uncompressed_size = item.size();
                entry.modified_time = item.lastWriteTime();
                entry.crc32 = item.crc();

                if (entry.is_directory) {
                    ++info.directory_count;
                } else {
                    ++info.file_count;
                    info.total_compressed_size += entry.compressed_size;
                    info.total_uncompressed_size += entry.uncompressed_size;
                }

                info.entries.push_back(std::move(entry));
            }

            return info;

        } catch (const bit7z::BitException& e) {
            LOG_ERROR("Cannot read {}: {}", pathToUtf8(archive_path_), e.what());
            return std::unexpected(detail::from_bit_exception(e));
        }
    }

    std::expected<std::vector<ArchiveEntry>, ArchiveError> listEntries() const override {
        auto info_result = getInfo();
        if (!info_result) {
            return std::unexpected(info_result.error());
        }
        return std::move(info_result->entries);
    }

    std::expected<void, ArchiveError> extractAll(const std::filesystem::path& dest_dir,
                                                 ArchiveProgressCallback progress) const override {
        if (!reader_) {
            return std::unexpected(ArchiveError::IoError);
        }

        bool cancelled = false;
        try {
            for (const auto& item : reader_->items()) {
                auto entry_path = normalize_path_separators(item.path());
                if (!is_safe_entry_path(entry_path)) {
                    LOG_ERROR("Refusing to extract {}: entry '{}' escapes the destination",
                              pathToUtf8(archive_path_), entry_path);
                    return std::unexpected(ArchiveError::UnsafeEntry);
                }
            }

            std::error_code ec;
            std::filesystem::create_directories(dest_dir, ec);
            if (ec) {
                return std::unexpected(ArchiveError::IoError);
            }

            uint64_t total = 0;
            reader_->setTotalCallback([&total](uint64_t value) { total = value; });
            reader_->setProgressCallback([&](uint64_t current) -> bool {
                if (progress && !progress(current, total)) {
                    cancelled = true;
                    return false;
                }
                return true;
            });

            reader_->extractTo(dest_dir.string());
            reset_callbacks();
            return {};

        } catch (const bit7z::BitException& e) {
            reset_callbacks();
            if (cancelled) {
                return std::unexpected(ArchiveError::Cancelled);
            }
            LOG_ERROR("Extraction of {} failed: {}", pathToUtf8(archive_path_), e.what());
            return std::unexpected(detail::from_bit_exception(e));
        }
    }

    std::expected<void, ArchiveError> test() const override {
        if (!reader_) {
            return std::unexpected(ArchiveError::IoError);
        }

        try {
            reader_->test();
            return {};
        } catch (const bit7z::BitException& e) {
            LOG_WARN("Archive test failed for {}: {}", pathToUtf8(archive_path_), e.what());
            return std::unexpected(ArchiveError::CorruptedArchive);
        }
    }

private:
    /// @brief Unpack the outer stream of a compressed tar into temp_tar_
    std::expected<void, ArchiveError> unwrap_tar(const std::filesystem::path& path,
                                                 ArchiveFormat format,
                                                 const ArchiveProgressCallback& progress) {
        if (progress && !progress(0, 0)) {
            return std::unexpected(ArchiveError::Cancelled);
        }

        bit7z::BitArchiveReader outer(*lib_, path.string(), detail::input_format(format, false));
        if (outer.itemsCount() != 1) {
            LOG_ERROR("{} is not a single-stream {} archive", pathToUtf8(path), to_string(format));
            return std::unexpected(ArchiveError::CorruptedArchive);
        }

        temp_tar_ = temporary_tar_path();
        std::ofstream tar_file(temp_tar_, std::ios::binary | std::ios::trunc);
        if (!tar_file) {
            return std::unexpected(ArchiveError::IoError);
        }

        bool cancelled = false;
        uint64_t total = 0;
        outer.setTotalCallback([&total](uint64_t value) { total = value; });
        outer.setProgressCallback([&](uint64_t current) -> bool {
            if (progress && !progress(current, total)) {
                cancelled = true;
                return false;
            }
            return true;
        });
        try {
            outer.extractTo(tar_file, 0);
        } catch (const bit7z::BitException&) {
            if (cancelled) {
                LOG_INFO("Unpacking {} cancelled", pathToUtf8(path));
                return std::unexpected(ArchiveError::Cancelled);
            }
            throw;
        }
        tar_file.close();
        if (!tar_file) {
            return std::unexpected(ArchiveError::IoError);
        }
        return {};
    }

    void reset_callbacks() const {
        reader_->setTotalCallback(nullptr);
        reader_->setProgressCallback(nullptr);
    }

    std::shared_ptr<const bit7z::Bit7zLibrary> lib_;
    std::unique_ptr<bit7z::BitArchiveReader> reader_;
    std::filesystem::path archive_path_;
    std::filesystem::path temp_tar_;
    ArchiveFormat format_ = ArchiveFormat::Unknown;
};

}  // namespace

// Factory implementation

std::expected<std::unique_ptr<IArchiveReader>, ArchiveError>
ArchiveReaderFactory::create(const std::filesystem::path& library) {
    auto lib = loadSevenZipLibrary(library);
    if (!lib) {
        return std::unexpected(lib.error());
    }
    return std::make_unique<Bit7zReader>(std::move(*lib));
}

}  // namespace laxy::archive
