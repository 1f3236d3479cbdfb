/// @file archive_writer.cpp
/// @brief Archive writer implementation using bit7z
///
/// Compressed tars are written in two passes: a temporary tar beside the
/// output, then the tar compressed as a single stream into the output.

#include "archive_writer.hpp"

#include <map>
#include <random>

#include <bit7z/bit7z.hpp>
#include <fmt/format.h>

#include "../util/logger.hpp"
#include "../util/string_utils.hpp"
#include "bit7z_format.hpp"
#include "seven_zip_library.hpp"

namespace laxy::archive {

namespace {

/// @brief Removes a file on scope exit
class ScopedFileRemover {
public:
    explicit ScopedFileRemover(std::filesystem::path path) : path_(std::move(path)) {}
    ~ScopedFileRemover() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    ScopedFileRemover(const ScopedFileRemover&) = delete;
    ScopedFileRemover& operator=(const ScopedFileRemover&) = delete;

private:
    std::filesystem::path path_;
};

/// @brief Maps the progress of one pass into a share of the whole job
struct PassProgress {
    const ArchiveProgressCallback* callback = nullptr;
    double offset = 0.0;  // Fraction of the job completed before this pass
    double weight = 1.0;  // Fraction of the job this pass represents
    uint64_t job_total = 0;
    uint64_t pass_total = 0;
    bool* cancelled = nullptr;

    bool operator()(uint64_t current) const {
        if (callback == nullptr || !*callback) {
            return true;
        }
        double fraction = pass_total > 0 ? static_cast<double>(current) / pass_total : 0.0;
        auto scaled = static_cast<uint64_t>((offset + weight * fraction) * job_total);
        if (!(*callback)(scaled, job_total)) {
            *cancelled = true;
            return false;
        }
        return true;
    }
};

class Bit7zWriter : public IArchiveWriter {
public:
    explicit Bit7zWriter(std::shared_ptr<const bit7z::Bit7zLibrary> lib) : lib_(std::move(lib)) {}

    std::expected<void, ArchiveError> write(std::span<const ArchiveSource> sources,
                                            const std::filesystem::path& archive_path,
                                            ArchiveFormat format, CompressionLevel level,
                                            ArchiveProgressCallback progress) override {
        if (!can_create(format)) {
            return std::unexpected(ArchiveError::UnsupportedFormat);
        }

        std::map<std::string, std::string> items;
        uint64_t total = 0;
        for (const auto& source : sources) {
            items.emplace(source.file.string(), source.entry_path);
            std::error_code ec;
            if (std::filesystem::is_regular_file(source.file, ec)) {
                total += std::filesystem::file_size(source.file, ec);
            }
        }

        bool cancelled = false;
        try {
            if (!is_compressed_tar(format)) {
                bit7z::BitFileCompressor compressor(*lib_, detail::output_format(format));
                configure(compressor, format, level);
                PassProgress pass{&progress, 0.0, 1.0, total, total, &cancelled};
                compressor.setProgressCallback(pass);
                compressor.compress(items, archive_path.string());
                return {};
            }

            thread_local std::mt19937_64 gen{std::random_device{}()};
            auto tar_path = archive_path.parent_path() /
                            fmt::format(".{}.laxy_tmp_{:016x}.tar",
                                        archive_path.filename().string(), gen());
            ScopedFileRemover remove_tar(tar_path);

            // Tar pass: half the job
            {
                bit7z::BitFileCompressor tar(*lib_, bit7z::BitFormat::Tar);
                tar.setOverwriteMode(bit7z::OverwriteMode::Overwrite);
                PassProgress pass{&progress, 0.0, 0.5, total, total, &cancelled};
                tar.setProgressCallback(pass);
                tar.compress(items, tar_path.string());
            }

            // Stream pass: the other half
            std::error_code ec;
            auto tar_size = std::filesystem::file_size(tar_path, ec);
            bit7z::BitFileCompressor stream(*lib_, detail::output_format(format));
            configure(stream, format, level);
            PassProgress pass{&progress, 0.5, 0.5, total, ec ? 0 : tar_size, &cancelled};
            stream.setProgressCallback(pass);
            stream.compressFile(tar_path.string(), archive_path.string());
            return {};

        } catch (const bit7z::BitException& e) {
            if (cancelled) {
                return std::unexpected(ArchiveError::Cancelled);
            }
            LOG_ERROR("Cannot write {}: {}", pathToUtf8(archive_path), e.what());
            return std::unexpected(detail::from_bit_exception(e));
        }
    }

private:
    static void configure(bit7z::BitFileCompressor& compressor, ArchiveFormat format,
                          CompressionLevel level) {
        compressor.setOverwriteMode(bit7z::OverwriteMode::Overwrite);
        if (format != ArchiveFormat::Tar) {
            compressor.setCompressionLevel(detail::to_bit7z(level));
        }
    }

    std::shared_ptr<const bit7z::Bit7zLibrary> lib_;
};

}  // namespace

std::expected<std::unique_ptr<IArchiveWriter>, ArchiveError>
ArchiveWriterFactory::create(const std::filesystem::path& library) {
    auto lib = loadSevenZipLibrary(library);
    if (!lib) {
        return std::unexpected(lib.error());
    }
    return std::make_unique<Bit7zWriter>(std::move(*lib));
}

}  // namespace laxy::archive
