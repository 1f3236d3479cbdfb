/// @file bit7z_format.cpp
/// @brief Mapping between laxy archive types and bit7z

#include "bit7z_format.hpp"

#include <system_error>

namespace laxy::archive::detail {

const bit7z::BitInFormat& input_format(ArchiveFormat format, bool rar5) {
    switch (format) {
    case ArchiveFormat::Rar:
        return rar5 ? static_cast<const bit7z::BitInFormat&>(bit7z::BitFormat::Rar5)
                    : static_cast<const bit7z::BitInFormat&>(bit7z::BitFormat::Rar);
    default:
        return output_format(format);
    }
}

const bit7z::BitInOutFormat& output_format(ArchiveFormat format) {
    switch (format) {
    case ArchiveFormat::Zip:
        return bit7z::BitFormat::Zip;
    case ArchiveFormat::Tar:
        return bit7z::BitFormat::Tar;
    case ArchiveFormat::TarGz:
        return bit7z::BitFormat::GZip;
    case ArchiveFormat::TarBz2:
        return bit7z::BitFormat::BZip2;
    case ArchiveFormat::TarXz:
        return bit7z::BitFormat::Xz;
    case ArchiveFormat::SevenZip:
    case ArchiveFormat::Rar:
    case ArchiveFormat::Unknown:
        break;
    }
    return bit7z::BitFormat::SevenZip;
}

bit7z::BitCompressionLevel to_bit7z(CompressionLevel level) noexcept {
    switch (level) {
    case CompressionLevel::None:
        return bit7z::BitCompressionLevel::None;
    case CompressionLevel::Fastest:
        return bit7z::BitCompressionLevel::Fastest;
    case CompressionLevel::Fast:
        return bit7z::BitCompressionLevel::Fast;
    case CompressionLevel::Normal:
        return bit7z::BitCompressionLevel::Normal;
    case CompressionLevel::Best:
        return bit7z::BitCompressionLevel::Ultra;
    }
    return bit7z::BitCompressionLevel::Normal;
}

ArchiveError from_bit_exception(const bit7z::BitException& e) {
    auto condition = e.code().default_error_condition();
    if (condition == bit7z::BitFailureSource::WrongPassword) {
        return ArchiveError::PasswordRequired;
    }
    if (condition == bit7z::BitFailureSource::DataError ||
        condition == bit7z::BitFailureSource::CRCError ||
        condition == bit7z::BitFailureSource::InvalidArchive ||
        condition == bit7z::BitFailureSource::DataAfterEnd ||
        condition == bit7z::BitFailureSource::UnavailableData) {
        return ArchiveError::CorruptedArchive;
    }
    if (condition == bit7z::BitFailureSource::UnsupportedMethod ||
        condition == bit7z::BitFailureSource::FormatFeatureError) {
        return ArchiveError::UnsupportedFormat;
    }
    if (condition == bit7z::BitFailureSource::OperationNotPermitted ||
        e.code() == std::errc::permission_denied) {
        return ArchiveError::AccessDenied;
    }
    if (e.code() == std::errc::no_such_file_or_directory) {
        return ArchiveError::NotFound;
    }
    return ArchiveError::IoError;
}

}  // namespace laxy::archive::detail
