/// @file archive_entry.cpp
/// @brief Archive format detection and entry helpers

#include "archive_entry.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <fstream>
#include <utility>

#include "../util/string_utils.hpp"

namespace laxy::archive {

namespace {

// Longest suffix first so ".tar.gz" wins over ".gz"
constexpr std::array<std::pair<std::string_view, ArchiveFormat>, 10> kArchiveExtensions = {
    {{".tar.gz", ArchiveFormat::TarGz},
     {".tar.bz2", ArchiveFormat::TarBz2},
     {".tar.xz", ArchiveFormat::TarXz},
     {".tgz", ArchiveFormat::TarGz},
     {".tbz2", ArchiveFormat::TarBz2},
     {".txz", ArchiveFormat::TarXz},
     {".zip", ArchiveFormat::Zip},
     {".tar", ArchiveFormat::Tar},
     {".7z", ArchiveFormat::SevenZip},
     {".rar", ArchiveFormat::Rar}}
};

constexpr size_t kTarMagicOffset = 257;
constexpr size_t kHeadSize = 512;

[[nodiscard]] bool starts_with(std::span<const uint8_t> data,
                               std::initializer_list<uint8_t> magic) noexcept {
    if (data.size() < magic.size()) {
        return false;
    }
    return std::equal(magic.begin(), magic.end(), data.begin());
}

}  // namespace

std::optional<ArchiveFormat> format_from_string(std::string_view name) {
    auto lower = toLowercaseAscii(trim(name));
    if (!lower.empty() && lower.front() == '.') {
        lower.erase(0, 1);
    }
    for (const auto& [ext, format] : kArchiveExtensions) {
        if (ext.substr(1) == lower) {
            return format;
        }
    }
    if (lower == "sevenzip") {
        return ArchiveFormat::SevenZip;
    }
    return std::nullopt;
}

std::string_view default_extension(ArchiveFormat format) noexcept {
    switch (format) {
    case ArchiveFormat::Zip:
        return ".zip";
    case ArchiveFormat::Tar:
        return ".tar";
    case ArchiveFormat::TarGz:
        return ".tar.gz";
    case ArchiveFormat::TarBz2:
        return ".tar.bz2";
    case ArchiveFormat::TarXz:
        return ".tar.xz";
    case ArchiveFormat::SevenZip:
        return ".7z";
    case ArchiveFormat::Rar:
        return ".rar";
    case ArchiveFormat::Unknown:
        break;
    }
    return "";
}

ArchiveFormat format_from_extension(const std::filesystem::path& path) {
    auto name = pathToUtf8(path.filename());
    for (const auto& [ext, format] : kArchiveExtensions) {
        if (name.size() > ext.size() && endsWithIcase(name, ext)) {
            return format;
        }
    }
    return ArchiveFormat::Unknown;
}

ArchiveFormat format_from_signature(std::span<const uint8_t> head) noexcept {
    if (starts_with(head, {'P', 'K', 0x03, 0x04}) || starts_with(head, {'P', 'K', 0x05, 0x06})) {
        return ArchiveFormat::Zip;
    }
    if (starts_with(head, {0x1f, 0x8b})) {
        return ArchiveFormat::TarGz;
    }
    if (starts_with(head, {'B', 'Z', 'h'})) {
        return ArchiveFormat::TarBz2;
    }
    if (starts_with(head, {0xfd, '7', 'z', 'X', 'Z', 0x00})) {
        return ArchiveFormat::TarXz;
    }
    if (starts_with(head, {'7', 'z', 0xbc, 0xaf, 0x27, 0x1c})) {
        return ArchiveFormat::SevenZip;
    }
    if (starts_with(head, {'R', 'a', 'r', '!', 0x1a, 0x07})) {
        return ArchiveFormat::Rar;
    }
    if (head.size() >= kTarMagicOffset + 5 &&
        std::memcmp(head.data() + kTarMagicOffset, "ustar", 5) == 0) {
        return ArchiveFormat::Tar;
    }
    return ArchiveFormat::Unknown;
}

ArchiveFormat detect_format(const std::filesystem::path& path) {
    auto format = format_from_extension(path);
    if (format != ArchiveFormat::Unknown) {
        return format;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return ArchiveFormat::Unknown;
    }
    std::array<uint8_t, kHeadSize> head{};
    file.read(reinterpret_cast<char*>(head.data()), static_cast<std::streamsize>(head.size()));
    auto bytes_read = static_cast<size_t>(file.gcount());
    return format_from_signature(std::span(head.data(), bytes_read));
}

bool is_safe_entry_path(std::string_view entry_path) noexcept {
    if (entry_path.empty() || entry_path.front() == '/' || entry_path.front() == '\\') {
        return false;
    }
    // Drive letters from archives written on Windows
    if (entry_path.size() >= 2 && entry_path[1] == ':') {
        return false;
    }

    size_t start = 0;
    while (start <= entry_path.size()) {
        auto end = entry_path.find_first_of("/\\", start);
        if (end == std::string_view::npos) {
            end = entry_path.size();
        }
        if (entry_path.substr(start, end - start) == "..") {
            return false;
        }
        start = end + 1;
    }
    return true;
}

std::string ArchiveEntry::parent_path() const {
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos) {
        return "";
    }
    return path.substr(0, pos);
}

const ArchiveEntry* ArchiveInfo::find_entry(std::string_view entry_path) const {
    auto it = std::find_if(entries.begin(), entries.end(),
                           [entry_path](const ArchiveEntry& e) { return e.path == entry_path; });
    return it != entries.end() ? &*it : nullptr;
}

}  // namespace laxy::archive
