/// @file verifier.cpp
/// @brief Verifier implementation

#include "verifier.hpp"

#include "../util/hash.hpp"
#include "../util/logger.hpp"
#include "../util/string_utils.hpp"
#include "file_entry.hpp"

namespace laxy::fs {

namespace {

[[nodiscard]] std::expected<bool, ErrorKind> same_content(const std::filesystem::path& a,
                                                          const std::filesystem::path& b) {
    auto hash_a = sha256File(a);
    if (!hash_a) {
        LOG_WARN("Cannot hash {}: {}", pathToUtf8(a), to_string(hash_a.error()));
        return std::unexpected(ErrorKind::IoFailure);
    }
    auto hash_b = sha256File(b);
    if (!hash_b) {
        LOG_WARN("Cannot hash {}: {}", pathToUtf8(b), to_string(hash_b.error()));
        return std::unexpected(ErrorKind::IoFailure);
    }
    return *hash_a == *hash_b;
}

}  // namespace

bool Verifier::verify(const std::filesystem::path& source,
                      const std::filesystem::path& destination) const {
    return check(source, destination).has_value();
}

std::expected<void, ErrorKind> Verifier::check(const std::filesystem::path& source,
                                               const std::filesystem::path& destination) const {
    std::error_code ec;
    auto source_size = std::filesystem::file_size(source, ec);
    if (ec) {
        return std::unexpected(errorKindFromCode(ec));
    }
    auto destination_size = std::filesystem::file_size(destination, ec);
    if (ec) {
        return std::unexpected(errorKindFromCode(ec));
    }

    if (source_size != destination_size) {
        LOG_WARN("Size mismatch: {} ({} bytes) vs {} ({} bytes)", pathToUtf8(source), source_size,
                 pathToUtf8(destination), destination_size);
        return std::unexpected(ErrorKind::VerificationFailed);
    }

    if (!policy_.hashes(source_size)) {
        return {};
    }

    auto same = same_content(source, destination);
    if (!same) {
        return std::unexpected(same.error());
    }
    if (!*same) {
        LOG_WARN("Checksum mismatch: {} vs {}", pathToUtf8(source), pathToUtf8(destination));
        return std::unexpected(ErrorKind::VerificationFailed);
    }
    return {};
}

bool Verifier::identical(const std::filesystem::path& source,
                         const std::filesystem::path& destination) const {
    auto source_entry = readFileEntry(source);
    auto destination_entry = readFileEntry(destination);
    if (!source_entry || !destination_entry) {
        return false;
    }
    if (source_entry->is_directory || destination_entry->is_directory) {
        return false;
    }
    if (source_entry->size != destination_entry->size) {
        return false;
    }

    if (!policy_.hashes(source_entry->size)) {
        return source_entry->modified_time == destination_entry->modified_time;
    }

    auto same = same_content(source, destination);
    return same && *same;
}

}  // namespace laxy::fs
