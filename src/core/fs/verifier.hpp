/// @file verifier.hpp
/// @brief Post-copy content verification

#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>

#include "../config/settings.hpp"
#include "../operation/operation.hpp"

namespace laxy::fs {

/// @brief When to hash file content
struct VerificationPolicy {
    config::VerificationMode mode = config::VerificationMode::FullHashBelowThreshold;
    uint64_t full_hash_threshold = 10ull * 1024 * 1024;

    [[nodiscard]] static VerificationPolicy fromSettings(const config::VerificationSettings& s) {
        return VerificationPolicy{s.mode, s.full_hash_threshold};
    }

    /// @brief True if files of @p size are compared by SHA-256
    [[nodiscard]] constexpr bool hashes(uint64_t size) const noexcept {
        switch (mode) {
        case config::VerificationMode::FullHashBelowThreshold:
            return size < full_hash_threshold;
        case config::VerificationMode::AlwaysFullHash:
            return true;
        case config::VerificationMode::SizeOnly:
            return false;
        }
        return true;
    }
};

/// @brief Confirms that a destination file matches its source
class Verifier {
public:
    explicit Verifier(VerificationPolicy policy = {}) : policy_(policy) {}

    /// @brief Sizes equal and, where the policy hashes, SHA-256 equal
    [[nodiscard]] bool verify(const std::filesystem::path& source,
                              const std::filesystem::path& destination) const;

    /// @brief Same as verify() with the reason for a failure
    /// @return VerificationFailed on mismatch, NotFound / IoFailure if a side is unreadable
    [[nodiscard]] std::expected<void, ErrorKind> check(const std::filesystem::path& source,
                                                      const std::filesystem::path& destination) const;

    /// @brief Whether copying @p source over @p destination would change nothing
    ///
    /// Stricter than verify() when the policy does not hash: the
    /// modification times must also match.
    [[nodiscard]] bool identical(const std::filesystem::path& source,
                                 const std::filesystem::path& destination) const;

    [[nodiscard]] const VerificationPolicy& policy() const noexcept { return policy_; }

private:
    VerificationPolicy policy_;
};

}  // namespace laxy::fs
