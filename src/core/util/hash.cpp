/// @file hash.cpp
/// @brief SHA256 hash implementation using OpenSSL EVP

#include "hash.hpp"

#include <fstream>
#include <vector>

#include <fmt/format.h>
#include <openssl/evp.h>

namespace laxy {

namespace {

/// @brief RAII wrapper for an EVP digest context
class DigestContext {
public:
    DigestContext() : ctx_(EVP_MD_CTX_new()) {}
    ~DigestContext() {
        if (ctx_) {
            EVP_MD_CTX_free(ctx_);
        }
    }

    // Non-copyable, non-movable
    DigestContext(const DigestContext&) = delete;
    DigestContext& operator=(const DigestContext&) = delete;
    DigestContext(DigestContext&&) = delete;
    DigestContext& operator=(DigestContext&&) = delete;

    [[nodiscard]] bool init() {
        return ctx_ && EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) == 1;
    }

    [[nodiscard]] bool update(const void* data, size_t size) {
        return EVP_DigestUpdate(ctx_, data, size) == 1;
    }

    [[nodiscard]] bool finish(Sha256Hash& output) {
        unsigned int length = 0;
        if (EVP_DigestFinal_ex(ctx_, output.data(), &length) != 1) {
            return false;
        }
        return length == output.size();
    }

private:
    EVP_MD_CTX* ctx_ = nullptr;
};

}  // namespace

std::expected<Sha256Hash, HashError> sha256(std::span<const uint8_t> data) {
    DigestContext context;
    if (!context.init()) {
        return std::unexpected(HashError::InitializationFailed);
    }

    if (!context.update(data.data(), data.size())) {
        return std::unexpected(HashError::ComputationFailed);
    }

    Sha256Hash result{};
    if (!context.finish(result)) {
        return std::unexpected(HashError::ComputationFailed);
    }

    return result;
}

std::expected<Sha256Hash, HashError> sha256(std::string_view str) {
    return sha256(
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(str.data()), str.size()));
}

std::expected<Sha256Hash, HashError> sha256File(const std::filesystem::path& path,
                                                size_t chunk_size) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(HashError::FileReadFailed);
    }

    DigestContext context;
    if (!context.init()) {
        return std::unexpected(HashError::InitializationFailed);
    }

    std::vector<char> buffer(chunk_size == 0 ? 64 * 1024 : chunk_size);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto count = file.gcount();
        if (count > 0 && !context.update(buffer.data(), static_cast<size_t>(count))) {
            return std::unexpected(HashError::ComputationFailed);
        }
    }

    if (file.bad()) {
        return std::unexpected(HashError::FileReadFailed);
    }

    Sha256Hash result{};
    if (!context.finish(result)) {
        return std::unexpected(HashError::ComputationFailed);
    }

    return result;
}

std::string hashToHex(const Sha256Hash& hash) {
    std::string result;
    result.reserve(hash.size() * 2);

    for (uint8_t byte : hash) {
        result += fmt::format("{:02x}", byte);
    }

    return result;
}

std::expected<std::string, HashError> sha256Hex(std::string_view str) {
    auto hash_result = sha256(str);
    if (!hash_result) {
        return std::unexpected(hash_result.error());
    }
    return hashToHex(*hash_result);
}

}  // namespace laxy
