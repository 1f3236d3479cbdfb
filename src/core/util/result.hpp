/// @file result.hpp
/// @brief Error handling utilities using std::expected
///
/// Provides Result<T, E> type alias and helper functions for
/// consistent error handling throughout the engine.

#pragma once

#include <expected>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace laxy {

/// @brief Result type alias for functions that can fail
/// @tparam T Success value type
/// @tparam E Error type
template <typename T, typename E>
using Result = std::expected<T, E>;

/// @brief Result type for void-returning functions that can fail
/// @tparam E Error type
template <typename E>
using VoidResult = std::expected<void, E>;

/// @brief Create an error result
/// @param error The error value
/// @return std::unexpected containing the error
template <typename E>
[[nodiscard]] constexpr auto makeError(E error) {
    return std::unexpected(std::move(error));
}

/// @brief Error information with source location
/// @tparam ErrorCode The error code enum type
template <typename ErrorCode>
class ErrorInfo {
public:
    ErrorInfo(ErrorCode code, std::string message = "",
              std::source_location location = std::source_location::current())
        : code_(code), message_(std::move(message)), location_(location) {}

    [[nodiscard]] constexpr ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::source_location& location() const noexcept { return location_; }

    /// @brief Format error information as string
    [[nodiscard]] std::string format() const {
        if (message_.empty()) {
            return fmt::format("{} at {}:{}", to_string(code_), location_.file_name(),
                               location_.line());
        }
        return fmt::format("{}: {} at {}:{}", to_string(code_), message_, location_.file_name(),
                           location_.line());
    }

    /// @brief Code and message only, for user-facing output
    [[nodiscard]] std::string describe() const {
        if (message_.empty()) {
            return std::string(to_string(code_));
        }
        return fmt::format("{}: {}", to_string(code_), message_);
    }

private:
    ErrorCode code_;
    std::string message_;
    std::source_location location_;
};

/// @brief Log and return an error (for chaining)
///
/// Usage:
///   return logAndReturn(SomeError::Failed, "context info");
template <typename E>
[[nodiscard]] auto logAndReturn(E error, std::string_view context = "",
                                std::source_location loc = std::source_location::current()) {
    spdlog::default_logger_raw()->log(
        spdlog::source_loc{loc.file_name(), static_cast<int>(loc.line()), loc.function_name()},
        spdlog::level::err, "{}: {}", context, to_string(error));
    return std::unexpected(error);
}

/// @brief Build an ErrorInfo, log it and return it as unexpected
template <typename E>
[[nodiscard]] auto logAndReturnInfo(E code, std::string message,
                                    std::source_location loc = std::source_location::current()) {
    ErrorInfo<E> info(code, std::move(message), loc);
    spdlog::default_logger_raw()->log(
        spdlog::source_loc{loc.file_name(), static_cast<int>(loc.line()), loc.function_name()},
        spdlog::level::err, "{}", info.describe());
    return std::unexpected(std::move(info));
}

}  // namespace laxy

/// @brief TRY macro for error propagation
///
/// Evaluates the expression and returns early if it's an error.
/// Otherwise, extracts the value.
///
/// Usage:
///   auto value = LAXY_TRY(some_operation());
///
/// Note: This macro uses a GCC/Clang extension (statement expressions).
#define LAXY_TRY(expr)                                                                             \
    ({                                                                                             \
        auto&& _result = (expr);                                                                   \
        if (!_result) {                                                                            \
            return std::unexpected(_result.error());                                               \
        }                                                                                          \
        std::move(*_result);                                                                       \
    })

/// @brief Propagate error without extracting value
///
/// Usage:
///   LAXY_TRY_VOID(some_void_operation());
#define LAXY_TRY_VOID(expr)                                                                        \
    do {                                                                                           \
        auto&& _result = (expr);                                                                   \
        if (!_result) {                                                                            \
            return std::unexpected(_result.error());                                               \
        }                                                                                          \
    } while (0)
