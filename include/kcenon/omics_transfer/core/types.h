/**
 * @file types.h
 * @brief Core type definitions for omics_transfer
 */

#ifndef KCENON_OMICS_TRANSFER_CORE_TYPES_H
#define KCENON_OMICS_TRANSFER_CORE_TYPES_H

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::omics_transfer {

/**
 * @brief Error codes for omics transfer operations
 *
 * Error code ranges:
 * - -100 to -119: Transient network errors (retried by part tasks)
 * - -120 to -139: Remote API errors (never retried locally)
 * - -140 to -159: Configuration errors (raised before any task is queued)
 * - -160 to -179: Transfer outcome errors
 * - -180 to -199: Local file I/O errors
 * - -200 to -219: Internal and executor errors
 */
enum class error_code {
    success = 0,

    // Transient network errors (-100 to -119)
    connection_timeout = -100,
    connection_reset = -101,
    truncated_read = -102,
    read_timeout = -103,

    // Remote API errors (-120 to -139)
    remote_not_found = -120,
    remote_access_denied = -121,
    remote_throttled = -122,
    remote_validation_error = -123,
    remote_service_error = -124,
    remote_conflict = -125,

    // Configuration errors (-140 to -159)
    invalid_configuration = -140,
    unsupported_output = -141,
    file_not_found = -142,
    invalid_file_metadata = -143,
    invalid_argument = -144,
    missing_reference_arn = -145,

    // Transfer outcome errors (-160 to -179)
    retries_exceeded = -160,
    cancelled = -161,
    interrupted = -162,
    fatal_error = -163,
    content_length_mismatch = -164,

    // File I/O errors (-180 to -199)
    file_open_error = -180,
    file_read_error = -181,
    file_write_error = -182,
    file_rename_error = -183,

    // Internal errors (-200 to -219)
    internal_error = -200,
    executor_shutdown = -201,
    executor_full = -202,
    not_initialized = -203,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::connection_reset:
            return "connection reset";
        case error_code::truncated_read:
            return "truncated read";
        case error_code::read_timeout:
            return "read timeout";
        case error_code::remote_not_found:
            return "remote resource not found";
        case error_code::remote_access_denied:
            return "remote access denied";
        case error_code::remote_throttled:
            return "remote request throttled";
        case error_code::remote_validation_error:
            return "remote validation error";
        case error_code::remote_service_error:
            return "remote service error";
        case error_code::remote_conflict:
            return "remote conflict";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::unsupported_output:
            return "unsupported output";
        case error_code::file_not_found:
            return "file not found";
        case error_code::invalid_file_metadata:
            return "invalid file metadata";
        case error_code::invalid_argument:
            return "invalid argument";
        case error_code::missing_reference_arn:
            return "missing reference ARN";
        case error_code::retries_exceeded:
            return "retries exceeded";
        case error_code::cancelled:
            return "cancelled";
        case error_code::interrupted:
            return "interrupted";
        case error_code::fatal_error:
            return "fatal error";
        case error_code::content_length_mismatch:
            return "content length mismatch";
        case error_code::file_open_error:
            return "file open error";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::file_rename_error:
            return "file rename error";
        case error_code::internal_error:
            return "internal error";
        case error_code::executor_shutdown:
            return "executor shut down";
        case error_code::executor_full:
            return "executor backlog full";
        case error_code::not_initialized:
            return "not initialized";
        default:
            return "unknown error";
    }
}

/**
 * @brief Check if error code is a transient network error
 *
 * Only these errors are retried by part tasks.
 */
[[nodiscard]] constexpr auto is_transient_network_error(error_code code) noexcept -> bool {
    auto value = static_cast<int>(code);
    return value <= -100 && value >= -119;
}

/**
 * @brief Check if error code is a remote API error
 */
[[nodiscard]] constexpr auto is_remote_api_error(error_code code) noexcept -> bool {
    auto value = static_cast<int>(code);
    return value <= -120 && value >= -139;
}

/**
 * @brief Check if error code is a configuration error
 */
[[nodiscard]] constexpr auto is_configuration_error(error_code code) noexcept -> bool {
    auto value = static_cast<int>(code);
    return value <= -140 && value >= -159;
}

/**
 * @brief Check if error code is an I/O error
 */
[[nodiscard]] constexpr auto is_io_error(error_code code) noexcept -> bool {
    auto value = static_cast<int>(code);
    return value <= -180 && value >= -199;
}

/**
 * @brief Check if error code represents a cancellation
 *
 * User-initiated (cancelled) and interrupt-triggered (interrupted)
 * cancellations are distinct codes; both count as cancellation.
 */
[[nodiscard]] constexpr auto is_cancellation(error_code code) noexcept -> bool {
    return code == error_code::cancelled || code == error_code::interrupted;
}

/**
 * @brief Check if the error is retried locally
 */
[[nodiscard]] constexpr auto is_retryable(error_code code) noexcept -> bool {
    return is_transient_network_error(code);
}

/**
 * @brief Error type with code, message and optional cause
 */
struct error {
    error_code code;
    std::string message;
    std::shared_ptr<const error> cause;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}
    error(error_code c, std::string msg, error underlying)
        : code(c),
          message(std::move(msg)),
          cause(std::make_shared<const error>(std::move(underlying))) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Size and layout of one remote file
 */
struct file_part_info {
    uint64_t content_length = 0;
    uint64_t part_size = 0;
    uint64_t total_parts = 0;

    [[nodiscard]] auto operator==(const file_part_info& other) const -> bool = default;
};

/**
 * @brief One part of a file download
 */
struct part_descriptor {
    uint64_t part_number = 1;
    uint64_t offset = 0;
    uint64_t size = 0;
    std::size_t max_attempts = 1;
};

}  // namespace kcenon::omics_transfer

#endif  // KCENON_OMICS_TRANSFER_CORE_TYPES_H
