/**
 * @file types.h
 * @brief Core type definitions for blob_upload_system
 */

#ifndef KCENON_BLOB_CORE_TYPES_H
#define KCENON_BLOB_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::blob {

/**
 * @brief Error codes for blob operations
 *
 * Codes in the service range (-300 to -349) are produced by classifying
 * responses from the blob service. All other ranges are raised locally.
 */
enum class error_code {
    success = 0,

    // Argument and configuration errors (-100 to -119)
    no_token_provided = -100,
    invalid_argument = -101,
    invalid_configuration = -102,

    // Response decoding errors (-120 to -139)
    invalid_response_json = -120,
    unexpected_content_type = -121,

    // Local file errors (-140 to -159)
    file_not_found = -140,
    file_read_error = -141,
    file_write_error = -142,
    file_already_exists = -143,

    // Transport errors (-160 to -179)
    network_error = -160,
    transfer_timeout = -161,

    // Internal errors (-200 to -219)
    internal_error = -200,
    not_initialized = -201,

    // Service errors (-300 to -349)
    access_denied = -300,
    not_found = -301,
    store_not_found = -302,
    store_suspended = -303,
    content_type_not_allowed = -304,
    pathname_mismatch = -305,
    token_expired = -306,
    file_too_large = -307,
    rate_limited = -308,
    service_unavailable = -309,
    internal_server_error = -310,
    bad_request = -311,
    unknown_error = -312,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::no_token_provided:
            return "no token provided";
        case error_code::invalid_argument:
            return "invalid argument";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::invalid_response_json:
            return "invalid response json";
        case error_code::unexpected_content_type:
            return "unexpected content type";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::file_already_exists:
            return "file already exists";
        case error_code::network_error:
            return "network error";
        case error_code::transfer_timeout:
            return "transfer timeout";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        case error_code::access_denied:
            return "access denied";
        case error_code::not_found:
            return "blob not found";
        case error_code::store_not_found:
            return "store not found";
        case error_code::store_suspended:
            return "store suspended";
        case error_code::content_type_not_allowed:
            return "content type not allowed";
        case error_code::pathname_mismatch:
            return "client token pathname mismatch";
        case error_code::token_expired:
            return "client token expired";
        case error_code::file_too_large:
            return "file too large";
        case error_code::rate_limited:
            return "rate limited";
        case error_code::service_unavailable:
            return "service unavailable";
        case error_code::internal_server_error:
            return "internal server error";
        case error_code::bad_request:
            return "bad request";
        case error_code::unknown_error:
            return "unknown error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Check if error code was produced by the blob service
 */
[[nodiscard]] constexpr auto is_service_error(error_code code) -> bool {
    auto value = static_cast<int>(code);
    return value <= -300 && value >= -349;
}

/**
 * @brief Check if an attempt that failed with this code may be retried
 *
 * Transport failures are retried alongside the three transient service codes.
 */
[[nodiscard]] constexpr auto is_retryable(error_code code) -> bool {
    switch (code) {
        case error_code::unknown_error:
        case error_code::service_unavailable:
        case error_code::internal_server_error:
        case error_code::network_error:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;
    std::optional<uint32_t> retry_after_seconds;  ///< Only set for rate_limited

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}
    error(error_code c, std::string msg, std::optional<uint32_t> retry_after)
        : code(c), message(std::move(msg)), retry_after_seconds(retry_after) {}

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

}  // namespace kcenon::blob

#endif  // KCENON_BLOB_CORE_TYPES_H
