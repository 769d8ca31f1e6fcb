/**
 * @file blob_config.h
 * @brief Blob client configuration types
 *
 * Configuration can be assembled in code with blob_config_builder or read
 * from the process environment with blob_config::from_environment().
 */

#ifndef KCENON_BLOB_CORE_BLOB_CONFIG_H
#define KCENON_BLOB_CORE_BLOB_CONFIG_H

#include <kcenon/blob/core/types.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace kcenon::blob {

/// Smallest part size the service accepts for any part but the last
inline constexpr std::size_t min_part_size = 5 * 1024 * 1024;

/// Part size used when none is configured
inline constexpr std::size_t default_part_size = 8 * 1024 * 1024;

/// Default upper bound on part uploads in flight
inline constexpr std::size_t default_max_concurrent_parts = 6;

/// Default API endpoint
inline constexpr const char* default_api_url = "https://vercel.com/api/blob";

/// Default API version header value
inline constexpr const char* default_api_version = "11";

/**
 * @brief Retry policy for blob requests
 *
 * Delay before retry n (0-based) is min(2^n * base_delay, max_delay).
 */
struct retry_policy {
    /// Retries after the first attempt
    std::size_t max_retries = 10;

    /// Delay before the first retry
    std::chrono::milliseconds base_delay{100};

    /// Cap on any single delay
    std::chrono::milliseconds max_delay{2000};

    [[nodiscard]] auto delay_for(std::size_t attempt) const -> std::chrono::milliseconds {
        constexpr std::size_t max_shift = 30;
        auto factor = int64_t{1} << std::min(attempt, max_shift);
        auto delay = base_delay.count() * factor;
        if (delay < 0 || delay > max_delay.count()) {
            return max_delay;
        }
        return std::chrono::milliseconds(delay);
    }
};

/**
 * @brief Multipart upload configuration
 */
struct multipart_config {
    /// Bodies larger than this go through multipart upload
    uint64_t threshold = 5 * 1024 * 1024;

    /// Size of every part but the last
    std::size_t part_size = default_part_size;

    /// Maximum concurrent part uploads
    std::size_t max_concurrent_parts = default_max_concurrent_parts;

    /// Wall-clock limit on the whole part phase, 0 = none
    std::chrono::milliseconds deadline{0};

    [[nodiscard]] auto validate() const -> result<void> {
        if (part_size < min_part_size) {
            return unexpected(error{error_code::invalid_configuration,
                                    "part size must be at least 5 MiB"});
        }
        if (max_concurrent_parts == 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "max_concurrent_parts must be at least 1"});
        }
        if (deadline.count() < 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "deadline must not be negative"});
        }
        return {};
    }
};

/**
 * @brief Blob client configuration
 */
struct blob_config {
    /// API base URL
    std::string api_url = default_api_url;

    /// Value of the x-api-version header
    std::string api_version = default_api_version;

    /// Retry policy for every request
    retry_policy retry;

    /// Always send x-content-length, not only when progress is tracked
    bool send_content_length = false;

    /// Value of x-proxy-through-alternative-api, when set
    std::optional<std::string> proxy_through_alternative_api;

    /// Per-request timeout
    std::chrono::milliseconds request_timeout{30000};

    /// Longest a download may go without receiving data
    std::chrono::milliseconds download_timeout{120000};

    /// Multipart settings
    multipart_config multipart;

    /**
     * @brief Build configuration from environment variables
     *
     * Reads VERCEL_BLOB_API_URL, VERCEL_BLOB_API_VERSION_OVERRIDE,
     * VERCEL_BLOB_RETRIES, VERCEL_BLOB_USE_X_CONTENT_LENGTH and
     * VERCEL_BLOB_PROXY_THROUGH_ALTERNATIVE_API (and their NEXT_PUBLIC_
     * variants). Unset or malformed values keep their defaults.
     */
    [[nodiscard]] static auto from_environment() -> blob_config;

    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief Fluent builder for blob_config
 */
class blob_config_builder {
public:
    blob_config_builder() = default;

    /**
     * @brief Start from environment-derived settings
     */
    static auto from_environment() -> blob_config_builder {
        blob_config_builder builder;
        builder.config_ = blob_config::from_environment();
        return builder;
    }

    auto with_api_url(const std::string& url) -> blob_config_builder& {
        config_.api_url = url;
        return *this;
    }

    auto with_api_version(const std::string& version) -> blob_config_builder& {
        config_.api_version = version;
        return *this;
    }

    auto with_max_retries(std::size_t retries) -> blob_config_builder& {
        config_.retry.max_retries = retries;
        return *this;
    }

    auto with_retry_policy(const retry_policy& policy) -> blob_config_builder& {
        config_.retry = policy;
        return *this;
    }

    auto with_content_length_header(bool enable) -> blob_config_builder& {
        config_.send_content_length = enable;
        return *this;
    }

    auto with_alternative_api(const std::string& value) -> blob_config_builder& {
        config_.proxy_through_alternative_api = value;
        return *this;
    }

    auto with_request_timeout(std::chrono::milliseconds timeout) -> blob_config_builder& {
        config_.request_timeout = timeout;
        return *this;
    }

    auto with_download_timeout(std::chrono::milliseconds timeout) -> blob_config_builder& {
        config_.download_timeout = timeout;
        return *this;
    }

    auto with_multipart(const multipart_config& config) -> blob_config_builder& {
        config_.multipart = config;
        return *this;
    }

    auto with_part_size(std::size_t size) -> blob_config_builder& {
        config_.multipart.part_size = size;
        return *this;
    }

    auto with_multipart_threshold(uint64_t threshold) -> blob_config_builder& {
        config_.multipart.threshold = threshold;
        return *this;
    }

    auto with_max_concurrent_parts(std::size_t count) -> blob_config_builder& {
        config_.multipart.max_concurrent_parts = count;
        return *this;
    }

    auto with_upload_deadline(std::chrono::milliseconds deadline) -> blob_config_builder& {
        config_.multipart.deadline = deadline;
        return *this;
    }

    /**
     * @brief Validate and return the configuration
     */
    [[nodiscard]] auto build() const -> result<blob_config> {
        if (auto valid = config_.validate(); !valid) {
            return unexpected(valid.error());
        }
        return config_;
    }

private:
    blob_config config_;
};

}  // namespace kcenon::blob

#endif  // KCENON_BLOB_CORE_BLOB_CONFIG_H
