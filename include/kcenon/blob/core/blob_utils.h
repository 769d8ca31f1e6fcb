/**
 * @file blob_utils.h
 * @brief Common helpers for building and decoding blob API calls
 */

#ifndef KCENON_BLOB_CORE_BLOB_UTILS_H
#define KCENON_BLOB_CORE_BLOB_UTILS_H

#include <kcenon/blob/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kcenon::blob::blob_utils {

/// Longest pathname accepted by the service
inline constexpr std::size_t max_pathname_length = 950;

// ============================================================================
// Encoding Utilities
// ============================================================================

/**
 * @brief Percent-encode a string
 * @param value Value to encode
 * @param encode_slash Encode '/' as %2F
 * @return Encoded string (unreserved characters are kept)
 */
auto url_encode(std::string_view value, bool encode_slash = true) -> std::string;

/**
 * @brief Build "k1=v1&k2=v2" with both sides percent-encoded
 */
auto build_query_string(const std::vector<std::pair<std::string, std::string>>& params)
    -> std::string;

/**
 * @brief Set a query parameter on an absolute URL, replacing any previous value
 */
auto set_query_param(const std::string& url, const std::string& key, const std::string& value)
    -> std::string;

auto to_lower(std::string_view value) -> std::string;

// ============================================================================
// Identifier Utilities
// ============================================================================

auto generate_random_hex(std::size_t byte_count) -> std::string;

auto get_unix_timestamp_ms() -> int64_t;

/**
 * @brief Store id embedded in a read-write token
 *
 * Tokens look like vercel_blob_rw_<store_id>_<secret>; the store id is the
 * fourth underscore-separated segment. Returns "" when absent.
 */
auto extract_store_id(std::string_view token) -> std::string;

/**
 * @brief Request id of the form <store_id>:<unix_ms>:<8 hex chars>
 */
auto make_request_id(std::string_view store_id) -> std::string;

// ============================================================================
// Time Utilities
// ============================================================================

/**
 * @brief Parse an ISO 8601 or RFC 1123 timestamp
 *
 * Accepts "2024-05-01T10:20:30.123Z" (fraction and a +hh:mm offset are
 * optional) and "Wed, 01 May 2024 10:20:30 GMT". Fractions of a second are
 * dropped.
 */
auto parse_timestamp(std::string_view value)
    -> std::optional<std::chrono::system_clock::time_point>;

// ============================================================================
// Validation Utilities
// ============================================================================

/**
 * @brief Validate a destination pathname
 *
 * Must be non-empty, at most 950 characters, and free of "//".
 */
auto validate_pathname(std::string_view pathname) -> result<void>;

/**
 * @brief True for application/json and any +json media type
 */
auto is_json_content_type(std::string_view content_type) -> bool;

/**
 * @brief True when value starts with http:// or https://
 */
auto is_url(std::string_view value) -> bool;

}  // namespace kcenon::blob::blob_utils

#endif  // KCENON_BLOB_CORE_BLOB_UTILS_H
