/**
 * @file response_classifier.h
 * @brief Decoding and error classification of blob service responses
 */

#ifndef KCENON_BLOB_CLIENT_RESPONSE_CLASSIFIER_H
#define KCENON_BLOB_CLIENT_RESPONSE_CLASSIFIER_H

#include <kcenon/blob/core/types.h>
#include <kcenon/blob/transport/transport_interface.h>

#include <json/json.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::blob {

/**
 * @brief Map a machine-readable service error code to an error_code
 *
 * Unrecognized codes map to error_code::unknown_error.
 */
[[nodiscard]] auto map_service_code(std::string_view code) -> error_code;

/**
 * @brief Map an HTTP status to an error_code when the body carries no code
 */
[[nodiscard]] auto map_http_status(int status_code) -> error_code;

/**
 * @brief Parse a retry-after header holding whole seconds
 * @return std::nullopt when missing or not a non-negative integer
 */
[[nodiscard]] auto parse_retry_after(const std::optional<std::string>& value)
    -> std::optional<uint32_t>;

/**
 * @brief Classify a non-2xx response
 *
 * Uses error.code from a {"error": {"code", "message"}} body when present,
 * falling back to the HTTP status. Never inspects free-text messages.
 */
[[nodiscard]] auto classify_response(const http_response& response) -> error;

/**
 * @brief Parse JSON text
 * @return invalid_response_json when the text is not valid JSON
 */
[[nodiscard]] auto parse_json(std::string_view text) -> result<Json::Value>;

/**
 * @brief Serialize JSON compactly
 */
[[nodiscard]] auto write_json(const Json::Value& value) -> std::string;

/**
 * @brief Decode a successful response that must be JSON
 *
 * @return unexpected_content_type when content-type is not a JSON media
 *         type; invalid_response_json when the body does not parse
 */
[[nodiscard]] auto decode_json_response(const http_response& response) -> result<Json::Value>;

/**
 * @brief Decode a successful response as JSON if possible, else as a string
 */
[[nodiscard]] auto decode_any_response(const http_response& response) -> Json::Value;

}  // namespace kcenon::blob

#endif  // KCENON_BLOB_CLIENT_RESPONSE_CLASSIFIER_H
