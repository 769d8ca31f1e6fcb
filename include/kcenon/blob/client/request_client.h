/**
 * @file request_client.h
 * @brief Blob API calls with retries, headers and response decoding
 */

#ifndef KCENON_BLOB_CLIENT_REQUEST_CLIENT_H
#define KCENON_BLOB_CLIENT_REQUEST_CLIENT_H

#include <kcenon/blob/auth/token_provider.h>
#include <kcenon/blob/core/blob_config.h>
#include <kcenon/blob/core/chunk_source.h>
#include <kcenon/blob/core/execution_context.h>
#include <kcenon/blob/core/progress.h>
#include <kcenon/blob/core/types.h>
#include <kcenon/blob/transport/transport_interface.h>

#include <json/json.h>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kcenon::blob {

/**
 * @brief How a successful response body is returned
 */
enum class decode_mode {
    json,  ///< Must be a JSON media type and parse as JSON
    any,   ///< JSON when it parses, otherwise the body as a JSON string
    none,  ///< Body ignored; null is returned
};

/**
 * @brief One logical API call; retries reuse it unchanged
 */
struct api_request {
    http_method method = http_method::post;

    /// Appended to blob_config::api_url, e.g. "/" or "/mpu"
    std::string path = "/";

    /// Call-specific headers; override the common ones on conflict
    std::map<std::string, std::string> headers;

    std::vector<std::pair<std::string, std::string>> query;

    byte_buffer body;

    /// Receives 0%, transfer and 100% events for this call
    upload_progress_callback on_upload_progress;

    /// Overrides blob_config::request_timeout
    std::optional<std::chrono::milliseconds> timeout;

    decode_mode decode = decode_mode::json;

    /// Overrides the token provider for this call
    std::optional<std::string> token;
};

using api_completion = std::function<void(result<Json::Value>)>;

/**
 * @brief Resilient request client
 *
 * Every call gets one request id (`<store_id>:<unix_ms>:<8 hex>`) reused by
 * all of its attempts. Retried: unknown_error, service_unavailable,
 * internal_server_error and the transport failures network_error and
 * transfer_timeout, after min(2^attempt * base_delay, max_delay). Other
 * service errors and other transport errors (invalid_argument for a bad
 * URL, for one) fail at once with their own kind.
 * When retries run out the caller receives unknown_error, except for
 * service_unavailable which keeps its kind.
 */
class request_client {
public:
    request_client(blob_config config,
                   std::shared_ptr<http_transport> transport,
                   std::shared_ptr<token_provider> tokens);
    ~request_client();

    request_client(const request_client&) = delete;
    request_client& operator=(const request_client&) = delete;

    /**
     * @brief Start a call; on_complete runs exactly once
     *
     * Backoff waits go through ctx.defer(). With a blocking transport the
     * whole call, retries included, runs before issue() returns.
     */
    void issue(api_request request, execution_context& ctx, api_completion on_complete) const;

    /**
     * @brief Issue and wait for the outcome on the calling thread
     */
    [[nodiscard]] auto call(api_request request, execution_context& ctx) const
        -> result<Json::Value>;

    /**
     * @brief Resolve the token for a call without touching the network
     */
    [[nodiscard]] auto resolve_token(const std::optional<std::string>& override_token) const
        -> result<std::string>;

    [[nodiscard]] auto config() const -> const blob_config&;
    [[nodiscard]] auto transport() const -> std::shared_ptr<http_transport>;

private:
    struct shared_state;
    struct call_state;

    static void run_attempt(const std::shared_ptr<call_state>& call);
    static void on_response(const std::shared_ptr<call_state>& call,
                            result<http_response> response);
    static void retry_later(const std::shared_ptr<call_state>& call, const std::string& reason);
    static void abandon(const std::shared_ptr<call_state>& call);

    std::shared_ptr<const shared_state> shared_;
};

}  // namespace kcenon::blob

#endif  // KCENON_BLOB_CLIENT_REQUEST_CLIENT_H
