/**
 * @file transport_interface.h
 * @brief HTTP transport abstraction
 *
 * A transport issues exactly one HTTP exchange and reports its outcome
 * through a completion handler. Blocking transports invoke the handler
 * before send() returns; asynchronous transports invoke it later from their
 * event loop. Retries, headers and error classification live above this
 * layer.
 */

#ifndef KCENON_BLOB_TRANSPORT_TRANSPORT_INTERFACE_H
#define KCENON_BLOB_TRANSPORT_TRANSPORT_INTERFACE_H

#include <kcenon/blob/core/chunk_source.h>
#include <kcenon/blob/core/types.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace kcenon::blob {

/**
 * @brief HTTP methods used against the blob service
 */
enum class http_method {
    get,
    put,
    post,
    del,
    head,
};

[[nodiscard]] constexpr auto to_string(http_method method) -> const char* {
    switch (method) {
        case http_method::get: return "GET";
        case http_method::put: return "PUT";
        case http_method::post: return "POST";
        case http_method::del: return "DELETE";
        case http_method::head: return "HEAD";
        default: return "GET";
    }
}

/**
 * @brief Receives response body bytes as they arrive
 *
 * When set on a request, the body is streamed here and http_response::body
 * stays empty. Returning an error aborts the exchange with that error.
 */
using response_body_sink = std::function<result<void>(std::span<const std::byte>)>;

/**
 * @brief Sees the status line and headers before any body byte
 *
 * Header names are lower-case.
 */
using response_header_handler =
    std::function<void(int status_code, const std::map<std::string, std::string>& headers)>;

/**
 * @brief One HTTP exchange
 */
struct http_request {
    http_method method = http_method::get;

    /// Absolute URL, without query string
    std::string url;

    /// Query parameters, appended percent-encoded in order
    std::vector<std::pair<std::string, std::string>> query;

    /// Request headers (names are sent as given)
    std::map<std::string, std::string> headers;

    /// Request body
    byte_buffer body;

    /// Limit on each connect, write or read step of the exchange
    std::chrono::milliseconds timeout{30000};

    /// Optional streaming destination for the response body
    response_body_sink body_sink;

    /// Optional observer of the response head
    response_header_handler on_headers;

    /**
     * @brief URL with the encoded query string appended
     */
    [[nodiscard]] auto full_url() const -> std::string;
};

/**
 * @brief Response of one HTTP exchange
 */
struct http_response {
    int status_code = 0;

    /// Header names are lower-case
    std::map<std::string, std::string> headers;

    byte_buffer body;

    [[nodiscard]] auto is_success() const -> bool {
        return status_code >= 200 && status_code < 300;
    }

    [[nodiscard]] auto get_body_string() const -> std::string {
        return std::string(reinterpret_cast<const char*>(body.data()), body.size());
    }

    /**
     * @brief Header value by name (case-insensitive)
     */
    [[nodiscard]] auto get_header(const std::string& name) const -> std::optional<std::string>;
};

/**
 * @brief Reports request body bytes written so far
 */
using send_progress_handler = std::function<void(uint64_t bytes_sent)>;

/**
 * @brief Receives the outcome of an exchange
 *
 * Transport failures (resolve, connect, TLS, reset, timeout) are reported as
 * error_code::network_error or error_code::transfer_timeout. Any HTTP status,
 * including 4xx and 5xx, is a successful exchange.
 */
using response_handler = std::function<void(result<http_response>)>;

/**
 * @brief Abstract HTTP transport
 */
class http_transport {
public:
    virtual ~http_transport() = default;

    /**
     * @brief Issue one HTTP exchange
     * @param request Request to send
     * @param on_progress Optional upload progress observer
     * @param on_complete Invoked exactly once with the outcome
     */
    virtual void send(http_request request,
                      send_progress_handler on_progress,
                      response_handler on_complete) = 0;

    /**
     * @brief Whether on_complete always runs before send() returns
     */
    [[nodiscard]] virtual auto is_blocking() const -> bool = 0;

    /**
     * @brief Release pooled connections
     */
    virtual void close() {}
};

}  // namespace kcenon::blob

#endif  // KCENON_BLOB_TRANSPORT_TRANSPORT_INTERFACE_H
