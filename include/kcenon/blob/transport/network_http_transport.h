/**
 * @file network_http_transport.h
 * @brief Blocking transport backed by kcenon network_system
 */

#ifndef KCENON_BLOB_TRANSPORT_NETWORK_HTTP_TRANSPORT_H
#define KCENON_BLOB_TRANSPORT_NETWORK_HTTP_TRANSPORT_H

#include <kcenon/blob/transport/transport_interface.h>

#include <chrono>
#include <memory>

namespace kcenon::blob {

/**
 * @brief HTTP transport using kcenon::network::core::http_client
 *
 * Available when built with KCENON_WITH_NETWORK_SYSTEM; otherwise every send
 * completes with internal_error. network_system reports no upload progress,
 * so only the final byte count is reported, and a streaming body sink
 * receives the whole body at once.
 */
class network_http_transport : public http_transport {
public:
    /**
     * @param timeout Used for requests that carry no timeout of their own
     */
    explicit network_http_transport(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{30000});
    ~network_http_transport() override;

    network_http_transport(const network_http_transport&) = delete;
    network_http_transport& operator=(const network_http_transport&) = delete;

    void send(http_request request,
              send_progress_handler on_progress,
              response_handler on_complete) override;

    [[nodiscard]] auto is_blocking() const -> bool override { return true; }

    /**
     * @brief Whether network_system was compiled in
     */
    [[nodiscard]] static auto is_available() -> bool;

    /**
     * @brief Timeout an exchange of request runs under
     */
    [[nodiscard]] auto timeout_for(const http_request& request) const
        -> std::chrono::milliseconds;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::blob

#endif  // KCENON_BLOB_TRANSPORT_NETWORK_HTTP_TRANSPORT_H
