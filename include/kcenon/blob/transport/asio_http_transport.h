/**
 * @file asio_http_transport.h
 * @brief HTTP/1.1 transport on Boost.Asio and Boost.Beast
 *
 * asio_http_transport runs every exchange as asynchronous operations on an
 * io_context it does not own, so it is the transport of the cooperative
 * execution model. blocking_http_transport drives the same exchange on a
 * private io_context per call and is the transport of the threaded model.
 */

#ifndef KCENON_BLOB_TRANSPORT_ASIO_HTTP_TRANSPORT_H
#define KCENON_BLOB_TRANSPORT_ASIO_HTTP_TRANSPORT_H

#include <kcenon/blob/config/feature_flags.h>
#include <kcenon/blob/transport/transport_interface.h>

#include <cstddef>
#include <memory>
#include <string>

namespace boost::asio {
class io_context;
}

namespace kcenon::blob {

/**
 * @brief TLS settings for https:// endpoints
 */
struct tls_options {
    /// Verify the server certificate chain and host name
    bool verify_peer = true;

    /// Extra CA bundle (PEM); system defaults are always loaded
    std::string ca_file;
};

/**
 * @brief Asynchronous Beast transport bound to a caller's io_context
 *
 * send() starts the exchange and returns immediately; on_progress and
 * on_complete run on the io_context thread. The io_context must outlive
 * every exchange started through this transport; the transport itself need
 * not. request.timeout limits each connect, write and read step, so a slow
 * but steady download is never cut off.
 */
class asio_http_transport : public http_transport {
public:
    explicit asio_http_transport(boost::asio::io_context& io_context,
                                 tls_options tls = {});
    ~asio_http_transport() override;

    asio_http_transport(const asio_http_transport&) = delete;
    asio_http_transport& operator=(const asio_http_transport&) = delete;

    void send(http_request request,
              send_progress_handler on_progress,
              response_handler on_complete) override;

    [[nodiscard]] auto is_blocking() const -> bool override { return false; }

    /// Bytes written per write call, which sets upload progress granularity
    static constexpr std::size_t write_limit = 64 * 1024;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Blocking transport; each send() runs to completion on the caller
 *
 * Safe to call from many worker threads at once.
 */
class blocking_http_transport : public http_transport {
public:
    explicit blocking_http_transport(tls_options tls = {});
    ~blocking_http_transport() override;

    blocking_http_transport(const blocking_http_transport&) = delete;
    blocking_http_transport& operator=(const blocking_http_transport&) = delete;

    void send(http_request request,
              send_progress_handler on_progress,
              response_handler on_complete) override;

    [[nodiscard]] auto is_blocking() const -> bool override { return true; }

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::blob

#endif  // KCENON_BLOB_TRANSPORT_ASIO_HTTP_TRANSPORT_H
