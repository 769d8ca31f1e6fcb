/**
 * @file asio_http_transport.cpp
 * @brief Boost.Beast HTTP/1.1 exchange shared by both transports
 */

#include <kcenon/blob/transport/asio_http_transport.h>

#include <kcenon/blob/core/blob_utils.h>
#include <kcenon/blob/core/logging.h>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/http/vector_body.hpp>

#if BLOB_HAS_TLS
#include <boost/asio/ssl.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>
#endif

#include <array>
#include <optional>
#include <string_view>

namespace kcenon::blob {

namespace {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

// ============================================================================
// URL and error helpers
// ============================================================================

struct url_parts {
    bool secure = false;
    std::string host;
    std::string port;
    std::string target;
};

auto parse_url(const std::string& url) -> result<url_parts> {
    url_parts parts;
    std::string_view rest(url);

    if (rest.rfind("https://", 0) == 0) {
        parts.secure = true;
        rest.remove_prefix(8);
    } else if (rest.rfind("http://", 0) == 0) {
        rest.remove_prefix(7);
    } else {
        return unexpected(error{error_code::invalid_argument,
                                "unsupported URL scheme: " + url});
    }

    auto path_start = rest.find_first_of("/?#");
    auto authority = rest.substr(0, path_start);
    if (path_start != std::string_view::npos) {
        auto path = rest.substr(path_start);
        path = path.substr(0, path.find('#'));
        parts.target = std::string(path);
    }
    if (parts.target.empty() || parts.target.front() != '/') {
        parts.target.insert(parts.target.begin(), '/');
    }

    if (auto at = authority.rfind('@'); at != std::string_view::npos) {
        authority.remove_prefix(at + 1);
    }

    std::string_view port;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return unexpected(error{error_code::invalid_argument, "malformed host in URL: " + url});
        }
        parts.host = std::string(authority.substr(1, close - 1));
        auto after = authority.substr(close + 1);
        if (!after.empty() && after.front() == ':') {
            port = after.substr(1);
        }
    } else if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
        parts.host = std::string(authority.substr(0, colon));
        port = authority.substr(colon + 1);
    } else {
        parts.host = std::string(authority);
    }

    if (parts.host.empty()) {
        return unexpected(error{error_code::invalid_argument, "missing host in URL: " + url});
    }
    parts.port = port.empty() ? (parts.secure ? "443" : "80") : std::string(port);
    return parts;
}

auto to_verb(http_method method) -> http::verb {
    switch (method) {
        case http_method::get: return http::verb::get;
        case http_method::put: return http::verb::put;
        case http_method::post: return http::verb::post;
        case http_method::del: return http::verb::delete_;
        case http_method::head: return http::verb::head;
        default: return http::verb::get;
    }
}

auto transport_error(const beast::error_code& ec, std::string_view stage) -> error {
    if (ec == beast::error::timeout || ec == asio::error::timed_out) {
        return error{error_code::transfer_timeout, std::string(stage) + " timed out"};
    }
    return error{error_code::network_error,
                 std::string(stage) + " failed: " + ec.message()};
}

template <typename Stream>
inline constexpr bool is_tls_stream = false;

#if BLOB_HAS_TLS
using tls_stream = beast::ssl_stream<beast::tcp_stream>;

template <>
inline constexpr bool is_tls_stream<tls_stream> = true;
#endif

// ============================================================================
// http_exchange
// ============================================================================

/**
 * @brief One request/response exchange on a fresh connection
 *
 * Keeps itself alive through the handlers it arms, and keeps its launcher
 * (and with it the TLS context) alive through owner_. The stream deadline is
 * re-armed before every connect, handshake, write and read step, so the
 * request timeout bounds inactivity rather than the whole exchange.
 */
template <typename Stream>
class http_exchange : public std::enable_shared_from_this<http_exchange<Stream>> {
public:
    template <typename... StreamArgs>
    http_exchange(std::shared_ptr<const void> owner,
                  asio::io_context& io_context,
                  url_parts target,
                  bool verify_peer,
                  http_request request,
                  send_progress_handler on_progress,
                  response_handler on_complete,
                  StreamArgs&&... stream_args)
        : owner_(std::move(owner)),
          resolver_(io_context),
          stream_(std::forward<StreamArgs>(stream_args)...),
          target_(std::move(target)),
          verify_peer_(verify_peer),
          method_(request.method),
          timeout_(request.timeout),
          sink_(std::move(request.body_sink)),
          on_headers_(std::move(request.on_headers)),
          on_progress_(std::move(on_progress)),
          on_complete_(std::move(on_complete)) {
        build_request(std::move(request));
    }

    void start() {
        BLOB_LOG_TRACE(log_category::transport,
                       std::string(to_string(method_)) + " " + target_.host +
                           ":" + target_.port);
        resolver_.async_resolve(
            target_.host, target_.port,
            [self = this->shared_from_this()](const beast::error_code& ec,
                                              tcp::resolver::results_type results) {
                self->on_resolve(ec, results);
            });
    }

private:
    void build_request(http_request request) {
        request_.method(to_verb(request.method));
        request_.target(target_.target);
        request_.version(11);

        std::string host_header = target_.host;
        if (target_.port != (target_.secure ? "443" : "80")) {
            host_header += ":" + target_.port;
        }
        request_.set(http::field::host, host_header);
        request_.set(http::field::user_agent, "blob_upload_system");
        for (const auto& [name, value] : request.headers) {
            request_.set(name, value);
        }

        request_.body() = std::move(request.body);
        request_.prepare_payload();
    }

    void on_resolve(const beast::error_code& ec, const tcp::resolver::results_type& results) {
        if (ec) {
            fail(transport_error(ec, "resolve"));
            return;
        }
        arm_deadline();
        beast::get_lowest_layer(stream_).async_connect(
            results,
            [self = this->shared_from_this()](const beast::error_code& ec,
                                              const tcp::endpoint&) {
                self->on_connect(ec);
            });
    }

    void on_connect(const beast::error_code& ec) {
        if (ec) {
            fail(transport_error(ec, "connect"));
            return;
        }

        if constexpr (is_tls_stream<Stream>) {
#if BLOB_HAS_TLS
            if (!SSL_set_tlsext_host_name(stream_.native_handle(), target_.host.c_str())) {
                fail(error{error_code::network_error, "failed to set TLS server name"});
                return;
            }
            if (verify_peer_) {
                stream_.set_verify_callback(asio::ssl::host_name_verification(target_.host));
            }
            arm_deadline();
            stream_.async_handshake(
                asio::ssl::stream_base::client,
                [self = this->shared_from_this()](const beast::error_code& ec) {
                    if (ec) {
                        self->fail(transport_error(ec, "TLS handshake"));
                        return;
                    }
                    self->write_header();
                });
#endif
        } else {
            write_header();
        }
    }

    void write_header() {
        serializer_.emplace(request_);
        serializer_->limit(asio_http_transport::write_limit);
        arm_deadline();
        http::async_write_header(
            stream_, *serializer_,
            [self = this->shared_from_this()](const beast::error_code& ec, std::size_t) {
                if (ec) {
                    self->fail(transport_error(ec, "write"));
                    return;
                }
                self->write_body();
            });
    }

    void write_body() {
        if (serializer_->is_done()) {
            read_header();
            return;
        }
        arm_deadline();
        http::async_write_some(
            stream_, *serializer_,
            [self = this->shared_from_this()](const beast::error_code& ec,
                                              std::size_t bytes_transferred) {
                if (ec) {
                    self->fail(transport_error(ec, "write"));
                    return;
                }
                self->bytes_sent_ += bytes_transferred;
                if (self->on_progress_ && bytes_transferred > 0) {
                    self->on_progress_(self->bytes_sent_);
                }
                self->write_body();
            });
    }

    void read_header() {
        parser_.emplace();
        parser_->body_limit(boost::none);
        if (method_ == http_method::head) {
            parser_->skip(true);
        }
        arm_deadline();
        http::async_read_header(
            stream_, buffer_, *parser_,
            [self = this->shared_from_this()](const beast::error_code& ec, std::size_t) {
                if (ec) {
                    self->fail(transport_error(ec, "read"));
                    return;
                }
                self->on_header();
            });
    }

    void on_header() {
        const auto& message = parser_->get();
        response_.status_code = static_cast<int>(message.result_int());
        for (const auto& field : message) {
            auto raw_name = field.name_string();
            auto raw_value = field.value();
            auto name = blob_utils::to_lower(std::string_view(raw_name.data(), raw_name.size()));
            std::string value(raw_value.data(), raw_value.size());

            auto [it, inserted] = response_.headers.emplace(name, value);
            if (!inserted) {
                it->second += ", " + value;
            }
        }
        if (on_headers_) {
            on_headers_(response_.status_code, response_.headers);
        }
        read_body();
    }

    void read_body() {
        if (parser_->is_done()) {
            finish();
            return;
        }

        auto& body = parser_->get().body();
        body.data = chunk_.data();
        body.size = chunk_.size();
        arm_deadline();
        http::async_read(
            stream_, buffer_, *parser_,
            [self = this->shared_from_this()](beast::error_code ec, std::size_t) {
                if (ec == http::error::need_buffer) {
                    ec = {};
                }
                if (ec) {
                    self->fail(transport_error(ec, "read"));
                    return;
                }

                auto produced = self->chunk_.size() - self->parser_->get().body().size;
                if (auto delivered = self->deliver(produced); !delivered) {
                    self->fail(delivered.error());
                    return;
                }
                self->read_body();
            });
    }

    auto deliver(std::size_t count) -> result<void> {
        if (count == 0) {
            return {};
        }
        const auto* first = reinterpret_cast<const std::byte*>(chunk_.data());
        if (sink_ && response_.is_success()) {
            return sink_(std::span<const std::byte>(first, count));
        }
        response_.body.insert(response_.body.end(), first, first + count);
        return {};
    }

    void finish() {
        close();
        BLOB_LOG_TRACE(log_category::transport,
                       "exchange with " + target_.host + " completed with status " +
                           std::to_string(response_.status_code));
        complete(std::move(response_));
    }

    void fail(error err) {
        close();
        BLOB_LOG_DEBUG(log_category::transport,
                       "exchange with " + target_.host + " failed: " + err.message);
        complete(unexpected(std::move(err)));
    }

    void arm_deadline() {
        beast::get_lowest_layer(stream_).expires_after(timeout_);
    }

    void close() {
        beast::get_lowest_layer(stream_).close();
    }

    void complete(result<http_response> outcome) {
        if (!on_complete_) {
            return;
        }
        auto handler = std::move(on_complete_);
        on_complete_ = nullptr;
        handler(std::move(outcome));
    }

    // Declared first so the stream goes before the TLS context it borrows
    std::shared_ptr<const void> owner_;
    tcp::resolver resolver_;
    Stream stream_;
    url_parts target_;
    bool verify_peer_;
    http_method method_;
    std::chrono::milliseconds timeout_;

    response_body_sink sink_;
    response_header_handler on_headers_;
    send_progress_handler on_progress_;
    response_handler on_complete_;

    http::request<http::vector_body<std::byte>> request_;
    std::optional<http::request_serializer<http::vector_body<std::byte>>> serializer_;
    uint64_t bytes_sent_ = 0;

    beast::flat_buffer buffer_;
    std::optional<http::response_parser<http::buffer_body>> parser_;
    std::array<char, 16 * 1024> chunk_{};
    http_response response_;
};

// ============================================================================
// exchange_launcher
// ============================================================================

/**
 * @brief Owns TLS state and starts exchanges on a given io_context
 *
 * Every exchange holds a reference to its launcher, so a transport may be
 * destroyed while exchanges are still running on the loop.
 */
class exchange_launcher : public std::enable_shared_from_this<exchange_launcher> {
public:
    explicit exchange_launcher(tls_options tls)
        : tls_(std::move(tls))
#if BLOB_HAS_TLS
          , ssl_context_(asio::ssl::context::tls_client)
#endif
    {
#if BLOB_HAS_TLS
        beast::error_code ec;
        ssl_context_.set_default_verify_paths(ec);
        if (ec) {
            BLOB_LOG_WARN(log_category::transport,
                          "failed to load default CA paths: " + ec.message());
        }
        if (!tls_.ca_file.empty()) {
            ssl_context_.load_verify_file(tls_.ca_file, ec);
            if (ec) {
                BLOB_LOG_ERROR(log_category::transport,
                               "failed to load CA file " + tls_.ca_file + ": " + ec.message());
            }
        }
        ssl_context_.set_verify_mode(tls_.verify_peer ? asio::ssl::verify_peer
                                                      : asio::ssl::verify_none);
#endif
    }

    /**
     * @brief Start an exchange; on error nothing was started
     */
    [[nodiscard]] auto launch(asio::io_context& io_context,
                              http_request request,
                              send_progress_handler on_progress,
                              response_handler on_complete) -> result<void> {
        auto target = parse_url(request.full_url());
        if (!target) {
            return unexpected(target.error());
        }

        if (target.value().secure) {
#if BLOB_HAS_TLS
            auto exchange = std::make_shared<http_exchange<tls_stream>>(
                shared_from_this(), io_context, std::move(target.value()), tls_.verify_peer, std::move(request),
                std::move(on_progress), std::move(on_complete), io_context, ssl_context_);
            exchange->start();
            return {};
#else
            return unexpected(error{error_code::network_error,
                                    "https endpoints require a build with BLOB_ENABLE_TLS"});
#endif
        }

        auto exchange = std::make_shared<http_exchange<beast::tcp_stream>>(
            shared_from_this(), io_context, std::move(target.value()), tls_.verify_peer, std::move(request),
            std::move(on_progress), std::move(on_complete), io_context);
        exchange->start();
        return {};
    }

private:
    tls_options tls_;
#if BLOB_HAS_TLS
    asio::ssl::context ssl_context_;
#endif
};

}  // namespace

// ============================================================================
// asio_http_transport
// ============================================================================

struct asio_http_transport::impl {
    asio::io_context& io_context;
    std::shared_ptr<exchange_launcher> launcher;

    impl(asio::io_context& io, tls_options tls)
        : io_context(io), launcher(std::make_shared<exchange_launcher>(std::move(tls))) {}
};

asio_http_transport::asio_http_transport(boost::asio::io_context& io_context, tls_options tls)
    : impl_(std::make_unique<impl>(io_context, std::move(tls))) {}

asio_http_transport::~asio_http_transport() = default;

void asio_http_transport::send(http_request request,
                               send_progress_handler on_progress,
                               response_handler on_complete) {
    auto handler = std::make_shared<response_handler>(std::move(on_complete));
    auto started = impl_->launcher->launch(
        impl_->io_context, std::move(request), std::move(on_progress),
        [handler](result<http_response> outcome) { (*handler)(std::move(outcome)); });
    if (!started) {
        // Completion is always delivered from the loop, never inside send()
        asio::post(impl_->io_context, [handler, err = started.error()]() {
            (*handler)(unexpected(err));
        });
    }
}

// ============================================================================
// blocking_http_transport
// ============================================================================

struct blocking_http_transport::impl {
    std::shared_ptr<exchange_launcher> launcher;

    explicit impl(tls_options tls)
        : launcher(std::make_shared<exchange_launcher>(std::move(tls))) {}
};

blocking_http_transport::blocking_http_transport(tls_options tls)
    : impl_(std::make_unique<impl>(std::move(tls))) {}

blocking_http_transport::~blocking_http_transport() = default;

void blocking_http_transport::send(http_request request,
                                   send_progress_handler on_progress,
                                   response_handler on_complete) {
    asio::io_context io_context{1};
    std::optional<result<http_response>> outcome;

    auto started = impl_->launcher->launch(
        io_context, std::move(request), std::move(on_progress),
        [&outcome](result<http_response> response) { outcome = std::move(response); });
    if (!started) {
        on_complete(unexpected(started.error()));
        return;
    }

    io_context.run();

    if (!outcome) {
        on_complete(unexpected(error{error_code::internal_error,
                                     "exchange ended without a result"}));
        return;
    }
    on_complete(std::move(*outcome));
}

}  // namespace kcenon::blob
