/**
 * @file network_http_transport.cpp
 * @brief network_system http_client adapter
 */

#include <kcenon/blob/transport/network_http_transport.h>

#include <kcenon/blob/config/feature_flags.h>
#include <kcenon/blob/core/blob_utils.h>
#include <kcenon/blob/core/logging.h>

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>

#include <map>
#include <mutex>
#endif

namespace kcenon::blob {

// ============================================================================
// Implementation
// ============================================================================

struct network_http_transport::impl {
    std::chrono::milliseconds default_timeout;

#if KCENON_WITH_NETWORK_SYSTEM
    // http_client fixes its timeout at construction, so keep one per timeout
    std::mutex mutex;
    std::map<std::chrono::milliseconds::rep,
             std::shared_ptr<kcenon::network::core::http_client>> clients;

    auto client_for(std::chrono::milliseconds timeout)
        -> std::shared_ptr<kcenon::network::core::http_client> {
        std::lock_guard<std::mutex> lock(mutex);
        auto& client = clients[timeout.count()];
        if (!client) {
            client = std::make_shared<kcenon::network::core::http_client>(timeout);
        }
        return client;
    }
#endif

    explicit impl(std::chrono::milliseconds timeout) : default_timeout(timeout) {}

#if KCENON_WITH_NETWORK_SYSTEM
    static auto convert_response(
        const kcenon::network::internal::http_response& resp) -> http_response {
        http_response result;
        result.status_code = resp.status_code;
        for (const auto& [name, value] : resp.headers) {
            result.headers[blob_utils::to_lower(name)] = value;
        }
        result.body.reserve(resp.body.size());
        for (auto byte : resp.body) {
            result.body.push_back(static_cast<std::byte>(byte));
        }
        return result;
    }
#endif
};

// ============================================================================
// Constructor / Destructor
// ============================================================================

network_http_transport::network_http_transport(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

network_http_transport::~network_http_transport() = default;

auto network_http_transport::is_available() -> bool {
    return KCENON_WITH_NETWORK_SYSTEM != 0;
}

auto network_http_transport::timeout_for(const http_request& request) const
    -> std::chrono::milliseconds {
    return request.timeout.count() > 0 ? request.timeout : impl_->default_timeout;
}

// ============================================================================
// HTTP Operations
// ============================================================================

void network_http_transport::send(http_request request,
                                  send_progress_handler on_progress,
                                  response_handler on_complete) {
#if KCENON_WITH_NETWORK_SYSTEM
    auto url = request.full_url();
    const auto& headers = request.headers;
    auto client = impl_->client_for(timeout_for(request));
    std::vector<uint8_t> body;
    body.reserve(request.body.size());
    for (auto byte : request.body) {
        body.push_back(static_cast<uint8_t>(byte));
    }

    auto fail = [&](const char* what) {
        BLOB_LOG_DEBUG(log_category::transport, std::string(what) + " " + url);
        on_complete(unexpected(error{error_code::network_error, what}));
    };

    switch (request.method) {
        case http_method::get: {
            auto response = client->get(url, {}, headers);
            if (response.is_err()) {
                fail("HTTP GET request failed");
                return;
            }
            auto converted = impl::convert_response(response.value());
            if (request.on_headers) {
                request.on_headers(converted.status_code, converted.headers);
            }
            if (request.body_sink && converted.is_success()) {
                if (auto sunk = request.body_sink(converted.body); !sunk) {
                    on_complete(unexpected(sunk.error()));
                    return;
                }
                converted.body.clear();
            }
            on_complete(std::move(converted));
            return;
        }
        case http_method::post: {
            auto response = client->post(url, body, headers);
            if (response.is_err()) {
                fail("HTTP POST request failed");
                return;
            }
            if (on_progress) {
                on_progress(body.size());
            }
            on_complete(impl::convert_response(response.value()));
            return;
        }
        case http_method::put: {
            std::string body_str(body.begin(), body.end());
            auto response = client->put(url, body_str, headers);
            if (response.is_err()) {
                fail("HTTP PUT request failed");
                return;
            }
            if (on_progress) {
                on_progress(body.size());
            }
            on_complete(impl::convert_response(response.value()));
            return;
        }
        case http_method::del: {
            auto response = client->del(url, headers);
            if (response.is_err()) {
                fail("HTTP DELETE request failed");
                return;
            }
            on_complete(impl::convert_response(response.value()));
            return;
        }
        default:
            on_complete(unexpected(error{error_code::invalid_argument,
                                         std::string("unsupported method ") +
                                             to_string(request.method)}));
            return;
    }
#else
    (void)request;
    (void)on_progress;
    on_complete(unexpected(error{
        error_code::internal_error,
        "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}));
#endif
}

}  // namespace kcenon::blob
