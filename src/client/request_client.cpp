/**
 * @file request_client.cpp
 * @brief Retry loop and header construction for blob API calls
 */

#include <kcenon/blob/client/request_client.h>

#include <kcenon/blob/client/response_classifier.h>
#include <kcenon/blob/core/blob_utils.h>
#include <kcenon/blob/core/logging.h>

#include <mutex>

namespace kcenon::blob {

// ============================================================================
// State
// ============================================================================

struct request_client::shared_state {
    blob_config config;
    std::shared_ptr<http_transport> transport;
    std::shared_ptr<token_provider> tokens;
};

struct request_client::call_state {
    std::shared_ptr<const shared_state> shared;
    execution_context* ctx = nullptr;
    std::weak_ptr<const void> ctx_alive;
    api_request request;
    api_completion on_complete;

    std::string token;
    std::string request_id;
    std::string url;
    uint64_t total_length = 0;
    bool send_length = false;
    std::size_t attempt = 0;
    uint64_t reported = 0;
    std::chrono::steady_clock::time_point started;

    auto log_context() const -> transfer_log_context {
        transfer_log_context log_ctx;
        log_ctx.request_id = request_id;
        log_ctx.attempt = static_cast<uint32_t>(attempt);
        log_ctx.bytes = total_length;
        return log_ctx;
    }

    void finish(result<Json::Value> outcome) {
        auto log_ctx = log_context();
        log_ctx.duration_ms = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started)
                .count());
        if (outcome) {
            BLOB_LOG_DEBUG_CTX(log_category::request,
                               std::string(to_string(request.method)) + " " + url + " succeeded",
                               log_ctx);
        } else {
            log_ctx.error_message = outcome.error().message;
            BLOB_LOG_WARN_CTX(log_category::request,
                              std::string(to_string(request.method)) + " " + url + " failed: " +
                                  to_string(outcome.error().code),
                              log_ctx);
        }

        auto handler = std::move(on_complete);
        on_complete = nullptr;
        handler(std::move(outcome));
    }
};

// ============================================================================
// request_client
// ============================================================================

request_client::request_client(blob_config config,
                               std::shared_ptr<http_transport> transport,
                               std::shared_ptr<token_provider> tokens)
    : shared_(std::make_shared<shared_state>(
          shared_state{std::move(config), std::move(transport), std::move(tokens)})) {}

request_client::~request_client() = default;

auto request_client::config() const -> const blob_config& {
    return shared_->config;
}

auto request_client::transport() const -> std::shared_ptr<http_transport> {
    return shared_->transport;
}

auto request_client::resolve_token(const std::optional<std::string>& override_token) const
    -> result<std::string> {
    if (override_token && !override_token->empty()) {
        return *override_token;
    }
    if (!shared_->tokens) {
        return unexpected(error{error_code::no_token_provided, "no token provider configured"});
    }
    return shared_->tokens->get_token();
}

void request_client::issue(api_request request,
                           execution_context& ctx,
                           api_completion on_complete) const {
    auto token = resolve_token(request.token);
    if (!token) {
        on_complete(unexpected(token.error()));
        return;
    }

    auto call = std::make_shared<call_state>();
    call->shared = shared_;
    call->ctx = &ctx;
    call->ctx_alive = ctx.lifetime();
    call->on_complete = std::move(on_complete);
    call->token = std::move(token.value());
    call->request_id = blob_utils::make_request_id(blob_utils::extract_store_id(call->token));
    call->url = shared_->config.api_url + request.path;
    call->total_length = request.body.size();
    call->send_length =
        static_cast<bool>(request.on_upload_progress) || shared_->config.send_content_length;
    call->started = std::chrono::steady_clock::now();
    call->request = std::move(request);

    if (call->request.on_upload_progress && call->total_length > 0) {
        call->request.on_upload_progress(make_progress_event(0, call->total_length));
    }

    run_attempt(call);
}

auto request_client::call(api_request request, execution_context& ctx) const
    -> result<Json::Value> {
    struct slot {
        std::mutex mutex;
        std::optional<result<Json::Value>> outcome;
    };
    auto outcome_slot = std::make_shared<slot>();

    issue(std::move(request), ctx, [outcome_slot, &ctx](result<Json::Value> outcome) {
        {
            std::lock_guard<std::mutex> lock(outcome_slot->mutex);
            outcome_slot->outcome = std::move(outcome);
        }
        ctx.notify();
    });

    auto waited = ctx.wait_until([&outcome_slot] {
        std::lock_guard<std::mutex> lock(outcome_slot->mutex);
        return outcome_slot->outcome.has_value();
    });
    if (!waited) {
        return unexpected(waited.error());
    }

    std::lock_guard<std::mutex> lock(outcome_slot->mutex);
    return std::move(*outcome_slot->outcome);
}

// ============================================================================
// Attempt loop
// ============================================================================

void request_client::run_attempt(const std::shared_ptr<call_state>& call) {
    const auto& config = call->shared->config;

    http_request req;
    req.method = call->request.method;
    req.url = call->url;
    req.query = call->request.query;
    req.headers["authorization"] = "Bearer " + call->token;
    req.headers["x-api-blob-request-id"] = call->request_id;
    req.headers["x-api-blob-request-attempt"] = std::to_string(call->attempt);
    req.headers["x-api-version"] = config.api_version;
    if (config.proxy_through_alternative_api) {
        req.headers["x-proxy-through-alternative-api"] = *config.proxy_through_alternative_api;
    }
    for (const auto& [name, value] : call->request.headers) {
        req.headers[name] = value;
    }
    if (call->send_length && call->total_length > 0) {
        req.headers["x-content-length"] = std::to_string(call->total_length);
    }
    req.body = call->request.body;
    req.timeout = call->request.timeout.value_or(config.request_timeout);

    send_progress_handler on_progress;
    if (call->request.on_upload_progress) {
        // Intermediate events stay below 100%; that one is reserved for success
        on_progress = [call](uint64_t bytes_sent) {
            if (bytes_sent > call->reported && bytes_sent < call->total_length) {
                call->reported = bytes_sent;
                call->request.on_upload_progress(
                    make_progress_event(bytes_sent, call->total_length));
            }
        };
    }

    BLOB_LOG_TRACE(log_category::request,
                   std::string(to_string(req.method)) + " " + call->url + " attempt " +
                       std::to_string(call->attempt));

    call->shared->transport->send(
        std::move(req), std::move(on_progress),
        [call](result<http_response> response) { on_response(call, std::move(response)); });
}

void request_client::on_response(const std::shared_ptr<call_state>& call,
                                 result<http_response> response) {
    const auto& retry = call->shared->config.retry;

    if (!response) {
        const auto& cause = response.error();
        // Only connection-level failures are transient; a bad URL or a missing
        // TLS build fails the same way on every attempt
        if (cause.code != error_code::network_error &&
            cause.code != error_code::transfer_timeout) {
            call->finish(unexpected(cause));
            return;
        }
        if (call->attempt < retry.max_retries) {
            retry_later(call, cause.message);
            return;
        }
        call->finish(unexpected(error{
            error_code::unknown_error,
            "request failed after " + std::to_string(call->attempt + 1) +
                " attempts: " + cause.message}));
        return;
    }

    const auto& resp = response.value();
    if (resp.is_success()) {
        if (call->request.on_upload_progress) {
            call->request.on_upload_progress(
                upload_progress_event{call->total_length, call->total_length, 100.0});
        }

        switch (call->request.decode) {
            case decode_mode::none:
                call->finish(Json::Value());
                return;
            case decode_mode::any:
                call->finish(decode_any_response(resp));
                return;
            case decode_mode::json:
            default:
                call->finish(decode_json_response(resp));
                return;
        }
    }

    auto err = classify_response(resp);
    if (is_retryable(err.code) && call->attempt < retry.max_retries) {
        retry_later(call, std::string(to_string(err.code)) + " (HTTP " +
                              std::to_string(resp.status_code) + ")");
        return;
    }
    if (err.code == error_code::internal_server_error) {
        err = error{error_code::unknown_error, err.message};
    }
    call->finish(unexpected(std::move(err)));
}

void request_client::retry_later(const std::shared_ptr<call_state>& call,
                                 const std::string& reason) {
    auto delay = call->shared->config.retry.delay_for(call->attempt);

    auto log_ctx = call->log_context();
    log_ctx.error_message = reason;
    BLOB_LOG_DEBUG_CTX(log_category::request,
                       "retrying " + call->url + " in " + std::to_string(delay.count()) + "ms",
                       log_ctx);

    auto alive = call->ctx_alive.lock();
    if (!alive) {
        abandon(call);
        return;
    }
    ++call->attempt;
    call->ctx->defer(delay, [call] {
        if (call->ctx_alive.expired()) {
            abandon(call);
            return;
        }
        run_attempt(call);
    });
}

void request_client::abandon(const std::shared_ptr<call_state>& call) {
    call->finish(unexpected(error{error_code::not_initialized,
                                  "execution context is gone; retry abandoned"}));
}

}  // namespace kcenon::blob
