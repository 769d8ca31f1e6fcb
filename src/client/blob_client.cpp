/**
 * @file blob_client.cpp
 * @brief Blob uploads, downloads and store operations
 */

#include <kcenon/blob/client/blob_client.h>

#include <kcenon/blob/client/response_classifier.h>
#include <kcenon/blob/core/blob_utils.h>
#include <kcenon/blob/core/logging.h>

#include <algorithm>
#include <charconv>
#include <fstream>
#include <limits>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <system_error>

namespace kcenon::blob {

namespace {

auto telemetry_size(const blob_body& body) -> std::optional<uint64_t> {
    if (std::holds_alternative<byte_buffer>(body)) {
        return std::get<byte_buffer>(body).size();
    }
    if (std::holds_alternative<std::string>(body)) {
        return std::get<std::string>(body).size();
    }
    return std::nullopt;
}

/**
 * @brief Run one raw exchange on the client's execution context and wait
 */
auto send_and_wait(http_transport& transport, execution_context& ctx, http_request request)
    -> result<http_response> {
    struct slot {
        std::mutex mutex;
        std::optional<result<http_response>> outcome;
    };
    auto outcome_slot = std::make_shared<slot>();

    transport.send(std::move(request), {},
                   [outcome_slot, &ctx](result<http_response> outcome) {
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

auto make_blob_url(const std::string& store_id, std::string_view pathname, blob_access access)
    -> std::string {
    while (!pathname.empty() && pathname.front() == '/') {
        pathname.remove_prefix(1);
    }
    return "https://" + store_id + "." + to_string(access) + ".blob.vercel-storage.com/" +
           std::string(pathname);
}

/**
 * @brief Path of an absolute URL without its leading "/"
 */
auto pathname_of(const std::string& url) -> std::string {
    auto scheme = url.find("://");
    auto start = url.find('/', scheme == std::string::npos ? 0 : scheme + 3);
    if (start == std::string::npos) {
        return {};
    }
    auto end = url.find_first_of("?#", start);
    return url.substr(start + 1, end == std::string::npos ? std::string::npos : end - start - 1);
}

auto header_or_empty(const http_response& response, const std::string& name) -> std::string {
    return response.get_header(name).value_or("");
}

auto last_modified_of(const http_response& response) -> std::chrono::system_clock::time_point {
    if (auto value = response.get_header("last-modified")) {
        if (auto parsed = blob_utils::parse_timestamp(*value)) {
            return *parsed;
        }
    }
    return std::chrono::system_clock::now();
}

void remove_temporary(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        BLOB_LOG_DEBUG(log_category::file,
                       "failed to remove temporary file " + path.string() + ": " + ec.message());
    }
}

}  // namespace

// ============================================================================
// Implementation
// ============================================================================

struct blob_client::impl {
    blob_config config;
    std::shared_ptr<token_provider> tokens;
    std::shared_ptr<telemetry_sink> telemetry;
    std::shared_ptr<http_transport> transport;
    std::unique_ptr<request_client> requests;
    // Declared last so that a worker pool drains before the client parts go
    std::shared_ptr<execution_context> execution;
    bool open = true;

    auto call(api_request request) -> result<Json::Value> {
        return requests->call(std::move(request), *execution);
    }

    void track_put(const put_options& options, bool multipart, std::optional<uint64_t> size) {
        telemetry_event event;
        event.name = "blob_put";
        event.attributes["access"] = to_string(options.access);
        event.attributes["content_type"] = options.content_type.value_or("");
        event.attributes["multipart"] = multipart ? "true" : "false";
        if (size) {
            event.attributes["size_bytes"] = std::to_string(*size);
        }
        emit_telemetry(telemetry.get(), event);
    }
};

// ============================================================================
// Builder
// ============================================================================

blob_client::builder::builder() = default;

auto blob_client::builder::with_config(const blob_config& config) -> builder& {
    context_.config = config;
    return *this;
}

auto blob_client::builder::with_token(const std::string& token) -> builder& {
    context_.tokens = std::make_shared<static_token_provider>(token);
    return *this;
}

auto blob_client::builder::with_token_provider(std::shared_ptr<token_provider> provider)
    -> builder& {
    context_.tokens = std::move(provider);
    return *this;
}

auto blob_client::builder::with_telemetry(std::shared_ptr<telemetry_sink> sink) -> builder& {
    context_.telemetry = std::move(sink);
    return *this;
}

auto blob_client::builder::with_execution_model(execution_model model) -> builder& {
    context_.model = model;
    return *this;
}

auto blob_client::builder::with_io_context(boost::asio::io_context& io_context) -> builder& {
    context_.model = execution_model::cooperative;
    context_.execution = std::make_shared<io_context_execution>(io_context);
    return *this;
}

auto blob_client::builder::with_transport(std::shared_ptr<http_transport> transport)
    -> builder& {
    context_.transport = std::move(transport);
    return *this;
}

auto blob_client::builder::with_execution_context(std::shared_ptr<execution_context> execution)
    -> builder& {
    context_.execution = std::move(execution);
    return *this;
}

auto blob_client::builder::with_tls(const tls_options& tls) -> builder& {
    context_.tls = tls;
    return *this;
}

auto blob_client::builder::build() -> result<blob_client> {
    return blob_client::create(context_);
}

// ============================================================================
// Construction
// ============================================================================

auto blob_client::create(client_context context) -> result<blob_client> {
    if (auto valid = context.config.validate(); !valid) {
        return unexpected(valid.error());
    }

    get_logger().initialize();

    auto state = std::make_unique<impl>();
    state->config = context.config;
    state->tokens = context.tokens ? context.tokens
                                   : std::make_shared<environment_token_provider>();
    state->telemetry = context.telemetry;

    auto model = context.execution ? context.execution->model() : context.model;
    state->execution = context.execution;
    if (!state->execution) {
        if (model == execution_model::threaded) {
            state->execution = thread_pool_execution::create(
                std::max<std::size_t>(context.config.multipart.max_concurrent_parts, 1));
        } else {
            state->execution = std::make_shared<io_context_execution>();
        }
    }

    state->transport = context.transport;
    if (!state->transport) {
        if (model == execution_model::threaded) {
            state->transport = std::make_shared<blocking_http_transport>(context.tls);
        } else {
            auto* loop = dynamic_cast<io_context_execution*>(state->execution.get());
            if (loop == nullptr) {
                return unexpected(error{error_code::invalid_configuration,
                                        "a custom cooperative execution context needs a transport"});
            }
            state->transport =
                std::make_shared<asio_http_transport>(loop->io_context(), context.tls);
        }
    }

    if (model == execution_model::threaded && !state->transport->is_blocking()) {
        return unexpected(error{error_code::invalid_configuration,
                                "the threaded model needs a blocking transport"});
    }

    state->requests =
        std::make_unique<request_client>(state->config, state->transport, state->tokens);

    BLOB_LOG_INFO(log_category::client,
                  std::string("blob client created (") + to_string(model) + " model, " +
                      state->config.api_url + ")");
    return blob_client(std::move(state));
}

blob_client::blob_client(std::unique_ptr<impl> impl) : impl_(std::move(impl)) {}

blob_client::~blob_client() {
    if (impl_) {
        close();
    }
}

blob_client::blob_client(blob_client&&) noexcept = default;
auto blob_client::operator=(blob_client&&) noexcept -> blob_client& = default;

void blob_client::close() {
    if (!impl_ || !impl_->open) {
        return;
    }
    impl_->open = false;
    impl_->transport->close();
    BLOB_LOG_DEBUG(log_category::client, "blob client closed");
}

auto blob_client::is_open() const -> bool {
    return impl_ && impl_->open;
}

auto blob_client::ensure_open() const -> result<void> {
    if (!impl_) {
        return unexpected(error{error_code::not_initialized, "blob client was moved from"});
    }
    if (!impl_->open) {
        return unexpected(error{error_code::not_initialized, "blob client is closed"});
    }
    return {};
}

auto blob_client::state() const -> impl& {
    if (!impl_) {
        throw std::runtime_error("blob client was moved from");
    }
    return *impl_;
}

auto blob_client::config() const -> const blob_config& {
    return state().config;
}

auto blob_client::execution() -> execution_context& {
    return *state().execution;
}

auto blob_client::requests() const -> const request_client& {
    return *state().requests;
}

auto blob_client::multipart() -> multipart_client {
    auto& current = state();
    return multipart_client(*current.requests, *current.execution);
}

auto blob_client::create_uploader() -> multipart_uploader {
    auto& current = state();
    return multipart_uploader(*current.requests, *current.execution, current.config.multipart);
}

// ============================================================================
// put / upload_file
// ============================================================================

auto blob_client::put(const std::string& path, blob_body body, const put_options& options)
    -> result<put_blob_result> {
    if (auto open = ensure_open(); !open) {
        return unexpected(open.error());
    }
    if (auto valid = blob_utils::validate_pathname(path); !valid) {
        return unexpected(valid.error());
    }
    auto token = impl_->requests->resolve_token(options.token);
    if (!token) {
        return unexpected(token.error());
    }

    auto headers = make_put_headers(options);
    auto size = telemetry_size(body);
    const auto threshold = impl_->config.multipart.threshold;
    bool use_multipart = options.multipart || body_length(body) > threshold;

    if (!use_multipart) {
        // Bodies of unknown length are read only far enough to pick the path
        auto prefix = read_prefix(std::move(body), static_cast<std::size_t>(threshold) + 1);
        if (!prefix) {
            return unexpected(prefix.error());
        }
        if (!prefix.value().complete || prefix.value().head.size() > threshold) {
            auto chained = chain_body(std::move(prefix.value()));
            if (!chained) {
                return unexpected(chained.error());
            }
            use_multipart = true;
            body = std::move(chained.value());
        } else {
            api_request request;
            request.method = http_method::put;
            request.path = "/";
            request.headers = headers;
            request.query = {{"pathname", path}};
            request.body = std::move(prefix.value().head);
            request.on_upload_progress = options.on_upload_progress;
            request.token = token.value();

            auto response = impl_->requests->call(std::move(request), *impl_->execution);
            if (!response) {
                return unexpected(response.error());
            }
            auto descriptor = put_blob_result::from_json(response.value());
            if (descriptor) {
                impl_->track_put(options, false, size);
            }
            return descriptor;
        }
    }

    auto uploader = create_uploader();
    auto descriptor = uploader.upload(path, std::move(body), headers, token.value(),
                                      options.on_upload_progress);
    if (descriptor) {
        impl_->track_put(options, true, size);
    }
    return descriptor;
}

auto blob_client::upload_file(const std::filesystem::path& local_path,
                              const std::string& path,
                              const put_options& options) -> result<put_blob_result> {
    if (auto open = ensure_open(); !open) {
        return unexpected(open.error());
    }
    if (local_path.empty()) {
        return unexpected(error{error_code::invalid_argument, "local_path is required"});
    }
    if (auto valid = blob_utils::validate_pathname(path); !valid) {
        return unexpected(valid.error());
    }
    if (auto token = impl_->requests->resolve_token(options.token); !token) {
        return unexpected(token.error());
    }

    std::error_code ec;
    if (!std::filesystem::exists(local_path, ec)) {
        return unexpected(error{error_code::file_not_found,
                                "local_path does not exist: " + local_path.string()});
    }
    if (!std::filesystem::is_regular_file(local_path, ec)) {
        return unexpected(error{error_code::invalid_argument,
                                "local_path is not a file: " + local_path.string()});
    }
    auto size = std::filesystem::file_size(local_path, ec);
    if (ec) {
        return unexpected(error{error_code::file_read_error,
                                "cannot stat " + local_path.string() + ": " + ec.message()});
    }

    auto stream = std::make_shared<std::ifstream>(local_path, std::ios::binary);
    if (!stream->is_open()) {
        return unexpected(error{error_code::file_read_error,
                                "cannot open " + local_path.string()});
    }

    transfer_log_context log_ctx;
    log_ctx.pathname = path;
    log_ctx.total_bytes = size;
    BLOB_LOG_INFO_CTX(log_category::file, "uploading " + local_path.string(), log_ctx);

    auto file_options = options;
    file_options.multipart = options.multipart || size > impl_->config.multipart.threshold;
    return put(path, blob_body(std::shared_ptr<std::istream>(stream)), file_options);
}

// ============================================================================
// download_file
// ============================================================================

auto blob_client::download_file(const std::string& url_or_path,
                                const std::filesystem::path& local_path,
                                const download_options& options)
    -> result<std::filesystem::path> {
    if (auto open = ensure_open(); !open) {
        return unexpected(open.error());
    }
    if (url_or_path.empty()) {
        return unexpected(error{error_code::invalid_argument, "url or pathname is required"});
    }
    if (local_path.empty()) {
        return unexpected(error{error_code::invalid_argument, "local_path is required"});
    }
    auto token = impl_->requests->resolve_token(options.token);
    if (!token) {
        return unexpected(token.error());
    }

    std::string blob_url;
    if (blob_utils::is_url(url_or_path)) {
        blob_url = url_or_path;
    } else {
        auto store_id = blob_utils::extract_store_id(token.value());
        if (store_id.empty()) {
            return unexpected(error{error_code::invalid_argument,
                                    "token carries no store id; pass a full blob URL"});
        }
        blob_url = make_blob_url(store_id, url_or_path, options.access);
    }
    auto target_url = blob_utils::set_query_param(blob_url, "download", "1");

    std::error_code ec;
    if (!options.overwrite && std::filesystem::exists(local_path, ec)) {
        return unexpected(error{error_code::file_already_exists,
                                "destination exists; set overwrite to replace it"});
    }
    if (options.create_parents && local_path.has_parent_path()) {
        std::filesystem::create_directories(local_path.parent_path(), ec);
        if (ec) {
            return unexpected(error{error_code::file_write_error,
                                    "cannot create " + local_path.parent_path().string() +
                                        ": " + ec.message()});
        }
    }

    auto temporary = local_path;
    temporary += ".part";
    auto output = std::make_shared<std::ofstream>(temporary, std::ios::binary | std::ios::trunc);
    if (!output->is_open()) {
        return unexpected(error{error_code::file_write_error,
                                "cannot open " + temporary.string() + " for writing"});
    }

    struct download_progress {
        uint64_t loaded = 0;
        std::optional<uint64_t> total;
    };
    auto progress = std::make_shared<download_progress>();
    auto on_progress = options.on_progress;

    http_request request;
    request.method = http_method::get;
    request.url = target_url;
    request.timeout = options.timeout.value_or(impl_->config.download_timeout);
    if (options.access == blob_access::private_access) {
        request.headers["authorization"] = "Bearer " + token.value();
    }
    request.on_headers = [progress](int, const std::map<std::string, std::string>& headers) {
        auto it = headers.find("content-length");
        if (it == headers.end()) {
            return;
        }
        uint64_t length = 0;
        auto [ptr, parse_ec] = std::from_chars(
            it->second.data(), it->second.data() + it->second.size(), length);
        if (parse_ec == std::errc{} && length > 0) {
            progress->total = length;
        }
    };
    request.body_sink = [output, progress, on_progress](std::span<const std::byte> data)
        -> result<void> {
        output->write(reinterpret_cast<const char*>(data.data()),
                      static_cast<std::streamsize>(data.size()));
        if (!*output) {
            return unexpected(error{error_code::file_write_error,
                                    "failed writing downloaded data"});
        }
        progress->loaded += data.size();
        if (on_progress) {
            on_progress(progress->loaded, progress->total);
        }
        return {};
    };

    auto response = send_and_wait(*impl_->transport, *impl_->execution, std::move(request));
    output->close();

    auto failed = [&temporary](error err) -> result<std::filesystem::path> {
        remove_temporary(temporary);
        return unexpected(std::move(err));
    };

    if (!response) {
        auto err = response.error();
        if (err.code == error_code::network_error) {
            err = error{error_code::unknown_error, "download failed: " + err.message};
        }
        return failed(std::move(err));
    }
    if (response.value().status_code == 404) {
        return failed(error{error_code::not_found, "blob not found: " + blob_url});
    }
    if (!response.value().is_success()) {
        return failed(classify_response(response.value()));
    }
    if (output->fail()) {
        return failed(error{error_code::file_write_error,
                            "failed to finish writing " + temporary.string()});
    }

    std::filesystem::rename(temporary, local_path, ec);
    if (ec) {
        return failed(error{error_code::file_write_error,
                            "cannot move download into place: " + ec.message()});
    }

    transfer_log_context log_ctx;
    log_ctx.pathname = local_path.string();
    log_ctx.bytes = progress->loaded;
    BLOB_LOG_INFO_CTX(log_category::file, "download completed", log_ctx);
    return local_path;
}

// ============================================================================
// get
// ============================================================================

auto blob_client::get(const std::string& url_or_path, const get_options& options)
    -> result<get_blob_result> {
    if (auto open = ensure_open(); !open) {
        return unexpected(open.error());
    }
    if (url_or_path.empty()) {
        return unexpected(error{error_code::invalid_argument, "url or pathname is required"});
    }
    auto token = impl_->requests->resolve_token(options.token);
    if (!token) {
        return unexpected(token.error());
    }

    get_blob_result blob;
    if (blob_utils::is_url(url_or_path)) {
        blob.url = url_or_path;
        blob.pathname = pathname_of(url_or_path);
    } else {
        auto relative = std::string_view(url_or_path);
        while (!relative.empty() && relative.front() == '/') {
            relative.remove_prefix(1);
        }
        blob.pathname = std::string(relative);
        auto store_id = blob_utils::extract_store_id(token.value());
        if (!store_id.empty()) {
            blob.url = make_blob_url(store_id, blob.pathname, options.access);
        } else {
            auto metadata = head(url_or_path, token.value());
            if (!metadata) {
                return unexpected(metadata.error());
            }
            blob.url = metadata.value().url;
            blob.pathname = metadata.value().pathname;
            blob.download_url = metadata.value().download_url;
        }
    }
    if (blob.download_url.empty()) {
        blob.download_url = blob_utils::set_query_param(blob.url, "download", "1");
    }
    if (!options.use_cache) {
        blob.url = blob_utils::set_query_param(blob.url, "cache", "0");
    }

    http_request request;
    request.method = http_method::get;
    request.url = blob.url;
    request.timeout = options.timeout.value_or(impl_->config.download_timeout);
    if (options.access == blob_access::private_access) {
        request.headers["authorization"] = "Bearer " + token.value();
    }
    if (options.if_none_match && !options.if_none_match->empty()) {
        request.headers["if-none-match"] = *options.if_none_match;
    }

    auto response = send_and_wait(*impl_->transport, *impl_->execution, std::move(request));
    if (!response) {
        return unexpected(response.error());
    }
    auto& answer = response.value();
    if (answer.status_code == 404) {
        return unexpected(error{error_code::not_found, "blob not found: " + blob.url});
    }
    if (answer.status_code != 304 && !answer.is_success()) {
        return unexpected(classify_response(answer));
    }

    blob.status_code = answer.status_code;
    blob.content_disposition = header_or_empty(answer, "content-disposition");
    blob.cache_control = header_or_empty(answer, "cache-control");
    blob.uploaded_at = last_modified_of(answer);
    blob.etag = header_or_empty(answer, "etag");
    if (answer.status_code == 304) {
        return blob;
    }

    blob.content_type = answer.get_header("content-type").value_or("application/octet-stream");
    blob.size = answer.body.size();
    if (auto length = answer.get_header("content-length")) {
        uint64_t declared = 0;
        auto [ptr, ec] = std::from_chars(length->data(), length->data() + length->size(), declared);
        if (ec == std::errc{}) {
            blob.size = declared;
        }
    }
    blob.content = std::move(answer.body);
    return blob;
}

// ============================================================================
// head / list
// ============================================================================

auto blob_client::head(const std::string& url_or_path, const std::optional<std::string>& token)
    -> result<head_blob_result> {
    if (auto open = ensure_open(); !open) {
        return unexpected(open.error());
    }
    if (url_or_path.empty()) {
        return unexpected(error{error_code::invalid_argument, "url or pathname is required"});
    }

    api_request request;
    request.method = http_method::get;
    request.query = {{"url", url_or_path}};
    request.token = token;

    auto response = impl_->call(std::move(request));
    if (!response) {
        return unexpected(response.error());
    }
    return head_blob_result::from_json(response.value());
}

auto blob_client::list_objects(const list_options& options) -> result<list_blob_result> {
    if (auto open = ensure_open(); !open) {
        return unexpected(open.error());
    }

    api_request request;
    request.method = http_method::get;
    if (options.limit) {
        request.query.emplace_back("limit", std::to_string(*options.limit));
    }
    if (options.prefix) {
        request.query.emplace_back("prefix", *options.prefix);
    }
    if (options.cursor) {
        request.query.emplace_back("cursor", *options.cursor);
    }
    if (options.mode) {
        request.query.emplace_back("mode", to_string(*options.mode));
    }
    request.token = options.token;

    auto response = impl_->call(std::move(request));
    if (!response) {
        return unexpected(response.error());
    }
    return list_blob_result::from_json(response.value());
}

auto blob_client::iterate_objects(const list_visitor& visitor, const iterate_options& options)
    -> result<uint64_t> {
    if (!visitor) {
        return unexpected(error{error_code::invalid_argument, "visitor is required"});
    }

    list_options page_options;
    page_options.prefix = options.prefix;
    page_options.mode = options.mode;
    page_options.cursor = options.cursor;
    page_options.token = options.token;

    uint64_t visited = 0;
    while (true) {
        page_options.limit = options.batch_size;
        if (options.limit) {
            if (visited >= *options.limit) {
                break;
            }
            auto remaining = *options.limit - visited;
            if (!page_options.limit || *page_options.limit > remaining) {
                page_options.limit = static_cast<uint32_t>(
                    std::min<uint64_t>(remaining, std::numeric_limits<uint32_t>::max()));
            }
        }

        auto page = list_objects(page_options);
        if (!page) {
            return unexpected(page.error());
        }
        for (const auto& item : page.value().blobs) {
            ++visited;
            if (!visitor(item)) {
                return visited;
            }
            if (options.limit && visited >= *options.limit) {
                return visited;
            }
        }

        page_options.cursor = page.value().next_cursor();
        if (!page_options.cursor) {
            break;
        }
    }
    return visited;
}

// ============================================================================
// delete / copy / create_folder
// ============================================================================

auto blob_client::delete_object(const std::string& url_or_path,
                                const std::optional<std::string>& token) -> result<void> {
    auto deleted = delete_objects({url_or_path}, token);
    if (!deleted) {
        return unexpected(deleted.error());
    }
    return {};
}

auto blob_client::delete_objects(const std::vector<std::string>& urls_or_paths,
                                 const std::optional<std::string>& token)
    -> result<std::size_t> {
    if (auto open = ensure_open(); !open) {
        return unexpected(open.error());
    }
    if (urls_or_paths.empty()) {
        return unexpected(error{error_code::invalid_argument, "nothing to delete"});
    }

    Json::Value urls(Json::arrayValue);
    for (const auto& url : urls_or_paths) {
        if (url.empty()) {
            return unexpected(error{error_code::invalid_argument,
                                    "an empty url or pathname cannot be deleted"});
        }
        urls.append(url);
    }
    Json::Value body(Json::objectValue);
    body["urls"] = urls;

    api_request request;
    request.method = http_method::post;
    request.path = "/delete";
    request.headers["content-type"] = "application/json";
    request.body = to_bytes(write_json(body));
    request.decode = decode_mode::none;
    request.token = token;

    auto response = impl_->call(std::move(request));
    if (!response) {
        return unexpected(response.error());
    }

    telemetry_event event;
    event.name = "blob_delete";
    event.attributes["count"] = std::to_string(urls_or_paths.size());
    emit_telemetry(impl_->telemetry.get(), event);

    BLOB_LOG_DEBUG(log_category::client,
                   "deleted " + std::to_string(urls_or_paths.size()) + " blob(s)");
    return urls_or_paths.size();
}

auto blob_client::copy_object(const std::string& source,
                              const std::string& destination,
                              const copy_options& options) -> result<put_blob_result> {
    if (auto open = ensure_open(); !open) {
        return unexpected(open.error());
    }
    if (source.empty()) {
        return unexpected(error{error_code::invalid_argument, "copy source is required"});
    }
    if (auto valid = blob_utils::validate_pathname(destination); !valid) {
        return unexpected(valid.error());
    }
    auto token = impl_->requests->resolve_token(options.token);
    if (!token) {
        return unexpected(token.error());
    }

    auto source_url = source;
    if (!blob_utils::is_url(source_url)) {
        auto metadata = head(source, token.value());
        if (!metadata) {
            return unexpected(metadata.error());
        }
        source_url = metadata.value().url;
    }

    api_request request;
    request.method = http_method::put;
    request.headers = make_put_headers(options);
    request.query = {{"pathname", destination}, {"fromUrl", source_url}};
    request.token = token.value();

    auto response = impl_->call(std::move(request));
    if (!response) {
        return unexpected(response.error());
    }
    return put_blob_result::from_json(response.value());
}

auto blob_client::create_folder(const std::string& path, const create_folder_options& options)
    -> result<create_folder_result> {
    if (auto open = ensure_open(); !open) {
        return unexpected(open.error());
    }
    if (path.empty()) {
        return unexpected(error{error_code::invalid_argument, "folder path is required"});
    }
    auto folder = path;
    if (folder.back() != '/') {
        folder += '/';
    }
    if (auto valid = blob_utils::validate_pathname(folder); !valid) {
        return unexpected(valid.error());
    }

    put_options marker;
    marker.allow_overwrite = options.allow_overwrite;

    api_request request;
    request.method = http_method::put;
    request.headers = make_put_headers(marker);
    request.query = {{"pathname", folder}};
    request.token = options.token;

    auto response = impl_->call(std::move(request));
    if (!response) {
        return unexpected(response.error());
    }
    return create_folder_result::from_json(response.value());
}

}  // namespace kcenon::blob
