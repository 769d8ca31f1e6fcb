/**
 * @file fake_blob_service.h
 * @brief In-memory blob service behind the http_transport interface
 *
 * Answers create / upload / complete multipart calls, single PUTs, GET
 * downloads and the store operations (head, list, delete, copy, folder
 * creation) over an in-memory map of pathnames. Responses can be scripted per
 * route to inject failures.
 */

#ifndef KCENON_BLOB_TESTS_SUPPORT_FAKE_BLOB_SERVICE_H
#define KCENON_BLOB_TESTS_SUPPORT_FAKE_BLOB_SERVICE_H

#include <kcenon/blob/core/blob_utils.h>
#include <kcenon/blob/core/chunk_source.h>
#include <kcenon/blob/transport/transport_interface.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <json/json.h>

#include <algorithm>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace kcenon::blob::test {

/**
 * @brief Request as seen by the fake service
 */
struct recorded_request {
    http_method method = http_method::get;
    std::string url;
    std::vector<std::pair<std::string, std::string>> query;
    std::map<std::string, std::string> headers;
    std::string body;

    [[nodiscard]] auto header(const std::string& name) const -> std::string {
        auto it = headers.find(name);
        return it == headers.end() ? std::string{} : it->second;
    }

    [[nodiscard]] auto query_value(const std::string& name) const -> std::string {
        for (const auto& [key, value] : query) {
            if (key == name) return value;
        }
        return {};
    }
};

/**
 * @brief Response injected in place of the normal answer
 */
struct scripted_response {
    int status_code = 200;
    std::string body;
    std::map<std::string, std::string> headers;

    /// Report a transport failure instead of any response
    bool network_failure = false;

    static auto service_error(int status, const std::string& code,
                              const std::string& message = "scripted failure")
        -> scripted_response {
        scripted_response response;
        response.status_code = status;
        response.body = R"({"error":{"code":")" + code + R"(","message":")" + message + R"("}})";
        response.headers["content-type"] = "application/json";
        return response;
    }

    static auto transport_failure() -> scripted_response {
        scripted_response response;
        response.network_failure = true;
        return response;
    }
};

class fake_blob_service : public http_transport {
public:
    /**
     * @brief Blocking service; answers before send() returns
     */
    fake_blob_service() = default;

    /**
     * @brief Asynchronous service; answers from handlers posted to io
     */
    explicit fake_blob_service(boost::asio::io_context& io) : io_(&io) {}

    [[nodiscard]] auto is_blocking() const -> bool override { return io_ == nullptr; }

    // ------------------------------------------------------------------------
    // Scripting
    // ------------------------------------------------------------------------

    /**
     * @brief Queue a response for the next call on route
     *
     * Routes are "create", "upload", "complete", "put", "get", "head",
     * "list", "delete", "copy" and "folder".
     */
    void script(const std::string& route, scripted_response response) {
        std::lock_guard<std::mutex> lock(mutex_);
        scripts_[route].push_back(std::move(response));
    }

    /**
     * @brief Answer every upload of part_number with response
     */
    void fail_part(uint32_t part_number, scripted_response response) {
        std::lock_guard<std::mutex> lock(mutex_);
        part_failures_[part_number] = std::move(response);
    }

    /**
     * @brief Hold each part upload for delay before answering
     */
    void set_upload_delay(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        upload_delay_ = delay;
    }

    /**
     * @brief Make url downloadable with content
     *
     * headers are sent with the content; a request whose if-none-match equals
     * the etag header gets 304.
     */
    void add_download(const std::string& url, std::string content,
                      std::map<std::string, std::string> headers = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        downloads_[url] = std::move(content);
        download_headers_[url] = std::move(headers);
    }

    /**
     * @brief Store a blob as if it had been uploaded
     */
    void add_blob(const std::string& pathname, std::string content) {
        std::lock_guard<std::mutex> lock(mutex_);
        stored_[pathname] = std::move(content);
    }

    /**
     * @brief Call observer with every request as it arrives
     */
    void set_request_observer(std::function<void(const recorded_request&)> observer) {
        std::lock_guard<std::mutex> lock(mutex_);
        observer_ = std::move(observer);
    }

    /**
     * @brief Omit content-type from JSON answers
     */
    void set_omit_content_type(bool omit) {
        std::lock_guard<std::mutex> lock(mutex_);
        omit_content_type_ = omit;
    }

    // ------------------------------------------------------------------------
    // Inspection
    // ------------------------------------------------------------------------

    [[nodiscard]] auto requests() const -> std::vector<recorded_request> {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    [[nodiscard]] auto requests_for(const std::string& route) const
        -> std::vector<recorded_request> {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<recorded_request> matching;
        for (const auto& request : requests_) {
            if (route_of(request) == route) matching.push_back(request);
        }
        return matching;
    }

    [[nodiscard]] auto max_concurrent_uploads() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return max_uploads_in_flight_;
    }

    /**
     * @brief Part payloads received, by part number
     */
    [[nodiscard]] auto parts() const -> std::map<uint32_t, std::string> {
        std::lock_guard<std::mutex> lock(mutex_);
        return parts_;
    }

    /**
     * @brief Body of the last completion request, parsed
     */
    [[nodiscard]] auto completed_parts() const -> Json::Value {
        std::lock_guard<std::mutex> lock(mutex_);
        return completed_parts_;
    }

    /**
     * @brief Stored blobs by pathname
     */
    [[nodiscard]] auto stored() const -> std::map<std::string, std::string> {
        std::lock_guard<std::mutex> lock(mutex_);
        return stored_;
    }

    // ------------------------------------------------------------------------
    // http_transport
    // ------------------------------------------------------------------------

    void send(http_request request,
              send_progress_handler on_progress,
              response_handler on_complete) override {
        recorded_request seen;
        seen.method = request.method;
        seen.url = request.url;
        seen.query = request.query;
        seen.headers = request.headers;
        seen.body.assign(reinterpret_cast<const char*>(request.body.data()), request.body.size());

        auto route = route_of(seen);
        std::chrono::milliseconds delay{0};
        std::function<void(const recorded_request&)> observer;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(seen);
            observer = observer_;
            if (route == "upload") {
                ++uploads_in_flight_;
                max_uploads_in_flight_ = std::max(max_uploads_in_flight_, uploads_in_flight_);
                delay = upload_delay_;
            }
        }
        if (observer) {
            observer(seen);
        }

        auto respond = [this, seen, route, request = std::move(request),
                        on_progress = std::move(on_progress),
                        on_complete = std::move(on_complete)]() mutable {
            if (on_progress && !seen.body.empty()) {
                on_progress(seen.body.size() / 2);
                on_progress(seen.body.size());
            }
            auto outcome = answer(route, seen, request);
            if (route == "upload") {
                std::lock_guard<std::mutex> lock(mutex_);
                --uploads_in_flight_;
            }
            on_complete(std::move(outcome));
        };

        if (io_ == nullptr) {
            if (delay.count() > 0) {
                std::this_thread::sleep_for(delay);
            }
            respond();
            return;
        }

        if (delay.count() > 0) {
            auto timer = std::make_shared<boost::asio::steady_timer>(*io_, delay);
            timer->async_wait([timer, respond = std::move(respond)](
                                  const boost::system::error_code&) mutable { respond(); });
            return;
        }
        boost::asio::post(*io_, std::move(respond));
    }

private:
    static auto route_of(const recorded_request& request) -> std::string {
        if (request.method == http_method::get) {
            // Blob reads go straight to the blob host without API headers
            if (request.header("x-api-version").empty()) return "get";
            return request.query_value("url").empty() ? "list" : "head";
        }
        auto action = request.header("x-mpu-action");
        if (!action.empty()) return action;
        constexpr std::string_view delete_path = "/delete";
        if (request.method == http_method::post && request.url.size() >= delete_path.size() &&
            request.url.compare(request.url.size() - delete_path.size(), delete_path.size(),
                                delete_path) == 0) {
            return "delete";
        }
        if (!request.query_value("fromUrl").empty()) return "copy";
        auto pathname = request.query_value("pathname");
        if (!pathname.empty() && pathname.back() == '/') return "folder";
        return "put";
    }

    static auto pathname_from(const std::string& url_or_path) -> std::string {
        if (!blob_utils::is_url(url_or_path)) {
            return url_or_path;
        }
        auto start = url_or_path.find('/', url_or_path.find("://") + 3);
        if (start == std::string::npos) return {};
        auto end = url_or_path.find('?', start);
        return url_or_path.substr(start + 1,
                                  end == std::string::npos ? std::string::npos : end - start - 1);
    }

    static auto parse_json(const std::string& text, Json::Value& value) -> bool {
        Json::CharReaderBuilder reader;
        std::istringstream stream(text);
        std::string errors;
        return Json::parseFromStream(reader, stream, &value, &errors);
    }

    auto not_found() -> http_response {
        Json::Value value(Json::objectValue);
        value["error"]["code"] = "not_found";
        value["error"]["message"] = "The requested blob does not exist";
        return json_response(404, value);
    }

    auto list_page(const recorded_request& seen) -> http_response {
        auto prefix = seen.query_value("prefix");
        auto folded = seen.query_value("mode") == "folded";
        std::size_t limit = 1000;
        if (auto text = seen.query_value("limit"); !text.empty()) limit = std::stoul(text);
        std::size_t start = 0;
        if (auto text = seen.query_value("cursor"); !text.empty()) start = std::stoul(text);

        std::vector<std::string> matching;
        std::vector<std::string> folders;
        for (const auto& [pathname, content] : stored_) {
            if (pathname.compare(0, prefix.size(), prefix) != 0) continue;
            if (folded) {
                auto slash = pathname.find('/', prefix.size());
                if (slash != std::string::npos && slash + 1 < pathname.size()) {
                    auto folder = pathname.substr(0, slash + 1);
                    if (std::find(folders.begin(), folders.end(), folder) == folders.end()) {
                        folders.push_back(folder);
                    }
                    continue;
                }
            }
            matching.push_back(pathname);
        }

        Json::Value value(Json::objectValue);
        value["blobs"] = Json::Value(Json::arrayValue);
        auto end = std::min(matching.size(), start + limit);
        for (auto index = start; index < end; ++index) {
            Json::Value item = descriptor(matching[index]);
            item["size"] = static_cast<Json::UInt64>(stored_[matching[index]].size());
            item["uploadedAt"] = "2024-05-01T10:20:30.000Z";
            value["blobs"].append(item);
        }
        value["hasMore"] = end < matching.size();
        if (end < matching.size()) {
            value["cursor"] = std::to_string(end);
        }
        if (folded) {
            value["folders"] = Json::Value(Json::arrayValue);
            for (const auto& folder : folders) value["folders"].append(folder);
        }
        return json_response(200, value);
    }

    auto json_response(int status, const Json::Value& value) -> http_response {
        Json::StreamWriterBuilder writer;
        writer["indentation"] = "";
        http_response response;
        response.status_code = status;
        if (!omit_content_type_) {
            response.headers["content-type"] = "application/json; charset=utf-8";
        }
        response.body = to_bytes(Json::writeString(writer, value));
        return response;
    }

    static auto descriptor(const std::string& pathname) -> Json::Value {
        Json::Value value(Json::objectValue);
        value["url"] = "https://store.public.blob.vercel-storage.com/" + pathname;
        value["downloadUrl"] = "https://store.public.blob.vercel-storage.com/" + pathname +
                               "?download=1";
        value["pathname"] = pathname;
        value["contentType"] = "application/octet-stream";
        value["contentDisposition"] = "attachment; filename=\"" + pathname + "\"";
        value["etag"] = "\"blob-etag\"";
        return value;
    }

    auto answer(const std::string& route, const recorded_request& seen,
                const http_request& request) -> result<http_response> {
        std::lock_guard<std::mutex> lock(mutex_);

        std::optional<scripted_response> scripted;
        if (route == "upload") {
            auto part = static_cast<uint32_t>(std::stoul(seen.header("x-mpu-part-number")));
            if (auto it = part_failures_.find(part); it != part_failures_.end()) {
                scripted = it->second;
            }
        }
        if (!scripted) {
            auto& queue = scripts_[route];
            if (!queue.empty()) {
                scripted = std::move(queue.front());
                queue.pop_front();
            }
        }
        if (scripted) {
            if (scripted->network_failure) {
                return unexpected(error{error_code::network_error, "connection reset"});
            }
            http_response response;
            response.status_code = scripted->status_code;
            response.headers = scripted->headers;
            response.body = to_bytes(scripted->body);
            return response;
        }

        auto pathname = seen.query_value("pathname");
        if (route == "create") {
            Json::Value value(Json::objectValue);
            value["uploadId"] = "upload-" + std::to_string(++upload_counter_);
            value["key"] = "key/" + pathname;
            return json_response(200, value);
        }
        if (route == "upload") {
            auto part = static_cast<uint32_t>(std::stoul(seen.header("x-mpu-part-number")));
            parts_[part] = seen.body;
            Json::Value value(Json::objectValue);
            value["etag"] = "etag-" + std::to_string(part);
            return json_response(200, value);
        }
        if (route == "complete") {
            Json::Value body;
            if (!parse_json(seen.body, body)) {
                return json_response(400, Json::Value(Json::objectValue));
            }
            completed_parts_ = body;
            std::string assembled;
            for (const auto& entry : body) {
                auto part = entry["partNumber"].asUInt();
                if (auto it = parts_.find(part); it != parts_.end()) {
                    assembled += it->second;
                }
            }
            stored_[pathname] = assembled;
            return json_response(200, descriptor(pathname));
        }
        if (route == "put") {
            stored_[pathname] = seen.body;
            return json_response(200, descriptor(pathname));
        }
        if (route == "folder") {
            stored_[pathname] = "";
            Json::Value value(Json::objectValue);
            value["pathname"] = pathname;
            value["url"] = descriptor(pathname)["url"];
            return json_response(200, value);
        }
        if (route == "copy") {
            auto source = stored_.find(pathname_from(seen.query_value("fromUrl")));
            if (source == stored_.end()) return not_found();
            stored_[pathname] = source->second;
            return json_response(200, descriptor(pathname));
        }
        if (route == "head") {
            auto blob = stored_.find(pathname_from(seen.query_value("url")));
            if (blob == stored_.end()) return not_found();
            Json::Value value = descriptor(blob->first);
            value["size"] = static_cast<Json::UInt64>(blob->second.size());
            value["uploadedAt"] = "2024-05-01T10:20:30.000Z";
            value["cacheControl"] = "public, max-age=2592000";
            return json_response(200, value);
        }
        if (route == "list") {
            return list_page(seen);
        }
        if (route == "delete") {
            Json::Value body;
            if (!parse_json(seen.body, body) || !body["urls"].isArray()) {
                return json_response(400, Json::Value(Json::objectValue));
            }
            for (const auto& url : body["urls"]) {
                stored_.erase(pathname_from(url.asString()));
            }
            http_response response;
            response.status_code = 200;
            return response;
        }

        // get
        auto base = seen.url.substr(0, seen.url.find('?'));
        auto it = downloads_.find(base);
        if (it == downloads_.end()) {
            http_response missing;
            missing.status_code = 404;
            return missing;
        }
        http_response response;
        response.status_code = 200;
        response.headers["content-length"] = std::to_string(it->second.size());
        response.headers["content-type"] = "application/octet-stream";
        for (const auto& [name, value] : download_headers_[base]) {
            response.headers[name] = value;
        }
        auto etag = response.headers.find("etag");
        if (etag != response.headers.end() && !seen.header("if-none-match").empty() &&
            seen.header("if-none-match") == etag->second) {
            http_response unchanged;
            unchanged.status_code = 304;
            unchanged.headers = response.headers;
            unchanged.headers.erase("content-length");
            unchanged.headers.erase("content-type");
            return unchanged;
        }
        if (request.on_headers) {
            request.on_headers(response.status_code, response.headers);
        }
        auto bytes = to_bytes(it->second);
        if (request.body_sink) {
            std::size_t offset = 0;
            constexpr std::size_t slice = 1024;
            while (offset < bytes.size()) {
                auto count = std::min(slice, bytes.size() - offset);
                auto sunk = request.body_sink(
                    std::span<const std::byte>(bytes.data() + offset, count));
                if (!sunk) {
                    return unexpected(sunk.error());
                }
                offset += count;
            }
        } else {
            response.body = std::move(bytes);
        }
        return response;
    }

    boost::asio::io_context* io_ = nullptr;

    mutable std::mutex mutex_;
    std::vector<recorded_request> requests_;
    std::map<std::string, std::deque<scripted_response>> scripts_;
    std::map<uint32_t, scripted_response> part_failures_;
    std::map<std::string, std::string> downloads_;
    std::map<std::string, std::map<std::string, std::string>> download_headers_;
    std::map<uint32_t, std::string> parts_;
    std::map<std::string, std::string> stored_;
    Json::Value completed_parts_;
    std::function<void(const recorded_request&)> observer_;
    std::chrono::milliseconds upload_delay_{0};
    std::size_t uploads_in_flight_ = 0;
    std::size_t max_uploads_in_flight_ = 0;
    uint64_t upload_counter_ = 0;
    bool omit_content_type_ = false;
};

}  // namespace kcenon::blob::test

#endif  // KCENON_BLOB_TESTS_SUPPORT_FAKE_BLOB_SERVICE_H
