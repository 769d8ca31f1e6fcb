/**
 * @file multipart_client.cpp
 * @brief create / upload / complete calls against /mpu
 */

#include <kcenon/blob/multipart/multipart_client.h>

#include <kcenon/blob/core/blob_utils.h>
#include <kcenon/blob/core/logging.h>
#include <kcenon/blob/multipart/completion_assembler.h>

#include <mutex>

namespace kcenon::blob {

namespace {

constexpr const char* mpu_path = "/mpu";

auto required_string(const Json::Value& value, const char* name) -> std::optional<std::string> {
    if (value.isObject() && value.isMember(name) && value[name].isString()) {
        return value[name].asString();
    }
    return std::nullopt;
}

}  // namespace

auto make_multipart_headers(const std::map<std::string, std::string>& put_headers,
                            const std::string& action,
                            const std::optional<std::string>& key,
                            const std::optional<std::string>& upload_id,
                            std::optional<uint32_t> part_number)
    -> std::map<std::string, std::string> {
    auto headers = put_headers;
    headers["x-mpu-action"] = action;
    if (key) {
        headers["x-mpu-key"] = blob_utils::url_encode(*key, true);
    }
    if (upload_id) {
        headers["x-mpu-upload-id"] = *upload_id;
    }
    if (part_number) {
        headers["x-mpu-part-number"] = std::to_string(*part_number);
    }
    return headers;
}

multipart_client::multipart_client(const request_client& requests, execution_context& ctx)
    : requests_(requests), ctx_(ctx) {}

auto multipart_client::create_multipart_upload(const std::string& path,
                                               const std::map<std::string, std::string>& headers,
                                               const std::optional<std::string>& token)
    -> result<multipart_session> {
    api_request request;
    request.method = http_method::post;
    request.path = mpu_path;
    request.headers = make_multipart_headers(headers, "create");
    request.query = {{"pathname", path}};
    request.token = token;

    auto response = requests_.call(std::move(request), ctx_);
    if (!response) {
        return unexpected(response.error());
    }

    auto upload_id = required_string(response.value(), "uploadId");
    auto key = required_string(response.value(), "key");
    if (!upload_id || !key) {
        return unexpected(error{error_code::invalid_response_json,
                                "create multipart upload response lacks uploadId or key"});
    }

    transfer_log_context log_ctx;
    log_ctx.pathname = path;
    log_ctx.upload_id = *upload_id;
    BLOB_LOG_INFO_CTX(log_category::multipart, "multipart upload created", log_ctx);

    return multipart_session{*upload_id, *key, path, headers, token};
}

void multipart_client::upload_part_async(const multipart_session& session,
                                         uint32_t part_number,
                                         byte_buffer body,
                                         upload_progress_callback on_progress,
                                         part_completion on_complete) {
    api_request request;
    request.method = http_method::post;
    request.path = mpu_path;
    request.headers = make_multipart_headers(session.headers, "upload", session.key,
                                             session.upload_id, part_number);
    request.query = {{"pathname", session.path}};
    request.body = std::move(body);
    request.on_upload_progress = std::move(on_progress);
    request.token = session.token;

    requests_.issue(
        std::move(request), ctx_,
        [part_number, on_complete = std::move(on_complete)](result<Json::Value> response) {
            if (!response) {
                on_complete(unexpected(response.error()));
                return;
            }
            auto etag = required_string(response.value(), "etag");
            if (!etag) {
                on_complete(unexpected(error{error_code::invalid_response_json,
                                             "upload part response lacks etag"}));
                return;
            }
            on_complete(part_result{part_number, *etag});
        });
}

auto multipart_client::upload_part(const multipart_session& session,
                                   uint32_t part_number,
                                   byte_buffer body,
                                   upload_progress_callback on_progress)
    -> result<part_result> {
    struct slot {
        std::mutex mutex;
        std::optional<result<part_result>> outcome;
    };
    auto outcome_slot = std::make_shared<slot>();
    auto& ctx = ctx_;

    upload_part_async(session, part_number, std::move(body), std::move(on_progress),
                      [outcome_slot, &ctx](result<part_result> outcome) {
                          {
                              std::lock_guard<std::mutex> lock(outcome_slot->mutex);
                              outcome_slot->outcome = std::move(outcome);
                          }
                          ctx.notify();
                      });

    auto waited = ctx_.wait_until([&outcome_slot] {
        std::lock_guard<std::mutex> lock(outcome_slot->mutex);
        return outcome_slot->outcome.has_value();
    });
    if (!waited) {
        return unexpected(waited.error());
    }

    std::lock_guard<std::mutex> lock(outcome_slot->mutex);
    return std::move(*outcome_slot->outcome);
}

auto multipart_client::complete_multipart_upload(const multipart_session& session,
                                                 std::vector<part_result> parts)
    -> result<put_blob_result> {
    completion_assembler assembler(requests_, ctx_);
    return assembler.complete(session, std::move(parts));
}

}  // namespace kcenon::blob
