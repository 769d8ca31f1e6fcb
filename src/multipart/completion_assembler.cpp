/**
 * @file completion_assembler.cpp
 * @brief Multipart completion
 */

#include <kcenon/blob/multipart/completion_assembler.h>

#include <kcenon/blob/client/response_classifier.h>
#include <kcenon/blob/core/logging.h>
#include <kcenon/blob/multipart/multipart_client.h>

#include <algorithm>

namespace kcenon::blob {

auto order_parts(std::vector<part_result> parts) -> std::vector<part_result> {
    std::sort(parts.begin(), parts.end(), [](const part_result& a, const part_result& b) {
        return a.part_number < b.part_number;
    });
    return parts;
}

auto make_completion_body(const std::vector<part_result>& ordered_parts) -> byte_buffer {
    Json::Value body(Json::arrayValue);
    for (const auto& part : ordered_parts) {
        Json::Value entry(Json::objectValue);
        entry["partNumber"] = part.part_number;
        entry["etag"] = part.etag;
        body.append(entry);
    }
    return to_bytes(write_json(body));
}

completion_assembler::completion_assembler(const request_client& requests,
                                           execution_context& ctx)
    : requests_(requests), ctx_(ctx) {}

auto completion_assembler::complete(const multipart_session& session,
                                    std::vector<part_result> parts)
    -> result<put_blob_result> {
    auto ordered = order_parts(std::move(parts));

    api_request request;
    request.method = http_method::post;
    request.path = "/mpu";
    request.headers = make_multipart_headers(session.headers, "complete", session.key,
                                             session.upload_id);
    request.headers["content-type"] = "application/json";
    request.query = {{"pathname", session.path}};
    request.body = make_completion_body(ordered);
    request.token = session.token;

    transfer_log_context log_ctx;
    log_ctx.pathname = session.path;
    log_ctx.upload_id = session.upload_id;
    log_ctx.part_number = static_cast<uint32_t>(ordered.size());
    BLOB_LOG_DEBUG_CTX(log_category::multipart, "completing multipart upload", log_ctx);

    auto response = requests_.call(std::move(request), ctx_);
    if (!response) {
        return unexpected(response.error());
    }
    return put_blob_result::from_json(response.value());
}

}  // namespace kcenon::blob
