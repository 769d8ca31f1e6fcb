/**
 * @file multipart_uploader.cpp
 * @brief Multipart orchestration
 */

#include <kcenon/blob/multipart/multipart_uploader.h>

#include <kcenon/blob/core/logging.h>
#include <kcenon/blob/multipart/completion_assembler.h>
#include <kcenon/blob/multipart/multipart_client.h>
#include <kcenon/blob/multipart/upload_scheduler.h>

namespace kcenon::blob {

multipart_uploader::multipart_uploader(const request_client& requests,
                                       execution_context& ctx,
                                       multipart_config config)
    : requests_(requests), ctx_(ctx), config_(config) {}

void multipart_uploader::set_observer(upload_state_observer observer) {
    observer_ = std::move(observer);
}

void multipart_uploader::transition(upload_state next) {
    auto previous = state_;
    state_ = next;
    BLOB_LOG_DEBUG(log_category::multipart,
                   std::string("upload state ") + to_string(previous) + " -> " + to_string(next));
    if (observer_) {
        observer_(previous, next);
    }
}

auto multipart_uploader::fail(const error& err) -> result<put_blob_result> {
    transfer_log_context log_ctx;
    if (session_) {
        log_ctx.pathname = session_->path;
        log_ctx.upload_id = session_->upload_id;
    }
    log_ctx.error_message = err.message;
    BLOB_LOG_ERROR_CTX(log_category::multipart,
                       std::string("multipart upload failed in state ") + to_string(state_),
                       log_ctx);
    transition(upload_state::failed);
    return unexpected(err);
}

auto multipart_uploader::upload(const std::string& path,
                                blob_body body,
                                const std::map<std::string, std::string>& headers,
                                const std::optional<std::string>& token,
                                upload_progress_callback on_progress)
    -> result<put_blob_result> {
    state_ = upload_state::created;
    session_.reset();

    if (auto valid = config_.validate(); !valid) {
        return fail(valid.error());
    }

    auto total = body_length(body);
    auto source = chunk_source::create(std::move(body), config_.part_size);
    if (!source) {
        return fail(source.error());
    }

    auto client = std::make_shared<multipart_client>(requests_, ctx_);

    // created
    auto session = client->create_multipart_upload(path, headers, token);
    if (!session) {
        return fail(session.error());
    }
    session_ = session.value();

    // uploading_parts
    transition(upload_state::uploading_parts);
    upload_scheduler scheduler(
        ctx_, scheduler_options{config_.max_concurrent_parts, config_.deadline});
    auto parts = scheduler.run(
        *session_, source.value(), total, std::move(on_progress),
        [client](const multipart_session& part_session,
                 uint32_t part_number,
                 byte_buffer part_body,
                 upload_progress_callback on_part_progress,
                 std::function<void(result<part_result>)> on_complete) {
            client->upload_part_async(part_session, part_number, std::move(part_body),
                                      std::move(on_part_progress), std::move(on_complete));
        });
    if (!parts) {
        return fail(parts.error());
    }

    // completing
    transition(upload_state::completing);
    completion_assembler assembler(requests_, ctx_);
    auto descriptor = assembler.complete(*session_, std::move(parts.value()));
    if (!descriptor) {
        return fail(descriptor.error());
    }

    transition(upload_state::done);

    transfer_log_context log_ctx;
    log_ctx.pathname = path;
    log_ctx.upload_id = session_->upload_id;
    log_ctx.bytes = total;
    BLOB_LOG_INFO_CTX(log_category::multipart, "multipart upload completed", log_ctx);
    return descriptor;
}

}  // namespace kcenon::blob
