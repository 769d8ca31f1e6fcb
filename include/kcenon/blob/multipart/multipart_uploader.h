/**
 * @file multipart_uploader.h
 * @brief create -> upload parts -> complete state machine
 */

#ifndef KCENON_BLOB_MULTIPART_MULTIPART_UPLOADER_H
#define KCENON_BLOB_MULTIPART_MULTIPART_UPLOADER_H

#include <kcenon/blob/client/blob_types.h>
#include <kcenon/blob/client/request_client.h>
#include <kcenon/blob/core/blob_config.h>
#include <kcenon/blob/core/chunk_source.h>
#include <kcenon/blob/multipart/multipart_session.h>

#include <functional>
#include <map>
#include <optional>
#include <string>

namespace kcenon::blob {

/**
 * @brief Orchestrator states
 */
enum class upload_state {
    created,
    uploading_parts,
    completing,
    done,
    failed,
};

[[nodiscard]] constexpr auto to_string(upload_state state) -> const char* {
    switch (state) {
        case upload_state::created: return "created";
        case upload_state::uploading_parts: return "uploading_parts";
        case upload_state::completing: return "completing";
        case upload_state::done: return "done";
        case upload_state::failed: return "failed";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto is_terminal(upload_state state) -> bool {
    return state == upload_state::done || state == upload_state::failed;
}

/**
 * @brief Observes state transitions (from, to)
 */
using upload_state_observer = std::function<void(upload_state from, upload_state to)>;

/**
 * @brief Runs one multipart upload from an arbitrary body
 *
 * No abort call is issued on failure; the service expires abandoned uploads.
 */
class multipart_uploader {
public:
    multipart_uploader(const request_client& requests,
                       execution_context& ctx,
                       multipart_config config);

    void set_observer(upload_state_observer observer);

    /**
     * @brief Upload body to path
     * @param headers Put headers for every multipart call
     */
    [[nodiscard]] auto upload(const std::string& path,
                              blob_body body,
                              const std::map<std::string, std::string>& headers,
                              const std::optional<std::string>& token = {},
                              upload_progress_callback on_progress = {})
        -> result<put_blob_result>;

    [[nodiscard]] auto state() const -> upload_state { return state_; }

    /**
     * @brief Session of the current or last upload, once created
     */
    [[nodiscard]] auto session() const -> const std::optional<multipart_session>& {
        return session_;
    }

private:
    void transition(upload_state next);
    auto fail(const error& err) -> result<put_blob_result>;

    const request_client& requests_;
    execution_context& ctx_;
    multipart_config config_;
    upload_state_observer observer_;
    upload_state state_ = upload_state::created;
    std::optional<multipart_session> session_;
};

}  // namespace kcenon::blob

#endif  // KCENON_BLOB_MULTIPART_MULTIPART_UPLOADER_H
