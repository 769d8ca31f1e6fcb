/**
 * @file multipart_client.h
 * @brief The three multipart API calls
 *
 * Usable directly by callers that drive parts themselves:
 *
 * @code
 * multipart_client mpu(requests, ctx);
 * auto session = mpu.create_multipart_upload("videos/a.mp4", headers);
 * auto part1 = mpu.upload_part(session.value(), 1, first_chunk);
 * auto part2 = mpu.upload_part(session.value(), 2, last_chunk);
 * auto blob = mpu.complete_multipart_upload(session.value(),
 *                                           {part1.value(), part2.value()});
 * @endcode
 */

#ifndef KCENON_BLOB_MULTIPART_MULTIPART_CLIENT_H
#define KCENON_BLOB_MULTIPART_MULTIPART_CLIENT_H

#include <kcenon/blob/client/blob_types.h>
#include <kcenon/blob/client/request_client.h>
#include <kcenon/blob/multipart/multipart_session.h>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::blob {

using part_completion = std::function<void(result<part_result>)>;

/**
 * @brief Multipart calls on top of request_client
 *
 * Both references must outlive the client and any part upload it started.
 */
class multipart_client {
public:
    multipart_client(const request_client& requests, execution_context& ctx);

    /**
     * @brief POST /mpu with x-mpu-action: create
     */
    [[nodiscard]] auto create_multipart_upload(const std::string& path,
                                               const std::map<std::string, std::string>& headers,
                                               const std::optional<std::string>& token = {})
        -> result<multipart_session>;

    /**
     * @brief Upload one part without blocking on the outcome
     */
    void upload_part_async(const multipart_session& session,
                           uint32_t part_number,
                           byte_buffer body,
                           upload_progress_callback on_progress,
                           part_completion on_complete);

    /**
     * @brief Upload one part and wait for its etag
     */
    [[nodiscard]] auto upload_part(const multipart_session& session,
                                   uint32_t part_number,
                                   byte_buffer body,
                                   upload_progress_callback on_progress = {})
        -> result<part_result>;

    /**
     * @brief POST /mpu with x-mpu-action: complete
     *
     * Parts are sent sorted by part number whatever order they are given in.
     */
    [[nodiscard]] auto complete_multipart_upload(const multipart_session& session,
                                                 std::vector<part_result> parts)
        -> result<put_blob_result>;

    [[nodiscard]] auto context() -> execution_context& { return ctx_; }

private:
    const request_client& requests_;
    execution_context& ctx_;
};

/**
 * @brief Headers of one multipart call: the session's put headers plus the
 *        x-mpu-* set for the action
 */
[[nodiscard]] auto make_multipart_headers(const std::map<std::string, std::string>& put_headers,
                                          const std::string& action,
                                          const std::optional<std::string>& key = {},
                                          const std::optional<std::string>& upload_id = {},
                                          std::optional<uint32_t> part_number = {})
    -> std::map<std::string, std::string>;

}  // namespace kcenon::blob

#endif  // KCENON_BLOB_MULTIPART_MULTIPART_CLIENT_H
