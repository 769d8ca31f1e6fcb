/**
 * @file completion_assembler.h
 * @brief Orders part results and finalizes a multipart upload
 */

#ifndef KCENON_BLOB_MULTIPART_COMPLETION_ASSEMBLER_H
#define KCENON_BLOB_MULTIPART_COMPLETION_ASSEMBLER_H

#include <kcenon/blob/client/blob_types.h>
#include <kcenon/blob/client/request_client.h>
#include <kcenon/blob/multipart/multipart_session.h>

#include <vector>

namespace kcenon::blob {

/**
 * @brief Sort part results ascending by part number
 */
[[nodiscard]] auto order_parts(std::vector<part_result> parts) -> std::vector<part_result>;

/**
 * @brief Completion body: [{"partNumber": n, "etag": "..."}, ...]
 */
[[nodiscard]] auto make_completion_body(const std::vector<part_result>& ordered_parts)
    -> byte_buffer;

class completion_assembler {
public:
    completion_assembler(const request_client& requests, execution_context& ctx);

    /**
     * @brief Issue the complete call with the parts in ascending order
     * @return The stored blob descriptor; unmodelled response fields are kept
     *         in put_blob_result::extra
     */
    [[nodiscard]] auto complete(const multipart_session& session, std::vector<part_result> parts)
        -> result<put_blob_result>;

private:
    const request_client& requests_;
    execution_context& ctx_;
};

}  // namespace kcenon::blob

#endif  // KCENON_BLOB_MULTIPART_COMPLETION_ASSEMBLER_H
