/**
 * @file multipart_session.h
 * @brief Records produced by the multipart handshake and part uploads
 */

#ifndef KCENON_BLOB_MULTIPART_MULTIPART_SESSION_H
#define KCENON_BLOB_MULTIPART_MULTIPART_SESSION_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace kcenon::blob {

/**
 * @brief Outcome of create-multipart-upload
 *
 * Read-only once created; shared by every part upload and the completion.
 */
struct multipart_session {
    std::string upload_id;

    /// Object key assigned by the service
    std::string key;

    /// Destination pathname
    std::string path;

    /// Put headers sent with every multipart call
    std::map<std::string, std::string> headers;

    /// Token override for every call of this upload
    std::optional<std::string> token;
};

/**
 * @brief One uploaded part
 */
struct part_result {
    uint32_t part_number = 0;
    std::string etag;

    [[nodiscard]] auto operator==(const part_result& other) const -> bool = default;
};

}  // namespace kcenon::blob

#endif  // KCENON_BLOB_MULTIPART_MULTIPART_SESSION_H
