/**
 * @file blob_types.h
 * @brief Options and results of the public blob operations
 */

#ifndef KCENON_BLOB_CLIENT_BLOB_TYPES_H
#define KCENON_BLOB_CLIENT_BLOB_TYPES_H

#include <kcenon/blob/core/chunk_source.h>
#include <kcenon/blob/core/progress.h>
#include <kcenon/blob/core/types.h>

#include <json/json.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::blob {

/**
 * @brief Blob visibility
 */
enum class blob_access {
    public_access,
    private_access,
};

[[nodiscard]] constexpr auto to_string(blob_access access) -> const char* {
    switch (access) {
        case blob_access::public_access: return "public";
        case blob_access::private_access: return "private";
        default: return "public";
    }
}

/**
 * @brief Options for put() and upload_file()
 */
struct put_options {
    blob_access access = blob_access::public_access;

    /// Sent as x-content-type when set
    std::optional<std::string> content_type;

    bool add_random_suffix = false;

    bool allow_overwrite = false;

    /// Sent as x-cache-control-max-age when set
    std::optional<uint32_t> cache_control_max_age;

    /// Use multipart upload even below the threshold
    bool multipart = false;

    upload_progress_callback on_upload_progress;

    /// Overrides the client's token provider
    std::optional<std::string> token;
};

/**
 * @brief Options for download_file()
 */
struct download_options {
    blob_access access = blob_access::public_access;

    /// Replace an existing destination file
    bool overwrite = false;

    /// Create missing parent directories of the destination
    bool create_parents = false;

    /// Overrides blob_config::download_timeout
    std::optional<std::chrono::milliseconds> timeout;

    download_progress_callback on_progress;

    std::optional<std::string> token;
};

/**
 * @brief Descriptor of a stored blob
 */
struct put_blob_result {
    std::string url;
    std::string download_url;
    std::string pathname;
    std::string content_type;
    std::string content_disposition;

    /// Response fields not modelled above, verbatim
    Json::Value extra{Json::objectValue};

    /**
     * @brief Build from a service response object
     * @return invalid_response_json when url or pathname is missing
     */
    [[nodiscard]] static auto from_json(const Json::Value& value) -> result<put_blob_result>;
};

/**
 * @brief Metadata of a stored blob, as returned by head()
 */
struct head_blob_result {
    uint64_t size = 0;
    std::chrono::system_clock::time_point uploaded_at;
    std::string pathname;
    std::string content_type;
    std::string content_disposition;
    std::string url;
    std::string download_url;
    std::string cache_control;

    /**
     * @return invalid_response_json when url or pathname is missing
     */
    [[nodiscard]] static auto from_json(const Json::Value& value) -> result<head_blob_result>;
};

/**
 * @brief One entry of a listing page
 */
struct list_blob_item {
    std::string url;
    std::string download_url;
    std::string pathname;
    uint64_t size = 0;
    std::chrono::system_clock::time_point uploaded_at;

    [[nodiscard]] static auto from_json(const Json::Value& value) -> result<list_blob_item>;
};

/**
 * @brief How a listing treats "/" in pathnames
 */
enum class list_mode {
    expanded,  ///< Every blob under the prefix
    folded,    ///< Blobs at this level; deeper ones grouped into folders
};

[[nodiscard]] constexpr auto to_string(list_mode mode) -> const char* {
    switch (mode) {
        case list_mode::expanded: return "expanded";
        case list_mode::folded: return "folded";
        default: return "expanded";
    }
}

/**
 * @brief One page of a listing
 */
struct list_blob_result {
    std::vector<list_blob_item> blobs;

    /// Pass back in list_options::cursor for the next page
    std::optional<std::string> cursor;

    bool has_more = false;

    /// Only filled in folded mode
    std::vector<std::string> folders;

    [[nodiscard]] static auto from_json(const Json::Value& value) -> result<list_blob_result>;

    /**
     * @brief Cursor of the following page, or nullopt on the last one
     */
    [[nodiscard]] auto next_cursor() const -> std::optional<std::string>;
};

/**
 * @brief Options for list_objects()
 */
struct list_options {
    /// Page size; the service default applies when unset
    std::optional<uint32_t> limit;
    std::optional<std::string> prefix;
    std::optional<std::string> cursor;
    std::optional<list_mode> mode;
    std::optional<std::string> token;
};

/**
 * @brief Options for iterate_objects()
 */
struct iterate_options {
    std::optional<std::string> prefix;
    std::optional<list_mode> mode;

    /// Page size of each underlying list call
    std::optional<uint32_t> batch_size;

    /// Stop after this many blobs in total
    std::optional<uint64_t> limit;

    /// Resume a listing from this cursor
    std::optional<std::string> cursor;

    std::optional<std::string> token;
};

/**
 * @brief Receives each listed blob; return false to stop the iteration
 */
using list_visitor = std::function<bool(const list_blob_item&)>;

/**
 * @brief Options for copy_object()
 */
struct copy_options {
    blob_access access = blob_access::public_access;
    std::optional<std::string> content_type;
    bool add_random_suffix = false;
    bool allow_overwrite = false;
    std::optional<uint32_t> cache_control_max_age;
    std::optional<std::string> token;
};

/**
 * @brief Options for create_folder()
 */
struct create_folder_options {
    bool allow_overwrite = false;
    std::optional<std::string> token;
};

struct create_folder_result {
    std::string pathname;
    std::string url;

    [[nodiscard]] static auto from_json(const Json::Value& value) -> result<create_folder_result>;
};

/**
 * @brief Options for get()
 */
struct get_options {
    blob_access access = blob_access::public_access;

    /// Overrides blob_config::download_timeout
    std::optional<std::chrono::milliseconds> timeout;

    /// When false, the request bypasses the CDN cache with cache=0
    bool use_cache = true;

    /// Conditional request; a matching etag yields status 304 and no content
    std::optional<std::string> if_none_match;

    std::optional<std::string> token;
};

/**
 * @brief A blob read into memory
 */
struct get_blob_result {
    std::string url;
    std::string download_url;
    std::string pathname;

    /// Unset on a 304 answer
    std::optional<std::string> content_type;

    /// Unset on a 304 answer
    std::optional<uint64_t> size;

    std::string content_disposition;
    std::string cache_control;

    /// From last-modified; the time of the call when absent or unparseable
    std::chrono::system_clock::time_point uploaded_at;

    std::string etag;
    byte_buffer content;
    int status_code = 200;
};

/**
 * @brief Headers that carry put options to the service
 */
[[nodiscard]] auto make_put_headers(const put_options& options)
    -> std::map<std::string, std::string>;

/**
 * @brief Headers that carry copy options to the service
 */
[[nodiscard]] auto make_put_headers(const copy_options& options)
    -> std::map<std::string, std::string>;

}  // namespace kcenon::blob

#endif  // KCENON_BLOB_CLIENT_BLOB_TYPES_H
