/**
 * @file chunk_source.h
 * @brief Body input variants and their re-slicing into upload parts
 */

#ifndef KCENON_BLOB_CORE_CHUNK_SOURCE_H
#define KCENON_BLOB_CORE_CHUNK_SOURCE_H

#include <kcenon/blob/core/types.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace kcenon::blob {

using byte_buffer = std::vector<std::byte>;

/**
 * @brief Pull-style producer of byte chunks
 *
 * Returns std::nullopt once exhausted. Chunks may have any size, including
 * zero; they are re-sliced before upload.
 */
using chunk_generator = std::function<std::optional<byte_buffer>()>;

/**
 * @brief Accepted body shapes
 *
 * - byte_buffer: raw bytes
 * - std::string: text, uploaded as its UTF-8 bytes
 * - std::shared_ptr<std::istream>: readable stream, read to end
 * - chunk_generator: lazily produced chunks of unknown total size
 */
using blob_body = std::variant<byte_buffer,
                               std::string,
                               std::shared_ptr<std::istream>,
                               chunk_generator>;

/**
 * @brief Convert text to its byte representation
 */
[[nodiscard]] auto to_bytes(std::string_view text) -> byte_buffer;

/**
 * @brief Length of a body when it can be known without consuming it
 *
 * Seekable streams are measured from their current position. Generators and
 * non-seekable streams report 0.
 */
[[nodiscard]] auto body_length(const blob_body& body) -> uint64_t;

/**
 * @brief Leading bytes of a body and whatever was not read
 */
struct body_prefix {
    byte_buffer head;

    /// head holds the entire body and rest is spent
    bool complete = false;

    blob_body rest;
};

/**
 * @brief Read at least limit bytes of a body, or all of it if shorter
 *
 * Streams stop after limit bytes; generators stop at the first piece that
 * reaches limit, so head may be longer. In-memory bodies longer than limit
 * are not copied and come back untouched in rest with an empty head.
 */
[[nodiscard]] auto read_prefix(blob_body body, std::size_t limit) -> result<body_prefix>;

/**
 * @brief Body that yields head and then the rest of prefix lazily
 *
 * Read errors from the remainder are raised by the generator as
 * std::runtime_error, which chunk_source reports as file_read_error.
 */
[[nodiscard]] auto chain_body(body_prefix prefix) -> result<blob_body>;

/**
 * @brief Lazy, one-pass, ordered sequence of part-sized chunks
 *
 * Every chunk except the last is exactly part_size bytes. The sequence only
 * depends on the input bytes and part size, never on how the input arrives
 * (one buffer, a stream, or arbitrarily sized generator chunks). An empty
 * body yields no chunks.
 */
class chunk_source {
public:
    /**
     * @brief Create a chunk source over a body
     * @param body Input body
     * @param part_size Target chunk size in bytes (must be > 0)
     * @return Chunk source or invalid_argument
     */
    [[nodiscard]] static auto create(blob_body body, std::size_t part_size)
        -> result<chunk_source>;

    /**
     * @brief Produce the next chunk
     * @return Next chunk, std::nullopt once exhausted, or a read error
     */
    [[nodiscard]] auto next() -> result<std::optional<byte_buffer>>;

    /**
     * @brief Total body size if known, otherwise 0
     */
    [[nodiscard]] auto total_size() const -> uint64_t;

    /**
     * @brief Number of chunks produced so far
     */
    [[nodiscard]] auto chunks_produced() const -> uint32_t;

    [[nodiscard]] auto part_size() const -> std::size_t;

    chunk_source(chunk_source&&) noexcept;
    auto operator=(chunk_source&&) noexcept -> chunk_source&;
    ~chunk_source();

    chunk_source(const chunk_source&) = delete;
    auto operator=(const chunk_source&) -> chunk_source& = delete;

private:
    struct impl;
    explicit chunk_source(std::unique_ptr<impl> impl);

    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::blob

#endif  // KCENON_BLOB_CORE_CHUNK_SOURCE_H
