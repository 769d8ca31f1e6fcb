/**
 * @file blob_client.h
 * @brief Public entry point for blob uploads and downloads
 */

#ifndef KCENON_BLOB_CLIENT_BLOB_CLIENT_H
#define KCENON_BLOB_CLIENT_BLOB_CLIENT_H

#include <kcenon/blob/auth/token_provider.h>
#include <kcenon/blob/client/blob_types.h>
#include <kcenon/blob/client/request_client.h>
#include <kcenon/blob/core/blob_config.h>
#include <kcenon/blob/core/chunk_source.h>
#include <kcenon/blob/core/execution_context.h>
#include <kcenon/blob/multipart/multipart_client.h>
#include <kcenon/blob/multipart/multipart_uploader.h>
#include <kcenon/blob/telemetry/telemetry_sink.h>
#include <kcenon/blob/transport/asio_http_transport.h>
#include <kcenon/blob/transport/transport_interface.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace boost::asio {
class io_context;
}

namespace kcenon::blob {

/**
 * @brief Everything a client runs with; nothing is read from globals later
 *
 * Null members are filled with defaults for the execution model: an
 * environment token provider, no telemetry, blocking_http_transport on a
 * worker pool (threaded) or asio_http_transport on a private io_context
 * (cooperative).
 */
struct client_context {
    blob_config config;
    std::shared_ptr<token_provider> tokens;
    std::shared_ptr<telemetry_sink> telemetry;
    execution_model model = execution_model::threaded;
    std::shared_ptr<http_transport> transport;
    std::shared_ptr<execution_context> execution;
    tls_options tls;
};

/**
 * @brief Blob client
 *
 * @code
 * auto client = blob_client::builder()
 *     .with_config(blob_config::from_environment())
 *     .with_token(token)
 *     .build();
 *
 * put_options options;
 * options.content_type = "video/mp4";
 * options.on_upload_progress = [](const upload_progress_event& e) {
 *     std::cout << e.percentage << "%\n";
 * };
 * auto blob = client.value().upload_file("movie.mp4", "videos/movie.mp4", options);
 * @endcode
 *
 * Operations block the calling thread. In the cooperative model that thread
 * runs the io_context, so it must be the loop's owner.
 */
class blob_client {
public:
    class builder {
    public:
        builder();

        auto with_config(const blob_config& config) -> builder&;
        auto with_token(const std::string& token) -> builder&;
        auto with_token_provider(std::shared_ptr<token_provider> provider) -> builder&;
        auto with_telemetry(std::shared_ptr<telemetry_sink> sink) -> builder&;
        auto with_execution_model(execution_model model) -> builder&;

        /**
         * @brief Cooperative model on a caller-owned io_context
         */
        auto with_io_context(boost::asio::io_context& io_context) -> builder&;

        auto with_transport(std::shared_ptr<http_transport> transport) -> builder&;
        auto with_execution_context(std::shared_ptr<execution_context> execution) -> builder&;
        auto with_tls(const tls_options& tls) -> builder&;

        [[nodiscard]] auto build() -> result<blob_client>;

    private:
        client_context context_;
    };

    /**
     * @brief Create a client from an explicit context
     * @return invalid_configuration when the config or model pairing is invalid
     */
    [[nodiscard]] static auto create(client_context context) -> result<blob_client>;

    ~blob_client();

    blob_client(const blob_client&) = delete;
    auto operator=(const blob_client&) -> blob_client& = delete;
    /**
     * A moved-from client is empty: is_open() is false, operations fail with
     * not_initialized and the accessors below throw std::runtime_error.
     */
    blob_client(blob_client&&) noexcept;
    auto operator=(blob_client&&) noexcept -> blob_client&;

    /**
     * @brief Release the transport; later calls fail with not_initialized
     */
    void close();

    [[nodiscard]] auto is_open() const -> bool;

    /**
     * @brief Store body at path
     *
     * Bodies larger than multipart.threshold, or any body when
     * options.multipart is set, go through multipart upload.
     */
    [[nodiscard]] auto put(const std::string& path, blob_body body, const put_options& options = {})
        -> result<put_blob_result>;

    /**
     * @brief Store a local file at path
     */
    [[nodiscard]] auto upload_file(const std::filesystem::path& local_path,
                                   const std::string& path,
                                   const put_options& options = {}) -> result<put_blob_result>;

    /**
     * @brief Download a blob URL, or a pathname in the token's store, to a
     *        local file
     *
     * Data is written to `<local_path>.part` and renamed on success; the
     * temporary file is removed on failure.
     */
    [[nodiscard]] auto download_file(const std::string& url_or_path,
                                     const std::filesystem::path& local_path,
                                     const download_options& options = {})
        -> result<std::filesystem::path>;

    /**
     * @brief Read a blob into memory
     *
     * A pathname is resolved against the token's store; without a store id
     * it is looked up with head() first. 404 yields not_found. A 304 answer
     * to if_none_match is a success with empty content.
     */
    [[nodiscard]] auto get(const std::string& url_or_path, const get_options& options = {})
        -> result<get_blob_result>;

    /**
     * @brief Metadata of a blob URL or pathname
     */
    [[nodiscard]] auto head(const std::string& url_or_path,
                            const std::optional<std::string>& token = std::nullopt)
        -> result<head_blob_result>;

    /**
     * @brief One page of blobs
     */
    [[nodiscard]] auto list_objects(const list_options& options = {})
        -> result<list_blob_result>;

    /**
     * @brief Walk a listing page by page
     *
     * Follows the cursor while the service reports more pages, and stops
     * after options.limit blobs or when visitor returns false.
     * @return Number of blobs passed to visitor
     */
    [[nodiscard]] auto iterate_objects(const list_visitor& visitor,
                                       const iterate_options& options = {})
        -> result<uint64_t>;

    /**
     * @brief Delete one blob
     */
    [[nodiscard]] auto delete_object(const std::string& url_or_path,
                                     const std::optional<std::string>& token = std::nullopt)
        -> result<void>;

    /**
     * @brief Delete several blobs in one call
     * @return Number of URLs sent
     */
    [[nodiscard]] auto delete_objects(const std::vector<std::string>& urls_or_paths,
                                      const std::optional<std::string>& token = std::nullopt)
        -> result<std::size_t>;

    /**
     * @brief Copy a blob to a new pathname on the service side
     *
     * A source pathname is resolved to its URL with head() first.
     */
    [[nodiscard]] auto copy_object(const std::string& source,
                                   const std::string& destination,
                                   const copy_options& options = {}) -> result<put_blob_result>;

    /**
     * @brief Create an empty folder marker; a trailing "/" is added if missing
     */
    [[nodiscard]] auto create_folder(const std::string& path,
                                     const create_folder_options& options = {})
        -> result<create_folder_result>;

    /**
     * @brief Manual multipart API bound to this client
     */
    [[nodiscard]] auto multipart() -> multipart_client;

    /**
     * @brief Orchestrator bound to this client's configuration
     */
    [[nodiscard]] auto create_uploader() -> multipart_uploader;

    [[nodiscard]] auto config() const -> const blob_config&;
    [[nodiscard]] auto execution() -> execution_context&;
    [[nodiscard]] auto requests() const -> const request_client&;

private:
    struct impl;
    explicit blob_client(std::unique_ptr<impl> impl);

    [[nodiscard]] auto ensure_open() const -> result<void>;
    [[nodiscard]] auto state() const -> impl&;

    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::blob

#endif  // KCENON_BLOB_CLIENT_BLOB_CLIENT_H
