/**
 * @file blob.h
 * @brief Main header for blob_upload_system library
 * @version 0.1.0
 *
 * Include this header to access the blob client, the manual multipart API
 * and the transports.
 *
 * @code
 * #include <kcenon/blob/blob.h>
 *
 * using namespace kcenon::blob;
 *
 * auto client = blob_client::builder()
 *     .with_token("vercel_blob_rw_store_secret")
 *     .build();
 *
 * auto blob = client.value().put("notes/hello.txt", to_bytes("hello"));
 * @endcode
 */

#ifndef KCENON_BLOB_BLOB_H
#define KCENON_BLOB_BLOB_H

#include <cstdint>
#include <string>

// Core
#include "kcenon/blob/core/blob_config.h"
#include "kcenon/blob/core/chunk_source.h"
#include "kcenon/blob/core/execution_context.h"
#include "kcenon/blob/core/progress.h"
#include "kcenon/blob/core/types.h"

// Transport
#include "kcenon/blob/transport/asio_http_transport.h"
#include "kcenon/blob/transport/network_http_transport.h"
#include "kcenon/blob/transport/transport_interface.h"

// Client
#include "kcenon/blob/auth/token_provider.h"
#include "kcenon/blob/client/blob_client.h"
#include "kcenon/blob/client/blob_types.h"
#include "kcenon/blob/client/request_client.h"

// Multipart
#include "kcenon/blob/multipart/completion_assembler.h"
#include "kcenon/blob/multipart/multipart_client.h"
#include "kcenon/blob/multipart/multipart_uploader.h"
#include "kcenon/blob/multipart/upload_scheduler.h"

// Telemetry
#include "kcenon/blob/telemetry/telemetry_sink.h"

namespace kcenon::blob {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::blob

#endif  // KCENON_BLOB_BLOB_H
