/**
 * @file upload_scheduler.h
 * @brief Bounded-concurrency part upload driver
 */

#ifndef KCENON_BLOB_MULTIPART_UPLOAD_SCHEDULER_H
#define KCENON_BLOB_MULTIPART_UPLOAD_SCHEDULER_H

#include <kcenon/blob/core/blob_config.h>
#include <kcenon/blob/core/chunk_source.h>
#include <kcenon/blob/core/execution_context.h>
#include <kcenon/blob/core/progress.h>
#include <kcenon/blob/multipart/multipart_session.h>

#include <chrono>
#include <functional>
#include <vector>

namespace kcenon::blob {

/**
 * @brief Uploads one part and reports its outcome exactly once
 *
 * May complete inline or later; must not throw. multipart_client's
 * upload_part_async() has this shape.
 */
using part_upload_fn = std::function<void(const multipart_session& session,
                                          uint32_t part_number,
                                          byte_buffer body,
                                          upload_progress_callback on_part_progress,
                                          std::function<void(result<part_result>)> on_complete)>;

struct scheduler_options {
    std::size_t max_concurrent_parts = default_max_concurrent_parts;

    /// Limit on the whole run, 0 = none
    std::chrono::milliseconds deadline{0};
};

/**
 * @brief Pulls chunks in order and keeps at most max_concurrent_parts uploads
 *        outstanding
 *
 * Parts are numbered 1..N in production order. Aggregate progress is the sum
 * of each part's highest reported byte count, delivered under one lock so the
 * callback sees a non-decreasing loaded value; a final 100% event follows the
 * last part. The first failure stops admission; parts already in flight are
 * drained before that failure is returned. When the deadline passes,
 * transfer_timeout is returned at once and later part events are dropped;
 * parts dispatched but not yet started never call upload, and parts still in
 * flight stop touching the execution context once it is destroyed.
 */
class upload_scheduler {
public:
    upload_scheduler(execution_context& ctx, scheduler_options options);

    /**
     * @brief Upload every chunk of source
     * @param total Expected byte count, 0 when unknown
     * @return Part results in completion order
     */
    [[nodiscard]] auto run(const multipart_session& session,
                           chunk_source& source,
                           uint64_t total,
                           upload_progress_callback on_progress,
                           part_upload_fn upload) -> result<std::vector<part_result>>;

private:
    struct run_state;

    execution_context& ctx_;
    scheduler_options options_;
};

}  // namespace kcenon::blob

#endif  // KCENON_BLOB_MULTIPART_UPLOAD_SCHEDULER_H
