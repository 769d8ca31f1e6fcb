/**
 * @file upload_scheduler.cpp
 * @brief Admission gate, progress aggregation and failure draining
 */

#include <kcenon/blob/multipart/upload_scheduler.h>

#include <kcenon/blob/core/logging.h>

#include <map>
#include <mutex>
#include <optional>

namespace kcenon::blob {

struct upload_scheduler::run_state {
    std::mutex mutex;
    std::size_t in_flight = 0;
    std::optional<error> failure;
    bool abandoned = false;
    std::vector<part_result> parts;
    std::map<uint32_t, uint64_t> part_loaded;
    uint64_t total = 0;
    upload_progress_callback on_progress;

    void record_progress(uint32_t part_number, uint64_t loaded) {
        std::lock_guard<std::mutex> lock(mutex);
        if (abandoned || !on_progress) {
            return;
        }
        auto& entry = part_loaded[part_number];
        if (loaded > entry) {
            entry = loaded;
        }

        uint64_t total_loaded = 0;
        for (const auto& [part, bytes] : part_loaded) {
            total_loaded += bytes;
        }
        on_progress(make_progress_event(total_loaded, total));
    }

    void record_outcome(uint32_t part_number, result<part_result> outcome) {
        std::lock_guard<std::mutex> lock(mutex);
        --in_flight;
        if (outcome) {
            parts.push_back(std::move(outcome.value()));
            return;
        }

        transfer_log_context log_ctx;
        log_ctx.part_number = part_number;
        log_ctx.error_message = outcome.error().message;
        BLOB_LOG_WARN_CTX(log_category::scheduler, "part upload failed", log_ctx);

        if (!failure) {
            failure = outcome.error();
        }
    }

    // Parts dispatched before an abandon must not start once it happened
    auto begin_part() -> bool {
        std::lock_guard<std::mutex> lock(mutex);
        if (abandoned) {
            --in_flight;
            return false;
        }
        return true;
    }

    void record_failure(error err) {
        std::lock_guard<std::mutex> lock(mutex);
        if (!failure) {
            failure = std::move(err);
        }
    }
};

upload_scheduler::upload_scheduler(execution_context& ctx, scheduler_options options)
    : ctx_(ctx), options_(options) {}

auto upload_scheduler::run(const multipart_session& session,
                           chunk_source& source,
                           uint64_t total,
                           upload_progress_callback on_progress,
                           part_upload_fn upload) -> result<std::vector<part_result>> {
    if (options_.max_concurrent_parts == 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "max_concurrent_parts must be at least 1"});
    }

    auto state = std::make_shared<run_state>();
    state->total = total;
    state->on_progress = std::move(on_progress);

    std::optional<execution_context::time_point> deadline;
    if (options_.deadline.count() > 0) {
        deadline = std::chrono::steady_clock::now() + options_.deadline;
    }

    auto abandon = [&state](const error& err) -> result<std::vector<part_result>> {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->abandoned = true;
        BLOB_LOG_WARN(log_category::scheduler,
                      "part phase abandoned with " + std::to_string(state->in_flight) +
                          " parts in flight: " + err.message);
        return unexpected(err);
    };

    auto& ctx = ctx_;
    const auto limit = options_.max_concurrent_parts;
    uint32_t next_part_number = 1;

    while (true) {
        auto admitted = ctx_.wait_until(
            [&state, limit] {
                std::lock_guard<std::mutex> lock(state->mutex);
                return state->failure.has_value() || state->in_flight < limit;
            },
            deadline);
        if (!admitted) {
            return abandon(admitted.error());
        }

        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->failure) {
                break;
            }
        }

        auto chunk = source.next();
        if (!chunk) {
            state->record_failure(chunk.error());
            break;
        }
        if (!chunk.value()) {
            break;
        }

        auto part_number = next_part_number++;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            ++state->in_flight;
            state->part_loaded[part_number] = 0;
        }

        BLOB_LOG_TRACE(log_category::scheduler,
                       "dispatching part " + std::to_string(part_number) + " (" +
                           std::to_string(chunk.value()->size()) + " bytes)");

        ctx_.dispatch(
            [state, &ctx, alive = ctx.lifetime(), session, upload, part_number,
             body = std::move(*chunk.value())]() mutable {
                if (!state->begin_part()) {
                    return;
                }
                upload(
                    session, part_number, std::move(body),
                    [state, part_number](const upload_progress_event& event) {
                        state->record_progress(part_number, event.loaded);
                    },
                    [state, &ctx, alive, part_number](result<part_result> outcome) {
                        state->record_outcome(part_number, std::move(outcome));
                        if (auto held = alive.lock()) {
                            ctx.notify();
                        }
                    });
            },
            "upload");
    }

    auto drained = ctx_.wait_until(
        [&state] {
            std::lock_guard<std::mutex> lock(state->mutex);
            return state->in_flight == 0;
        },
        deadline);
    if (!drained) {
        return abandon(drained.error());
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->failure) {
        return unexpected(*state->failure);
    }

    if (state->on_progress) {
        uint64_t loaded = total;
        if (loaded == 0) {
            for (const auto& [part, bytes] : state->part_loaded) {
                loaded += bytes;
            }
        }
        state->on_progress(upload_progress_event{loaded, total, 100.0});
    }

    BLOB_LOG_DEBUG(log_category::scheduler,
                   "uploaded " + std::to_string(state->parts.size()) + " parts");
    return std::move(state->parts);
}

}  // namespace kcenon::blob
