/**
 * @file execution_context.cpp
 * @brief Threaded and cooperative execution models
 */

#include <kcenon/blob/core/execution_context.h>

#include <kcenon/blob/core/logging.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <thread>

namespace kcenon::blob {

// ============================================================================
// thread_pool_execution
// ============================================================================

thread_pool_execution::thread_pool_execution(
    std::shared_ptr<adapters::worker_pool_interface> pool)
    : pool_(std::move(pool)) {}

auto thread_pool_execution::create(std::size_t worker_count)
    -> std::shared_ptr<thread_pool_execution> {
    return std::make_shared<thread_pool_execution>(
        adapters::worker_pool_factory::create(worker_count, "blob_upload_pool"));
}

void thread_pool_execution::dispatch(job task, const std::string& stage) {
    // Jobs report their own outcome; the future only carries an exception
    // that dispatched jobs never throw.
    (void)pool_->submit_to_stage(std::move(task), stage);
    BLOB_LOG_TRACE(log_category::scheduler,
                   stage + " dispatched, " + std::to_string(pool_->pending_tasks(stage)) +
                       " pending");
}

void thread_pool_execution::defer(std::chrono::milliseconds delay, job continuation) {
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }
    continuation();
}

auto thread_pool_execution::wait_until(const std::function<bool()>& ready,
                                       std::optional<time_point> deadline)
    -> result<void> {
    std::unique_lock<std::mutex> lock(mutex_);
    if (deadline) {
        if (!cv_.wait_until(lock, *deadline, ready)) {
            return unexpected(error{error_code::transfer_timeout,
                                    "upload deadline exceeded"});
        }
        return {};
    }
    cv_.wait(lock, ready);
    return {};
}

void thread_pool_execution::notify() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
    }
    cv_.notify_all();
}

auto thread_pool_execution::model() const -> execution_model {
    return execution_model::threaded;
}

auto thread_pool_execution::pool() const -> std::shared_ptr<adapters::worker_pool_interface> {
    return pool_;
}

// ============================================================================
// io_context_execution
// ============================================================================

io_context_execution::io_context_execution()
    : owned_(std::make_unique<boost::asio::io_context>(1)),
      io_context_(owned_.get()) {}

io_context_execution::io_context_execution(boost::asio::io_context& io_context)
    : io_context_(&io_context) {}

io_context_execution::~io_context_execution() = default;

void io_context_execution::dispatch(job task, const std::string& /*stage*/) {
    boost::asio::post(*io_context_, std::move(task));
}

void io_context_execution::defer(std::chrono::milliseconds delay, job continuation) {
    auto timer = std::make_shared<boost::asio::steady_timer>(*io_context_, delay);
    timer->async_wait(
        [timer, continuation = std::move(continuation)](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted) {
                return;
            }
            continuation();
        });
}

auto io_context_execution::wait_until(const std::function<bool()>& ready,
                                      std::optional<time_point> deadline)
    -> result<void> {
    if (io_context_->stopped()) {
        io_context_->restart();
    }

    while (!ready()) {
        std::size_t handled = 0;
        if (deadline) {
            if (std::chrono::steady_clock::now() >= *deadline) {
                return unexpected(error{error_code::transfer_timeout,
                                        "upload deadline exceeded"});
            }
            handled = io_context_->run_one_until(*deadline);
        } else {
            handled = io_context_->run_one();
        }

        if (handled == 0 && io_context_->stopped()) {
            io_context_->restart();
            if (ready()) {
                break;
            }
            BLOB_LOG_ERROR(log_category::scheduler,
                           "io_context ran out of work before the wait completed");
            return unexpected(error{error_code::internal_error,
                                    "no pending work can complete the wait"});
        }
    }
    return {};
}

void io_context_execution::notify() {
    // Waiters re-check their predicate after every handler
}

auto io_context_execution::model() const -> execution_model {
    return execution_model::cooperative;
}

auto io_context_execution::io_context() -> boost::asio::io_context& {
    return *io_context_;
}

}  // namespace kcenon::blob
