/**
 * @file execution_context.h
 * @brief Execution models for running concurrent uploads
 *
 * Upload logic is written once against execution_context. The threaded
 * model runs jobs on a worker pool with blocking I/O; the cooperative model
 * runs every job and I/O completion on a single boost::asio::io_context that
 * the waiting thread pumps.
 */

#ifndef KCENON_BLOB_CORE_EXECUTION_CONTEXT_H
#define KCENON_BLOB_CORE_EXECUTION_CONTEXT_H

#include <kcenon/blob/adapters/thread_pool_adapter.h>
#include <kcenon/blob/core/types.h>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace boost::asio {
class io_context;
}

namespace kcenon::blob {

/**
 * @brief Which execution model a client runs on
 */
enum class execution_model {
    threaded,     ///< Worker pool with blocking transport calls
    cooperative,  ///< Single-threaded io_context with asynchronous transport
};

[[nodiscard]] constexpr auto to_string(execution_model model) -> const char* {
    switch (model) {
        case execution_model::threaded: return "threaded";
        case execution_model::cooperative: return "cooperative";
        default: return "unknown";
    }
}

/**
 * @brief Abstract execution seam used by the scheduler and orchestrator
 *
 * Completion handlers that change state observed by wait_until() must call
 * notify() afterwards, without holding their own locks.
 */
class execution_context {
public:
    using job = std::function<void()>;
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~execution_context() = default;

    /**
     * @brief Run a job concurrently with the caller
     * @param task Job; must not throw
     * @param stage Label used for pool bookkeeping
     */
    virtual void dispatch(job task, const std::string& stage) = 0;

    /**
     * @brief Run a continuation after a delay
     *
     * The threaded model sleeps the calling worker; the cooperative model
     * arms a timer and returns immediately.
     */
    virtual void defer(std::chrono::milliseconds delay, job continuation) = 0;

    /**
     * @brief Block the driving thread until ready() holds
     * @param ready Predicate over shared state
     * @param deadline Optional wall-clock limit
     * @return transfer_timeout when the deadline passes first; internal_error
     *         when no outstanding work could ever satisfy the predicate
     */
    [[nodiscard]] virtual auto wait_until(const std::function<bool()>& ready,
                                          std::optional<time_point> deadline = std::nullopt)
        -> result<void> = 0;

    /**
     * @brief Wake a thread blocked in wait_until()
     */
    virtual void notify() = 0;

    [[nodiscard]] virtual auto model() const -> execution_model = 0;

    /**
     * @brief Token that expires when this context is destroyed
     *
     * Handlers that may outlive the operation which armed them (a part still
     * in flight after a deadline, a pending retry timer) check it before
     * touching the context.
     */
    [[nodiscard]] auto lifetime() const -> std::weak_ptr<const void> { return alive_; }

private:
    std::shared_ptr<const void> alive_ = std::make_shared<char>('\0');
};

/**
 * @brief Threaded execution on a worker pool
 */
class thread_pool_execution : public execution_context {
public:
    explicit thread_pool_execution(std::shared_ptr<adapters::worker_pool_interface> pool);

    /**
     * @brief Create with a pool from worker_pool_factory
     * @param worker_count Worker threads (0 = hardware concurrency)
     */
    [[nodiscard]] static auto create(std::size_t worker_count)
        -> std::shared_ptr<thread_pool_execution>;

    void dispatch(job task, const std::string& stage) override;
    void defer(std::chrono::milliseconds delay, job continuation) override;
    [[nodiscard]] auto wait_until(const std::function<bool()>& ready,
                                  std::optional<time_point> deadline = std::nullopt)
        -> result<void> override;
    void notify() override;
    [[nodiscard]] auto model() const -> execution_model override;

    [[nodiscard]] auto pool() const -> std::shared_ptr<adapters::worker_pool_interface>;

private:
    std::mutex mutex_;
    std::condition_variable cv_;

    // Destroyed first: workers are joined while mutex_ and cv_ still exist
    std::shared_ptr<adapters::worker_pool_interface> pool_;
};

/**
 * @brief Cooperative execution on one boost::asio::io_context
 *
 * wait_until() runs handlers on the calling thread until the predicate holds,
 * so the caller must be the thread that owns the loop.
 */
class io_context_execution : public execution_context {
public:
    /**
     * @brief Use a private io_context
     */
    io_context_execution();

    /**
     * @brief Use a caller-owned io_context; it must outlive this object
     */
    explicit io_context_execution(boost::asio::io_context& io_context);

    ~io_context_execution() override;

    io_context_execution(const io_context_execution&) = delete;
    io_context_execution& operator=(const io_context_execution&) = delete;

    void dispatch(job task, const std::string& stage) override;
    void defer(std::chrono::milliseconds delay, job continuation) override;
    [[nodiscard]] auto wait_until(const std::function<bool()>& ready,
                                  std::optional<time_point> deadline = std::nullopt)
        -> result<void> override;
    void notify() override;
    [[nodiscard]] auto model() const -> execution_model override;

    [[nodiscard]] auto io_context() -> boost::asio::io_context&;

private:
    std::unique_ptr<boost::asio::io_context> owned_;
    boost::asio::io_context* io_context_;
};

}  // namespace kcenon::blob

#endif  // KCENON_BLOB_CORE_EXECUTION_CONTEXT_H
