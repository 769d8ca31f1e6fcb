// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker pool adapter implementation
 */

#include "kcenon/blob/adapters/thread_pool_adapter.h"

#include <condition_variable>
#include <deque>
#include <thread>
#include <vector>

#if KCENON_WITH_THREAD_SYSTEM
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::blob::adapters {

// ============================================================================
// Stage tracking helper (shared implementation)
// ============================================================================

namespace {

class stage_tracker {
public:
    void increment(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[stage_name];
    }

    void decrement(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        if (it != counts_.end() && it->second > 0) {
            --it->second;
        }
    }

    [[nodiscard]] size_t count(const std::string& stage_name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        return it != counts_.end() ? it->second : 0;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> counts_;
};

auto resolve_worker_count(size_t requested) -> size_t {
    if (requested != 0) {
        return requested;
    }
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

// Runs task and forwards its outcome to promise
void run_into(const std::function<void()>& task, std::promise<void>& promise) {
    try {
        task();
        promise.set_value();
    } catch (...) {
        promise.set_exception(std::current_exception());
    }
}

}  // namespace

// ============================================================================
// thread_system_worker_pool implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Job wrapping a callable for thread_system execution
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name = "blob_job")
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_worker_pool::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    stage_tracker tracker;
};

thread_system_worker_pool::thread_system_worker_pool(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_worker_pool::~thread_system_worker_pool() = default;

std::shared_ptr<thread_system_worker_pool>
thread_system_worker_pool::create_default(size_t worker_count,
                                          const std::string& pool_name) {
    worker_count = resolve_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    return std::make_shared<thread_system_worker_pool>(std::move(pool), pool_name, worker_count);
}

std::future<void> thread_system_worker_pool::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    pimpl_->tracker.increment(stage_name);

    auto wrapped = [state = pimpl_.get(), task = std::move(task), promise, stage_name]() {
        run_into(task, *promise);
        state->tracker.decrement(stage_name);
    };
    pimpl_->pool->enqueue(std::make_unique<function_job>(std::move(wrapped), stage_name));
    return future;
}

size_t thread_system_worker_pool::worker_count() const {
    return pimpl_->worker_count;
}

size_t thread_system_worker_pool::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// basic_worker_pool implementation
// ============================================================================

struct basic_worker_pool::impl {
    struct queued_task {
        std::function<void()> task;
        std::shared_ptr<std::promise<void>> promise;
        std::string stage;
    };

    std::mutex mutex;
    std::condition_variable cv;
    std::deque<queued_task> queue;
    std::vector<std::thread> workers;
    bool stopping{false};
    stage_tracker tracker;

    void worker_loop() {
        while (true) {
            queued_task item;
            {
                std::unique_lock<std::mutex> lock(mutex);
                cv.wait(lock, [this] { return stopping || !queue.empty(); });
                if (queue.empty()) {
                    return;
                }
                item = std::move(queue.front());
                queue.pop_front();
            }

            run_into(item.task, *item.promise);
            tracker.decrement(item.stage);
        }
    }

    auto enqueue(std::function<void()> task, std::string stage) -> std::future<void> {
        auto promise = std::make_shared<std::promise<void>>();
        auto future = promise->get_future();

        tracker.increment(stage);
        {
            std::lock_guard<std::mutex> lock(mutex);
            queue.push_back(queued_task{std::move(task), std::move(promise), std::move(stage)});
        }
        cv.notify_one();
        return future;
    }
};

basic_worker_pool::basic_worker_pool(size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    auto count = resolve_worker_count(worker_count);
    pimpl_->workers.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        pimpl_->workers.emplace_back([state = pimpl_.get()] { state->worker_loop(); });
    }
}

basic_worker_pool::~basic_worker_pool() {
    {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        pimpl_->stopping = true;
    }
    pimpl_->cv.notify_all();
    for (auto& worker : pimpl_->workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

std::future<void> basic_worker_pool::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    return pimpl_->enqueue(std::move(task), stage_name);
}

size_t basic_worker_pool::worker_count() const {
    return pimpl_->workers.size();
}

size_t basic_worker_pool::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
}

// ============================================================================
// worker_pool_factory implementation
// ============================================================================

std::shared_ptr<worker_pool_interface> worker_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_worker_pool::create_default(worker_count, pool_name);
#else
    (void)pool_name;
    return std::make_shared<basic_worker_pool>(worker_count);
#endif
}

}  // namespace kcenon::blob::adapters
