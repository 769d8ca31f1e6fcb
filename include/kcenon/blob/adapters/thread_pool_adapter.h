// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Worker pool adapter for threaded part uploads
 *
 * Provides a unified worker pool interface for the threaded execution model,
 * backed by thread_system when available and by a small std::thread pool
 * otherwise.
 *
 * Features:
 * - Stage-based task tracking (e.g. "part_upload", "create", "complete")
 * - Seamless integration with thread_system when available
 */

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::blob::adapters {

/**
 * @brief Interface for worker pool operations
 */
class worker_pool_interface {
public:
    virtual ~worker_pool_interface() = default;

    /**
     * @brief Submit a task under a named stage for tracking
     * @param task The task to execute
     * @param stage_name Stage label (e.g. "part_upload")
     * @return Future for the task completion
     */
    virtual std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) = 0;

    [[nodiscard]] virtual size_t worker_count() const = 0;

    /**
     * @brief Tasks submitted under a stage but not yet finished
     */
    [[nodiscard]] virtual size_t pending_tasks(const std::string& stage_name) const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter that wraps thread_system::thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_worker_pool : public worker_pool_interface {
public:
    /**
     * @brief Construct with an existing thread_pool
     * @param pool Shared pointer to thread_system's thread_pool
     * @param pool_name Name for identification in logs
     * @param worker_count Number of workers in the pool (for reporting)
     */
    explicit thread_system_worker_pool(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "blob_upload_pool",
        size_t worker_count = 0);

    ~thread_system_worker_pool() override;

    thread_system_worker_pool(const thread_system_worker_pool&) = delete;
    thread_system_worker_pool& operator=(const thread_system_worker_pool&) = delete;

    /**
     * @brief Create a started pool with its own workers
     * @param worker_count Number of worker threads (0 = hardware concurrency)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static std::shared_ptr<thread_system_worker_pool> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "blob_upload_pool");

    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fixed-size std::thread pool used when thread_system is unavailable
 *
 * Workers drain the queue before the destructor joins them.
 */
class basic_worker_pool : public worker_pool_interface {
public:
    /**
     * @param worker_count Number of worker threads (0 = hardware concurrency)
     */
    explicit basic_worker_pool(size_t worker_count = 0);
    ~basic_worker_pool() override;

    basic_worker_pool(const basic_worker_pool&) = delete;
    basic_worker_pool& operator=(const basic_worker_pool&) = delete;

    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Factory selecting the best available worker pool
 *
 * 1. thread_system_worker_pool (when KCENON_WITH_THREAD_SYSTEM)
 * 2. basic_worker_pool (fallback)
 */
class worker_pool_factory {
public:
    [[nodiscard]] static std::shared_ptr<worker_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "blob_upload_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::blob::adapters
