// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file task_pool_adapter.h
 * @brief Background task pool used for out-of-band session signalling
 *
 * Keep-alive writes to the administrative session must not block the
 * bulk-copy loop, so they run on a small background pool. The pool is
 * thread_system's thread_pool when the library is built with it, and
 * std::async otherwise.
 *
 * Tasks are grouped in named lanes ("keep_alive") so a caller can see how
 * many of its own tasks are still in flight and avoid piling up sends.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "../config/feature_flags.h"

#if DEVICE_TRANSFER_USE_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::device_transfer::adapters {

/**
 * @brief Interface for background task execution
 */
class task_pool_interface {
public:
    virtual ~task_pool_interface() = default;

    /**
     * @brief Submit a task in a named lane
     * @param task The task to execute
     * @param lane Lane name used for in-flight accounting
     * @return Future for the task completion
     */
    virtual std::future<void> submit(std::function<void()> task, const std::string& lane) = 0;

    /**
     * @brief Get the number of worker threads
     */
    [[nodiscard]] virtual size_t worker_count() const = 0;

    /**
     * @brief Check if the pool accepts tasks
     */
    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Tasks of one lane that have not finished yet
     */
    [[nodiscard]] virtual size_t in_flight(const std::string& lane) const = 0;
};

#if DEVICE_TRANSFER_USE_THREAD_SYSTEM

/**
 * @brief Pool backed by thread_system's thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_task_pool : public task_pool_interface {
public:
    explicit thread_system_task_pool(std::shared_ptr<kcenon::thread::thread_pool> pool,
                                     size_t worker_count = 0);

    ~thread_system_task_pool() override;

    thread_system_task_pool(const thread_system_task_pool&) = delete;
    thread_system_task_pool& operator=(const thread_system_task_pool&) = delete;

    /**
     * @brief Create a started pool with its own workers
     * @param worker_count Number of worker threads (0 = 1)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static std::shared_ptr<thread_system_task_pool> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "device_transfer_pool");

    std::future<void> submit(std::function<void()> task, const std::string& lane) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t in_flight(const std::string& lane) const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // DEVICE_TRANSFER_USE_THREAD_SYSTEM

/**
 * @brief Fallback implementation using std::async
 *
 * Every task gets its own thread. Futures returned by submit() block in
 * their destructor until the task has finished.
 */
class async_task_pool : public task_pool_interface {
public:
    async_task_pool();
    ~async_task_pool() override;

    async_task_pool(const async_task_pool&) = delete;
    async_task_pool& operator=(const async_task_pool&) = delete;

    std::future<void> submit(std::function<void()> task, const std::string& lane) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t in_flight(const std::string& lane) const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Creates the best available pool
 *
 * Priority: thread_system > std::async
 */
class task_pool_factory {
public:
    [[nodiscard]] static std::shared_ptr<task_pool_interface> create(
        size_t worker_count = 1,
        const std::string& pool_name = "device_transfer_pool");
};

}  // namespace kcenon::device_transfer::adapters
