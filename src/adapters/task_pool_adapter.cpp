// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file task_pool_adapter.cpp
 * @brief Background task pool implementations
 */

#include "kcenon/device_transfer/adapters/task_pool_adapter.h"

#include <atomic>
#include <mutex>
#include <thread>
#include <unordered_map>

#if DEVICE_TRANSFER_USE_THREAD_SYSTEM
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::device_transfer::adapters {

namespace {

class lane_tracker {
public:
    void increment(const std::string& lane) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[lane];
    }

    void decrement(const std::string& lane) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(lane);
        if (it != counts_.end() && it->second > 0) {
            --it->second;
        }
    }

    [[nodiscard]] size_t count(const std::string& lane) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(lane);
        return it == counts_.end() ? 0 : it->second;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> counts_;
};

// Runs the task, settles the promise and releases the lane slot
auto run_tracked(const std::function<void()>& task, std::promise<void>& promise,
                 lane_tracker& tracker, const std::string& lane) -> void {
    try {
        task();
        promise.set_value();
    } catch (...) {
        promise.set_exception(std::current_exception());
    }
    tracker.decrement(lane);
}

}  // namespace

// ============================================================================
// thread_system_task_pool implementation
// ============================================================================

#if DEVICE_TRANSFER_USE_THREAD_SYSTEM

class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name)
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

struct thread_system_task_pool::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    size_t worker_count{0};
    lane_tracker tracker;
};

thread_system_task_pool::thread_system_task_pool(
    std::shared_ptr<kcenon::thread::thread_pool> pool, size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->worker_count = worker_count;
}

thread_system_task_pool::~thread_system_task_pool() {
    if (pimpl_ && pimpl_->pool) {
        (void)pimpl_->pool->stop();
    }
}

std::shared_ptr<thread_system_task_pool> thread_system_task_pool::create_default(
    size_t worker_count, const std::string& pool_name) {
    if (worker_count == 0) {
        worker_count = 1;
    }

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    return std::make_shared<thread_system_task_pool>(std::move(pool), worker_count);
}

std::future<void> thread_system_task_pool::submit(std::function<void()> task,
                                                  const std::string& lane) {
    pimpl_->tracker.increment(lane);

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto* tracker = &pimpl_->tracker;
    auto wrapped = [task = std::move(task), promise, tracker, lane]() {
        run_tracked(task, *promise, *tracker, lane);
    };

    auto job = std::make_unique<function_job>(std::move(wrapped), lane);
    pimpl_->pool->enqueue(std::move(job));

    return future;
}

size_t thread_system_task_pool::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_task_pool::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_task_pool::in_flight(const std::string& lane) const {
    return pimpl_->tracker.count(lane);
}

#endif  // DEVICE_TRANSFER_USE_THREAD_SYSTEM

// ============================================================================
// async_task_pool implementation
// ============================================================================

struct async_task_pool::impl {
    lane_tracker tracker;
};

async_task_pool::async_task_pool() : pimpl_(std::make_unique<impl>()) {}

async_task_pool::~async_task_pool() = default;

std::future<void> async_task_pool::submit(std::function<void()> task,
                                          const std::string& lane) {
    pimpl_->tracker.increment(lane);

    auto* tracker = &pimpl_->tracker;
    return std::async(std::launch::async, [task = std::move(task), tracker, lane]() {
        std::promise<void> promise;
        auto settled = promise.get_future();
        run_tracked(task, promise, *tracker, lane);
        settled.get();
    });
}

size_t async_task_pool::worker_count() const {
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 1;
}

bool async_task_pool::is_running() const { return true; }

size_t async_task_pool::in_flight(const std::string& lane) const {
    return pimpl_->tracker.count(lane);
}

// ============================================================================
// task_pool_factory implementation
// ============================================================================

std::shared_ptr<task_pool_interface> task_pool_factory::create(size_t worker_count,
                                                               const std::string& pool_name) {
#if DEVICE_TRANSFER_USE_THREAD_SYSTEM
    return thread_system_task_pool::create_default(worker_count, pool_name);
#else
    (void)worker_count;
    (void)pool_name;
    return std::make_shared<async_task_pool>();
#endif
}

}  // namespace kcenon::device_transfer::adapters
