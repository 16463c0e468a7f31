/**
 * @file keep_alive_timer.cpp
 * @brief Implementation of keep_alive_timer
 */

#include "kcenon/device_transfer/transfer/keep_alive_timer.h"

namespace kcenon::device_transfer {

namespace {

auto to_ns(keep_alive_timer::clock::time_point tp) -> int64_t {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

}  // namespace

keep_alive_timer::keep_alive_timer(std::function<void()> signal,
                                   std::chrono::milliseconds interval)
    : signal_(std::move(signal)), interval_(interval) {
    last_signal_ns_.store(to_ns(clock::now()));
}

keep_alive_timer::~keep_alive_timer() { stop(); }

auto keep_alive_timer::start() -> void {
    if (!enabled()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    last_signal_ns_.store(to_ns(clock::now()));
    running_ = true;
    worker_ = std::thread([this] { run(); });
}

auto keep_alive_timer::stop() -> void {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

auto keep_alive_timer::poke() -> bool {
    if (!enabled()) {
        return false;
    }
    return try_fire(clock::now());
}

auto keep_alive_timer::try_fire(clock::time_point now) -> bool {
    const auto now_ns = to_ns(now);
    const auto interval_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(interval_).count();

    auto last = last_signal_ns_.load();
    if (now_ns - last < interval_ns) {
        return false;
    }
    if (!last_signal_ns_.compare_exchange_strong(last, now_ns)) {
        return false;
    }

    signals_sent_.fetch_add(1, std::memory_order_relaxed);
    if (signal_) {
        signal_();
    }
    return true;
}

auto keep_alive_timer::run() -> void {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        auto last = clock::time_point{std::chrono::nanoseconds{last_signal_ns_.load()}};
        cv_.wait_until(lock, last + interval_, [this] { return !running_; });
        if (!running_) {
            break;
        }
        lock.unlock();
        try_fire(clock::now());
        lock.lock();
    }
}

}  // namespace kcenon::device_transfer
