/**
 * @file keep_alive_timer.h
 * @brief Periodic idle-timeout prevention for the administrative session
 */

#ifndef KCENON_DEVICE_TRANSFER_TRANSFER_KEEP_ALIVE_TIMER_H
#define KCENON_DEVICE_TRANSFER_TRANSFER_KEEP_ALIVE_TIMER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace kcenon::device_transfer {

/**
 * @brief Fires a signal whenever `interval` elapsed since the last one
 *
 * Two sources drive the timer: a background thread started by start(), and
 * poke() called by the copy loop after every block. Both compare against a
 * shared atomic timestamp and claim a slot with compare-exchange, so a
 * given interval produces at most one signal whichever source sees it
 * first. The signal callback must not block; the engine hands it a
 * fire-and-forget submission to the task pool.
 *
 * An interval of zero disables the timer entirely.
 */
class keep_alive_timer {
public:
    using clock = std::chrono::steady_clock;

    keep_alive_timer(std::function<void()> signal, std::chrono::milliseconds interval);
    ~keep_alive_timer();

    keep_alive_timer(const keep_alive_timer&) = delete;
    keep_alive_timer& operator=(const keep_alive_timer&) = delete;

    /**
     * @brief Reset the reference time to now and start the background thread
     */
    auto start() -> void;

    /**
     * @brief Stop the background thread; idempotent
     */
    auto stop() -> void;

    /**
     * @brief Signal now if the interval has elapsed
     * @return true if this call emitted the signal
     */
    auto poke() -> bool;

    [[nodiscard]] auto enabled() const -> bool { return interval_.count() > 0; }

    [[nodiscard]] auto signals_sent() const -> std::size_t {
        return signals_sent_.load(std::memory_order_relaxed);
    }

private:
    auto try_fire(clock::time_point now) -> bool;
    auto run() -> void;

    std::function<void()> signal_;
    std::chrono::milliseconds interval_;

    std::atomic<int64_t> last_signal_ns_{0};
    std::atomic<std::size_t> signals_sent_{0};

    std::mutex mutex_;
    std::condition_variable cv_;
    bool running_ = false;
    std::thread worker_;
};

}  // namespace kcenon::device_transfer

#endif  // KCENON_DEVICE_TRANSFER_TRANSFER_KEEP_ALIVE_TIMER_H
