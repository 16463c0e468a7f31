/**
 * @file transfer_engine.cpp
 * @brief Implementation of transfer_engine
 */

#include "kcenon/device_transfer/transfer/transfer_engine.h"

#include <span>

#include <kcenon/device_transfer/core/logging.h>
#include <kcenon/device_transfer/transfer/keep_alive_timer.h>

namespace kcenon::device_transfer {

transfer_engine::transfer_engine(std::shared_ptr<bulk_copy_channel> bulk,
                                 std::shared_ptr<admin_channel> admin,
                                 ssh_credentials credentials,
                                 std::shared_ptr<adapters::task_pool_interface> pool)
    : bulk_(std::move(bulk)),
      admin_(std::move(admin)),
      credentials_(std::move(credentials)),
      pool_(pool ? std::move(pool) : adapters::task_pool_factory::create()) {}

auto transfer_engine::copy(transfer_direction direction,
                           const std::string& source,
                           const std::string& destination,
                           const progress_sink& progress,
                           std::chrono::milliseconds keep_alive_interval) -> result<void> {
    if (!bulk_ || !admin_) {
        return unexpected(error{error_code::not_initialized, "transfer engine has no channels"});
    }

    auto session = bulk_->open(credentials_);
    if (!session) {
        return unexpected(session.error());
    }

    transfer_log_context ctx;
    ctx.operation = to_string(direction);
    ctx.source = source;
    ctx.destination = destination;
    ctx.host = credentials_.host;
    DT_LOG_INFO_CTX(log_category::engine, "bulk copy started", ctx);

    keep_alive_timer timer([this] { send_keep_alive(); }, keep_alive_interval);
    timer.start();

    uint64_t last_total = 0;
    uint64_t last_copied = 0;
    auto on_block = [&](const copy_progress& p) {
        timer.poke();
        last_copied = p.bytes_copied;
        last_total = p.total_bytes;
        if (progress) {
            progress(source, destination, p.bytes_copied, p.total_bytes);
        }
    };

    auto started = std::chrono::steady_clock::now();
    auto copied = direction == transfer_direction::upload
                      ? session.value()->send_file(source, destination, block_size, on_block)
                      : session.value()->fetch_file(source, destination, block_size, on_block);

    timer.stop();
    last_keep_alive_count_ = timer.signals_sent();
    drain_keep_alives();
    session.value().reset();

    ctx.file_size = last_total;
    ctx.bytes_transferred = last_copied;
    ctx.duration_ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                                std::chrono::steady_clock::now() - started)
                                                .count());
    if (!copied) {
        ctx.error_message = copied.error().message;
        DT_LOG_ERROR_CTX(log_category::engine, "bulk copy failed", ctx);
        return copied;
    }

    DT_LOG_INFO_CTX(log_category::engine, "bulk copy completed", ctx);
    return {};
}

auto transfer_engine::send_keep_alive() -> void {
    if (pool_->in_flight(keep_alive_lane) > 0) {
        DT_LOG_DEBUG(log_category::engine, "previous keep-alive still in flight, skipping");
        return;
    }

    DT_LOG_DEBUG(log_category::engine, "sending keep-alive to device");
    auto admin = admin_;
    auto future = pool_->submit(
        [admin] {
            auto written = admin->write_raw(std::span<const std::byte>(&keep_alive_byte, 1));
            if (!written) {
                DT_LOG_WARN(log_category::engine,
                            "keep-alive write failed: " + written.error().message);
            }
        },
        keep_alive_lane);

    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_.push_back(std::move(future));
}

auto transfer_engine::drain_keep_alives() -> void {
    std::vector<std::future<void>> pending;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending.swap(pending_);
    }
    for (auto& f : pending) {
        if (f.valid()) {
            f.wait();
        }
    }
}

}  // namespace kcenon::device_transfer
