/**
 * @file transfer_engine.h
 * @brief Single get/put over the bulk-copy channel
 */

#ifndef KCENON_DEVICE_TRANSFER_TRANSFER_TRANSFER_ENGINE_H
#define KCENON_DEVICE_TRANSFER_TRANSFER_TRANSFER_ENGINE_H

#include <chrono>
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "kcenon/device_transfer/adapters/task_pool_adapter.h"
#include "kcenon/device_transfer/channel/admin_channel.h"
#include "kcenon/device_transfer/channel/bulk_copy_channel.h"
#include "kcenon/device_transfer/channel/ssh_config.h"
#include "kcenon/device_transfer/core/transfer_types.h"
#include "kcenon/device_transfer/core/types.h"

namespace kcenon::device_transfer {

/**
 * @brief Moves one file across the bulk-copy channel
 *
 * Every copy() opens its own bulk-copy session from the credentials the
 * engine was built with; the administrative session is never multiplexed
 * for data. While the copy runs, the administrative session receives a
 * form-feed (Ctrl-L, which only redraws the prompt) whenever
 * `keep_alive_interval` elapsed, so the device does not close it for
 * inactivity. The write is submitted to the task pool and never waited on
 * by the copy loop.
 */
class transfer_engine {
public:
    static constexpr std::size_t block_size = 65536;
    static constexpr std::byte keep_alive_byte{0x0C};
    static constexpr const char* keep_alive_lane = "keep_alive";

    /**
     * @param bulk Factory for bulk-copy sessions
     * @param admin Administrative session receiving keep-alive signals
     * @param credentials Credentials for the bulk-copy session
     * @param pool Pool running keep-alive writes (created when null)
     */
    transfer_engine(std::shared_ptr<bulk_copy_channel> bulk,
                    std::shared_ptr<admin_channel> admin,
                    ssh_credentials credentials,
                    std::shared_ptr<adapters::task_pool_interface> pool = nullptr);

    /**
     * @brief Copy one file
     * @param direction upload sends `source` (local) to `destination` (device);
     *        download fetches `source` (device) into `destination` (local)
     * @param source Source location
     * @param destination Destination location
     * @param progress Called after every block; may be empty
     * @param keep_alive_interval Idle-timeout prevention interval, 0 disables
     */
    [[nodiscard]] auto copy(transfer_direction direction,
                            const std::string& source,
                            const std::string& destination,
                            const progress_sink& progress,
                            std::chrono::milliseconds keep_alive_interval) -> result<void>;

    /**
     * @brief Keep-alive signals emitted by the last copy()
     */
    [[nodiscard]] auto last_keep_alive_count() const -> std::size_t {
        return last_keep_alive_count_;
    }

private:
    auto send_keep_alive() -> void;
    auto drain_keep_alives() -> void;

    std::shared_ptr<bulk_copy_channel> bulk_;
    std::shared_ptr<admin_channel> admin_;
    ssh_credentials credentials_;
    std::shared_ptr<adapters::task_pool_interface> pool_;

    std::mutex pending_mutex_;
    std::vector<std::future<void>> pending_;
    std::size_t last_keep_alive_count_ = 0;
};

}  // namespace kcenon::device_transfer

#endif  // KCENON_DEVICE_TRANSFER_TRANSFER_TRANSFER_ENGINE_H
