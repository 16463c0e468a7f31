/**
 * @file bulk_copy_channel.h
 * @brief Bulk-copy (SCP) channel abstraction
 */

#ifndef KCENON_DEVICE_TRANSFER_CHANNEL_BULK_COPY_CHANNEL_H
#define KCENON_DEVICE_TRANSFER_CHANNEL_BULK_COPY_CHANNEL_H

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include "kcenon/device_transfer/channel/ssh_config.h"
#include "kcenon/device_transfer/core/transfer_types.h"
#include "kcenon/device_transfer/core/types.h"

namespace kcenon::device_transfer {

/**
 * @brief Per-block progress callback of a copy session
 */
using block_progress_callback = std::function<void(const copy_progress&)>;

/**
 * @brief One open bulk-copy connection
 *
 * Closing happens on destruction.
 */
class bulk_copy_session {
public:
    virtual ~bulk_copy_session() = default;

    /**
     * @brief Send a local file to the device
     * @param local_path Source file
     * @param remote_spec Destination path as understood by the device
     * @param block_size Bytes per write
     * @param on_progress Invoked after each block
     */
    [[nodiscard]] virtual auto send_file(const std::filesystem::path& local_path,
                                         const std::string& remote_spec,
                                         std::size_t block_size,
                                         const block_progress_callback& on_progress)
        -> result<void> = 0;

    /**
     * @brief Fetch a device file to the local filesystem
     */
    [[nodiscard]] virtual auto fetch_file(const std::string& remote_spec,
                                          const std::filesystem::path& local_path,
                                          std::size_t block_size,
                                          const block_progress_callback& on_progress)
        -> result<void> = 0;
};

/**
 * @brief Factory for bulk-copy sessions
 *
 * Every open() is a new connection, independent of the administrative
 * session even though both use the same credentials.
 */
class bulk_copy_channel {
public:
    virtual ~bulk_copy_channel() = default;

    [[nodiscard]] virtual auto open(const ssh_credentials& credentials)
        -> result<std::unique_ptr<bulk_copy_session>> = 0;
};

}  // namespace kcenon::device_transfer

#endif  // KCENON_DEVICE_TRANSFER_CHANNEL_BULK_COPY_CHANNEL_H
