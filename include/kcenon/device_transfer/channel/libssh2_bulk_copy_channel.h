/**
 * @file libssh2_bulk_copy_channel.h
 * @brief SCP bulk-copy channel over libssh2
 */

#ifndef KCENON_DEVICE_TRANSFER_CHANNEL_LIBSSH2_BULK_COPY_CHANNEL_H
#define KCENON_DEVICE_TRANSFER_CHANNEL_LIBSSH2_BULK_COPY_CHANNEL_H

#include <memory>

#include "kcenon/device_transfer/channel/bulk_copy_channel.h"

namespace kcenon::device_transfer {

class ssh_session;

/**
 * @brief SCP session on a dedicated SSH connection
 */
class libssh2_copy_session : public bulk_copy_session {
public:
    explicit libssh2_copy_session(std::unique_ptr<ssh_session> session);
    ~libssh2_copy_session() override;

    [[nodiscard]] auto send_file(const std::filesystem::path& local_path,
                                 const std::string& remote_spec,
                                 std::size_t block_size,
                                 const block_progress_callback& on_progress)
        -> result<void> override;

    [[nodiscard]] auto fetch_file(const std::string& remote_spec,
                                  const std::filesystem::path& local_path,
                                  std::size_t block_size,
                                  const block_progress_callback& on_progress)
        -> result<void> override;

private:
    std::unique_ptr<ssh_session> session_;
};

/**
 * @brief Opens one libssh2_copy_session per call
 */
class libssh2_bulk_copy_channel : public bulk_copy_channel {
public:
    [[nodiscard]] auto open(const ssh_credentials& credentials)
        -> result<std::unique_ptr<bulk_copy_session>> override;
};

}  // namespace kcenon::device_transfer

#endif  // KCENON_DEVICE_TRANSFER_CHANNEL_LIBSSH2_BULK_COPY_CHANNEL_H
