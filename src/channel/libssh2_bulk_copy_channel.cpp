/**
 * @file libssh2_bulk_copy_channel.cpp
 * @brief SCP send/receive over libssh2
 */

#include "kcenon/device_transfer/channel/libssh2_bulk_copy_channel.h"

#include <algorithm>
#include <fstream>
#include <vector>

#include <sys/stat.h>

#include <libssh2.h>

#include <kcenon/device_transfer/channel/ssh_session.h>
#include <kcenon/device_transfer/core/logging.h>

namespace kcenon::device_transfer {

namespace {

struct channel_deleter {
    void operator()(LIBSSH2_CHANNEL* channel) const {
        if (channel) {
            libssh2_channel_free(channel);
        }
    }
};

using channel_ptr = std::unique_ptr<LIBSSH2_CHANNEL, channel_deleter>;

}  // namespace

libssh2_copy_session::libssh2_copy_session(std::unique_ptr<ssh_session> session)
    : session_(std::move(session)) {
    session_->set_blocking(true);
}

libssh2_copy_session::~libssh2_copy_session() = default;

auto libssh2_copy_session::send_file(const std::filesystem::path& local_path,
                                     const std::string& remote_spec,
                                     std::size_t block_size,
                                     const block_progress_callback& on_progress)
    -> result<void> {
    std::error_code ec;
    auto total = std::filesystem::file_size(local_path, ec);
    if (ec) {
        return unexpected(error{error_code::file_not_found,
                                "cannot stat " + local_path.string() + ": " + ec.message()});
    }

    std::ifstream file(local_path, std::ios::binary);
    if (!file) {
        return unexpected(error{error_code::file_access_denied,
                                "cannot open " + local_path.string()});
    }

    channel_ptr channel(libssh2_scp_send64(session_->native(), remote_spec.c_str(), 0644,
                                           static_cast<libssh2_int64_t>(total), 0, 0));
    if (!channel) {
        return unexpected(error{error_code::copy_session_failed,
                                "scp send to " + remote_spec + " refused: " +
                                    session_->last_error()});
    }

    std::vector<char> buffer(block_size);
    uint64_t sent = 0;
    while (sent < total) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto got = static_cast<std::size_t>(file.gcount());
        if (got == 0) {
            return unexpected(error{error_code::file_read_error,
                                    "short read from " + local_path.string()});
        }

        std::size_t offset = 0;
        while (offset < got) {
            auto rc = libssh2_channel_write(channel.get(), buffer.data() + offset, got - offset);
            if (rc < 0) {
                return unexpected(error{error_code::copy_send_failed,
                                        "scp write failed: " + session_->last_error()});
            }
            offset += static_cast<std::size_t>(rc);
        }
        sent += got;

        if (on_progress) {
            on_progress(copy_progress{sent, total});
        }
    }

    libssh2_channel_send_eof(channel.get());
    libssh2_channel_wait_eof(channel.get());
    libssh2_channel_wait_closed(channel.get());
    return {};
}

auto libssh2_copy_session::fetch_file(const std::string& remote_spec,
                                      const std::filesystem::path& local_path,
                                      std::size_t block_size,
                                      const block_progress_callback& on_progress)
    -> result<void> {
    libssh2_struct_stat info{};
    channel_ptr channel(libssh2_scp_recv2(session_->native(), remote_spec.c_str(), &info));
    if (!channel) {
        return unexpected(error{error_code::copy_session_failed,
                                "scp receive of " + remote_spec + " refused: " +
                                    session_->last_error()});
    }

    std::ofstream file(local_path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return unexpected(error{error_code::file_write_error,
                                "cannot create " + local_path.string()});
    }

    const auto total = static_cast<uint64_t>(info.st_size);
    std::vector<char> buffer(block_size);
    uint64_t received = 0;
    while (received < total) {
        auto want = static_cast<std::size_t>(
            std::min<uint64_t>(buffer.size(), total - received));
        auto rc = libssh2_channel_read(channel.get(), buffer.data(), want);
        if (rc < 0) {
            return unexpected(error{error_code::copy_receive_failed,
                                    "scp read failed: " + session_->last_error()});
        }
        if (rc == 0) {
            break;
        }

        file.write(buffer.data(), rc);
        if (!file) {
            return unexpected(error{error_code::file_write_error,
                                    "write to " + local_path.string() + " failed"});
        }
        received += static_cast<uint64_t>(rc);

        if (on_progress) {
            on_progress(copy_progress{received, total});
        }
    }

    if (received != total) {
        return unexpected(error{error_code::copy_size_mismatch,
                                "received " + std::to_string(received) + " of " +
                                    std::to_string(total) + " bytes"});
    }
    return {};
}

auto libssh2_bulk_copy_channel::open(const ssh_credentials& credentials)
    -> result<std::unique_ptr<bulk_copy_session>> {
    auto session = ssh_session::connect(credentials);
    if (!session) {
        return unexpected(session.error());
    }
    DT_LOG_DEBUG(log_category::channel, "bulk-copy session open to " + credentials.host);
    return std::unique_ptr<bulk_copy_session>(
        std::make_unique<libssh2_copy_session>(std::move(session.value())));
}

}  // namespace kcenon::device_transfer
