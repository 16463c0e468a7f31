/**
 * @file libssh2_admin_channel.h
 * @brief admin_channel over an interactive libssh2 shell
 */

#ifndef KCENON_DEVICE_TRANSFER_CHANNEL_LIBSSH2_ADMIN_CHANNEL_H
#define KCENON_DEVICE_TRANSFER_CHANNEL_LIBSSH2_ADMIN_CHANNEL_H

#include <memory>
#include <string>

#include "kcenon/device_transfer/channel/admin_channel.h"
#include "kcenon/device_transfer/channel/ssh_config.h"

namespace kcenon::device_transfer {

/**
 * @brief CLI session driven through a PTY shell
 *
 * Commands are written followed by a newline and their output is read
 * until one of the configured prompts appears on the last line. The
 * command echo and the trailing prompt are removed from the returned
 * text. The current privilege level is tracked from the prompt and
 * changed with the escalate/deescalate commands of the configured levels.
 *
 * @code
 * auto channel = libssh2_admin_channel::open(cisco_iosxe::platform_config(credentials));
 * if (channel.has_value()) {
 *     auto version = channel.value()->send_command("show version", std::chrono::seconds{30});
 * }
 * @endcode
 */
class libssh2_admin_channel : public admin_channel {
public:
    /**
     * @brief Connect, open the shell and reach the default privilege level
     */
    [[nodiscard]] static auto open(admin_channel_config config)
        -> result<std::shared_ptr<libssh2_admin_channel>>;

    ~libssh2_admin_channel() override;

    libssh2_admin_channel(const libssh2_admin_channel&) = delete;
    libssh2_admin_channel& operator=(const libssh2_admin_channel&) = delete;

    [[nodiscard]] auto send_command(const std::string& command,
                                    std::chrono::milliseconds timeout)
        -> result<std::string> override;

    [[nodiscard]] auto send_commands(const std::vector<std::string>& commands,
                                     std::chrono::milliseconds timeout)
        -> result<std::vector<std::string>> override;

    [[nodiscard]] auto send_config(const std::vector<std::string>& directives)
        -> result<config_response> override;

    [[nodiscard]] auto acquire_privilege(const std::string& level) -> result<void> override;

    [[nodiscard]] auto write_raw(std::span<const std::byte> bytes) -> result<void> override;

    [[nodiscard]] auto timeout_ops() const -> std::chrono::milliseconds override;

    /**
     * @brief Privilege level of the last prompt seen
     */
    [[nodiscard]] auto current_privilege() const -> std::string;

    [[nodiscard]] auto config() const -> const admin_channel_config&;

private:
    struct impl;

    explicit libssh2_admin_channel(std::unique_ptr<impl> pimpl);

    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::device_transfer

#endif  // KCENON_DEVICE_TRANSFER_CHANNEL_LIBSSH2_ADMIN_CHANNEL_H
