/**
 * @file cisco_iosxe.h
 * @brief Cisco IOS-XE command syntax, parsers and platform preset
 */

#ifndef KCENON_DEVICE_TRANSFER_DEVICES_CISCO_IOSXE_H
#define KCENON_DEVICE_TRANSFER_DEVICES_CISCO_IOSXE_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "kcenon/device_transfer/capability/capability_profile.h"
#include "kcenon/device_transfer/channel/admin_channel.h"
#include "kcenon/device_transfer/channel/bulk_copy_channel.h"
#include "kcenon/device_transfer/channel/ssh_config.h"
#include "kcenon/device_transfer/channel/storage_root_resolver.h"
#include "kcenon/device_transfer/probe/remote_file_probe.h"
#include "kcenon/device_transfer/transfer/transfer_orchestrator.h"

namespace kcenon::device_transfer::cisco_iosxe {

/**
 * @brief `verify /md5` and `dir` handling
 *
 * @code
 * verify /md5 (flash:image.bin) = 0123456789abcdef0123456789abcdef
 *
 * Directory of flash:/image.bin
 *    22  -rw-    471234560  Mar 3 2024 10:01:12 +00:00  image.bin
 * 7712788480 bytes total (3821002752 bytes free)
 * @endcode
 */
class file_dialect : public remote_file_dialect {
public:
    [[nodiscard]] auto hash_command(const std::string& path) const -> std::string override;
    [[nodiscard]] auto listing_command(const std::string& path) const -> std::string override;
    [[nodiscard]] auto free_space_command(const std::string& root) const
        -> std::optional<std::string> override;

    [[nodiscard]] auto parse_hash(const std::string& output) const
        -> std::optional<std::string> override;
    [[nodiscard]] auto parse_size(const std::string& output, const std::string& name) const
        -> std::optional<uint64_t> override;
    [[nodiscard]] auto parse_free_space(const std::string& output) const
        -> std::optional<uint64_t> override;
};

/**
 * @brief Reads the default filesystem from `dir | i Directory of`
 *
 * `dir` without arguments needs privileged exec, so the resolver raises
 * the session to that level first.
 */
class storage_resolver : public storage_root_resolver {
public:
    explicit storage_resolver(std::shared_ptr<admin_channel> channel,
                              std::string privilege = "privilege_exec");

    [[nodiscard]] auto resolve_active_root() -> result<std::optional<std::string>> override;

    /// Filesystem named by the first `Directory of` line, if any
    [[nodiscard]] static auto parse_root(const std::string& output) -> std::optional<std::string>;

private:
    std::shared_ptr<admin_channel> channel_;
    std::string privilege_;
};

/**
 * @brief SCP server enablement and optional SSH bulk-mode window
 *
 * `ip scp server enable` is always required. When a bulk-mode window is
 * requested, `ip ssh bulk-mode <window>` is required as well and a
 * previously configured window is restored on rollback.
 */
class scp_capability_profile : public capability_profile {
public:
    static constexpr const char* scp_server_key = "ip scp server enable";
    static constexpr const char* bulk_mode_key = "ip ssh bulk-mode";

    explicit scp_capability_profile(std::optional<uint32_t> bulk_mode_window = std::nullopt);

    [[nodiscard]] auto inspect_command() const -> std::string override;
    [[nodiscard]] auto parse_settings(const std::string& output) const
        -> std::vector<capability_setting> override;
    [[nodiscard]] auto required_settings() const -> std::vector<capability_setting> override;

private:
    std::optional<uint32_t> bulk_mode_window_;
};

/**
 * @brief Administrative session preset for IOS-XE
 *
 * exec / privilege_exec / configuration prompts, `enable` escalation with
 * the enable secret, the usual `%` rejection markers, and paging disabled
 * on open.
 */
[[nodiscard]] auto platform_config(const ssh_credentials& credentials) -> admin_channel_config;

/**
 * @brief Options for make_orchestrator()
 */
struct platform_options {
    /// Timeout for `verify /md5`; hashing a large image takes minutes
    std::chrono::milliseconds hash_timeout{std::chrono::minutes{10}};

    /// Request `ip ssh bulk-mode <window>` during capability negotiation
    std::optional<uint32_t> bulk_mode_window;

    /// Pool for keep-alive writes (created when null)
    std::shared_ptr<adapters::task_pool_interface> pool;
};

/**
 * @brief Wire an orchestrator for an IOS-XE device
 * @param admin Open administrative session
 * @param bulk Bulk-copy channel factory
 * @param credentials Credentials for bulk-copy sessions
 * @param options Platform options
 */
[[nodiscard]] auto make_orchestrator(std::shared_ptr<admin_channel> admin,
                                     std::shared_ptr<bulk_copy_channel> bulk,
                                     const ssh_credentials& credentials,
                                     const platform_options& options = {})
    -> result<transfer_orchestrator>;

}  // namespace kcenon::device_transfer::cisco_iosxe

#endif  // KCENON_DEVICE_TRANSFER_DEVICES_CISCO_IOSXE_H
