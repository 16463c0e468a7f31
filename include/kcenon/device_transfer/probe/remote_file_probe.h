/**
 * @file remote_file_probe.h
 * @brief file_probe for a device filesystem reached over the admin channel
 */

#ifndef KCENON_DEVICE_TRANSFER_PROBE_REMOTE_FILE_PROBE_H
#define KCENON_DEVICE_TRANSFER_PROBE_REMOTE_FILE_PROBE_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "kcenon/device_transfer/channel/admin_channel.h"
#include "kcenon/device_transfer/probe/file_probe.h"

namespace kcenon::device_transfer {

/**
 * @brief Device-specific command syntax and output parsing for file probes
 */
class remote_file_dialect {
public:
    virtual ~remote_file_dialect() = default;

    /**
     * @brief Build the device path of a file on a filesystem root
     */
    [[nodiscard]] virtual auto join(const std::string& root, const std::string& name) const
        -> std::string {
        return root + name;
    }

    /// Command asking the device for the MD5 of a path
    [[nodiscard]] virtual auto hash_command(const std::string& path) const -> std::string = 0;

    /// Command listing a path together with the free space of its storage
    [[nodiscard]] virtual auto listing_command(const std::string& path) const -> std::string = 0;

    /**
     * @brief Command reporting the free space of a storage root alone
     *
     * Used when the file listing carries no free-space figure, which is
     * what devices print for a file that does not exist. Empty optional
     * when the dialect has no such command.
     */
    [[nodiscard]] virtual auto free_space_command(const std::string& root) const
        -> std::optional<std::string> {
        (void)root;
        return std::nullopt;
    }

    /// MD5 token from the hash command output, empty optional if absent
    [[nodiscard]] virtual auto parse_hash(const std::string& output) const
        -> std::optional<std::string> = 0;

    /// Size of `name` from the listing output
    [[nodiscard]] virtual auto parse_size(const std::string& output,
                                          const std::string& name) const
        -> std::optional<uint64_t> = 0;

    /// Free bytes from the listing output
    [[nodiscard]] virtual auto parse_free_space(const std::string& output) const
        -> std::optional<uint64_t> = 0;
};

/**
 * @brief Probes a device file with an integrity check and a listing
 *
 * The integrity check runs with `hash_timeout` because hashing a large
 * image on the device takes far longer than an ordinary command.
 */
class remote_file_probe : public file_probe {
public:
    remote_file_probe(std::shared_ptr<admin_channel> channel,
                      std::shared_ptr<const remote_file_dialect> dialect,
                      std::chrono::milliseconds hash_timeout);

    [[nodiscard]] auto probe(const std::string& location,
                             const std::optional<std::string>& storage_context)
        -> result<file_state> override;

    [[nodiscard]] auto locate(const std::string& location,
                              const std::optional<std::string>& storage_context) const
        -> std::string override;

    [[nodiscard]] auto side() const -> std::string_view override { return "device"; }

    [[nodiscard]] auto hash_timeout() const -> std::chrono::milliseconds { return hash_timeout_; }

private:
    std::shared_ptr<admin_channel> channel_;
    std::shared_ptr<const remote_file_dialect> dialect_;
    std::chrono::milliseconds hash_timeout_;
};

}  // namespace kcenon::device_transfer

#endif  // KCENON_DEVICE_TRANSFER_PROBE_REMOTE_FILE_PROBE_H
