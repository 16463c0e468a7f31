/**
 * @file device_transfer.h
 * @brief Main header for the device_transfer library
 * @version 0.1.0
 *
 * Idempotent, verifiable single-file transfer between the local
 * filesystem and a network device reached over an administrative CLI
 * session plus an SCP bulk-copy session.
 *
 * @code
 * #include <kcenon/device_transfer/device_transfer.h>
 *
 * using namespace kcenon::device_transfer;
 *
 * auto admin = libssh2_admin_channel::open(cisco_iosxe::platform_config(credentials));
 * auto orchestrator = cisco_iosxe::make_orchestrator(
 *     admin.value(), std::make_shared<libssh2_bulk_copy_channel>(), credentials);
 *
 * auto outcome = orchestrator.value().transfer(
 *     transfer_direction::upload, "image.bin", "", transfer_options{});
 * @endcode
 */

#ifndef KCENON_DEVICE_TRANSFER_DEVICE_TRANSFER_H
#define KCENON_DEVICE_TRANSFER_DEVICE_TRANSFER_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/device_transfer/core/types.h"
#include "kcenon/device_transfer/core/transfer_types.h"
#include "kcenon/device_transfer/core/checksum.h"
#include "kcenon/device_transfer/core/logging.h"

// Channels
#include "kcenon/device_transfer/channel/admin_channel.h"
#include "kcenon/device_transfer/channel/bulk_copy_channel.h"
#include "kcenon/device_transfer/channel/libssh2_admin_channel.h"
#include "kcenon/device_transfer/channel/libssh2_bulk_copy_channel.h"

// Probes, capability, transfer
#include "kcenon/device_transfer/probe/local_file_probe.h"
#include "kcenon/device_transfer/probe/remote_file_probe.h"
#include "kcenon/device_transfer/capability/capability_negotiator.h"
#include "kcenon/device_transfer/transfer/transfer_engine.h"
#include "kcenon/device_transfer/transfer/transfer_orchestrator.h"

// Devices
#include "kcenon/device_transfer/devices/cisco_iosxe.h"

namespace kcenon::device_transfer {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::device_transfer

#endif  // KCENON_DEVICE_TRANSFER_DEVICE_TRANSFER_H
