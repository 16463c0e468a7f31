/**
 * @file transfer_options.h
 * @brief Per-run options of an orchestrated transfer
 */

#ifndef KCENON_DEVICE_TRANSFER_TRANSFER_TRANSFER_OPTIONS_H
#define KCENON_DEVICE_TRANSFER_TRANSFER_TRANSFER_OPTIONS_H

#include <chrono>
#include <optional>
#include <string>

#include "kcenon/device_transfer/capability/capability_negotiator.h"
#include "kcenon/device_transfer/core/transfer_types.h"

namespace kcenon::device_transfer {

/**
 * @brief Options of one transfer() call
 */
struct transfer_options {
    /// Compare fingerprints before and after the copy. Without it the
    /// overwrite and free-space gates have nothing to act on.
    bool verify_hash = true;

    /// Replace a destination whose fingerprint differs from the source
    bool overwrite = false;

    force_policy force = force_policy::check_only;

    /// Roll back capability changes once the copy finished or failed
    bool cleanup = true;

    /// Keep-alive interval; unset uses the orchestrator default, 0 disables
    std::optional<std::chrono::milliseconds> keep_alive_interval;

    /// Device filesystem root, e.g. "flash:"; empty resolves it from the device
    std::string storage_root;

    progress_sink progress;
};

}  // namespace kcenon::device_transfer

#endif  // KCENON_DEVICE_TRANSFER_TRANSFER_TRANSFER_OPTIONS_H
