/**
 * @file file_probe.h
 * @brief Uniform file inspection contract for local and remote targets
 */

#ifndef KCENON_DEVICE_TRANSFER_PROBE_FILE_PROBE_H
#define KCENON_DEVICE_TRANSFER_PROBE_FILE_PROBE_H

#include <optional>
#include <string>
#include <string_view>

#include "kcenon/device_transfer/core/transfer_types.h"
#include "kcenon/device_transfer/core/types.h"

namespace kcenon::device_transfer {

/**
 * @brief Produces a file_state for a location
 *
 * A missing or unreadable file is reported as file_state::not_found(),
 * never as an error. The error path is reserved for failures of the
 * channel used to reach the file.
 */
class file_probe {
public:
    virtual ~file_probe() = default;

    /**
     * @brief Inspect a file
     * @param location File name or path
     * @param storage_context Storage the location lives on: the device
     *        filesystem for remote probes, a free-space override path for
     *        local probes
     */
    [[nodiscard]] virtual auto probe(const std::string& location,
                                     const std::optional<std::string>& storage_context)
        -> result<file_state> = 0;

    /**
     * @brief Path the bulk-copy channel uses to address a location
     */
    [[nodiscard]] virtual auto locate(const std::string& location,
                                      const std::optional<std::string>& storage_context) const
        -> std::string {
        (void)storage_context;
        return location;
    }

    /**
     * @brief Short name used in log messages ("local", "device")
     */
    [[nodiscard]] virtual auto side() const -> std::string_view = 0;
};

}  // namespace kcenon::device_transfer

#endif  // KCENON_DEVICE_TRANSFER_PROBE_FILE_PROBE_H
