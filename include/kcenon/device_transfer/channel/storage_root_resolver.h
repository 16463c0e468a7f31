/**
 * @file storage_root_resolver.h
 * @brief Discovery of the device's active filesystem
 */

#ifndef KCENON_DEVICE_TRANSFER_CHANNEL_STORAGE_ROOT_RESOLVER_H
#define KCENON_DEVICE_TRANSFER_CHANNEL_STORAGE_ROOT_RESOLVER_H

#include <optional>
#include <string>

#include "kcenon/device_transfer/core/types.h"

namespace kcenon::device_transfer {

/**
 * @brief Reports the filesystem root the device uses by default
 *
 * Returns an empty optional when the device does not report one; an error
 * result only for channel failures.
 */
class storage_root_resolver {
public:
    virtual ~storage_root_resolver() = default;

    [[nodiscard]] virtual auto resolve_active_root() -> result<std::optional<std::string>> = 0;
};

}  // namespace kcenon::device_transfer

#endif  // KCENON_DEVICE_TRANSFER_CHANNEL_STORAGE_ROOT_RESOLVER_H
