/**
 * @file local_file_probe.h
 * @brief file_probe for the operator's filesystem
 */

#ifndef KCENON_DEVICE_TRANSFER_PROBE_LOCAL_FILE_PROBE_H
#define KCENON_DEVICE_TRANSFER_PROBE_LOCAL_FILE_PROBE_H

#include "kcenon/device_transfer/probe/file_probe.h"

namespace kcenon::device_transfer {

/**
 * @brief Hashes a local file and measures the free space next to it
 *
 * Free space is taken from the storage_context path when given, otherwise
 * from the file's parent directory, or the working directory when the
 * location has no directory part.
 */
class local_file_probe : public file_probe {
public:
    [[nodiscard]] auto probe(const std::string& location,
                             const std::optional<std::string>& storage_context)
        -> result<file_state> override;

    [[nodiscard]] auto side() const -> std::string_view override { return "local"; }
};

}  // namespace kcenon::device_transfer

#endif  // KCENON_DEVICE_TRANSFER_PROBE_LOCAL_FILE_PROBE_H
